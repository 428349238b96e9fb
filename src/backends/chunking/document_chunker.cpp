/**
 * @file document_chunker.cpp
 * @brief Document Chunking Implementation
 */

#include "document_chunker.h"
#include "quality_scorer.h"
#include "strategy_catalog.h"
#include "token_estimator.h"
#include "utf8_text.h"

#include <chrono>
#include <string>

#include "cw/core/cw_logger.h"

#define LOG_TAG "Chunking.Chunker"
#define LOGI(...) CW_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) CW_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGD(...) CW_LOG_DEBUG(LOG_TAG, __VA_ARGS__)

namespace chunkwise {
namespace chunking {

std::unique_ptr<IChunkAssembler> create_assembler(ChunkStrategy strategy) {
    switch (strategy) {
        case ChunkStrategy::Sentence:
            return create_sentence_assembler();
        case ChunkStrategy::Paragraph:
            return create_paragraph_assembler();
        case ChunkStrategy::Semantic:
            return create_semantic_assembler();
        case ChunkStrategy::SlidingWindow:
            return create_sliding_window_assembler();
        case ChunkStrategy::FixedSize:
            break;
    }
    return create_fixed_size_assembler();
}

ChunkStrategy resolve_strategy(std::string_view strategy_id) {
    const auto strategy = parse_strategy(strategy_id);
    if (!strategy) {
        LOGW("Unknown chunking strategy '%.*s', using fixed-size",
             static_cast<int>(strategy_id.size()), strategy_id.data());
        return ChunkStrategy::FixedSize;
    }
    return *strategy;
}

ChunkerConfig clamp_config(const ChunkerConfig& config) {
    ChunkerConfig clamped = config;
    if (clamped.chunk_size <= 0) {
        LOGW("chunk_size %d is not positive, using 1", clamped.chunk_size);
        clamped.chunk_size = 1;
    }
    if (clamped.chunk_overlap < 0) {
        LOGW("chunk_overlap %d is negative, using 0", clamped.chunk_overlap);
        clamped.chunk_overlap = 0;
    }
    if (clamped.chunk_overlap >= clamped.chunk_size) {
        LOGW("chunk_overlap %d must be below chunk_size %d, using %d",
             clamped.chunk_overlap, clamped.chunk_size, clamped.chunk_size - 1);
        clamped.chunk_overlap = clamped.chunk_size - 1;
    }
    return clamped;
}

DocumentChunker::DocumentChunker(const ChunkerConfig& config)
    : config_(clamp_config(config)), assembler_(create_assembler(config_.strategy)) {}

std::vector<ChunkRecord> DocumentChunker::chunk_document(std::string_view text) const {
    const Utf8Text document(text);
    return chunk_validated(document);
}

ChunkingResult DocumentChunker::process(std::string_view text) const {
    const auto start = std::chrono::steady_clock::now();

    const Utf8Text document(text);
    ChunkingResult result;
    result.chunks = chunk_validated(document);

    const auto end = std::chrono::steady_clock::now();
    const double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    result.metrics = summarize_metrics(result.chunks, document.size(), config_, elapsed_ms);
    result.insights = strategy_insights(result.chunks, config_.strategy);

    LOGI("Chunked %zu characters into %zu chunks (%s, size=%d, overlap=%d) in %.2f ms",
         document.size(), result.chunks.size(), assembler_->name(),
         config_.chunk_size, config_.chunk_overlap, elapsed_ms);
    return result;
}

size_t DocumentChunker::estimate_tokens(std::string_view text) const {
    if (!utf8::is_valid(text)) {
        throw InvalidTextError("text is not valid UTF-8");
    }
    return chunking::estimate_tokens(text);
}

std::vector<ChunkRecord> DocumentChunker::chunk_validated(const Utf8Text& document) const {
    if (utf8::is_blank(document.bytes())) {
        return {};
    }

    auto chunks = assembler_->assemble(document, config_.chunk_size, config_.chunk_overlap);
    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].sequence_index = i + 1;
    }

    LOGD("%s assembler produced %zu chunks", assembler_->name(), chunks.size());
    return chunks;
}

std::vector<ChunkRecord> chunk(
    std::string_view text,
    std::string_view strategy_id,
    int chunk_size,
    int overlap
) {
    ChunkerConfig config;
    config.strategy = resolve_strategy(strategy_id);
    config.chunk_size = chunk_size;
    config.chunk_overlap = overlap;
    return DocumentChunker(config).chunk_document(text);
}

} // namespace chunking
} // namespace chunkwise
