/**
 * @file semantic_assembler.cpp
 * @brief Token-budgeted sentence grouping with a soft break point
 */

#include "chunk_assembler.h"
#include "quality_scorer.h"
#include "text_splitters.h"
#include "token_estimator.h"

#include <algorithm>

#include "cw/core/cw_logger.h"

#define LOG_TAG "Chunking.Semantic"
#define LOGD(...) CW_LOG_DEBUG(LOG_TAG, __VA_ARGS__)

namespace chunkwise {
namespace chunking {

namespace {

// Cut once cumulative tokens reach this share of the budget
constexpr double kBreakThreshold = 0.8;

class SemanticAssembler : public IChunkAssembler {
public:
    std::vector<ChunkRecord> assemble(
        const Utf8Text& document,
        int chunk_size,
        int overlap
    ) const override {
        const size_t size = static_cast<size_t>(std::max(chunk_size, 1));
        const size_t overlap_tokens = static_cast<size_t>(std::max(overlap, 0));
        const auto sentences = split_sentences(document);

        std::vector<ChunkRecord> chunks;
        std::vector<const AtomicUnit*> buffer;
        size_t buffer_tokens = 0;
        // Sentences at the front of buffer that were already emitted
        size_t carried = 0;

        for (const auto& sentence : sentences) {
            const bool overflow = !buffer.empty() && buffer_tokens + sentence.estimated_tokens > size;
            buffer.push_back(&sentence);
            buffer_tokens += sentence.estimated_tokens;
            if (!overflow) {
                continue;
            }

            const size_t cut = find_break_point(buffer, size, carried);
            std::vector<const AtomicUnit*> emitted(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(cut));
            chunks.push_back(make_chunk(emitted));

            const size_t keep = std::min(overlap_sentence_count(emitted, overlap_tokens), emitted.size() / 2);
            buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(cut - keep));
            carried = keep;

            buffer_tokens = 0;
            for (const auto* unit : buffer) {
                buffer_tokens += unit->estimated_tokens;
            }
        }

        // A tail made only of carried overlap adds nothing new
        if (buffer.size() > carried) {
            chunks.push_back(make_chunk(buffer));
        }

        LOGD("Semantic pass: %zu sentences -> %zu chunks", sentences.size(), chunks.size());
        return chunks;
    }

    ChunkStrategy strategy() const noexcept override { return ChunkStrategy::Semantic; }

    const char* name() const noexcept override { return "semantic"; }

private:
    // First prefix reaching the threshold, else the midpoint. The prefix always
    // takes at least one sentence past the carried overlap.
    static size_t find_break_point(const std::vector<const AtomicUnit*>& buffer, size_t size, size_t carried) {
        const double threshold = kBreakThreshold * static_cast<double>(size);
        size_t cumulative = 0;
        for (size_t i = 0; i < buffer.size(); ++i) {
            cumulative += buffer[i]->estimated_tokens;
            if (i >= carried && static_cast<double>(cumulative) >= threshold) {
                return i + 1;
            }
        }
        return std::max(carried + 1, buffer.size() / 2);
    }

    // Trailing sentences of emitted needed to reach overlap tokens
    static size_t overlap_sentence_count(const std::vector<const AtomicUnit*>& emitted, size_t overlap) {
        if (overlap == 0) {
            return 0;
        }
        size_t tokens = 0;
        for (size_t count = 1; count <= emitted.size(); ++count) {
            tokens += emitted[emitted.size() - count]->estimated_tokens;
            if (tokens >= overlap) {
                return count;
            }
        }
        return emitted.size();
    }

    static ChunkRecord make_chunk(const std::vector<const AtomicUnit*>& units) {
        ChunkRecord chunk;
        for (size_t i = 0; i < units.size(); ++i) {
            if (i > 0) {
                chunk.text.push_back(' ');
            }
            chunk.text.append(units[i]->text);
            chunk.character_count += units[i]->character_count;
        }
        chunk.character_count += units.size() - 1;
        chunk.estimated_tokens = estimate_tokens(chunk.text);
        chunk.unit_count = units.size();
        chunk.unit_range = UnitRange{units.front()->index + 1, units.back()->index + 1};
        chunk.strategy = ChunkStrategy::Semantic;
        chunk.coherence_score = semantic_coherence(chunk.text);
        chunk.topic_keywords = topic_keywords(chunk.text);
        chunk.semantic_density = semantic_density(chunk.text);
        return chunk;
    }
};

} // namespace

std::unique_ptr<IChunkAssembler> create_semantic_assembler() {
    return std::make_unique<SemanticAssembler>();
}

} // namespace chunking
} // namespace chunkwise
