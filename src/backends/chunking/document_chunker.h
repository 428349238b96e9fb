/**
 * @file document_chunker.h
 * @brief Document chunking entry point
 *
 * Splits documents into overlapping chunks for embedding and indexing.
 */

#ifndef CHUNKWISE_DOCUMENT_CHUNKER_H
#define CHUNKWISE_DOCUMENT_CHUNKER_H

#include <memory>
#include <string_view>
#include <vector>

#include "chunk_assembler.h"
#include "chunk_types.h"

namespace chunkwise {
namespace chunking {

/**
 * @brief Document chunker for one strategy and parameter set
 *
 * Parameters are clamped on construction (size >= 1, 0 <= overlap < size),
 * each adjustment logged as a warning. All methods are const and safe to
 * call concurrently.
 */
class DocumentChunker {
public:
    explicit DocumentChunker(const ChunkerConfig& config = ChunkerConfig{});

    /**
     * @brief Split document into chunks
     *
     * @param text UTF-8 document
     * @return Chunks with 1-based sequence_index; empty for blank text
     * @throws InvalidTextError if text is not valid UTF-8
     */
    std::vector<ChunkRecord> chunk_document(std::string_view text) const;

    /**
     * @brief Chunk and summarize: metrics, insights and processing time
     *
     * @throws InvalidTextError if text is not valid UTF-8
     */
    ChunkingResult process(std::string_view text) const;

    /**
     * @brief Estimate token count for text
     *
     * @throws InvalidTextError if text is not valid UTF-8
     */
    size_t estimate_tokens(std::string_view text) const;

    /**
     * @brief Effective configuration, after clamping
     */
    const ChunkerConfig& config() const noexcept { return config_; }

private:
    std::vector<ChunkRecord> chunk_validated(const Utf8Text& document) const;

    ChunkerConfig config_;
    std::unique_ptr<IChunkAssembler> assembler_;
};

/**
 * @brief Chunk text with the strategy named by a catalog id
 *
 * Unknown ids fall back to fixed-size with a warning.
 *
 * @throws InvalidTextError if text is not valid UTF-8
 */
std::vector<ChunkRecord> chunk(
    std::string_view text,
    std::string_view strategy_id,
    int chunk_size,
    int overlap
);

/**
 * @brief Resolve a catalog id, falling back to fixed-size with a warning
 */
ChunkStrategy resolve_strategy(std::string_view strategy_id);

/**
 * @brief Clamp size and overlap into a usable range, logging each change
 */
ChunkerConfig clamp_config(const ChunkerConfig& config);

} // namespace chunking
} // namespace chunkwise

#endif // CHUNKWISE_DOCUMENT_CHUNKER_H
