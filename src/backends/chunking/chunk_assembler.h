/**
 * @file chunk_assembler.h
 * @brief Abstract interface for chunk assembly strategies
 *
 * One assembler per segmentation strategy. Assemblers are stateless apart
 * from the rolling buffer of a single call, so one instance may be shared
 * across threads.
 */

#ifndef CHUNKWISE_CHUNK_ASSEMBLER_H
#define CHUNKWISE_CHUNK_ASSEMBLER_H

#include <memory>
#include <vector>

#include "chunk_types.h"
#include "utf8_text.h"

namespace chunkwise {
namespace chunking {

// =============================================================================
// ASSEMBLER INTERFACE
// =============================================================================

class IChunkAssembler {
public:
    virtual ~IChunkAssembler() = default;

    /**
     * @brief Assemble chunks from a document
     *
     * @param document Validated, non-blank document
     * @param chunk_size Target size, >= 1
     * @param overlap Overlap, in [0, chunk_size)
     * @return Ordered chunk records; sequence_index is left for the caller
     */
    virtual std::vector<ChunkRecord> assemble(
        const Utf8Text& document,
        int chunk_size,
        int overlap
    ) const = 0;

    virtual ChunkStrategy strategy() const noexcept = 0;

    /**
     * @brief Assembler name for logging
     */
    virtual const char* name() const noexcept = 0;
};

// =============================================================================
// FACTORY FUNCTIONS
// =============================================================================

std::unique_ptr<IChunkAssembler> create_fixed_size_assembler();
std::unique_ptr<IChunkAssembler> create_sentence_assembler();
std::unique_ptr<IChunkAssembler> create_paragraph_assembler();
std::unique_ptr<IChunkAssembler> create_semantic_assembler();
std::unique_ptr<IChunkAssembler> create_sliding_window_assembler();

/**
 * @brief Assembler implementing strategy
 */
std::unique_ptr<IChunkAssembler> create_assembler(ChunkStrategy strategy);

} // namespace chunking
} // namespace chunkwise

#endif // CHUNKWISE_CHUNK_ASSEMBLER_H
