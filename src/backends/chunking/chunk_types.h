/**
 * @file chunk_types.h
 * @brief Chunking data model
 */

#ifndef CHUNKWISE_CHUNK_TYPES_H
#define CHUNKWISE_CHUNK_TYPES_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunkwise {
namespace chunking {

/**
 * @brief Segmentation strategy
 */
enum class ChunkStrategy {
    FixedSize,
    Sentence,
    Paragraph,
    Semantic,
    SlidingWindow
};

/**
 * @brief Kind of atomic unit produced by a boundary splitter
 */
enum class UnitKind {
    Sentence,
    Paragraph,
    Word
};

/**
 * @brief Smallest span a splitter produces
 *
 * text views into the document being chunked and is only valid while that
 * document is.
 */
struct AtomicUnit {
    std::string_view text;
    UnitKind kind = UnitKind::Sentence;
    size_t index = 0;              // Position in the splitter output
    size_t group = 0;              // Source paragraph for sentence fragments
    size_t estimated_tokens = 0;
    size_t character_count = 0;    // Grapheme clusters
};

/**
 * @brief Inclusive, 1-based range of contributing units
 */
struct UnitRange {
    size_t first = 0;
    size_t last = 0;
};

/**
 * @brief Half-open grapheme offsets [start, end) into the source document
 */
struct CharRange {
    size_t start = 0;
    size_t end = 0;
};

/**
 * @brief One chunk produced by an assembler
 */
struct ChunkRecord {
    size_t sequence_index = 0;     // 1-based
    std::string text;              // Trimmed
    size_t estimated_tokens = 0;
    size_t character_count = 0;
    size_t unit_count = 0;
    std::optional<UnitRange> unit_range;
    std::optional<CharRange> char_range;
    ChunkStrategy strategy = ChunkStrategy::FixedSize;

    // Strategy-specific quality fields
    std::optional<double> completeness;
    std::optional<double> coherence;
    std::optional<double> coherence_score;
    std::optional<double> semantic_density;
    std::vector<std::string> topic_keywords;
    std::optional<size_t> overlap_tokens;
    std::optional<int> overlap_percentage;
};

/**
 * @brief Chunking configuration
 *
 * Sizes are in characters for the fixed-size, sentence and paragraph
 * strategies and in estimated tokens for semantic and sliding-window.
 */
struct ChunkerConfig {
    ChunkStrategy strategy = ChunkStrategy::Sentence;
    int chunk_size = 512;
    int chunk_overlap = 50;

    /**
     * @brief Configuration carrying the catalog defaults of a strategy
     */
    static ChunkerConfig for_strategy(ChunkStrategy strategy);
};

/**
 * @brief Aggregate metrics over one chunking run
 */
struct ChunkingMetrics {
    size_t total_chunks = 0;
    double average_tokens = 0.0;
    size_t min_tokens = 0;
    size_t max_tokens = 0;
    double average_characters = 0.0;
    size_t min_characters = 0;
    size_t max_characters = 0;
    size_t total_characters = 0;        // Document length in grapheme clusters
    size_t estimated_document_tokens = 0;
    double average_quality = 0.0;
    double size_consistency = 0.0;
    double overlap_efficiency = 0.0;    // Percent
    double processing_time_ms = 0.0;
};

/**
 * @brief Chunks plus their metrics and reporting insights
 */
struct ChunkingResult {
    std::vector<ChunkRecord> chunks;
    ChunkingMetrics metrics;
    std::vector<std::string> insights;
};

} // namespace chunking
} // namespace chunkwise

#endif // CHUNKWISE_CHUNK_TYPES_H
