/**
 * @file quality_scorer.h
 * @brief Lexical chunk quality heuristics, run metrics and insights
 *
 * These are crude lexical proxies (repetition, punctuation, word counts),
 * not semantic measurements. Scores are in [0, 1].
 */

#ifndef CHUNKWISE_QUALITY_SCORER_H
#define CHUNKWISE_QUALITY_SCORER_H

#include <string>
#include <string_view>
#include <vector>

#include "chunk_types.h"

namespace chunkwise {
namespace chunking {

// =============================================================================
// PER-CHUNK SCORES
// =============================================================================

/**
 * @brief Fraction of sentences in text that end with '.', '!' or '?'
 */
double sentence_completeness(std::string_view text);

/**
 * @brief min(1, 3 * fraction of lowercased words that repeat an earlier word)
 */
double paragraph_coherence(std::string_view text);

/**
 * @brief min(1, 2 * share of distinct words (>= 3 code points) seen more than once)
 */
double semantic_coherence(std::string_view text);

/**
 * @brief Most frequent non-stopword words of at least 4 code points
 *
 * Lowercased; ties keep first-appearance order.
 */
std::vector<std::string> topic_keywords(std::string_view text, size_t limit = 5);

/**
 * @brief min(1, average words per sentence / 20)
 */
double semantic_density(std::string_view text);

/**
 * @brief True if lowercase word is in the fixed English stopword set
 */
bool is_stopword(std::string_view word);

/**
 * @brief Length of the longest word run that is a suffix of previous and a
 *        prefix of current
 */
size_t shared_word_run(
    const std::vector<std::string_view>& previous,
    const std::vector<std::string_view>& current
);

// =============================================================================
// RUN SUMMARY
// =============================================================================

/**
 * @brief Mean per-chunk quality
 *
 * Per chunk: mean of the present quality fields plus the token ratio
 * min(t/target, target/t). Chunks with no field are skipped.
 */
double calculate_average_quality(const std::vector<ChunkRecord>& chunks, int target_size);

/**
 * @brief Aggregate metrics for one run
 *
 * @param document_characters Document length in grapheme clusters
 * @param elapsed_ms Measured processing time
 */
ChunkingMetrics summarize_metrics(
    const std::vector<ChunkRecord>& chunks,
    size_t document_characters,
    const ChunkerConfig& config,
    double elapsed_ms
);

/**
 * @brief Human-readable observations about a run; reporting only
 */
std::vector<std::string> strategy_insights(
    const std::vector<ChunkRecord>& chunks,
    ChunkStrategy strategy
);

} // namespace chunking
} // namespace chunkwise

#endif // CHUNKWISE_QUALITY_SCORER_H
