/**
 * @file token_estimator.h
 * @brief Heuristic token counting
 */

#ifndef CHUNKWISE_TOKEN_ESTIMATOR_H
#define CHUNKWISE_TOKEN_ESTIMATOR_H

#include <cstddef>
#include <string_view>

namespace chunkwise {
namespace chunking {

/**
 * @brief Approximate the token count of text without a tokenizer
 *
 * words + ceil(punctuation / 2.5) + floor(numeric_words * 0.7)
 *       + floor(long_words * 0.3), at least 1 for non-empty text.
 * Used as a sizing budget only; it is not a billing count.
 *
 * @return 0 for empty text
 */
size_t estimate_tokens(std::string_view text);

} // namespace chunking
} // namespace chunkwise

#endif // CHUNKWISE_TOKEN_ESTIMATOR_H
