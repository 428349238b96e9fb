/**
 * @file token_estimator.cpp
 * @brief Heuristic token counting implementation
 */

#include "token_estimator.h"
#include "utf8_text.h"

#include <algorithm>

namespace chunkwise {
namespace chunking {

namespace {

constexpr size_t kLongWordLength = 6;

bool is_numeric_word(std::string_view word) {
    bool numeric = true;
    utf8::for_each_code_point(word, [&](size_t, size_t, UChar32 c) {
        if (c < 0 || !u_isdigit(c)) {
            numeric = false;
        }
    });
    return numeric;
}

} // namespace

size_t estimate_tokens(std::string_view text) {
    if (text.empty()) {
        return 0;
    }

    size_t punctuation = 0;
    utf8::for_each_code_point(text, [&](size_t, size_t, UChar32 c) {
        if (utf8::is_punctuation(c)) {
            ++punctuation;
        }
    });

    size_t words = 0;
    size_t numbers = 0;
    size_t long_words = 0;
    for (const auto word : utf8::word_tokens(text)) {
        ++words;
        if (is_numeric_word(word)) {
            ++numbers;
        }
        if (utf8::code_point_count(word) > kLongWordLength) {
            ++long_words;
        }
    }

    size_t tokens = words;
    tokens += (punctuation * 2 + 4) / 5;   // ceil(punctuation / 2.5)
    tokens += (numbers * 7) / 10;          // floor(numbers * 0.7)
    tokens += (long_words * 3) / 10;       // floor(long_words * 0.3)

    return std::max<size_t>(1, tokens);
}

} // namespace chunking
} // namespace chunkwise
