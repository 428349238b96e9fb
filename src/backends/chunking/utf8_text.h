/**
 * @file utf8_text.h
 * @brief UTF-8 validation, code point classification and grapheme indexing
 *
 * Every splitter and assembler works on validated UTF-8. Positions that are
 * user-visible ("characters") are grapheme clusters as defined by ICU's
 * character break rules, so no cut ever lands inside a multi-byte or
 * multi-codepoint character.
 */

#ifndef CHUNKWISE_UTF8_TEXT_H
#define CHUNKWISE_UTF8_TEXT_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace chunkwise {
namespace chunking {

/**
 * @brief Thrown when a document is not valid UTF-8
 *
 * This is a caller contract violation, not a data condition.
 */
class InvalidTextError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

namespace utf8 {

/**
 * @brief Visit every code point of text
 *
 * visitor(byte_offset, byte_length, code_point). Ill-formed sequences are
 * reported with a negative code point.
 */
template <typename Visitor>
void for_each_code_point(std::string_view text, Visitor&& visitor) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int64_t length = static_cast<int64_t>(text.size());
    int64_t i = 0;
    while (i < length) {
        const int64_t start = i;
        UChar32 c = 0;
        U8_NEXT(bytes, i, length, c);
        visitor(static_cast<size_t>(start), static_cast<size_t>(i - start), c);
    }
}

bool is_valid(std::string_view text) noexcept;

bool is_word_char(UChar32 c) noexcept;
bool is_space(UChar32 c) noexcept;
bool is_upper(UChar32 c) noexcept;
bool is_punctuation(UChar32 c) noexcept;
bool is_sentence_terminator(UChar32 c) noexcept;

/**
 * @brief True for code points that join the preceding cluster
 *        (Extend, ZWJ and SpacingMark)
 */
bool extends_cluster(UChar32 c) noexcept;

/**
 * @brief Strip leading and trailing whitespace clusters
 *
 * A whitespace code point carrying a combining mark is a visible cluster
 * and is kept whole.
 */
std::string_view trim(std::string_view text) noexcept;
bool is_blank(std::string_view text) noexcept;
std::string to_lower(std::string_view text);
size_t code_point_count(std::string_view text) noexcept;

/**
 * @brief Maximal runs of word code points (letters, digits, marks, '_')
 */
std::vector<std::string_view> word_tokens(std::string_view text);

/**
 * @brief Whitespace-delimited pieces; never contains empty pieces
 *
 * Pieces end only at cluster boundaries, as trim() does.
 */
std::vector<std::string_view> split_whitespace(std::string_view text);

/**
 * @brief Number of grapheme clusters in valid UTF-8 text
 */
size_t grapheme_count(std::string_view text);

} // namespace utf8

/**
 * @brief Grapheme-cluster index over a validated UTF-8 document
 *
 * Holds a view; the bytes must outlive the Utf8Text.
 */
class Utf8Text {
public:
    /**
     * @throws InvalidTextError if bytes are not valid UTF-8
     * @throws std::runtime_error if ICU cannot build a break iterator
     */
    explicit Utf8Text(std::string_view bytes);

    /// Number of grapheme clusters
    size_t size() const noexcept { return boundaries_.size() - 1; }
    bool empty() const noexcept { return size() == 0; }

    std::string_view bytes() const noexcept { return bytes_; }

    /// Bytes of clusters [first, last); indices are clamped to size()
    std::string_view slice(size_t first, size_t last) const noexcept;

    /// True if the cluster at index is whitespace only
    bool is_space(size_t index) const noexcept;

    /// Index of the last whitespace cluster in [first, last), or npos
    size_t find_last_space(size_t first, size_t last) const noexcept;

    /// Clusters starting inside span; span must view into bytes()
    size_t cluster_count(std::string_view span) const noexcept;

    static constexpr size_t npos = static_cast<size_t>(-1);

private:
    std::string_view bytes_;
    std::vector<size_t> boundaries_;
    std::vector<bool> spaces_;
};

} // namespace chunking
} // namespace chunkwise

#endif // CHUNKWISE_UTF8_TEXT_H
