/**
 * @file text_splitters.h
 * @brief Boundary splitters: sentences, paragraphs, words
 */

#ifndef CHUNKWISE_TEXT_SPLITTERS_H
#define CHUNKWISE_TEXT_SPLITTERS_H

#include <string_view>
#include <vector>

#include "chunk_types.h"
#include "utf8_text.h"

namespace chunkwise {
namespace chunking {

/**
 * @brief Sentence spans of text, trimmed and non-empty
 *
 * A sentence ends at '.', '!' or '?' followed by whitespace and an
 * uppercase letter, or followed only by whitespace up to the end of text.
 * Text without any such terminator comes back as one span.
 */
std::vector<std::string_view> sentence_spans(std::string_view text);

/**
 * @brief Paragraph spans separated by blank lines, trimmed and non-empty
 */
std::vector<std::string_view> paragraph_spans(std::string_view text);

/**
 * @brief Split a whole document into sentence units
 */
std::vector<AtomicUnit> split_sentences(const Utf8Text& document);

/**
 * @brief Split part of a document into sentence units
 *
 * @param span View into document.bytes()
 * @param group Value stored in AtomicUnit::group
 */
std::vector<AtomicUnit> split_sentences(const Utf8Text& document, std::string_view span, size_t group);

std::vector<AtomicUnit> split_paragraphs(const Utf8Text& document);

/**
 * @brief Whitespace-delimited words; empty documents yield no units
 */
std::vector<AtomicUnit> split_words(const Utf8Text& document);

} // namespace chunking
} // namespace chunkwise

#endif // CHUNKWISE_TEXT_SPLITTERS_H
