/**
 * @file text_splitters.cpp
 * @brief Boundary splitter implementation
 *
 * Explicit index scans over decoded code points; no regular expressions.
 */

#include "text_splitters.h"
#include "token_estimator.h"

namespace chunkwise {
namespace chunking {

namespace {

struct CodePoint {
    size_t offset;
    size_t length;
    UChar32 value;
};

std::vector<CodePoint> decode(std::string_view text) {
    std::vector<CodePoint> code_points;
    code_points.reserve(text.size());
    utf8::for_each_code_point(text, [&](size_t offset, size_t length, UChar32 c) {
        code_points.push_back(CodePoint{offset, length, c});
    });
    return code_points;
}

// Collects trimmed, non-empty pieces of text between cut points
class SpanCollector {
public:
    explicit SpanCollector(std::string_view text) : text_(text) {}

    void cut(size_t end, size_t next_start) {
        const auto piece = utf8::trim(text_.substr(start_, end - start_));
        if (!piece.empty()) {
            spans_.push_back(piece);
        }
        start_ = next_start;
    }

    std::vector<std::string_view> finish() {
        if (start_ < text_.size()) {
            cut(text_.size(), text_.size());
        }
        // Non-blank text always yields at least one unit
        if (spans_.empty() && !utf8::is_blank(text_)) {
            spans_.push_back(utf8::trim(text_));
        }
        return std::move(spans_);
    }

private:
    std::string_view text_;
    size_t start_ = 0;
    std::vector<std::string_view> spans_;
};

AtomicUnit make_unit(
    const Utf8Text& document,
    std::string_view span,
    UnitKind kind,
    size_t index,
    size_t group
) {
    AtomicUnit unit;
    unit.text = span;
    unit.kind = kind;
    unit.index = index;
    unit.group = group;
    unit.estimated_tokens = estimate_tokens(span);
    unit.character_count = document.cluster_count(span);
    return unit;
}

} // namespace

std::vector<std::string_view> sentence_spans(std::string_view text) {
    const auto code_points = decode(text);
    SpanCollector collector(text);

    for (size_t k = 0; k < code_points.size(); ++k) {
        if (!utf8::is_sentence_terminator(code_points[k].value)) {
            continue;
        }

        size_t next = k + 1;
        while (next < code_points.size() && utf8::is_space(code_points[next].value)) {
            ++next;
        }

        const bool at_end = next == code_points.size();
        const bool before_capital = next > k + 1 && !at_end && utf8::is_upper(code_points[next].value);
        if (at_end || before_capital) {
            const size_t end = code_points[k].offset + code_points[k].length;
            collector.cut(end, end);
        }
    }

    return collector.finish();
}

std::vector<std::string_view> paragraph_spans(std::string_view text) {
    const auto code_points = decode(text);
    SpanCollector collector(text);

    size_t k = 0;
    while (k < code_points.size()) {
        if (code_points[k].value != U'\n') {
            ++k;
            continue;
        }

        // A separator runs from this newline to the last newline of the
        // whitespace run that follows it
        size_t last_newline = k;
        size_t next = k + 1;
        while (next < code_points.size() && utf8::is_space(code_points[next].value)) {
            if (code_points[next].value == U'\n') {
                last_newline = next;
            }
            ++next;
        }

        if (last_newline == k) {
            k = next;
            continue;
        }

        collector.cut(
            code_points[k].offset,
            code_points[last_newline].offset + code_points[last_newline].length);
        k = last_newline + 1;
    }

    return collector.finish();
}

std::vector<AtomicUnit> split_sentences(const Utf8Text& document) {
    return split_sentences(document, document.bytes(), 0);
}

std::vector<AtomicUnit> split_sentences(const Utf8Text& document, std::string_view span, size_t group) {
    std::vector<AtomicUnit> units;
    for (const auto sentence : sentence_spans(span)) {
        units.push_back(make_unit(document, sentence, UnitKind::Sentence, units.size(), group));
    }
    return units;
}

std::vector<AtomicUnit> split_paragraphs(const Utf8Text& document) {
    std::vector<AtomicUnit> units;
    for (const auto paragraph : paragraph_spans(document.bytes())) {
        const size_t index = units.size();
        units.push_back(make_unit(document, paragraph, UnitKind::Paragraph, index, index));
    }
    return units;
}

std::vector<AtomicUnit> split_words(const Utf8Text& document) {
    std::vector<AtomicUnit> units;
    for (const auto word : utf8::split_whitespace(document.bytes())) {
        const size_t index = units.size();
        units.push_back(make_unit(document, word, UnitKind::Word, index, index));
    }
    return units;
}

} // namespace chunking
} // namespace chunkwise
