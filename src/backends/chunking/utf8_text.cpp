/**
 * @file utf8_text.cpp
 * @brief UTF-8 helpers backed by ICU
 */

#include "utf8_text.h"
#include "backends/chunking/icu_guards.h"

#include <algorithm>
#include <string>

#include <unicode/locid.h>
#include <unicode/utypes.h>

namespace chunkwise {
namespace chunking {
namespace utf8 {

namespace {

// Controls (CR, LF, tab...) always end their cluster, marks included
bool accepts_marks(UChar32 c) noexcept {
    const int32_t gcb = u_getIntPropertyValue(c, UCHAR_GRAPHEME_CLUSTER_BREAK);
    return gcb != U_GCB_CR && gcb != U_GCB_LF && gcb != U_GCB_CONTROL;
}

} // namespace

bool is_valid(std::string_view text) noexcept {
    bool valid = true;
    for_each_code_point(text, [&](size_t, size_t, UChar32 c) {
        if (c < 0) {
            valid = false;
        }
    });
    return valid;
}

bool is_word_char(UChar32 c) noexcept {
    if (c < 0) {
        return false;
    }
    if (c == U'_' || u_isalnum(c)) {
        return true;
    }
    // Combining marks stay attached to the word they modify
    return (U_GET_GC_MASK(c) & U_GC_M_MASK) != 0;
}

bool is_space(UChar32 c) noexcept {
    return c >= 0 && u_isUWhiteSpace(c);
}

bool is_upper(UChar32 c) noexcept {
    return c >= 0 && (u_isupper(c) || u_istitle(c));
}

bool is_punctuation(UChar32 c) noexcept {
    return c >= 0 && u_ispunct(c) && !is_word_char(c);
}

bool is_sentence_terminator(UChar32 c) noexcept {
    return c == U'.' || c == U'!' || c == U'?';
}

bool extends_cluster(UChar32 c) noexcept {
    if (c < 0) {
        return false;
    }
    const int32_t gcb = u_getIntPropertyValue(c, UCHAR_GRAPHEME_CLUSTER_BREAK);
    return gcb == U_GCB_EXTEND || gcb == U_GCB_ZWJ || gcb == U_GCB_SPACING_MARK;
}

std::string_view trim(std::string_view text) noexcept {
    size_t first = text.size();
    size_t last = 0;
    // A whitespace code point followed by a mark starts a visible cluster
    size_t pending_space = std::string_view::npos;
    for_each_code_point(text, [&](size_t offset, size_t length, UChar32 c) {
        if (is_space(c)) {
            pending_space = accepts_marks(c) ? offset : std::string_view::npos;
            return;
        }
        if (first == text.size()) {
            first = pending_space != std::string_view::npos && extends_cluster(c) ? pending_space : offset;
        }
        pending_space = std::string_view::npos;
        last = offset + length;
    });
    if (first == text.size()) {
        return text.substr(0, 0);
    }
    return text.substr(first, last - first);
}

bool is_blank(std::string_view text) noexcept {
    return trim(text).empty();
}

std::string to_lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for_each_code_point(text, [&](size_t offset, size_t length, UChar32 c) {
        if (c < 0) {
            out.append(text.substr(offset, length));
            return;
        }
        const UChar32 lower = u_tolower(c);
        uint8_t buffer[U8_MAX_LENGTH];
        int32_t written = 0;
        U8_APPEND_UNSAFE(buffer, written, lower);
        out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(written));
    });
    return out;
}

size_t code_point_count(std::string_view text) noexcept {
    size_t count = 0;
    for_each_code_point(text, [&](size_t, size_t, UChar32) { ++count; });
    return count;
}

std::vector<std::string_view> word_tokens(std::string_view text) {
    std::vector<std::string_view> words;
    size_t run_start = std::string_view::npos;
    for_each_code_point(text, [&](size_t offset, size_t, UChar32 c) {
        if (is_word_char(c)) {
            if (run_start == std::string_view::npos) {
                run_start = offset;
            }
        } else if (run_start != std::string_view::npos) {
            words.push_back(text.substr(run_start, offset - run_start));
            run_start = std::string_view::npos;
        }
    });
    if (run_start != std::string_view::npos) {
        words.push_back(text.substr(run_start));
    }
    return words;
}

std::vector<std::string_view> split_whitespace(std::string_view text) {
    std::vector<std::string_view> pieces;
    size_t run_start = std::string_view::npos;
    size_t pending_space = std::string_view::npos;
    for_each_code_point(text, [&](size_t offset, size_t, UChar32 c) {
        if (is_space(c)) {
            if (run_start != std::string_view::npos) {
                pieces.push_back(text.substr(run_start, offset - run_start));
                run_start = std::string_view::npos;
            }
            pending_space = accepts_marks(c) ? offset : std::string_view::npos;
            return;
        }
        if (run_start == std::string_view::npos) {
            run_start = pending_space != std::string_view::npos && extends_cluster(c) ? pending_space : offset;
        }
        pending_space = std::string_view::npos;
    });
    if (run_start != std::string_view::npos) {
        pieces.push_back(text.substr(run_start));
    }
    return pieces;
}

size_t grapheme_count(std::string_view text) {
    return Utf8Text(text).size();
}

} // namespace utf8

Utf8Text::Utf8Text(std::string_view bytes) : bytes_(bytes) {
    if (!utf8::is_valid(bytes)) {
        throw InvalidTextError("text is not valid UTF-8");
    }
    if (bytes.size() > static_cast<size_t>(INT32_MAX)) {
        throw InvalidTextError("text larger than 2 GiB is not supported");
    }

    boundaries_.push_back(0);
    if (bytes.empty()) {
        return;
    }

    UErrorCode status = U_ZERO_ERROR;
    UTextGuard text;
    if (!text.open_utf8(bytes, status)) {
        throw std::runtime_error(std::string("utext_openUTF8 failed: ") + u_errorName(status));
    }

    BreakIteratorPtr clusters(
        icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
    if (U_FAILURE(status) || !clusters) {
        throw std::runtime_error(
            std::string("Failed to create character break iterator: ") + u_errorName(status));
    }

    clusters->setText(text.get(), status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("BreakIterator::setText failed: ") + u_errorName(status));
    }

    // first() is always 0, already recorded
    for (int32_t pos = clusters->next(); pos != icu::BreakIterator::DONE; pos = clusters->next()) {
        boundaries_.push_back(static_cast<size_t>(pos));
    }
    if (boundaries_.back() != bytes.size()) {
        boundaries_.push_back(bytes.size());
    }

    spaces_.reserve(boundaries_.size() - 1);
    for (size_t i = 0; i + 1 < boundaries_.size(); ++i) {
        spaces_.push_back(utf8::is_blank(bytes.substr(boundaries_[i], boundaries_[i + 1] - boundaries_[i])));
    }
}

std::string_view Utf8Text::slice(size_t first, size_t last) const noexcept {
    const size_t n = size();
    if (last > n) {
        last = n;
    }
    if (first >= last) {
        return bytes_.substr(0, 0);
    }
    return bytes_.substr(boundaries_[first], boundaries_[last] - boundaries_[first]);
}

bool Utf8Text::is_space(size_t index) const noexcept {
    return index < spaces_.size() && spaces_[index];
}

size_t Utf8Text::find_last_space(size_t first, size_t last) const noexcept {
    if (last > size()) {
        last = size();
    }
    for (size_t i = last; i > first; --i) {
        if (spaces_[i - 1]) {
            return i - 1;
        }
    }
    return npos;
}

size_t Utf8Text::cluster_count(std::string_view span) const noexcept {
    if (span.empty() || span.data() < bytes_.data() ||
        span.data() + span.size() > bytes_.data() + bytes_.size()) {
        return 0;
    }
    const size_t first = static_cast<size_t>(span.data() - bytes_.data());
    const size_t last = first + span.size();
    const auto begin = std::lower_bound(boundaries_.begin(), boundaries_.end(), first);
    const auto end = std::lower_bound(boundaries_.begin(), boundaries_.end(), last);
    return static_cast<size_t>(end - begin);
}

} // namespace chunking
} // namespace chunkwise
