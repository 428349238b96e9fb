#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include <unicode/brkiter.h>
#include <unicode/utext.h>

namespace chunkwise {
namespace chunking {

// RAII guard for UText - closes the text on scope exit
class UTextGuard {
public:
    UTextGuard() : text_(nullptr) {}

    ~UTextGuard() {
        if (text_) {
            utext_close(text_);
        }
    }

    UTextGuard(const UTextGuard&) = delete;
    UTextGuard& operator=(const UTextGuard&) = delete;

    // Open a read-only UTF-8 view over bytes; bytes must outlive the guard
    bool open_utf8(std::string_view bytes, UErrorCode& status) {
        reset();
        text_ = utext_openUTF8(nullptr, bytes.data(), static_cast<int64_t>(bytes.size()), &status);
        return U_SUCCESS(status) && text_ != nullptr;
    }

    UText* get() const { return text_; }

    void reset() {
        if (text_) {
            utext_close(text_);
        }
        text_ = nullptr;
    }

private:
    UText* text_;
};

// ICU break iterators are plain C++ objects owned by the caller
using BreakIteratorPtr = std::unique_ptr<icu::BreakIterator>;

} // namespace chunking
} // namespace chunkwise
