/**
 * @file fixed_size_assembler.cpp
 * @brief Fixed-size windows over grapheme clusters
 */

#include "chunk_assembler.h"
#include "token_estimator.h"

#include <algorithm>

#include "cw/core/cw_logger.h"

#define LOG_TAG "Chunking.Fixed"
#define LOGD(...) CW_LOG_DEBUG(LOG_TAG, __VA_ARGS__)

namespace chunkwise {
namespace chunking {

namespace {

// Whitespace search radius around the overlap start
constexpr size_t kSnapRadius = 10;

class FixedSizeAssembler : public IChunkAssembler {
public:
    std::vector<ChunkRecord> assemble(
        const Utf8Text& document,
        int chunk_size,
        int overlap
    ) const override {
        const size_t n = document.size();
        const size_t size = static_cast<size_t>(std::max(chunk_size, 1));
        const size_t step_back = static_cast<size_t>(std::max(overlap, 0));

        std::vector<ChunkRecord> chunks;
        size_t start = 0;

        while (start < n) {
            size_t end = std::min(start + size, n);

            // Pull a full window's edge back to whitespace when it cuts a word
            if (end < n && !document.is_space(end - 1) && !document.is_space(end)) {
                const size_t last_space = document.find_last_space(start, end);
                if (last_space != Utf8Text::npos && (last_space - start) * 5 > size * 4) {
                    end = last_space;
                }
            }

            const auto text = utf8::trim(document.slice(start, end));
            if (!text.empty()) {
                ChunkRecord chunk;
                chunk.text = std::string(text);
                chunk.estimated_tokens = estimate_tokens(text);
                chunk.character_count = document.cluster_count(text);
                chunk.unit_count = utf8::split_whitespace(text).size();
                chunk.char_range = CharRange{start, end};
                chunk.strategy = ChunkStrategy::FixedSize;
                chunks.push_back(std::move(chunk));
            }

            if (end >= n) {
                break;
            }

            size_t next = end;
            if (step_back > 0) {
                next = end > step_back ? end - step_back : 0;
                next = snap_to_whitespace(document, next, start, end);
            }
            start = std::max(next, start + 1);
        }

        LOGD("Fixed-size pass: %zu clusters -> %zu chunks", n, chunks.size());
        return chunks;
    }

    ChunkStrategy strategy() const noexcept override { return ChunkStrategy::FixedSize; }

    const char* name() const noexcept override { return "fixed-size"; }

private:
    // Start just after the nearest whitespace within kSnapRadius of position,
    // looking forward first; the snapped start must stay in (start, end]
    static size_t snap_to_whitespace(const Utf8Text& document, size_t position, size_t start, size_t end) {
        for (size_t distance = 0; distance <= kSnapRadius; ++distance) {
            size_t found = Utf8Text::npos;
            if (document.is_space(position + distance)) {
                found = position + distance;
            } else if (distance <= position && document.is_space(position - distance)) {
                found = position - distance;
            }
            if (found != Utf8Text::npos) {
                const size_t snapped = found + 1;
                return (snapped > start && snapped <= end) ? snapped : position;
            }
        }
        return position;
    }
};

} // namespace

std::unique_ptr<IChunkAssembler> create_fixed_size_assembler() {
    return std::make_unique<FixedSizeAssembler>();
}

} // namespace chunking
} // namespace chunkwise
