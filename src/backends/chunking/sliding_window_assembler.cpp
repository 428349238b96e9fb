/**
 * @file sliding_window_assembler.cpp
 * @brief Overlapping word windows bounded by estimated tokens
 *
 * Overlap is approximated in words: the next window steps back a number of
 * words proportional to overlap / window tokens, so the token overlap that
 * results is close to, not exactly, the requested one. The overlap actually
 * achieved is reported per chunk.
 */

#include "chunk_assembler.h"
#include "quality_scorer.h"
#include "text_splitters.h"
#include "token_estimator.h"

#include <algorithm>
#include <cmath>

#include "cw/core/cw_logger.h"

#define LOG_TAG "Chunking.Sliding"
#define LOGD(...) CW_LOG_DEBUG(LOG_TAG, __VA_ARGS__)

namespace chunkwise {
namespace chunking {

namespace {

// Windows below this share of the target are dropped unless they cover new words
constexpr double kMinimumFill = 0.3;
// Never step back over more than this share of a window's tokens
constexpr double kMaxOverlapShare = 0.8;

class SlidingWindowAssembler : public IChunkAssembler {
public:
    std::vector<ChunkRecord> assemble(
        const Utf8Text& document,
        int chunk_size,
        int overlap
    ) const override {
        const size_t size = static_cast<size_t>(std::max(chunk_size, 1));
        const size_t overlap_tokens = static_cast<size_t>(std::max(overlap, 0));
        const size_t minimum_tokens = static_cast<size_t>(std::floor(kMinimumFill * static_cast<double>(size)));
        const auto words = split_words(document);

        std::vector<ChunkRecord> chunks;
        std::vector<std::string_view> previous_words;
        size_t covered_end = 0;
        size_t start = 0;

        while (start < words.size()) {
            size_t end = start;
            size_t tokens = 0;
            while (end < words.size()) {
                const size_t next_tokens = words[end].estimated_tokens;
                if (end > start && tokens + next_tokens > size) {
                    break;
                }
                tokens += next_tokens;
                ++end;
            }
            const size_t count = end - start;

            if (tokens >= minimum_tokens || end > covered_end) {
                std::vector<std::string_view> window_words;
                window_words.reserve(count);
                for (size_t i = start; i < end; ++i) {
                    window_words.push_back(words[i].text);
                }

                // Source text from the first to the last word of the window
                const auto first = words[start].text;
                const auto last = words[end - 1].text;
                const std::string_view span(first.data(),
                                            static_cast<size_t>(last.data() + last.size() - first.data()));

                ChunkRecord chunk;
                chunk.text = std::string(span);
                chunk.estimated_tokens = tokens;
                chunk.character_count = document.cluster_count(span);
                chunk.unit_count = count;
                chunk.unit_range = UnitRange{start + 1, end};
                chunk.strategy = ChunkStrategy::SlidingWindow;
                chunk.completeness = std::min(1.0, static_cast<double>(tokens) / static_cast<double>(size));

                size_t shared_tokens = 0;
                if (!chunks.empty()) {
                    const size_t shared = shared_word_run(previous_words, window_words);
                    if (shared > 0) {
                        const auto shared_first = window_words.front();
                        const auto shared_last = window_words[shared - 1];
                        shared_tokens = estimate_tokens(std::string_view(
                            shared_first.data(),
                            static_cast<size_t>(shared_last.data() + shared_last.size() - shared_first.data())));
                    }
                }
                chunk.overlap_tokens = shared_tokens;
                chunk.overlap_percentage = tokens > 0
                    ? static_cast<int>(std::lround(static_cast<double>(shared_tokens) * 100.0 / static_cast<double>(tokens)))
                    : 0;

                chunks.push_back(std::move(chunk));
                previous_words = std::move(window_words);
                covered_end = std::max(covered_end, end);
            }

            if (end >= words.size()) {
                break;
            }

            size_t next = 0;
            if (overlap_tokens > 0 && tokens > overlap_tokens) {
                const size_t target = std::min(
                    overlap_tokens, static_cast<size_t>(std::floor(kMaxOverlapShare * static_cast<double>(tokens))));
                size_t step_back = count * target / tokens;
                step_back = std::max<size_t>(1, std::min(step_back, count - 1));
                next = end - step_back;
            } else {
                next = start + std::max<size_t>(1, count / 2);
            }
            start = std::max(next, start + 1);
        }

        LOGD("Sliding pass: %zu words -> %zu windows", words.size(), chunks.size());
        return chunks;
    }

    ChunkStrategy strategy() const noexcept override { return ChunkStrategy::SlidingWindow; }

    const char* name() const noexcept override { return "sliding-window"; }
};

} // namespace

std::unique_ptr<IChunkAssembler> create_sliding_window_assembler() {
    return std::make_unique<SlidingWindowAssembler>();
}

} // namespace chunking
} // namespace chunkwise
