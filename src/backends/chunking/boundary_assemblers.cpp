/**
 * @file boundary_assemblers.cpp
 * @brief Sentence-boundary and paragraph-boundary assembly
 *
 * Both strategies pack whole units into a chunk while the joined length
 * stays within chunk_size (grapheme clusters, separators included), and seed
 * the next chunk with the shortest trailing run of units reaching overlap.
 */

#include "chunk_assembler.h"
#include "quality_scorer.h"
#include "text_splitters.h"
#include "token_estimator.h"

#include <algorithm>

#include "cw/core/cw_logger.h"

#define LOG_TAG "Chunking.Boundary"
#define LOGD(...) CW_LOG_DEBUG(LOG_TAG, __VA_ARGS__)

namespace chunkwise {
namespace chunking {

namespace {

constexpr std::string_view kSentenceSeparator = " ";
constexpr std::string_view kParagraphSeparator = "\n\n";

// Units from the same group join with a space, others with a blank line
std::string_view separator_between(const AtomicUnit& a, const AtomicUnit& b) {
    return a.group == b.group ? kSentenceSeparator : kParagraphSeparator;
}

size_t joined_length(const std::vector<const AtomicUnit*>& units) {
    size_t length = 0;
    for (size_t i = 0; i < units.size(); ++i) {
        if (i > 0) {
            length += separator_between(*units[i - 1], *units[i]).size();
        }
        length += units[i]->character_count;
    }
    return length;
}

std::string join(const std::vector<const AtomicUnit*>& units) {
    std::string text;
    for (size_t i = 0; i < units.size(); ++i) {
        if (i > 0) {
            text.append(separator_between(*units[i - 1], *units[i]));
        }
        text.append(units[i]->text);
    }
    return text;
}

/**
 * @brief Greedy packing shared by the sentence and paragraph strategies
 *
 * @param emit Called with each finished buffer of units
 */
template <typename Emit>
void pack_units(const std::vector<AtomicUnit>& units, size_t chunk_size, size_t overlap, Emit&& emit) {
    std::vector<const AtomicUnit*> buffer;
    size_t length = 0;

    for (const auto& unit : units) {
        const size_t separator = buffer.empty() ? 0 : separator_between(*buffer.back(), unit).size();

        if (!buffer.empty() && length + separator + unit.character_count > chunk_size) {
            emit(buffer);

            // Shortest suffix whose joined length reaches overlap
            std::vector<const AtomicUnit*> carried;
            size_t carried_length = 0;
            if (overlap > 0) {
                size_t suffix_length = 0;
                for (size_t start = buffer.size(); start > 0; --start) {
                    const size_t first = start - 1;
                    if (first + 1 < buffer.size()) {
                        suffix_length += separator_between(*buffer[first], *buffer[first + 1]).size();
                    }
                    suffix_length += buffer[first]->character_count;
                    if (suffix_length >= overlap) {
                        carried.assign(buffer.begin() + static_cast<std::ptrdiff_t>(first), buffer.end());
                        carried_length = suffix_length;
                        break;
                    }
                }
            }
            buffer = std::move(carried);
            length = carried_length;
        }

        if (!buffer.empty()) {
            length += separator_between(*buffer.back(), unit).size();
        }
        buffer.push_back(&unit);
        length += unit.character_count;
    }

    if (!buffer.empty()) {
        emit(buffer);
    }
}

// =============================================================================
// SENTENCE BOUNDARY
// =============================================================================

class SentenceAssembler : public IChunkAssembler {
public:
    std::vector<ChunkRecord> assemble(
        const Utf8Text& document,
        int chunk_size,
        int overlap
    ) const override {
        const auto sentences = split_sentences(document);
        std::vector<ChunkRecord> chunks;

        pack_units(sentences, static_cast<size_t>(std::max(chunk_size, 1)),
                   static_cast<size_t>(std::max(overlap, 0)),
                   [&](const std::vector<const AtomicUnit*>& buffer) {
                       ChunkRecord chunk;
                       chunk.text = join(buffer);
                       chunk.estimated_tokens = estimate_tokens(chunk.text);
                       chunk.character_count = joined_length(buffer);
                       chunk.unit_count = buffer.size();
                       chunk.unit_range = UnitRange{buffer.front()->index + 1, buffer.back()->index + 1};
                       chunk.strategy = ChunkStrategy::Sentence;
                       chunk.completeness = sentence_completeness(chunk.text);
                       chunks.push_back(std::move(chunk));
                   });

        LOGD("Sentence pass: %zu sentences -> %zu chunks", sentences.size(), chunks.size());
        return chunks;
    }

    ChunkStrategy strategy() const noexcept override { return ChunkStrategy::Sentence; }

    const char* name() const noexcept override { return "sentence-boundary"; }
};

// =============================================================================
// PARAGRAPH BOUNDARY
// =============================================================================

class ParagraphAssembler : public IChunkAssembler {
public:
    std::vector<ChunkRecord> assemble(
        const Utf8Text& document,
        int chunk_size,
        int overlap
    ) const override {
        const size_t size = static_cast<size_t>(std::max(chunk_size, 1));
        const auto paragraphs = split_paragraphs(document);

        // Oversized paragraphs are packed sentence by sentence instead
        std::vector<AtomicUnit> units;
        size_t fragmented = 0;
        for (const auto& paragraph : paragraphs) {
            if (paragraph.character_count <= size) {
                units.push_back(paragraph);
                continue;
            }
            auto sentences = split_sentences(document, paragraph.text, paragraph.group);
            units.insert(units.end(), sentences.begin(), sentences.end());
            ++fragmented;
        }

        std::vector<ChunkRecord> chunks;
        pack_units(units, size, static_cast<size_t>(std::max(overlap, 0)),
                   [&](const std::vector<const AtomicUnit*>& buffer) {
                       ChunkRecord chunk;
                       chunk.text = join(buffer);
                       chunk.estimated_tokens = estimate_tokens(chunk.text);
                       chunk.character_count = joined_length(buffer);
                       chunk.unit_count = buffer.back()->group - buffer.front()->group + 1;
                       chunk.unit_range = UnitRange{buffer.front()->group + 1, buffer.back()->group + 1};
                       chunk.strategy = ChunkStrategy::Paragraph;
                       chunk.coherence = paragraph_coherence(chunk.text);
                       chunks.push_back(std::move(chunk));
                   });

        LOGD("Paragraph pass: %zu paragraphs (%zu split into sentences) -> %zu chunks",
             paragraphs.size(), fragmented, chunks.size());
        return chunks;
    }

    ChunkStrategy strategy() const noexcept override { return ChunkStrategy::Paragraph; }

    const char* name() const noexcept override { return "paragraph-boundary"; }
};

} // namespace

std::unique_ptr<IChunkAssembler> create_sentence_assembler() {
    return std::make_unique<SentenceAssembler>();
}

std::unique_ptr<IChunkAssembler> create_paragraph_assembler() {
    return std::make_unique<ParagraphAssembler>();
}

} // namespace chunking
} // namespace chunkwise
