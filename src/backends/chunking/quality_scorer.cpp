/**
 * @file quality_scorer.cpp
 * @brief Quality heuristics and run summary
 */

#include "quality_scorer.h"
#include "text_splitters.h"
#include "utf8_text.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace chunkwise {
namespace chunking {

namespace {

const std::unordered_set<std::string_view>& stopwords() {
    static const std::unordered_set<std::string_view> words = {
        "the", "be", "to", "of", "and", "a", "in", "that", "have", "i", "it", "for",
        "not", "on", "with", "he", "as", "you", "do", "at", "this", "but", "his",
        "by", "from", "they", "she", "or", "an", "will", "my", "one", "all", "would",
        "there", "their", "what", "so", "up", "out", "if", "about", "who", "get",
        "which", "go", "me", "when", "make", "can", "like", "time", "no", "just",
        "him", "know", "take", "people", "into", "year", "your", "good", "some",
        "could", "them", "see", "other", "than", "then", "now", "look", "only",
        "come", "its", "over", "think", "also", "back", "after", "use", "two",
        "how", "our", "work", "first", "well", "way", "even", "new", "want",
        "because", "any", "these", "give", "day", "most", "us"
    };
    return words;
}

// Distinct lowercased words of at least min_length code points with their
// counts, in first-appearance order
struct WordFrequencies {
    std::vector<std::string> order;
    std::unordered_map<std::string, size_t> counts;
};

WordFrequencies count_words(const std::string& lowered, size_t min_length, bool skip_stopwords) {
    WordFrequencies freq;
    for (const auto word : utf8::word_tokens(lowered)) {
        if (utf8::code_point_count(word) < min_length) {
            continue;
        }
        if (skip_stopwords && is_stopword(word)) {
            continue;
        }
        auto [it, inserted] = freq.counts.emplace(std::string(word), 0);
        if (inserted) {
            freq.order.push_back(it->first);
        }
        ++it->second;
    }
    return freq;
}

template <typename Getter>
double mean_of(const std::vector<ChunkRecord>& chunks, Getter&& get) {
    double sum = 0.0;
    size_t count = 0;
    for (const auto& chunk : chunks) {
        const auto value = get(chunk);
        if (value) {
            sum += static_cast<double>(*value);
            ++count;
        }
    }
    return count > 0 ? sum / static_cast<double>(count) : 0.0;
}

long percent(double fraction) {
    return std::lround(fraction * 100.0);
}

} // namespace

// =============================================================================
// PER-CHUNK SCORES
// =============================================================================

double sentence_completeness(std::string_view text) {
    const auto sentences = sentence_spans(text);
    if (sentences.empty()) {
        return 0.0;
    }
    size_t complete = 0;
    for (const auto sentence : sentences) {
        const char last = sentence.back();
        if (last == '.' || last == '!' || last == '?') {
            ++complete;
        }
    }
    return static_cast<double>(complete) / static_cast<double>(sentences.size());
}

double paragraph_coherence(std::string_view text) {
    const std::string lowered = utf8::to_lower(text);
    const auto words = utf8::word_tokens(lowered);
    if (words.empty()) {
        return 0.0;
    }
    const std::unordered_set<std::string_view> unique(words.begin(), words.end());
    const double repetition =
        static_cast<double>(words.size() - unique.size()) / static_cast<double>(words.size());
    return std::min(1.0, repetition * 3.0);
}

double semantic_coherence(std::string_view text) {
    const auto freq = count_words(utf8::to_lower(text), 3, false);
    size_t repeated = 0;
    for (const auto& entry : freq.counts) {
        if (entry.second > 1) {
            ++repeated;
        }
    }
    const size_t distinct = std::max<size_t>(1, freq.counts.size());
    return std::min(1.0, static_cast<double>(repeated) / static_cast<double>(distinct) * 2.0);
}

std::vector<std::string> topic_keywords(std::string_view text, size_t limit) {
    auto freq = count_words(utf8::to_lower(text), 4, true);
    std::stable_sort(freq.order.begin(), freq.order.end(),
                     [&](const std::string& a, const std::string& b) {
                         return freq.counts.at(a) > freq.counts.at(b);
                     });
    if (freq.order.size() > limit) {
        freq.order.resize(limit);
    }
    return freq.order;
}

double semantic_density(std::string_view text) {
    const auto sentences = sentence_spans(text);
    size_t words = 0;
    for (const auto sentence : sentences) {
        words += utf8::word_tokens(sentence).size();
    }
    const double average =
        static_cast<double>(words) / static_cast<double>(std::max<size_t>(1, sentences.size()));
    return std::min(1.0, average / 20.0);
}

bool is_stopword(std::string_view word) {
    return stopwords().count(word) > 0;
}

size_t shared_word_run(
    const std::vector<std::string_view>& previous,
    const std::vector<std::string_view>& current
) {
    const size_t limit = std::min(previous.size(), current.size());
    for (size_t length = limit; length > 0; --length) {
        if (std::equal(previous.end() - static_cast<std::ptrdiff_t>(length), previous.end(),
                       current.begin())) {
            return length;
        }
    }
    return 0;
}

// =============================================================================
// RUN SUMMARY
// =============================================================================

double calculate_average_quality(const std::vector<ChunkRecord>& chunks, int target_size) {
    double total = 0.0;
    size_t scored = 0;

    for (const auto& chunk : chunks) {
        double quality = 0.0;
        size_t fields = 0;

        for (const auto& field : {chunk.completeness, chunk.coherence,
                                  chunk.coherence_score, chunk.semantic_density}) {
            if (field) {
                quality += *field;
                ++fields;
            }
        }

        if (chunk.estimated_tokens > 0 && target_size > 0) {
            const double ratio = static_cast<double>(chunk.estimated_tokens) / target_size;
            quality += std::min(ratio, 1.0 / ratio);
            ++fields;
        }

        if (fields > 0) {
            total += quality / static_cast<double>(fields);
            ++scored;
        }
    }

    return scored > 0 ? total / static_cast<double>(scored) : 0.0;
}

ChunkingMetrics summarize_metrics(
    const std::vector<ChunkRecord>& chunks,
    size_t document_characters,
    const ChunkerConfig& config,
    double elapsed_ms
) {
    ChunkingMetrics metrics;
    metrics.total_chunks = chunks.size();
    metrics.total_characters = document_characters;
    metrics.estimated_document_tokens = (document_characters + 3) / 4;
    metrics.processing_time_ms = elapsed_ms;

    if (chunks.empty()) {
        return metrics;
    }

    size_t token_sum = 0;
    size_t char_sum = 0;
    metrics.min_tokens = chunks.front().estimated_tokens;
    metrics.min_characters = chunks.front().character_count;
    for (const auto& chunk : chunks) {
        token_sum += chunk.estimated_tokens;
        char_sum += chunk.character_count;
        metrics.min_tokens = std::min(metrics.min_tokens, chunk.estimated_tokens);
        metrics.max_tokens = std::max(metrics.max_tokens, chunk.estimated_tokens);
        metrics.min_characters = std::min(metrics.min_characters, chunk.character_count);
        metrics.max_characters = std::max(metrics.max_characters, chunk.character_count);
    }

    const double count = static_cast<double>(chunks.size());
    metrics.average_tokens = static_cast<double>(token_sum) / count;
    metrics.average_characters = static_cast<double>(char_sum) / count;

    double variance = 0.0;
    for (const auto& chunk : chunks) {
        const double delta = static_cast<double>(chunk.estimated_tokens) - metrics.average_tokens;
        variance += delta * delta;
    }
    variance /= count;
    if (metrics.average_tokens > 0.0) {
        metrics.size_consistency = std::max(0.0, 1.0 - std::sqrt(variance) / metrics.average_tokens);
    }

    if (config.chunk_overlap > 0 && document_characters > 0) {
        metrics.overlap_efficiency = (count - 1.0) * config.chunk_overlap /
                                     static_cast<double>(document_characters) * 100.0;
    }

    metrics.average_quality = calculate_average_quality(chunks, config.chunk_size);
    return metrics;
}

std::vector<std::string> strategy_insights(
    const std::vector<ChunkRecord>& chunks,
    ChunkStrategy strategy
) {
    std::vector<std::string> insights;
    if (chunks.empty()) {
        return insights;
    }

    const double count = static_cast<double>(chunks.size());
    double average_tokens = 0.0;
    for (const auto& chunk : chunks) {
        average_tokens += static_cast<double>(chunk.estimated_tokens);
    }
    average_tokens /= count;

    double variance = 0.0;
    for (const auto& chunk : chunks) {
        const double delta = static_cast<double>(chunk.estimated_tokens) - average_tokens;
        variance += delta * delta;
    }
    const double spread = std::sqrt(variance / count);
    const double consistency = average_tokens > 0.0 ? std::max(0.0, 1.0 - spread / average_tokens) : 0.0;

    const auto units = [](const ChunkRecord& c) {
        return c.unit_count > 0 ? std::optional<size_t>(c.unit_count) : std::nullopt;
    };

    switch (strategy) {
        case ChunkStrategy::Sentence: {
            insights.push_back("Average of " + std::to_string(std::lround(mean_of(chunks, units))) +
                               " sentences per chunk");
            const double completeness =
                mean_of(chunks, [](const ChunkRecord& c) { return c.completeness; });
            insights.push_back(std::to_string(percent(completeness)) + "% sentence boundary preservation");
            const std::string pct = std::to_string(percent(consistency)) + "%";
            if (consistency > 0.8) {
                insights.push_back("Excellent consistency across chunks (" + pct + ")");
            } else if (consistency > 0.6) {
                insights.push_back("Good consistency with some size variation (" + pct + ")");
            } else {
                insights.push_back("High size variation, consider adjusting parameters (" + pct + ")");
            }
            break;
        }

        case ChunkStrategy::Paragraph: {
            insights.push_back("Average of " + std::to_string(std::lround(mean_of(chunks, units))) +
                               " paragraphs per chunk");
            const double coherence = mean_of(chunks, [](const ChunkRecord& c) { return c.coherence; });
            insights.push_back(std::to_string(percent(coherence)) + "% content coherence score");
            insights.push_back("Well suited to documents with clear paragraph structure");
            break;
        }

        case ChunkStrategy::Semantic: {
            const double coherence =
                mean_of(chunks, [](const ChunkRecord& c) { return c.coherence_score; });
            const double density =
                mean_of(chunks, [](const ChunkRecord& c) { return c.semantic_density; });
            insights.push_back(std::to_string(percent(coherence)) + "% semantic coherence score");
            insights.push_back(std::to_string(percent(density)) + "% information density");

            std::unordered_set<std::string> keywords;
            for (const auto& chunk : chunks) {
                keywords.insert(chunk.topic_keywords.begin(), chunk.topic_keywords.end());
            }
            insights.push_back(std::to_string(keywords.size()) + " unique topic keywords identified");
            break;
        }

        case ChunkStrategy::SlidingWindow: {
            const double overlap = mean_of(chunks, [](const ChunkRecord& c) {
                return c.overlap_percentage && *c.overlap_percentage > 0 ? c.overlap_percentage
                                                                         : std::nullopt;
            });
            insights.push_back("Average " + std::to_string(std::lround(overlap)) +
                               "% overlap between adjacent chunks");
            insights.push_back(std::to_string(chunks.size()) +
                               " overlapping windows maximize information retention");
            insights.push_back("Ideal for comprehensive coverage and context preservation");
            break;
        }

        case ChunkStrategy::FixedSize:
            insights.push_back("Consistent " + std::to_string(std::lround(average_tokens)) +
                               " tokens per chunk (+/-" + std::to_string(std::lround(spread)) + ")");
            insights.push_back("Predictable sizes allow efficient processing and storage");
            if (consistency > 0.9) {
                insights.push_back("Excellent uniformity, well suited to batch processing");
            } else {
                insights.push_back("Some variation from word boundaries, as expected");
            }
            break;
    }

    if (chunks.size() < 3) {
        insights.push_back("Very few chunks: consider a smaller chunk size for finer-grained retrieval");
    } else if (chunks.size() > 20) {
        insights.push_back("Many small chunks: consider a larger chunk size for efficiency");
    } else {
        insights.push_back("Appropriate chunk count for effective retrieval (" +
                           std::to_string(chunks.size()) + " chunks)");
    }

    return insights;
}

} // namespace chunking
} // namespace chunkwise
