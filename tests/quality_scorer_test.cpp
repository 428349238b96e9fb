/**
 * @file quality_scorer_test.cpp
 * @brief Unit tests for quality heuristics, run metrics and insights
 */

#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

#include "quality_scorer.h"

namespace chunkwise::chunking {

namespace {

ChunkRecord record(size_t tokens, size_t characters) {
    ChunkRecord chunk;
    chunk.estimated_tokens = tokens;
    chunk.character_count = characters;
    chunk.text = "x";
    return chunk;
}

std::vector<ChunkRecord> records(size_t count) {
    std::vector<ChunkRecord> chunks;
    for (size_t i = 0; i < count; ++i) {
        chunks.push_back(record(10, 40));
    }
    return chunks;
}

} // namespace

// ============================================================================
// Per-chunk Scores
// ============================================================================

TEST(QualityScorerTest, SentenceCompleteness) {
    EXPECT_DOUBLE_EQ(sentence_completeness("A. B!"), 1.0);
    EXPECT_DOUBLE_EQ(sentence_completeness("First one. Second one"), 0.5);
    EXPECT_DOUBLE_EQ(sentence_completeness("no terminator"), 0.0);
    EXPECT_DOUBLE_EQ(sentence_completeness(""), 0.0);
}

TEST(QualityScorerTest, ParagraphCoherence) {
    EXPECT_DOUBLE_EQ(paragraph_coherence("the the the cat"), 1.0);
    EXPECT_DOUBLE_EQ(paragraph_coherence("a a b c"), 0.75);
    EXPECT_DOUBLE_EQ(paragraph_coherence("alpha beta"), 0.0);
    EXPECT_DOUBLE_EQ(paragraph_coherence(""), 0.0);
    // Case-insensitive
    EXPECT_DOUBLE_EQ(paragraph_coherence("Word word"), 1.0);
}

TEST(QualityScorerTest, SemanticCoherence) {
    EXPECT_DOUBLE_EQ(semantic_coherence("red red blue"), 1.0);
    EXPECT_DOUBLE_EQ(semantic_coherence("apple apple pear plum grape kiwi"), 0.4);
    EXPECT_DOUBLE_EQ(semantic_coherence("cat dog"), 0.0);
    // Words shorter than three code points are ignored
    EXPECT_DOUBLE_EQ(semantic_coherence("ab ab ab"), 0.0);
}

TEST(QualityScorerTest, TopicKeywordsByFrequency) {
    EXPECT_EQ(topic_keywords("the data model and the data pipeline with model data"),
              (std::vector<std::string>{"data", "model", "pipeline"}));
}

TEST(QualityScorerTest, TopicKeywordsTiesKeepFirstAppearance) {
    EXPECT_EQ(topic_keywords("zeta alpha beta gamma delta omega"),
              (std::vector<std::string>{"zeta", "alpha", "beta", "gamma", "delta"}));
}

TEST(QualityScorerTest, TopicKeywordsAreLowercased) {
    EXPECT_EQ(topic_keywords("Data DATA data"), (std::vector<std::string>{"data"}));
}

TEST(QualityScorerTest, TopicKeywordsSkipStopwordsAndShortWords) {
    EXPECT_TRUE(topic_keywords("would could there their about which cat dog").empty());
    EXPECT_TRUE(is_stopword("because"));
    EXPECT_FALSE(is_stopword("chunk"));
}

TEST(QualityScorerTest, SemanticDensity) {
    EXPECT_DOUBLE_EQ(semantic_density("One two three. Four five six."), 0.15);

    std::string long_sentence;
    for (int i = 0; i < 40; ++i) {
        long_sentence += "word ";
    }
    EXPECT_DOUBLE_EQ(semantic_density(long_sentence), 1.0);
}

TEST(QualityScorerTest, SharedWordRun) {
    using Words = std::vector<std::string_view>;
    EXPECT_EQ(shared_word_run(Words{"a", "b", "c"}, Words{"b", "c", "d"}), 2ul);
    EXPECT_EQ(shared_word_run(Words{"a", "b"}, Words{"c"}), 0ul);
    EXPECT_EQ(shared_word_run(Words{"x", "x"}, Words{"x", "x"}), 2ul);
    EXPECT_EQ(shared_word_run(Words{}, Words{"a"}), 0ul);
}

// ============================================================================
// Average Quality
// ============================================================================

TEST(AverageQualityTest, MeansPresentFieldsAndTokenRatio) {
    auto chunk = record(50, 200);
    chunk.completeness = 1.0;
    // (1.0 + 50/100) / 2
    EXPECT_DOUBLE_EQ(calculate_average_quality({chunk}, 100), 0.75);
}

TEST(AverageQualityTest, OversizedChunkRatioIsInverted) {
    auto chunk = record(200, 800);
    EXPECT_DOUBLE_EQ(calculate_average_quality({chunk}, 100), 0.5);
}

TEST(AverageQualityTest, SkipsChunksWithoutAnyField) {
    auto scored = record(50, 200);
    scored.completeness = 1.0;
    const auto empty = record(0, 0);
    EXPECT_DOUBLE_EQ(calculate_average_quality({scored, empty}, 100), 0.75);
}

TEST(AverageQualityTest, EmptyIsZero) {
    EXPECT_DOUBLE_EQ(calculate_average_quality({}, 100), 0.0);
}

// ============================================================================
// Metrics Summary
// ============================================================================

TEST(MetricsSummaryTest, AggregatesChunkSizes) {
    const std::vector<ChunkRecord> chunks = {record(10, 40), record(20, 80), record(30, 120)};
    ChunkerConfig config;
    config.chunk_size = 100;
    config.chunk_overlap = 10;

    const auto metrics = summarize_metrics(chunks, 200, config, 1.5);
    EXPECT_EQ(metrics.total_chunks, 3ul);
    EXPECT_DOUBLE_EQ(metrics.average_tokens, 20.0);
    EXPECT_EQ(metrics.min_tokens, 10ul);
    EXPECT_EQ(metrics.max_tokens, 30ul);
    EXPECT_DOUBLE_EQ(metrics.average_characters, 80.0);
    EXPECT_EQ(metrics.min_characters, 40ul);
    EXPECT_EQ(metrics.max_characters, 120ul);
    EXPECT_EQ(metrics.total_characters, 200ul);
    EXPECT_EQ(metrics.estimated_document_tokens, 50ul);
    EXPECT_NEAR(metrics.size_consistency, 0.59175, 1e-4);
    EXPECT_DOUBLE_EQ(metrics.overlap_efficiency, 10.0);
    EXPECT_DOUBLE_EQ(metrics.processing_time_ms, 1.5);
}

TEST(MetricsSummaryTest, DocumentTokensRoundUp) {
    const auto metrics = summarize_metrics({}, 201, ChunkerConfig{}, 0.0);
    EXPECT_EQ(metrics.estimated_document_tokens, 51ul);
    EXPECT_EQ(metrics.total_chunks, 0ul);
    EXPECT_DOUBLE_EQ(metrics.overlap_efficiency, 0.0);
}

TEST(MetricsSummaryTest, NoOverlapMeansNoEfficiency) {
    ChunkerConfig config;
    config.chunk_overlap = 0;
    const auto metrics = summarize_metrics(records(4), 160, config, 0.0);
    EXPECT_DOUBLE_EQ(metrics.overlap_efficiency, 0.0);
    EXPECT_DOUBLE_EQ(metrics.size_consistency, 1.0);
}

// ============================================================================
// Insights
// ============================================================================

TEST(InsightsTest, EmptyRunHasNoInsights) {
    EXPECT_TRUE(strategy_insights({}, ChunkStrategy::Sentence).empty());
}

TEST(InsightsTest, ChunkCountVerdict) {
    EXPECT_NE(strategy_insights(records(2), ChunkStrategy::FixedSize).back().find("Very few chunks"),
              std::string::npos);
    EXPECT_NE(strategy_insights(records(25), ChunkStrategy::FixedSize).back().find("Many small chunks"),
              std::string::npos);

    const auto appropriate = strategy_insights(records(5), ChunkStrategy::FixedSize);
    EXPECT_NE(appropriate.back().find("(5 chunks)"), std::string::npos);
}

TEST(InsightsTest, FixedSizeReportsUniformity) {
    const auto insights = strategy_insights(records(5), ChunkStrategy::FixedSize);
    ASSERT_EQ(insights.size(), 4ul);
    EXPECT_EQ(insights[0], "Consistent 10 tokens per chunk (+/-0)");
    EXPECT_EQ(insights[2], "Excellent uniformity, well suited to batch processing");
}

TEST(InsightsTest, SemanticCountsUniqueKeywords) {
    auto first = record(10, 40);
    first.topic_keywords = {"alpha", "beta"};
    auto second = record(10, 40);
    second.topic_keywords = {"beta", "gamma"};

    const auto insights = strategy_insights({first, second}, ChunkStrategy::Semantic);
    ASSERT_GE(insights.size(), 3ul);
    EXPECT_EQ(insights[2], "3 unique topic keywords identified");
}

TEST(InsightsTest, SentenceReportsBoundaryPreservation) {
    auto first = record(10, 40);
    first.unit_count = 2;
    first.completeness = 1.0;
    auto second = record(10, 40);
    second.unit_count = 4;
    second.completeness = 0.5;

    const auto insights = strategy_insights({first, second}, ChunkStrategy::Sentence);
    ASSERT_GE(insights.size(), 3ul);
    EXPECT_EQ(insights[0], "Average of 3 sentences per chunk");
    EXPECT_EQ(insights[1], "75% sentence boundary preservation");
}

} // namespace chunkwise::chunking
