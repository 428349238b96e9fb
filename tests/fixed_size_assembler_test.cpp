/**
 * @file fixed_size_assembler_test.cpp
 * @brief Unit tests for fixed-size windows
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "chunk_assembler.h"

namespace chunkwise::chunking {

class FixedSizeAssemblerTest : public ::testing::Test {
protected:
    FixedSizeAssemblerTest() : assembler_(create_fixed_size_assembler()) {}

    std::vector<ChunkRecord> run(const std::string& text, int size, int overlap) const {
        const Utf8Text document(text);
        return assembler_->assemble(document, size, overlap);
    }

    std::unique_ptr<IChunkAssembler> assembler_;
};

// ============================================================================
// Window Placement
// ============================================================================

TEST_F(FixedSizeAssemblerTest, ReportsStrategy) {
    EXPECT_EQ(assembler_->strategy(), ChunkStrategy::FixedSize);
    EXPECT_STREQ(assembler_->name(), "fixed-size");
}

TEST_F(FixedSizeAssemblerTest, ContiguousWindowsWithoutOverlap) {
    const auto chunks = run(std::string(1000, 'a'), 100, 0);
    ASSERT_EQ(chunks.size(), 10ul);
    for (size_t i = 0; i < chunks.size(); ++i) {
        ASSERT_TRUE(chunks[i].char_range.has_value());
        EXPECT_EQ(chunks[i].char_range->start, i * 100);
        EXPECT_EQ(chunks[i].char_range->end, (i + 1) * 100);
        EXPECT_EQ(chunks[i].character_count, 100ul);
        EXPECT_EQ(chunks[i].strategy, ChunkStrategy::FixedSize);
    }
}

TEST_F(FixedSizeAssemblerTest, MaximalOverlapAdvancesOneCluster) {
    const auto chunks = run(std::string(1000, 'a'), 100, 99);
    ASSERT_EQ(chunks.size(), 901ul);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].char_range->start, i);
    }
    EXPECT_EQ(chunks.back().char_range->end, 1000ul);
}

TEST_F(FixedSizeAssemblerTest, ShortTextIsOneChunk) {
    const auto chunks = run("  short text  ", 100, 10);
    ASSERT_EQ(chunks.size(), 1ul);
    EXPECT_EQ(chunks[0].text, "short text");
    EXPECT_EQ(chunks[0].unit_count, 2ul);
}

// ============================================================================
// Word Boundaries
// ============================================================================

TEST_F(FixedSizeAssemblerTest, EdgeInsideWordMovesBackToLateWhitespace) {
    const auto chunks = run("abcdefghi jklmnop", 11, 0);
    ASSERT_EQ(chunks.size(), 2ul);
    EXPECT_EQ(chunks[0].text, "abcdefghi");
    EXPECT_EQ(chunks[0].char_range->end, 9ul);
    EXPECT_EQ(chunks[1].text, "jklmnop");
    EXPECT_EQ(chunks[1].char_range->start, 9ul);
}

TEST_F(FixedSizeAssemblerTest, EarlyWhitespaceDoesNotShortenWindow) {
    const auto chunks = run("ab cdefghijklmnop", 10, 0);
    ASSERT_EQ(chunks.size(), 2ul);
    EXPECT_EQ(chunks[0].text, "ab cdefghi");
    EXPECT_EQ(chunks[1].text, "jklmnop");
}

TEST_F(FixedSizeAssemblerTest, OverlapStartSnapsAfterWhitespace) {
    const auto chunks = run("alpha beta gamma delta epsilon zeta eta theta", 18, 5);
    ASSERT_GE(chunks.size(), 2ul);
    EXPECT_EQ(chunks[0].text, "alpha beta gamma");
    EXPECT_EQ(chunks[0].char_range->end, 16ul);
    // 16 - 5 = 11 is already a word start
    EXPECT_EQ(chunks[1].char_range->start, 11ul);
    EXPECT_EQ(chunks[1].text.rfind("gamma", 0), 0ul);
}

TEST_F(FixedSizeAssemblerTest, StartsStrictlyIncrease) {
    std::string text;
    for (int i = 0; i < 50; ++i) {
        text += "word" + std::to_string(i) + " ";
    }
    const auto chunks = run(text, 30, 25);
    ASSERT_GE(chunks.size(), 2ul);
    for (size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_GT(chunks[i].char_range->start, chunks[i - 1].char_range->start);
        EXPECT_LE(chunks[i].char_range->start, chunks[i - 1].char_range->end);
    }
}

// ============================================================================
// Multi-byte Safety
// ============================================================================

TEST_F(FixedSizeAssemblerTest, NeverSplitsCombiningSequences) {
    std::string text;
    for (int i = 0; i < 30; ++i) {
        text += "e\xCC\x81";
    }
    const auto chunks = run(text, 7, 0);
    ASSERT_EQ(chunks.size(), 5ul);
    EXPECT_EQ(chunks[0].character_count, 7ul);
    EXPECT_EQ(chunks[0].text.size(), 21ul);
    EXPECT_EQ(chunks.back().character_count, 2ul);
}

TEST_F(FixedSizeAssemblerTest, NeverSplitsEmojiSequences) {
    const std::string family =
        "\xF0\x9F\x91\xA8\xE2\x80\x8D\xF0\x9F\x91\xA9\xE2\x80\x8D\xF0\x9F\x91\xA7";
    const auto chunks = run(family + family + family + family + family, 2, 0);
    ASSERT_EQ(chunks.size(), 3ul);
    EXPECT_EQ(chunks[0].text, family + family);
    EXPECT_EQ(chunks[2].text, family);
}

TEST_F(FixedSizeAssemblerTest, HangulWindows) {
    // 4 syllables, window of 3
    const auto chunks = run("\xED\x95\x9C\xEA\xB5\xAD\xEC\x96\xB4\xEC\x9A\x94", 3, 0);
    ASSERT_EQ(chunks.size(), 2ul);
    EXPECT_EQ(chunks[0].text, "\xED\x95\x9C\xEA\xB5\xAD\xEC\x96\xB4");
    EXPECT_EQ(chunks[1].text, "\xEC\x9A\x94");
}

} // namespace chunkwise::chunking
