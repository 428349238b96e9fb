/**
 * @file cw_chunking_api_test.cpp
 * @brief Tests for the document chunking C API
 */

#include <gtest/gtest.h>
#include <cstring>
#include <string>

#include <nlohmann/json.hpp>

#include "cw/core/cw_error.h"
#include "cw/core/cw_types.h"
#include "cw/features/chunking/cw_chunking.h"

namespace {

nlohmann::json take_json(char* raw) {
    const auto parsed = nlohmann::json::parse(raw);
    cw_free(raw);
    return parsed;
}

} // namespace

class ChunkingApiTest : public ::testing::Test {
protected:
    void TearDown() override {
        cw_chunk_result_free(&result_);
        cw_chunker_destroy(chunker_);
    }

    cw_chunker_t* chunker_ = nullptr;
    cw_chunk_result_t result_{};
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ChunkingApiTest, CreateWithDefaults) {
    const cw_chunking_config_t config = cw_chunking_config_default();
    EXPECT_STREQ(config.strategy, "sentence");
    EXPECT_EQ(config.chunk_size, 512);
    EXPECT_EQ(config.chunk_overlap, 50);

    ASSERT_EQ(cw_chunker_create(&config, &chunker_), CW_SUCCESS);
    ASSERT_NE(chunker_, nullptr);
}

TEST_F(ChunkingApiTest, NullArguments) {
    const cw_chunking_config_t config = cw_chunking_config_default();
    EXPECT_EQ(cw_chunker_create(nullptr, &chunker_), CW_ERROR_NULL_POINTER);
    EXPECT_EQ(cw_chunker_create(&config, nullptr), CW_ERROR_NULL_POINTER);
    EXPECT_EQ(cw_chunker_create_from_json(nullptr, &chunker_), CW_ERROR_NULL_POINTER);
    EXPECT_EQ(cw_chunker_chunk(nullptr, "text", &result_), CW_ERROR_NULL_POINTER);
    EXPECT_EQ(cw_chunking_get_strategies_json(nullptr), CW_ERROR_NULL_POINTER);

    ASSERT_EQ(cw_chunker_create(&config, &chunker_), CW_SUCCESS);
    EXPECT_EQ(cw_chunker_chunk(chunker_, nullptr, &result_), CW_ERROR_NULL_POINTER);
    EXPECT_EQ(cw_chunker_chunk(chunker_, "text", nullptr), CW_ERROR_NULL_POINTER);

    // Destroying and freeing NULL are no-ops
    cw_chunker_destroy(nullptr);
    cw_chunk_result_free(nullptr);
}

TEST_F(ChunkingApiTest, ConfigForStrategy) {
    const auto semantic = cw_chunking_config_for_strategy("semantic");
    EXPECT_STREQ(semantic.strategy, "semantic");
    EXPECT_EQ(semantic.chunk_size, 1024);
    EXPECT_EQ(semantic.chunk_overlap, 128);

    const auto unknown = cw_chunking_config_for_strategy("nonexistent");
    EXPECT_STREQ(unknown.strategy, "fixed");

    const auto missing = cw_chunking_config_for_strategy(nullptr);
    EXPECT_STREQ(missing.strategy, "sentence");
}

TEST_F(ChunkingApiTest, CreatedConfigurationIsClamped) {
    cw_chunking_config_t config = cw_chunking_config_default();
    config.strategy = "fixed";
    config.chunk_size = 0;
    config.chunk_overlap = 10;
    ASSERT_EQ(cw_chunker_create(&config, &chunker_), CW_SUCCESS);

    char* json = nullptr;
    ASSERT_EQ(cw_chunker_get_config_json(chunker_, &json), CW_SUCCESS);
    const auto effective = take_json(json);
    EXPECT_EQ(effective["strategy"], "fixed");
    EXPECT_EQ(effective["chunkSize"], 1);
    EXPECT_EQ(effective["overlap"], 0);
}

TEST_F(ChunkingApiTest, CreateFromSavedConfiguration) {
    ASSERT_EQ(cw_chunker_create_from_json(R"({"strategy": "paragraph", "chunkSize": 600})", &chunker_),
              CW_SUCCESS);

    char* json = nullptr;
    ASSERT_EQ(cw_chunker_get_config_json(chunker_, &json), CW_SUCCESS);
    const auto effective = take_json(json);
    EXPECT_EQ(effective["strategy"], "paragraph");
    EXPECT_EQ(effective["chunkSize"], 600);
    EXPECT_EQ(effective["overlap"], 75);
}

TEST_F(ChunkingApiTest, MalformedSavedConfiguration) {
    EXPECT_EQ(cw_chunker_create_from_json("{broken", &chunker_), CW_ERROR_INVALID_FORMAT);
    EXPECT_EQ(chunker_, nullptr);
    EXPECT_EQ(cw_chunker_create_from_json(R"({"chunkSize": "big"})", &chunker_), CW_ERROR_INVALID_FORMAT);
    EXPECT_EQ(cw_chunker_create_from_json("42", &chunker_), CW_ERROR_INVALID_FORMAT);
    EXPECT_EQ(chunker_, nullptr);
}

// ============================================================================
// Chunking
// ============================================================================

TEST_F(ChunkingApiTest, ChunkSentences) {
    cw_chunking_config_t config = cw_chunking_config_default();
    config.chunk_size = 15;
    config.chunk_overlap = 5;
    ASSERT_EQ(cw_chunker_create(&config, &chunker_), CW_SUCCESS);

    ASSERT_EQ(cw_chunker_chunk(chunker_, "Hello world. This is a test.", &result_), CW_SUCCESS);
    ASSERT_EQ(result_.num_chunks, 2ul);
    ASSERT_NE(result_.chunks, nullptr);

    const cw_chunk_t& first = result_.chunks[0];
    EXPECT_EQ(first.sequence_index, 1ul);
    EXPECT_STREQ(first.text, "Hello world.");
    EXPECT_EQ(first.character_count, 12ul);
    EXPECT_EQ(first.unit_count, 1ul);
    EXPECT_EQ(first.unit_first, 1ul);
    EXPECT_EQ(first.unit_last, 1ul);
    EXPECT_STREQ(first.strategy, "sentence-boundary");

    const auto quality = nlohmann::json::parse(first.quality_json);
    EXPECT_DOUBLE_EQ(quality["completeness"].get<double>(), 1.0);

    const cw_chunk_t& second = result_.chunks[1];
    EXPECT_EQ(second.sequence_index, 2ul);
    EXPECT_STREQ(second.text, "Hello world. This is a test.");

    const auto metrics = nlohmann::json::parse(result_.metrics_json);
    EXPECT_EQ(metrics["totalChunks"], 2);
    EXPECT_EQ(metrics["totalCharacters"], 28);

    const auto insights = nlohmann::json::parse(result_.insights_json);
    EXPECT_TRUE(insights.is_array());
    EXPECT_FALSE(insights.empty());
    EXPECT_GE(result_.processing_time_ms, 0.0);
}

TEST_F(ChunkingApiTest, FixedChunksHaveNoUnitRange) {
    cw_chunking_config_t config = cw_chunking_config_default();
    config.strategy = "fixed";
    config.chunk_size = 10;
    config.chunk_overlap = 0;
    ASSERT_EQ(cw_chunker_create(&config, &chunker_), CW_SUCCESS);

    ASSERT_EQ(cw_chunker_chunk(chunker_, "aaaaaaaaaabbbbbbbbbb", &result_), CW_SUCCESS);
    ASSERT_EQ(result_.num_chunks, 2ul);
    EXPECT_STREQ(result_.chunks[1].text, "bbbbbbbbbb");
    EXPECT_EQ(result_.chunks[1].unit_first, 0ul);
    EXPECT_EQ(result_.chunks[1].unit_last, 0ul);
    EXPECT_STREQ(result_.chunks[1].strategy, "fixed-size");
    EXPECT_STREQ(result_.chunks[1].quality_json, "{}");
}

TEST_F(ChunkingApiTest, EmptyTextSucceedsWithNoChunks) {
    const cw_chunking_config_t config = cw_chunking_config_default();
    ASSERT_EQ(cw_chunker_create(&config, &chunker_), CW_SUCCESS);

    ASSERT_EQ(cw_chunker_chunk(chunker_, "", &result_), CW_SUCCESS);
    EXPECT_EQ(result_.num_chunks, 0ul);
    EXPECT_EQ(result_.chunks, nullptr);
    ASSERT_NE(result_.metrics_json, nullptr);
    EXPECT_EQ(nlohmann::json::parse(result_.metrics_json)["totalChunks"], 0);
}

TEST_F(ChunkingApiTest, InvalidUtf8IsRejected) {
    const cw_chunking_config_t config = cw_chunking_config_default();
    ASSERT_EQ(cw_chunker_create(&config, &chunker_), CW_SUCCESS);

    EXPECT_EQ(cw_chunker_chunk(chunker_, "broken \xC0\xAF text", &result_), CW_ERROR_INVALID_ENCODING);
    EXPECT_EQ(result_.num_chunks, 0ul);
    EXPECT_EQ(result_.chunks, nullptr);
    EXPECT_EQ(result_.metrics_json, nullptr);

    char* json = nullptr;
    EXPECT_EQ(cw_chunker_export_json(chunker_, "\xFF", &json), CW_ERROR_INVALID_ENCODING);
    EXPECT_EQ(json, nullptr);
}

TEST_F(ChunkingApiTest, ResultFreeZeroesStruct) {
    const cw_chunking_config_t config = cw_chunking_config_default();
    ASSERT_EQ(cw_chunker_create(&config, &chunker_), CW_SUCCESS);
    ASSERT_EQ(cw_chunker_chunk(chunker_, "One. Two.", &result_), CW_SUCCESS);

    cw_chunk_result_free(&result_);
    EXPECT_EQ(result_.chunks, nullptr);
    EXPECT_EQ(result_.num_chunks, 0ul);
    EXPECT_EQ(result_.metrics_json, nullptr);
    EXPECT_EQ(result_.insights_json, nullptr);
}

// ============================================================================
// JSON Surfaces
// ============================================================================

TEST_F(ChunkingApiTest, ExportJson) {
    cw_chunking_config_t config = cw_chunking_config_default();
    config.strategy = "semantic";
    config.chunk_size = 1024;
    config.chunk_overlap = 128;
    ASSERT_EQ(cw_chunker_create(&config, &chunker_), CW_SUCCESS);

    char* json = nullptr;
    ASSERT_EQ(cw_chunker_export_json(chunker_, "Data pipelines move data. Pipelines need data.", &json),
              CW_SUCCESS);
    const auto exported = take_json(json);

    EXPECT_EQ(exported["strategy"], "semantic");
    EXPECT_EQ(exported["chunkSize"], 1024);
    ASSERT_EQ(exported["chunks"].size(), 1ul);
    EXPECT_EQ(exported["chunks"][0]["type"], "semantic");
    EXPECT_EQ(exported["chunks"][0]["unit_range"], "1-2");
    EXPECT_EQ(exported["chunks"][0]["topic_keywords"][0], "data");
}

TEST_F(ChunkingApiTest, StrategyCatalog) {
    char* json = nullptr;
    ASSERT_EQ(cw_chunking_get_strategies_json(&json), CW_SUCCESS);
    const auto catalog = take_json(json);

    ASSERT_TRUE(catalog.is_array());
    ASSERT_EQ(catalog.size(), 5ul);
    EXPECT_EQ(catalog[0]["id"], "sentence");
    EXPECT_EQ(catalog[4]["id"], "sliding");
}

TEST_F(ChunkingApiTest, EstimateTokens) {
    EXPECT_EQ(cw_estimate_tokens("The quick brown fox."), 5ul);
    EXPECT_EQ(cw_estimate_tokens(""), 0ul);
    EXPECT_EQ(cw_estimate_tokens(nullptr), 0ul);
    EXPECT_EQ(cw_estimate_tokens("broken \xC0\xAF text"), 0ul);
}

TEST_F(ChunkingApiTest, ErrorMessages) {
    EXPECT_STREQ(cw_error_message(CW_SUCCESS), "Success");
    EXPECT_STREQ(cw_error_message(CW_ERROR_INVALID_ENCODING), "Text is not valid UTF-8");
    EXPECT_STREQ(cw_error_message(-999), "Unknown error");
}
