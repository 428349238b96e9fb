/**
 * @file cw_chunking_api.cpp
 * @brief Document Chunking C API Implementation
 */

#include "cw/features/chunking/cw_chunking.h"
#include "chunk_json.h"
#include "document_chunker.h"
#include "strategy_catalog.h"
#include "token_estimator.h"
#include "utf8_text.h"

#include <cstring>
#include <memory>
#include <new>
#include <string>

#include "cw/core/cw_logger.h"
#include "cw/core/cw_types.h"
#include "cw/core/cw_error.h"

#define LOG_TAG "Chunking.API"
#define LOGI(...) CW_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) CW_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) CW_LOG_ERROR(LOG_TAG, __VA_ARGS__)
#define LOGD(...) CW_LOG_DEBUG(LOG_TAG, __VA_ARGS__)

using namespace chunkwise::chunking;

// =============================================================================
// CHUNKER HANDLE
// =============================================================================

struct cw_chunker {
    std::unique_ptr<DocumentChunker> chunker;
};

namespace {

cw_result_t copy_string(const std::string& value, char** out) {
    *out = cw_strdup(value.c_str());
    return *out != nullptr ? CW_SUCCESS : CW_ERROR_OUT_OF_MEMORY;
}

cw_result_t fill_result(const ChunkingResult& result, cw_chunk_result_t* out_result) {
    out_result->processing_time_ms = result.metrics.processing_time_ms;

    cw_result_t status = copy_string(metrics_to_json(result.metrics).dump(), &out_result->metrics_json);
    if (status != CW_SUCCESS) {
        return status;
    }
    status = copy_string(nlohmann::json(result.insights).dump(), &out_result->insights_json);
    if (status != CW_SUCCESS) {
        return status;
    }

    if (result.chunks.empty()) {
        return CW_SUCCESS;
    }

    out_result->chunks = static_cast<cw_chunk_t*>(cw_alloc(sizeof(cw_chunk_t) * result.chunks.size()));
    if (out_result->chunks == nullptr) {
        return CW_ERROR_OUT_OF_MEMORY;
    }
    memset(out_result->chunks, 0, sizeof(cw_chunk_t) * result.chunks.size());
    out_result->num_chunks = result.chunks.size();

    for (size_t i = 0; i < result.chunks.size(); ++i) {
        const auto& record = result.chunks[i];
        auto& chunk = out_result->chunks[i];

        chunk.sequence_index = record.sequence_index;
        chunk.estimated_tokens = record.estimated_tokens;
        chunk.character_count = record.character_count;
        chunk.unit_count = record.unit_count;
        if (record.unit_range) {
            chunk.unit_first = record.unit_range->first;
            chunk.unit_last = record.unit_range->last;
        }

        if ((status = copy_string(record.text, &chunk.text)) != CW_SUCCESS ||
            (status = copy_string(strategy_tag(record.strategy), &chunk.strategy)) != CW_SUCCESS ||
            (status = copy_string(chunk_quality_to_json(record).dump(), &chunk.quality_json)) != CW_SUCCESS) {
            return status;
        }
    }
    return CW_SUCCESS;
}

} // namespace

// =============================================================================
// PUBLIC API IMPLEMENTATION
// =============================================================================

extern "C" {

cw_chunking_config_t cw_chunking_config_for_strategy(const char* strategy_id) {
    const ChunkStrategy strategy =
        strategy_id != nullptr ? resolve_strategy(strategy_id) : ChunkStrategy::Sentence;
    const auto& info = strategy_info(strategy);

    cw_chunking_config_t cfg;
    cfg.strategy = info.id;
    cfg.chunk_size = info.default_size;
    cfg.chunk_overlap = info.default_overlap;
    return cfg;
}

cw_result_t cw_chunker_create(
    const cw_chunking_config_t* config,
    cw_chunker_t** out_chunker
) {
    if (config == nullptr || out_chunker == nullptr) {
        LOGE("Null pointer in cw_chunker_create");
        return CW_ERROR_NULL_POINTER;
    }

    *out_chunker = nullptr;

    try {
        ChunkerConfig chunker_config;
        chunker_config.strategy =
            config->strategy != nullptr ? resolve_strategy(config->strategy) : ChunkStrategy::Sentence;
        chunker_config.chunk_size = config->chunk_size;
        chunker_config.chunk_overlap = config->chunk_overlap;

        auto handle = std::make_unique<cw_chunker>();
        handle->chunker = std::make_unique<DocumentChunker>(chunker_config);

        const auto& effective = handle->chunker->config();
        LOGI("Chunker created: strategy=%s, size=%d, overlap=%d",
             strategy_id(effective.strategy), effective.chunk_size, effective.chunk_overlap);

        *out_chunker = handle.release();
        return CW_SUCCESS;

    } catch (const std::bad_alloc& e) {
        LOGE("Memory allocation failed: %s", e.what());
        return CW_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& e) {
        LOGE("Exception creating chunker: %s", e.what());
        return CW_ERROR_PROCESSING_FAILED;
    }
}

cw_result_t cw_chunker_create_from_json(
    const char* config_json,
    cw_chunker_t** out_chunker
) {
    if (config_json == nullptr || out_chunker == nullptr) {
        LOGE("Null pointer in cw_chunker_create_from_json");
        return CW_ERROR_NULL_POINTER;
    }

    *out_chunker = nullptr;

    try {
        const ChunkerConfig chunker_config = parse_config(config_json);

        auto handle = std::make_unique<cw_chunker>();
        handle->chunker = std::make_unique<DocumentChunker>(chunker_config);

        *out_chunker = handle.release();
        return CW_SUCCESS;

    } catch (const nlohmann::json::exception& e) {
        LOGE("Invalid chunking configuration: %s", e.what());
        return CW_ERROR_INVALID_FORMAT;
    } catch (const std::bad_alloc& e) {
        LOGE("Memory allocation failed: %s", e.what());
        return CW_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& e) {
        LOGE("Exception creating chunker: %s", e.what());
        return CW_ERROR_PROCESSING_FAILED;
    }
}

cw_result_t cw_chunker_chunk(
    cw_chunker_t* chunker,
    const char* text,
    cw_chunk_result_t* out_result
) {
    if (chunker == nullptr || text == nullptr || out_result == nullptr) {
        return CW_ERROR_NULL_POINTER;
    }

    memset(out_result, 0, sizeof(cw_chunk_result_t));

    try {
        const auto result = chunker->chunker->process(text);

        const cw_result_t status = fill_result(result, out_result);
        if (status != CW_SUCCESS) {
            LOGE("Failed to allocate memory for chunk result");
            cw_chunk_result_free(out_result);
            return status;
        }

        LOGD("cw_chunker_chunk: %zu chunks, %.2fms", out_result->num_chunks,
             out_result->processing_time_ms);
        return CW_SUCCESS;

    } catch (const InvalidTextError& e) {
        LOGE("Rejected document: %s", e.what());
        cw_chunk_result_free(out_result);
        return CW_ERROR_INVALID_ENCODING;
    } catch (const std::bad_alloc& e) {
        LOGE("Memory allocation failed: %s", e.what());
        cw_chunk_result_free(out_result);
        return CW_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& e) {
        LOGE("Exception chunking document: %s", e.what());
        cw_chunk_result_free(out_result);
        return CW_ERROR_PROCESSING_FAILED;
    }
}

cw_result_t cw_chunker_export_json(
    cw_chunker_t* chunker,
    const char* text,
    char** out_json
) {
    if (chunker == nullptr || text == nullptr || out_json == nullptr) {
        return CW_ERROR_NULL_POINTER;
    }

    try {
        const auto result = chunker->chunker->process(text);
        const std::string json_str = export_to_json(result, chunker->chunker->config()).dump();

        char* json_copy = cw_strdup(json_str.c_str());
        if (json_copy == nullptr) {
            LOGE("Failed to allocate memory for export JSON");
            return CW_ERROR_OUT_OF_MEMORY;
        }
        *out_json = json_copy;
        return CW_SUCCESS;

    } catch (const InvalidTextError& e) {
        LOGE("Rejected document: %s", e.what());
        return CW_ERROR_INVALID_ENCODING;
    } catch (const std::bad_alloc& e) {
        LOGE("Memory allocation failed: %s", e.what());
        return CW_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& e) {
        LOGE("Exception exporting chunks: %s", e.what());
        return CW_ERROR_PROCESSING_FAILED;
    }
}

cw_result_t cw_chunker_get_config_json(
    cw_chunker_t* chunker,
    char** out_json
) {
    if (chunker == nullptr || out_json == nullptr) {
        return CW_ERROR_NULL_POINTER;
    }

    try {
        const std::string json_str = config_to_json(chunker->chunker->config()).dump();

        char* json_copy = cw_strdup(json_str.c_str());
        if (json_copy == nullptr) {
            LOGE("Failed to allocate memory for configuration JSON");
            return CW_ERROR_OUT_OF_MEMORY;
        }
        *out_json = json_copy;
        return CW_SUCCESS;

    } catch (const std::exception& e) {
        LOGE("Exception getting configuration: %s", e.what());
        return CW_ERROR_PROCESSING_FAILED;
    }
}

cw_result_t cw_chunking_get_strategies_json(char** out_json) {
    if (out_json == nullptr) {
        return CW_ERROR_NULL_POINTER;
    }

    try {
        const std::string json_str = catalog_to_json().dump();

        char* json_copy = cw_strdup(json_str.c_str());
        if (json_copy == nullptr) {
            LOGE("Failed to allocate memory for strategy catalog JSON");
            return CW_ERROR_OUT_OF_MEMORY;
        }
        *out_json = json_copy;
        return CW_SUCCESS;

    } catch (const std::exception& e) {
        LOGE("Exception encoding strategy catalog: %s", e.what());
        return CW_ERROR_PROCESSING_FAILED;
    }
}

size_t cw_estimate_tokens(const char* text) {
    if (text == nullptr) {
        return 0;
    }
    if (!utf8::is_valid(text)) {
        LOGW("cw_estimate_tokens: text is not valid UTF-8");
        return 0;
    }
    return estimate_tokens(text);
}

void cw_chunk_result_free(cw_chunk_result_t* result) {
    if (result == nullptr) {
        return;
    }

    cw_free(result->metrics_json);
    cw_free(result->insights_json);

    if (result->chunks != nullptr) {
        for (size_t i = 0; i < result->num_chunks; ++i) {
            cw_free(result->chunks[i].text);
            cw_free(result->chunks[i].strategy);
            cw_free(result->chunks[i].quality_json);
        }
        cw_free(result->chunks);
    }

    // The struct itself belongs to the caller
    memset(result, 0, sizeof(cw_chunk_result_t));
}

void cw_chunker_destroy(cw_chunker_t* chunker) {
    if (chunker == nullptr) {
        return;
    }

    LOGD("Destroying chunker");
    delete chunker;
}

} // extern "C"
