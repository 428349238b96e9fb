/**
 * @file chunk_json.h
 * @brief JSON encoding of chunking results and configuration
 *
 * Saved configuration format, as persisted per knowledge base:
 *   {"strategy": "semantic", "chunkSize": 1024, "overlap": 128}
 * "chunk_size" and "chunk_overlap" are accepted as alternative keys.
 */

#ifndef CHUNKWISE_CHUNK_JSON_H
#define CHUNKWISE_CHUNK_JSON_H

#include <string_view>

#include <nlohmann/json.hpp>

#include "chunk_types.h"

namespace chunkwise {
namespace chunking {

nlohmann::json chunk_to_json(const ChunkRecord& chunk);

/**
 * @brief Only the strategy-specific quality fields of a chunk
 */
nlohmann::json chunk_quality_to_json(const ChunkRecord& chunk);

nlohmann::json metrics_to_json(const ChunkingMetrics& metrics);

/**
 * @brief Decode a saved configuration
 *
 * Missing size or overlap take the strategy's catalog defaults; a missing
 * strategy means "sentence". Values are not clamped here.
 *
 * @throws nlohmann::json::exception on non-object input or wrongly typed fields
 */
ChunkerConfig config_from_json(const nlohmann::json& json);

/**
 * @brief Parse and decode a saved configuration
 *
 * @throws nlohmann::json::parse_error on malformed text
 */
ChunkerConfig parse_config(std::string_view json_text);

nlohmann::json config_to_json(const ChunkerConfig& config);

/**
 * @brief Strategy catalog as an array of entries in display order
 */
nlohmann::json catalog_to_json();

/**
 * @brief Export document for one chunking run
 *
 * {"strategy", "chunkSize", "overlap", "metrics", "chunks", "insights"}
 */
nlohmann::json export_to_json(const ChunkingResult& result, const ChunkerConfig& config);

} // namespace chunking
} // namespace chunkwise

#endif // CHUNKWISE_CHUNK_JSON_H
