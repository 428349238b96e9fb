/**
 * @file chunk_json.cpp
 * @brief nlohmann/json encoders and config decoder
 */

#include "chunk_json.h"
#include "document_chunker.h"
#include "strategy_catalog.h"

#include <string>

namespace chunkwise {
namespace chunking {

namespace {

const nlohmann::json* find_first(const nlohmann::json::object_t& object,
                                 const char* key, const char* alternative) {
    auto it = object.find(key);
    if (it == object.end()) {
        it = object.find(alternative);
    }
    return it == object.end() ? nullptr : &it->second;
}

} // namespace

nlohmann::json chunk_quality_to_json(const ChunkRecord& chunk) {
    nlohmann::json quality = nlohmann::json::object();
    if (chunk.completeness) {
        quality["completeness"] = *chunk.completeness;
    }
    if (chunk.coherence) {
        quality["coherence"] = *chunk.coherence;
    }
    if (chunk.coherence_score) {
        quality["coherence_score"] = *chunk.coherence_score;
    }
    if (chunk.semantic_density) {
        quality["semantic_density"] = *chunk.semantic_density;
    }
    if (chunk.strategy == ChunkStrategy::Semantic) {
        quality["topic_keywords"] = chunk.topic_keywords;
    }
    if (chunk.overlap_tokens) {
        quality["overlap_tokens"] = *chunk.overlap_tokens;
    }
    if (chunk.overlap_percentage) {
        quality["overlap_percentage"] = *chunk.overlap_percentage;
    }
    return quality;
}

nlohmann::json chunk_to_json(const ChunkRecord& chunk) {
    nlohmann::json json = chunk_quality_to_json(chunk);
    json["id"] = chunk.sequence_index;
    json["text"] = chunk.text;
    json["tokens"] = chunk.estimated_tokens;
    json["characters"] = chunk.character_count;
    json["units"] = chunk.unit_count;
    json["type"] = strategy_tag(chunk.strategy);
    if (chunk.unit_range) {
        json["unit_range"] = std::to_string(chunk.unit_range->first) + "-" +
                             std::to_string(chunk.unit_range->last);
    }
    if (chunk.char_range) {
        json["start_char"] = chunk.char_range->start;
        json["end_char"] = chunk.char_range->end;
    }
    return json;
}

nlohmann::json metrics_to_json(const ChunkingMetrics& metrics) {
    nlohmann::json json;
    json["totalChunks"] = metrics.total_chunks;
    json["avgTokens"] = metrics.average_tokens;
    json["minTokens"] = metrics.min_tokens;
    json["maxTokens"] = metrics.max_tokens;
    json["avgChunkSize"] = metrics.average_characters;
    json["minChunkSize"] = metrics.min_characters;
    json["maxChunkSize"] = metrics.max_characters;
    json["totalCharacters"] = metrics.total_characters;
    json["estimatedTokens"] = metrics.estimated_document_tokens;
    json["averageQuality"] = metrics.average_quality;
    json["sizeConsistency"] = metrics.size_consistency;
    json["overlapEfficiency"] = metrics.overlap_efficiency;
    json["processingTime"] = metrics.processing_time_ms;
    return json;
}

ChunkerConfig config_from_json(const nlohmann::json& json) {
    const auto& object = json.get_ref<const nlohmann::json::object_t&>();

    ChunkStrategy strategy = ChunkStrategy::Sentence;
    const auto strategy_it = object.find("strategy");
    if (strategy_it != object.end()) {
        strategy = resolve_strategy(strategy_it->second.get<std::string>());
    }

    ChunkerConfig config = ChunkerConfig::for_strategy(strategy);
    if (const auto* size = find_first(object, "chunkSize", "chunk_size")) {
        config.chunk_size = size->get<int>();
    }
    if (const auto* overlap = find_first(object, "overlap", "chunk_overlap")) {
        config.chunk_overlap = overlap->get<int>();
    }
    return config;
}

ChunkerConfig parse_config(std::string_view json_text) {
    return config_from_json(nlohmann::json::parse(json_text.begin(), json_text.end()));
}

nlohmann::json config_to_json(const ChunkerConfig& config) {
    nlohmann::json json;
    json["strategy"] = strategy_id(config.strategy);
    json["chunkSize"] = config.chunk_size;
    json["overlap"] = config.chunk_overlap;
    return json;
}

nlohmann::json catalog_to_json() {
    nlohmann::json catalog = nlohmann::json::array();
    for (const auto& info : strategy_catalog()) {
        nlohmann::json entry;
        entry["id"] = info.id;
        entry["name"] = info.name;
        entry["description"] = info.description;
        entry["defaultSize"] = info.default_size;
        entry["defaultOverlap"] = info.default_overlap;
        entry["sizeRange"] = {{"min", info.min_size}, {"max", info.max_size}};
        entry["features"] = {info.features[0], info.features[1], info.features[2]};
        entry["recommended"] = info.recommended;
        catalog.push_back(std::move(entry));
    }
    return catalog;
}

nlohmann::json export_to_json(const ChunkingResult& result, const ChunkerConfig& config) {
    nlohmann::json json = config_to_json(config);
    json["metrics"] = metrics_to_json(result.metrics);

    nlohmann::json chunks = nlohmann::json::array();
    for (const auto& chunk : result.chunks) {
        chunks.push_back(chunk_to_json(chunk));
    }
    json["chunks"] = std::move(chunks);
    json["insights"] = result.insights;
    return json;
}

} // namespace chunking
} // namespace chunkwise
