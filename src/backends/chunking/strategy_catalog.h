/**
 * @file strategy_catalog.h
 * @brief Static description of the available chunking strategies
 */

#ifndef CHUNKWISE_STRATEGY_CATALOG_H
#define CHUNKWISE_STRATEGY_CATALOG_H

#include <array>
#include <optional>
#include <string_view>

#include "chunk_types.h"

namespace chunkwise {
namespace chunking {

/**
 * @brief Catalog entry shown to users choosing a strategy
 */
struct StrategyInfo {
    ChunkStrategy strategy;
    const char* id;           // "sentence", "fixed", ...
    const char* name;
    const char* description;
    int default_size;
    int default_overlap;
    int min_size;             // Recommended range
    int max_size;
    std::array<const char*, 3> features;
    bool recommended;
};

/**
 * @brief All strategies in display order
 */
const std::array<StrategyInfo, 5>& strategy_catalog() noexcept;

const StrategyInfo& strategy_info(ChunkStrategy strategy) noexcept;

/**
 * @brief Strategy for a catalog id; std::nullopt for unknown ids
 */
std::optional<ChunkStrategy> parse_strategy(std::string_view id) noexcept;

/**
 * @brief Catalog id ("fixed", "sentence", "paragraph", "semantic", "sliding")
 */
const char* strategy_id(ChunkStrategy strategy) noexcept;

/**
 * @brief Tag stored on chunk records ("fixed-size", "sentence-boundary", ...)
 */
const char* strategy_tag(ChunkStrategy strategy) noexcept;

} // namespace chunking
} // namespace chunkwise

#endif // CHUNKWISE_STRATEGY_CATALOG_H
