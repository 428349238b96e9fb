/**
 * @file strategy_catalog.cpp
 * @brief Strategy catalog and id mapping
 */

#include "strategy_catalog.h"

namespace chunkwise {
namespace chunking {

const std::array<StrategyInfo, 5>& strategy_catalog() noexcept {
    static const std::array<StrategyInfo, 5> catalog = {{
        {ChunkStrategy::Sentence, "sentence", "Sentence-based",
         "Splits text on sentence boundaries; the default strategy",
         512, 50, 256, 2048,
         {"Preserves context", "Natural splits", "Fast processing"}, true},
        {ChunkStrategy::FixedSize, "fixed", "Fixed Size",
         "Splits text into evenly sized windows",
         512, 50, 256, 2048,
         {"Predictable size", "Even splits", "Efficient storage"}, false},
        {ChunkStrategy::Paragraph, "paragraph", "Paragraph-based",
         "Splits documents on paragraph boundaries",
         768, 75, 512, 4096,
         {"Keeps logical structure", "Preserves paragraphs", "Medium-sized chunks"}, false},
        {ChunkStrategy::Semantic, "semantic", "Semantic",
         "Groups sentences into topical units within a token budget",
         1024, 128, 512, 2048,
         {"Context optimized", "Preserves meaning", "High-quality retrieval"}, false},
        {ChunkStrategy::SlidingWindow, "sliding", "Sliding Window",
         "Continuous windows with overlapping sections",
         512, 256, 256, 1536,
         {"High overlap", "Minimal information loss", "Fine-grained retrieval"}, false},
    }};
    return catalog;
}

const StrategyInfo& strategy_info(ChunkStrategy strategy) noexcept {
    for (const auto& info : strategy_catalog()) {
        if (info.strategy == strategy) {
            return info;
        }
    }
    return strategy_catalog().front();
}

std::optional<ChunkStrategy> parse_strategy(std::string_view id) noexcept {
    for (const auto& info : strategy_catalog()) {
        if (id == info.id) {
            return info.strategy;
        }
    }
    return std::nullopt;
}

const char* strategy_id(ChunkStrategy strategy) noexcept {
    return strategy_info(strategy).id;
}

const char* strategy_tag(ChunkStrategy strategy) noexcept {
    switch (strategy) {
        case ChunkStrategy::FixedSize:
            return "fixed-size";
        case ChunkStrategy::Sentence:
            return "sentence-boundary";
        case ChunkStrategy::Paragraph:
            return "paragraph-boundary";
        case ChunkStrategy::Semantic:
            return "semantic";
        case ChunkStrategy::SlidingWindow:
            return "sliding-window";
    }
    return "fixed-size";
}

ChunkerConfig ChunkerConfig::for_strategy(ChunkStrategy strategy) {
    const auto& info = strategy_info(strategy);
    ChunkerConfig config;
    config.strategy = strategy;
    config.chunk_size = info.default_size;
    config.chunk_overlap = info.default_overlap;
    return config;
}

} // namespace chunking
} // namespace chunkwise
