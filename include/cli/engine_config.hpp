// File: include/cli/engine_config.hpp
//
// YAML Configuration Support for TrendSketch
// Allows loading engine and shell settings from YAML configuration files

#ifndef TRENDSKETCH_ENGINE_CONFIG_HPP
#define TRENDSKETCH_ENGINE_CONFIG_HPP

#include "core/types.hpp"
#include "corpus/series_corpus_index.hpp"
#include "search/pattern_search_service.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trendsketch {

/// Configuration structure for TrendSketch
struct EngineConfig {
    // === Matching Engine Settings ===
    struct Engine {
        size_t resample_point_count = 20;
        size_t top_k = 10;
        size_t min_draw_points = 5;
        float match_quality_scale = 20.0f;
        std::string local_cost = "absolute";   // absolute | squared
        size_t worker_threads = 1;
        size_t parallel_threshold = 256;
    } engine;

    // === Minimum Support Settings ===
    struct Support {
        size_t min_periods = 5;
        double fraction = 0.5;   // of the corpus period count
    } support;

    // === Data Source Settings ===
    struct Data {
        std::string database_file = "transactions.db";
        std::string value_measure = "sales";   // sales | quantity | profit
    } data;

    // === Interface Settings ===
    struct Interface {
        std::string prompt = "sketch> ";
        bool colors_enabled = true;
        bool verbose = false;
    } interface;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig structure if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig structure if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Search settings derived from the engine section
    SearchConfig ToSearchConfig() const;

    /// Support thresholds derived from the support section
    SupportPolicy ToSupportPolicy() const;

    /// Value measure parsed from the data section
    ValueMeasure GetValueMeasure() const;

    /// Create default configuration
    static EngineConfig Default();
};

} // namespace trendsketch

#endif // TRENDSKETCH_ENGINE_CONFIG_HPP
