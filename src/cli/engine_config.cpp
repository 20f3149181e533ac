// File: src/cli/engine_config.cpp
//
// YAML Configuration Implementation for TrendSketch

#include "cli/engine_config.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace trendsketch {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Apply one "section.key: value" entry; unknown keys are ignored
static void ApplyValue(EngineConfig& config, const std::string& section,
                       const std::string& key, const std::string& value) {
    if (section == "engine") {
        if (key == "resample_point_count") config.engine.resample_point_count = std::stoul(value);
        else if (key == "top_k") config.engine.top_k = std::stoul(value);
        else if (key == "min_draw_points") config.engine.min_draw_points = std::stoul(value);
        else if (key == "match_quality_scale") config.engine.match_quality_scale = std::stof(value);
        else if (key == "local_cost") config.engine.local_cost = value;
        else if (key == "worker_threads") config.engine.worker_threads = std::stoul(value);
        else if (key == "parallel_threshold") config.engine.parallel_threshold = std::stoul(value);
    }
    else if (section == "support") {
        if (key == "min_periods") config.support.min_periods = std::stoul(value);
        else if (key == "fraction") config.support.fraction = std::stod(value);
    }
    else if (section == "data") {
        if (key == "database_file") config.data.database_file = value;
        else if (key == "value_measure") config.data.value_measure = value;
    }
    else if (section == "interface") {
        if (key == "prompt") config.interface.prompt = value;
        else if (key == "colors_enabled") config.interface.colors_enabled = ParseBool(value);
        else if (key == "verbose") config.interface.verbose = ParseBool(value);
    }
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem << " at line "
                          << (parser.problem_mark.line + 1);
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplyValue(config, current_section, current_key, value);
                        } catch (const std::exception& e) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": '" << value << "' (" << e.what() << ")"
                                      << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# TrendSketch Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "engine:\n";
    ss << "  resample_point_count: " << engine.resample_point_count << "\n";
    ss << "  top_k: " << engine.top_k << "\n";
    ss << "  min_draw_points: " << engine.min_draw_points << "\n";
    ss << "  match_quality_scale: " << engine.match_quality_scale << "\n";
    ss << "  local_cost: \"" << engine.local_cost << "\"\n";
    ss << "  worker_threads: " << engine.worker_threads << "\n";
    ss << "  parallel_threshold: " << engine.parallel_threshold << "\n\n";

    ss << "support:\n";
    ss << "  min_periods: " << support.min_periods << "\n";
    ss << "  fraction: " << support.fraction << "\n\n";

    ss << "data:\n";
    ss << "  database_file: \"" << data.database_file << "\"\n";
    ss << "  value_measure: \"" << data.value_measure << "\"\n\n";

    ss << "interface:\n";
    ss << "  prompt: \"" << interface.prompt << "\"\n";
    ss << "  colors_enabled: " << (interface.colors_enabled ? "true" : "false") << "\n";
    ss << "  verbose: " << (interface.verbose ? "true" : "false") << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (engine.resample_point_count < 2) {
        errors.push_back("resample_point_count must be at least 2");
    }
    if (engine.top_k == 0) {
        errors.push_back("top_k must be greater than 0");
    }
    if (engine.min_draw_points < 2) {
        errors.push_back("min_draw_points must be at least 2");
    }
    if (engine.match_quality_scale <= 0.0f) {
        errors.push_back("match_quality_scale must be greater than 0");
    }
    if (engine.worker_threads == 0) {
        errors.push_back("worker_threads must be greater than 0");
    }
    if (engine.local_cost != "absolute" && engine.local_cost != "squared") {
        errors.push_back("local_cost must be one of: absolute, squared");
    }

    if (support.fraction <= 0.0 || support.fraction > 1.0) {
        errors.push_back("support fraction must be in (0.0, 1.0]");
    }

    if (data.value_measure != "sales" &&
        data.value_measure != "quantity" &&
        data.value_measure != "profit") {
        errors.push_back("value_measure must be one of: sales, quantity, profit");
    }

    return errors;
}

SearchConfig EngineConfig::ToSearchConfig() const {
    SearchConfig config;
    config.resample_point_count = engine.resample_point_count;
    config.top_k = engine.top_k;
    config.min_draw_points = engine.min_draw_points;
    config.match_quality_scale = engine.match_quality_scale;
    config.local_cost = ParseLocalCost(engine.local_cost);
    config.worker_threads = engine.worker_threads;
    config.parallel_threshold = engine.parallel_threshold;
    return config;
}

SupportPolicy EngineConfig::ToSupportPolicy() const {
    SupportPolicy policy;
    policy.min_periods = support.min_periods;
    policy.fraction = support.fraction;
    return policy;
}

ValueMeasure EngineConfig::GetValueMeasure() const {
    return ParseValueMeasure(data.value_measure);
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

} // namespace trendsketch
