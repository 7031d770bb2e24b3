#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace sentinel {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            } else {
                throw std::runtime_error(std::format("{} must contain only strings", key));
            }
        }
    }
    return result;
}

template<typename T>
T toml_positive(const toml::table& tbl, const std::string_view key, T fallback,
                const std::string_view section) {
    const auto node = tbl[key];
    if (!node) return fallback;
    const auto v = node.value<int64_t>();
    if (!v || *v <= 0) {
        throw std::runtime_error(std::format("{}.{} must be a positive integer", section, key));
    }
    return static_cast<T>(*v);
}

// Range is checked on the 64-bit value, before narrowing
int toml_score(const toml::node_view<const toml::node> node, const std::string& name) {
    const auto v = node.value<int64_t>();
    if (!v) {
        throw std::runtime_error(std::format("{} must be an integer", name));
    }
    if (*v < 0 || *v > RiskScorer::kMaxScore) {
        throw std::runtime_error(
            std::format("{} must be between 0 and {}", name, RiskScorer::kMaxScore));
    }
    return static_cast<int>(*v);
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

void extract_detection(const toml::table& root, SentinelConfig& config) {
    const auto* detection = root["detection"].as_table();
    if (!detection) return;
    const auto& d = *detection;

    config.pipeline.max_document_bytes = toml_positive<size_t>(
        d, "max_document_bytes", config.pipeline.max_document_bytes, "detection");
    config.registry.max_custom_patterns = toml_positive<size_t>(
        d, "max_custom_patterns", config.registry.max_custom_patterns, "detection");

    if (const auto* guard = d["guard"].as_table()) {
        auto& g = config.registry.guard;
        g.max_pattern_length = toml_positive<size_t>(
            *guard, "max_pattern_length", g.max_pattern_length, "detection.guard");
        g.max_repetition = toml_positive<uint64_t>(
            *guard, "max_repetition", g.max_repetition, "detection.guard");
        g.nested_bound_limit = toml_positive<uint32_t>(
            *guard, "nested_bound_limit", g.nested_bound_limit, "detection.guard");
    }

    // The decoder enforces the same document size cap as the pipeline
    config.decoder.max_document_bytes = config.pipeline.max_document_bytes;
}

RiskScorer::Config extract_risk(const toml::table& root) {
    RiskScorer::Config cfg;
    const auto* risk = root["risk"].as_table();
    if (!risk) return cfg;
    const auto& r = *risk;

    if (const auto node = r["default_weight"]) {
        cfg.default_weight = toml_score(node, "risk.default_weight");
    }

    if (const auto* weights = r["weights"].as_table()) {
        for (auto&& [key, node] : *weights) {
            cfg.weights[utils::to_upper(key.str())] =
                toml_score(toml::node_view<const toml::node>(&node),
                           std::format("risk.weights.{}", key.str()));
        }
    }

    if (const auto* bands = r["bands"].as_array()) {
        cfg.bands.clear();
        for (const auto& elem : *bands) {
            const auto* b = elem.as_table();
            if (!b) throw std::runtime_error("risk.bands entries must be tables");

            const auto level_name = (*b)["level"].value<std::string>();
            if (!(*b)["min_score"] || !level_name) {
                throw std::runtime_error("risk.bands entries require min_score and level");
            }
            const int min_score = toml_score((*b)["min_score"], "risk.bands.min_score");
            const auto level = RiskScorer::parse_level(*level_name);
            if (!level) {
                throw std::runtime_error(std::format("risk.bands: unknown level '{}'", *level_name));
            }
            cfg.bands.push_back({min_score, *level});
        }
    }
    return cfg;
}

void extract_batch(const toml::table& root, SentinelConfig& config) {
    const auto* batch = root["batch"].as_table();
    if (!batch) return;
    const auto& b = *batch;

    if (b.contains("allowed_extensions")) {
        config.decoder.allowed_extensions = toml_string_array(b, "allowed_extensions");
    }
    config.batch.artifact_prefix = b["artifact_prefix"].value_or(config.batch.artifact_prefix);
    config.batch.include_manifest = b["include_manifest"].value_or(config.batch.include_manifest);
}

SentinelConfig extract_all(const toml::table& tbl) {
    SentinelConfig config;
    config.logging = extract_logging(tbl);
    extract_detection(tbl, config);
    config.risk = extract_risk(tbl);
    extract_batch(tbl, config);
    return config;
}

ConfigLoader::LoadResult finish_load(toml::table tbl) {
    try {
        expand_env_vars_recursive(tbl);
        auto config = extract_all(tbl);
        if (auto err = ConfigLoader::validate(config)) {
            return ConfigLoader::LoadResult::error(std::format("Invalid config: {}", *err));
        }
        return ConfigLoader::LoadResult::ok(std::move(config));
    } catch (const std::runtime_error& e) {
        return ConfigLoader::LoadResult::error(std::format("Invalid config: {}", e.what()));
    }
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::optional<std::string> ConfigLoader::validate(const SentinelConfig& config) {
    if (!utils::log::parse_level(config.logging.level)) {
        return std::format("logging.level '{}' must be debug, info, warn or error",
                           config.logging.level);
    }
    if (config.risk.default_weight < 0 || config.risk.default_weight > RiskScorer::kMaxScore) {
        return std::format("risk.default_weight must be between 0 and {}", RiskScorer::kMaxScore);
    }
    for (const auto& [type, weight] : config.risk.weights) {
        if (weight < 0 || weight > RiskScorer::kMaxScore) {
            return std::format("risk.weights.{} must be between 0 and {}", type, RiskScorer::kMaxScore);
        }
    }
    if (auto err = RiskScorer::validate_bands(config.risk.bands)) {
        return *err;
    }
    for (const auto& ext : config.decoder.allowed_extensions) {
        if (ext.size() < 2 || ext.front() != '.') {
            return std::format("batch.allowed_extensions entry '{}' must start with '.'", ext);
        }
    }
    if (config.batch.artifact_prefix.find_first_of("/\\") != std::string::npos) {
        return "batch.artifact_prefix must not contain path separators";
    }
    return std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        return finish_load(toml::parse_file(config_path));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse {}: {}", config_path, e.description()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        return finish_load(toml::parse(toml_content));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    }
}

} // namespace sentinel
