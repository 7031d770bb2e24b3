#pragma once

#include "batch/batch_orchestrator.hpp"
#include "batch/document_decoder.hpp"
#include "detection/detection_pipeline.hpp"
#include "detection/pattern_registry.hpp"
#include "detection/risk_scorer.hpp"

#include <optional>
#include <string>

namespace sentinel {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// SentinelConfig - Complete parsed configuration
// ============================================================================

/**
 * Mirrors config/sentinel.toml:
 *
 *   [logging]          level
 *   [detection]        max_document_bytes, max_custom_patterns
 *   [detection.guard]  max_pattern_length, max_repetition, nested_bound_limit
 *   [risk]             default_weight
 *   [risk.weights]     TYPE = weight
 *   [[risk.bands]]     min_score, level
 *   [batch]            allowed_extensions, artifact_prefix, include_manifest
 */
struct SentinelConfig {
    LoggingConfig logging;
    PatternRegistry::Config registry;
    DetectionPipeline::Config pipeline;
    RiskScorer::Config risk;
    DocumentDecoder::Config decoder;
    BatchOrchestrator::Config batch;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SentinelConfig config;

        static LoadResult ok(SentinelConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sentinel.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints; returns the first violation
     */
    [[nodiscard]] static std::optional<std::string> validate(const SentinelConfig& config);
};

} // namespace sentinel
