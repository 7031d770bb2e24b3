#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "batch/batch_orchestrator.hpp"
#include "detection/pattern_registry.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel {

// ============================================================================
// Request / response contract consumed by the transport layer
// ============================================================================

/**
 * @brief Single-document scan request
 *
 * JSON: { "document": "...", "custom_patterns": { "NAME": "regex", ... } }
 * "text" is accepted as an alias of "document". Key order of
 * custom_patterns is preserved as declaration order.
 */
struct ScanRequest {
    std::string document;
    CustomPatternList custom_patterns;
};

[[nodiscard]] Result<ScanRequest> parse_scan_request(std::string_view json_text);

/**
 * @brief { redacted_text, detected_pii: [{type, value, start, end}],
 *          risk_score, risk_level, distribution }
 */
[[nodiscard]] nlohmann::json detection_result_to_json(const DetectionResult& result);

/**
 * @brief { error: "invalid_pattern", rejections: [{name, kind, reason}] }
 */
[[nodiscard]] nlohmann::json compile_error_to_json(const CompileResult& compiled);

/**
 * @brief Per-item batch summary; artifact_digests maps artifact name -> sha256
 */
[[nodiscard]] nlohmann::json batch_report_to_json(
    const BatchReport& report,
    const std::map<std::string, std::string>& artifact_digests = {});

[[nodiscard]] nlohmann::json builtin_catalog_to_json();

} // namespace sentinel
