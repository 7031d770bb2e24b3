#include "api/scan_api.hpp"

#include <format>

namespace sentinel {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

Result<ScanRequest> parse_scan_request(std::string_view json_text) {
    // ordered_json keeps custom_patterns in declaration order
    const auto root = ordered_json::parse(json_text.begin(), json_text.end(),
                                          nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded()) {
        return Result<ScanRequest>::error(ErrorCategory::INVALID_REQUEST, "request is not valid JSON");
    }
    if (!root.is_object()) {
        return Result<ScanRequest>::error(ErrorCategory::INVALID_REQUEST, "request must be a JSON object");
    }

    ScanRequest request;

    const auto doc_it = root.contains("document") ? root.find("document") : root.find("text");
    if (doc_it == root.end() || !doc_it->is_string()) {
        return Result<ScanRequest>::error(ErrorCategory::INVALID_REQUEST,
            "request.document must be a string");
    }
    request.document = doc_it->get<std::string>();

    const auto custom_it = root.find("custom_patterns");
    if (custom_it != root.end() && !custom_it->is_null()) {
        if (!custom_it->is_object()) {
            return Result<ScanRequest>::error(ErrorCategory::INVALID_REQUEST,
                "request.custom_patterns must be an object of name -> regex");
        }
        for (const auto& [name, regex] : custom_it->items()) {
            if (!regex.is_string()) {
                return Result<ScanRequest>::error(ErrorCategory::INVALID_PATTERN,
                    std::format("custom pattern {} must be a string", name));
            }
            request.custom_patterns.emplace_back(name, regex.get<std::string>());
        }
    }

    return Result<ScanRequest>::ok(std::move(request));
}

json detection_result_to_json(const DetectionResult& result) {
    json detected = json::array();
    for (const auto& e : result.detected_pii) {
        detected.push_back({
            {"type", e.type},
            {"value", e.value},
            {"start", e.start},
            {"end", e.end},
        });
    }

    json distribution = json::object();
    for (const auto& [type, count] : result.distribution) {
        distribution[type] = count;
    }

    return {
        {"redacted_text", result.redacted_text},
        {"detected_pii", std::move(detected)},
        {"risk_score", result.risk_score},
        {"risk_level", risk_level_to_string(result.risk_level)},
        {"distribution", std::move(distribution)},
    };
}

json compile_error_to_json(const CompileResult& compiled) {
    json rejections = json::array();
    for (const auto& r : compiled.rejections) {
        rejections.push_back({
            {"name", r.name},
            {"kind", error_category_to_string(r.category)},
            {"reason", r.reason},
        });
    }
    return {
        {"error", error_category_to_string(compiled.error_category())},
        {"rejections", std::move(rejections)},
    };
}

json batch_report_to_json(
    const BatchReport& report,
    const std::map<std::string, std::string>& artifact_digests) {

    json items = json::array();
    for (const auto& item : report.items) {
        json entry = {
            {"id", item.id},
            {"name", item.name},
            {"status", batch_status_to_string(item.status)},
        };

        if (item.status == BatchItemStatus::COMPLETED && item.result) {
            entry["detected_pii_count"] = item.result->detected_pii.size();
            entry["risk_score"] = item.result->risk_score;
            entry["risk_level"] = risk_level_to_string(item.result->risk_level);
            entry["artifact"] = item.artifact_name;
            const auto it = artifact_digests.find(item.artifact_name);
            if (it != artifact_digests.end()) {
                entry["sha256"] = it->second;
            }
        } else if (item.status == BatchItemStatus::ERROR) {
            entry["error"] = item.error;
            entry["error_kind"] = error_category_to_string(item.error_category);
        }
        items.push_back(std::move(entry));
    }

    return {
        {"total", report.items.size()},
        {"completed", report.completed_count()},
        {"errors", report.error_count()},
        {"detected_pii_total", report.total_detected()},
        {"cancelled", report.cancelled},
        {"elapsed_ms", report.elapsed.count()},
        {"items", std::move(items)},
    };
}

json builtin_catalog_to_json() {
    json patterns = json::array();
    for (const auto& b : PatternRegistry::builtin_catalog()) {
        patterns.push_back({
            {"type", b.type},
            {"regex", b.regex},
            {"description", b.description},
        });
    }
    return patterns;
}

} // namespace sentinel
