#pragma once

#include "core/error.hpp"

#include <re2/re2.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sentinel {

// ============================================================================
// Basic Enums
// ============================================================================

enum class PatternSource {
    BUILTIN,
    CUSTOM
};

enum class RiskLevel {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class BatchItemStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    ERROR
};

[[nodiscard]] inline const char* pattern_source_to_string(PatternSource source) {
    return source == PatternSource::BUILTIN ? "builtin" : "custom";
}

[[nodiscard]] inline const char* risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::NONE:     return "NONE";
        case RiskLevel::LOW:      return "LOW";
        case RiskLevel::MEDIUM:   return "MEDIUM";
        case RiskLevel::HIGH:     return "HIGH";
        case RiskLevel::CRITICAL: return "CRITICAL";
    }
    return "NONE";
}

[[nodiscard]] inline const char* batch_status_to_string(BatchItemStatus status) {
    switch (status) {
        case BatchItemStatus::PENDING:    return "pending";
        case BatchItemStatus::PROCESSING: return "processing";
        case BatchItemStatus::COMPLETED:  return "completed";
        case BatchItemStatus::ERROR:      return "error";
    }
    return "pending";
}

// ============================================================================
// Patterns
// ============================================================================

/// Ordered name -> regex source pairs; order is declaration (priority) order.
using CustomPatternList = std::vector<std::pair<std::string, std::string>>;

struct PatternSpec {
    std::string type;                           // Canonical uppercase identifier
    PatternSource source = PatternSource::BUILTIN;
    std::string regex_source;
    std::shared_ptr<const re2::RE2> regex;      // Shared: built-ins outlive requests
    uint32_t rank = 0;                          // Lower rank wins ties
};

/**
 * @brief Immutable active pattern set (built-ins first, then custom)
 *
 * Only PatternRegistry constructs non-empty sets; ranks are assigned in
 * iteration order.
 */
class PatternSet {
public:
    PatternSet() = default;
    explicit PatternSet(std::vector<PatternSpec> specs) : specs_(std::move(specs)) {
        for (size_t i = 0; i < specs_.size(); ++i) {
            specs_[i].rank = static_cast<uint32_t>(i);
        }
    }

    [[nodiscard]] const std::vector<PatternSpec>& specs() const { return specs_; }
    [[nodiscard]] size_t size() const { return specs_.size(); }
    [[nodiscard]] bool empty() const { return specs_.empty(); }

    [[nodiscard]] const PatternSpec* find(const std::string& type) const {
        for (const auto& spec : specs_) {
            if (spec.type == type) return &spec;
        }
        return nullptr;
    }

    auto begin() const { return specs_.begin(); }
    auto end() const { return specs_.end(); }

private:
    std::vector<PatternSpec> specs_;
};

// ============================================================================
// Matches
// ============================================================================

struct RawMatch {
    std::string type;
    size_t start = 0;           // Half-open [start, end) byte offsets
    size_t end = 0;
    std::string text;
    uint32_t rank = 0;

    [[nodiscard]] size_t length() const { return end - start; }
};

struct ResolvedMatch {
    std::string type;
    size_t start = 0;
    size_t end = 0;
    std::string text;

    ResolvedMatch() = default;
    ResolvedMatch(std::string t, size_t s, size_t e, std::string txt)
        : type(std::move(t)), start(s), end(e), text(std::move(txt)) {}

    [[nodiscard]] size_t length() const { return end - start; }
};

// ============================================================================
// Detection Output
// ============================================================================

struct DetectedEntity {
    std::string type;
    std::string value;
    size_t start = 0;
    size_t end = 0;
};

struct RiskAssessment {
    int score = 100;
    RiskLevel level = RiskLevel::NONE;
    std::map<std::string, size_t> distribution;   // type -> count
};

struct DetectionResult {
    std::string redacted_text;
    std::vector<DetectedEntity> detected_pii;     // Ascending start offset
    int risk_score = 100;
    RiskLevel risk_level = RiskLevel::NONE;
    std::map<std::string, size_t> distribution;
};

// ============================================================================
// Batch
// ============================================================================

struct BatchItem {
    size_t id = 0;
    std::string name;
    BatchItemStatus status = BatchItemStatus::PENDING;
    std::optional<DetectionResult> result;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error;
    std::string artifact_name;                    // Set for COMPLETED items
};

} // namespace sentinel
