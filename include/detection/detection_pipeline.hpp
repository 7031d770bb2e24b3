#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "detection/pattern_registry.hpp"
#include "detection/risk_scorer.hpp"

#include <memory>
#include <string_view>

namespace sentinel {

/**
 * @brief Single-document detection chain
 *
 * compile (PatternRegistry) -> resolve (MatchResolver) -> redact (Redactor)
 *                                                      -> score (RiskScorer)
 *
 * Holds only immutable collaborators; scan() allocates no shared state and
 * may be called concurrently. Every failure is returned as a Result error,
 * never thrown.
 */
class DetectionPipeline {
public:
    struct Config {
        size_t max_document_bytes = 10 * 1024 * 1024;
    };

    DetectionPipeline(std::shared_ptr<const PatternRegistry> registry,
                      RiskScorer scorer,
                      Config config);

    explicit DetectionPipeline(std::shared_ptr<const PatternRegistry> registry)
        : DetectionPipeline(std::move(registry), RiskScorer{}, Config{}) {}

    /**
     * @brief Compile the active set for a request (built-ins + custom)
     */
    [[nodiscard]] CompileResult compile(const CustomPatternList& custom) const;

    /**
     * @brief Scan with a per-request custom pattern list
     *
     * An invalid custom set aborts the scan before any matching runs.
     */
    [[nodiscard]] Result<DetectionResult> scan(
        std::string_view document,
        const CustomPatternList& custom = {}) const;

    /**
     * @brief Scan with an already compiled pattern set
     */
    [[nodiscard]] Result<DetectionResult> scan_compiled(
        std::string_view document,
        const PatternSet& patterns) const;

    [[nodiscard]] const PatternRegistry& registry() const { return *registry_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    std::shared_ptr<const PatternRegistry> registry_;
    RiskScorer scorer_;
    Config config_;
};

} // namespace sentinel
