#include "detection/detection_pipeline.hpp"
#include "detection/match_resolver.hpp"
#include "detection/redactor.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace sentinel {

DetectionPipeline::DetectionPipeline(
    std::shared_ptr<const PatternRegistry> registry,
    RiskScorer scorer,
    Config config)
    : registry_(std::move(registry)),
      scorer_(std::move(scorer)),
      config_(config) {
    if (!registry_) {
        throw std::invalid_argument("DetectionPipeline requires a pattern registry");
    }
}

CompileResult DetectionPipeline::compile(const CustomPatternList& custom) const {
    return registry_->compile(custom);
}

Result<DetectionResult> DetectionPipeline::scan(
    std::string_view document,
    const CustomPatternList& custom) const {

    auto compiled = registry_->compile(custom);
    if (!compiled.success) {
        return Result<DetectionResult>::error(compiled.error_category(), compiled.error_message());
    }
    return scan_compiled(document, compiled.patterns);
}

Result<DetectionResult> DetectionPipeline::scan_compiled(
    std::string_view document,
    const PatternSet& patterns) const {

    if (document.size() > config_.max_document_bytes) {
        return Result<DetectionResult>::error(ErrorCategory::UNSUPPORTED_DOCUMENT,
            std::format("document is {} bytes, limit is {}",
                        document.size(), config_.max_document_bytes));
    }

    utils::Timer timer;

    std::vector<ResolvedMatch> resolved;
    try {
        resolved = MatchResolver::resolve(document, patterns);
    } catch (const std::runtime_error& e) {
        // Only a set holding an uncompiled pattern gets here
        return Result<DetectionResult>::error(ErrorCategory::PATTERN_EVALUATION,
            std::format("regex evaluation failed: {}", e.what()));
    }

    DetectionResult result;
    try {
        result.redacted_text = Redactor::redact(document, resolved);
    } catch (const std::invalid_argument& e) {
        return Result<DetectionResult>::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }

    const auto assessment = scorer_.score(resolved);
    result.risk_score = assessment.score;
    result.risk_level = assessment.level;
    result.distribution = assessment.distribution;

    result.detected_pii.reserve(resolved.size());
    for (auto& m : resolved) {
        result.detected_pii.push_back(DetectedEntity{
            std::move(m.type), std::move(m.text), m.start, m.end});
    }

    utils::log::debug(std::format("Scanned {} bytes with {} patterns: {} entities, score {} ({} us)",
        document.size(), patterns.size(), result.detected_pii.size(),
        result.risk_score, timer.elapsed().count()));

    return Result<DetectionResult>::ok(std::move(result));
}

} // namespace sentinel
