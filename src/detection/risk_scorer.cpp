#include "detection/risk_scorer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sentinel {

RiskScorer::RiskScorer(Config config)
    : config_(std::move(config)) {
    std::sort(config_.bands.begin(), config_.bands.end(),
              [](const Band& a, const Band& b) { return a.min_score > b.min_score; });
}

int RiskScorer::weight_for(std::string_view type) const {
    const auto it = config_.weights.find(std::string(type));
    return it != config_.weights.end() ? it->second : config_.default_weight;
}

RiskLevel RiskScorer::classify(int score) const {
    for (const auto& band : config_.bands) {
        if (score >= band.min_score) {
            return band.level;
        }
    }
    return config_.bands.empty() ? RiskLevel::CRITICAL : config_.bands.back().level;
}

RiskAssessment RiskScorer::score(const std::vector<ResolvedMatch>& detected) const {
    RiskAssessment assessment;

    int penalty = 0;
    for (const auto& match : detected) {
        // Both terms stay within [0, kMaxScore], so the sum cannot overflow
        const int weight = std::clamp(weight_for(match.type), 0, kMaxScore);
        penalty = std::min(kMaxScore, penalty + weight);
        ++assessment.distribution[match.type];
    }

    assessment.score = std::max(0, kMaxScore - penalty);
    assessment.level = classify(assessment.score);
    return assessment;
}

std::optional<std::string> RiskScorer::validate_bands(const std::vector<Band>& bands) {
    if (bands.empty()) {
        return "risk band table is empty";
    }
    std::vector<int> mins;
    mins.reserve(bands.size());
    for (const auto& band : bands) {
        if (band.min_score < 0 || band.min_score > kMaxScore) {
            return std::format("risk band min_score {} outside [0, {}]", band.min_score, kMaxScore);
        }
        mins.push_back(band.min_score);
    }
    std::sort(mins.begin(), mins.end());
    if (std::adjacent_find(mins.begin(), mins.end()) != mins.end()) {
        return "risk bands have duplicate min_score values";
    }
    if (mins.front() != 0) {
        return "risk bands must include a band starting at 0";
    }
    return std::nullopt;
}

std::optional<RiskLevel> RiskScorer::parse_level(std::string_view name) {
    const std::string upper = utils::to_upper(name);
    if (upper == "NONE") return RiskLevel::NONE;
    if (upper == "LOW") return RiskLevel::LOW;
    if (upper == "MEDIUM") return RiskLevel::MEDIUM;
    if (upper == "HIGH") return RiskLevel::HIGH;
    if (upper == "CRITICAL") return RiskLevel::CRITICAL;
    return std::nullopt;
}

} // namespace sentinel
