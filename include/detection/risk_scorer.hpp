#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sentinel {

/**
 * @brief Maps a resolved match set to a 0-100 score and a risk level
 *
 * score = max(0, 100 - sum(weight(type))). Types missing from the weight
 * table (including every custom type) use default_weight. The level is the
 * first band, in descending min_score order, whose min_score <= score.
 */
class RiskScorer {
public:
    struct Band {
        int min_score;
        RiskLevel level;
    };

    struct Config {
        std::unordered_map<std::string, int> weights = {
            {"AADHAAR", 20}, {"PAN", 20}, {"PASSPORT", 20},
            {"CREDIT_CARD", 20}, {"CVV", 20}, {"ATM_PIN", 20},
            {"GSTIN", 10}, {"VOTER_ID", 10}, {"PHONE", 10}, {"UPI", 10},
            {"EMAIL", 5}, {"DOB", 5},
        };
        int default_weight = 5;
        // Descending by min_score; the last band must start at 0
        std::vector<Band> bands = {
            {100, RiskLevel::NONE},
            {80, RiskLevel::LOW},
            {50, RiskLevel::MEDIUM},
            {20, RiskLevel::HIGH},
            {0, RiskLevel::CRITICAL},
        };
    };

    static constexpr int kMaxScore = 100;

    RiskScorer() : RiskScorer(Config{}) {}
    explicit RiskScorer(Config config);

    [[nodiscard]] RiskAssessment score(const std::vector<ResolvedMatch>& detected) const;

    [[nodiscard]] int weight_for(std::string_view type) const;

    [[nodiscard]] RiskLevel classify(int score) const;

    /**
     * @brief Validate a band table; returns a description of the first problem
     */
    [[nodiscard]] static std::optional<std::string> validate_bands(const std::vector<Band>& bands);

    [[nodiscard]] static std::optional<RiskLevel> parse_level(std::string_view name);

private:
    Config config_;
};

} // namespace sentinel
