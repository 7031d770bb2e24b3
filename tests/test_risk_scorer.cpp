#include <catch2/catch_test_macros.hpp>
#include "detection/risk_scorer.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace sentinel;

namespace {

std::vector<ResolvedMatch> matches_of(std::initializer_list<std::string> types) {
    std::vector<ResolvedMatch> out;
    size_t offset = 0;
    for (const auto& type : types) {
        out.emplace_back(type, offset, offset + 1, "x");
        offset += 2;
    }
    return out;
}

} // anonymous namespace

TEST_CASE("RiskScorer: no entities scores 100 / NONE", "[risk_scorer]") {
    RiskScorer scorer;
    const auto a = scorer.score({});
    CHECK(a.score == 100);
    CHECK(a.level == RiskLevel::NONE);
    CHECK(a.distribution.empty());
}

TEST_CASE("RiskScorer: weights subtract and bands classify", "[risk_scorer]") {
    RiskScorer scorer;

    auto a = scorer.score(matches_of({"EMAIL", "PHONE"}));
    CHECK(a.score == 85);
    CHECK(a.level == RiskLevel::LOW);

    a = scorer.score(matches_of({"AADHAAR", "PAN"}));
    CHECK(a.score == 60);
    CHECK(a.level == RiskLevel::MEDIUM);

    a = scorer.score(matches_of({"AADHAAR", "PAN", "CREDIT_CARD"}));
    CHECK(a.score == 40);
    CHECK(a.level == RiskLevel::HIGH);

    a = scorer.score(matches_of({"AADHAAR", "PAN", "CREDIT_CARD", "CVV", "ATM_PIN"}));
    CHECK(a.score == 0);
    CHECK(a.level == RiskLevel::CRITICAL);
}

TEST_CASE("RiskScorer: score saturates at zero", "[risk_scorer]") {
    RiskScorer scorer;
    std::vector<ResolvedMatch> many;
    for (size_t i = 0; i < 1000; ++i) {
        many.emplace_back("AADHAAR", i * 2, i * 2 + 1, "x");
    }
    const auto a = scorer.score(many);
    CHECK(a.score == 0);
    CHECK(a.level == RiskLevel::CRITICAL);
    CHECK(a.distribution.at("AADHAAR") == 1000);
}

TEST_CASE("RiskScorer: extreme weights saturate without overflow", "[risk_scorer]") {
    RiskScorer::Config cfg;
    cfg.weights["EMAIL"] = std::numeric_limits<int>::max();
    cfg.default_weight = std::numeric_limits<int>::max();
    RiskScorer scorer(cfg);

    const auto a = scorer.score(matches_of({"PHONE", "EMAIL", "EMPLOYEE_ID"}));
    CHECK(a.score == 0);
    CHECK(a.level == RiskLevel::CRITICAL);
    CHECK(scorer.score(matches_of({"EMAIL"})).score == 0);
}

TEST_CASE("RiskScorer: unknown types use the default weight", "[risk_scorer]") {
    RiskScorer scorer;
    CHECK(scorer.weight_for("EMPLOYEE_ID") == 5);
    CHECK(scorer.score(matches_of({"EMPLOYEE_ID"})).score == 95);
}

TEST_CASE("RiskScorer: negative weights never raise the score", "[risk_scorer]") {
    RiskScorer::Config cfg;
    cfg.weights["BONUS"] = -50;
    RiskScorer scorer(cfg);
    CHECK(scorer.score(matches_of({"BONUS"})).score == 100);
    CHECK(scorer.score(matches_of({"BONUS", "EMAIL"})).score == 95);
}

TEST_CASE("RiskScorer: distribution counts per type", "[risk_scorer]") {
    RiskScorer scorer;
    const auto a = scorer.score(matches_of({"EMAIL", "PHONE", "EMAIL"}));
    REQUIRE(a.distribution.size() == 2);
    CHECK(a.distribution.at("EMAIL") == 2);
    CHECK(a.distribution.at("PHONE") == 1);
}

TEST_CASE("RiskScorer: classify uses band lower bounds", "[risk_scorer]") {
    RiskScorer scorer;
    CHECK(scorer.classify(100) == RiskLevel::NONE);
    CHECK(scorer.classify(99) == RiskLevel::LOW);
    CHECK(scorer.classify(80) == RiskLevel::LOW);
    CHECK(scorer.classify(79) == RiskLevel::MEDIUM);
    CHECK(scorer.classify(50) == RiskLevel::MEDIUM);
    CHECK(scorer.classify(49) == RiskLevel::HIGH);
    CHECK(scorer.classify(20) == RiskLevel::HIGH);
    CHECK(scorer.classify(19) == RiskLevel::CRITICAL);
    CHECK(scorer.classify(0) == RiskLevel::CRITICAL);
}

TEST_CASE("RiskScorer: custom bands are sorted on construction", "[risk_scorer]") {
    RiskScorer::Config cfg;
    cfg.bands = {{0, RiskLevel::HIGH}, {90, RiskLevel::LOW}};
    RiskScorer scorer(cfg);
    CHECK(scorer.classify(95) == RiskLevel::LOW);
    CHECK(scorer.classify(89) == RiskLevel::HIGH);
}

TEST_CASE("RiskScorer: validate_bands", "[risk_scorer]") {
    CHECK_FALSE(RiskScorer::validate_bands(RiskScorer::Config{}.bands).has_value());
    CHECK(RiskScorer::validate_bands({}).has_value());
    CHECK(RiskScorer::validate_bands({{50, RiskLevel::LOW}}).has_value());
    CHECK(RiskScorer::validate_bands({{0, RiskLevel::LOW}, {0, RiskLevel::HIGH}}).has_value());
    CHECK(RiskScorer::validate_bands({{0, RiskLevel::LOW}, {101, RiskLevel::NONE}}).has_value());
    CHECK(RiskScorer::validate_bands({{0, RiskLevel::LOW}, {-1, RiskLevel::NONE}}).has_value());
}

TEST_CASE("RiskScorer: parse_level", "[risk_scorer]") {
    CHECK(RiskScorer::parse_level("critical") == RiskLevel::CRITICAL);
    CHECK(RiskScorer::parse_level("Medium") == RiskLevel::MEDIUM);
    CHECK_FALSE(RiskScorer::parse_level("severe").has_value());
}
