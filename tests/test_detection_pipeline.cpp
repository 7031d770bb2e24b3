#include <catch2/catch_test_macros.hpp>
#include "detection/detection_pipeline.hpp"
#include "detection/redactor.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace sentinel;

namespace {

DetectionPipeline make_pipeline(DetectionPipeline::Config config = {}) {
    return DetectionPipeline(std::make_shared<const PatternRegistry>(), RiskScorer{}, config);
}

} // anonymous namespace

// ============================================================================
// End-to-end detection
// ============================================================================

TEST_CASE("DetectionPipeline: email and phone example", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();
    const std::string doc = "Contact jane@example.com or call 555-0100";

    auto result = pipeline.scan(doc);
    REQUIRE(result.is_ok());
    const auto& r = result.value();

    CHECK(r.redacted_text == "Contact [EMAIL] or call [PHONE]");
    REQUIRE(r.detected_pii.size() == 2);
    CHECK(r.detected_pii[0].type == "EMAIL");
    CHECK(r.detected_pii[0].value == "jane@example.com");
    CHECK(r.detected_pii[0].start == 8);
    CHECK(r.detected_pii[0].end == 24);
    CHECK(r.detected_pii[1].type == "PHONE");
    CHECK(r.detected_pii[1].value == "555-0100");
    CHECK(r.risk_score == 85);
    CHECK(r.risk_level == RiskLevel::LOW);
    CHECK(r.distribution.at("EMAIL") == 1);
    CHECK(r.distribution.at("PHONE") == 1);
}

TEST_CASE("DetectionPipeline: clean document", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();

    auto result = pipeline.scan("The quick brown fox jumps over the lazy dog.");
    REQUIRE(result.is_ok());
    CHECK(result.value().redacted_text == "The quick brown fox jumps over the lazy dog.");
    CHECK(result.value().detected_pii.empty());
    CHECK(result.value().risk_score == 100);
    CHECK(result.value().risk_level == RiskLevel::NONE);

    result = pipeline.scan("");
    REQUIRE(result.is_ok());
    CHECK(result.value().redacted_text.empty());
}

TEST_CASE("DetectionPipeline: mixed identity document", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();
    const std::string doc =
        "Name: Ravi\n"
        "PAN: ABCDE1234F\n"
        "Aadhaar: 1234 5678 9012\n"
        "DOB: 12/05/1990\n"
        "Card: 4111 1111 1111 1111\n";

    auto result = pipeline.scan(doc);
    REQUIRE(result.is_ok());
    const auto& r = result.value();

    CHECK(r.redacted_text ==
        "Name: Ravi\n"
        "PAN: [PAN]\n"
        "Aadhaar: [AADHAAR]\n"
        "DOB: [DOB]\n"
        "Card: [CREDIT_CARD]\n");
    REQUIRE(r.detected_pii.size() == 4);
    // 100 - (20 + 20 + 5 + 20)
    CHECK(r.risk_score == 35);
    CHECK(r.risk_level == RiskLevel::HIGH);
}

// ============================================================================
// Properties
// ============================================================================

TEST_CASE("DetectionPipeline: detected spans are disjoint and match the source text", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();
    const std::string doc =
        "ids 27ABCDE1234F1Z5, A1234567, ABC1234567; pay ravi.k@okaxis or "
        "mail ravi@example.org; pin 4321 cvv 123; call +91 9876543210";

    auto result = pipeline.scan(doc);
    REQUIRE(result.is_ok());
    const auto& entities = result.value().detected_pii;
    REQUIRE_FALSE(entities.empty());

    for (size_t i = 0; i < entities.size(); ++i) {
        CHECK(entities[i].end > entities[i].start);
        CHECK(doc.substr(entities[i].start, entities[i].end - entities[i].start) == entities[i].value);
        if (i > 0) {
            CHECK(entities[i].start >= entities[i - 1].end);
        }
    }

    // Every entity value is gone from the redacted text and its token is present
    const auto& redacted = result.value().redacted_text;
    for (const auto& e : entities) {
        CHECK(redacted.find(e.value) == std::string::npos);
        CHECK(redacted.find(Redactor::token_for(e.type)) != std::string::npos);
    }
}

TEST_CASE("DetectionPipeline: redaction is idempotent", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();
    const CustomPatternList custom = {{"EMPLOYEE_ID", R"(EMP-\d{5})"}};

    for (const std::string doc : {
             std::string("Contact jane@example.com or call 555-0100"),
             std::string("EMP-00042 PAN ABCDE1234F card 4111-1111-1111-1111 cvv 999"),
             std::string("GSTIN 27ABCDE1234F1Z5 voter ABC1234567 born 01-01-2000")}) {
        auto first = pipeline.scan(doc, custom);
        REQUIRE(first.is_ok());

        auto second = pipeline.scan(first.value().redacted_text, custom);
        REQUIRE(second.is_ok());
        INFO(first.value().redacted_text);
        CHECK(second.value().detected_pii.empty());
        CHECK(second.value().redacted_text == first.value().redacted_text);
        CHECK(second.value().risk_score == 100);
    }
}

TEST_CASE("DetectionPipeline: scans are deterministic", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();
    const std::string doc = "jane@example.com 555-0100 ABCDE1234F 12/05/1990";

    auto a = pipeline.scan(doc);
    auto b = pipeline.scan(doc);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(a.value().redacted_text == b.value().redacted_text);
    CHECK(a.value().risk_score == b.value().risk_score);
    REQUIRE(a.value().detected_pii.size() == b.value().detected_pii.size());
}

// ============================================================================
// Custom patterns
// ============================================================================

TEST_CASE("DetectionPipeline: custom pattern detects alongside built-ins", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();

    auto result = pipeline.scan("Badge EMP-00042 for jane@example.com",
                                {{"employee_id", R"(EMP-\d{5})"}});
    REQUIRE(result.is_ok());
    CHECK(result.value().redacted_text == "Badge [EMPLOYEE_ID] for [EMAIL]");
    // Unlisted custom type uses the default weight of 5
    CHECK(result.value().risk_score == 90);
}

TEST_CASE("DetectionPipeline: invalid custom pattern aborts the scan", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();

    auto result = pipeline.scan("jane@example.com", {{"BROKEN", "(unclosed"}});
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INVALID_PATTERN);
    CHECK(result.error_message().find("BROKEN") != std::string::npos);

    result = pipeline.scan("aaaa", {{"EVIL", "(a+)+$"}});
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PATTERN_COMPLEXITY_REJECTED);
}

TEST_CASE("DetectionPipeline: colliding custom pattern is rejected, built-ins unaffected", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();

    auto rejected = pipeline.scan("mail jane@example.com", {{"X1234567", "zzz"}});
    REQUIRE(rejected.is_error());
    CHECK(rejected.error_category() == ErrorCategory::INVALID_PATTERN);

    auto ok = pipeline.scan("mail jane@example.com");
    REQUIRE(ok.is_ok());
    CHECK(ok.value().redacted_text == "mail [EMAIL]");
}

// ============================================================================
// Limits and construction
// ============================================================================

TEST_CASE("DetectionPipeline: oversized document is rejected", "[detection_pipeline]") {
    DetectionPipeline::Config cfg;
    cfg.max_document_bytes = 16;
    const auto pipeline = make_pipeline(cfg);

    auto result = pipeline.scan(std::string(17, 'a'));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::UNSUPPORTED_DOCUMENT);

    CHECK(pipeline.scan(std::string(16, 'a')).is_ok());
}

TEST_CASE("DetectionPipeline: requires a registry", "[detection_pipeline]") {
    CHECK_THROWS_AS(DetectionPipeline(nullptr), std::invalid_argument);
}

TEST_CASE("DetectionPipeline: compile exposes the active set", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();
    const auto compiled = pipeline.compile({{"TICKET", R"(TKT-\d{6})"}});
    REQUIRE(compiled.success);
    CHECK(compiled.patterns.size() == 13);

    auto result = pipeline.scan_compiled("TKT-123456", compiled.patterns);
    REQUIRE(result.is_ok());
    CHECK(result.value().redacted_text == "[TICKET]");
}

// ============================================================================
// Large and multi-byte input
// ============================================================================

TEST_CASE("DetectionPipeline: long unbroken runs scan without failure", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();

    for (const char fill : {'a', '1'}) {
        const std::string doc(1024 * 1024, fill);
        auto result = pipeline.scan(doc);
        REQUIRE(result.is_ok());
        CHECK(result.value().detected_pii.empty());
        CHECK(result.value().redacted_text == doc);
        CHECK(result.value().risk_score == 100);
    }

    const std::string ticket = "TKT-" + std::string(200 * 1024, 'Q');
    auto result = pipeline.scan("ref " + ticket + " end", {{"TICKET", "TKT-[0-9A-Z]+"}});
    REQUIRE(result.is_ok());
    REQUIRE(result.value().detected_pii.size() == 1);
    CHECK(result.value().detected_pii[0].value == ticket);
    CHECK(result.value().redacted_text == "ref [TICKET] end");
}

TEST_CASE("DetectionPipeline: matches end on character boundaries", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();
    const std::string doc = "ID X\xC3\xA9 end";   // "ID Xé end"

    auto whole = pipeline.scan(doc, {{"CODE", "X[^ ]"}});
    REQUIRE(whole.is_ok());
    REQUIRE(whole.value().detected_pii.size() == 1);
    CHECK(whole.value().detected_pii[0].value == "X\xC3\xA9");
    CHECK(whole.value().redacted_text == "ID [CODE] end");

    // A single-byte match would split the character; it is dropped
    auto split = pipeline.scan(doc, {{"CODE", R"(X\C)"}});
    REQUIRE(split.is_ok());
    CHECK(split.value().detected_pii.empty());
    CHECK(split.value().redacted_text == doc);
}

TEST_CASE("DetectionPipeline: uncompiled pattern in a set is an evaluation error", "[detection_pipeline]") {
    const auto pipeline = make_pipeline();

    RE2::Options options;
    options.set_log_errors(false);
    PatternSpec broken;
    broken.type = "BROKEN";
    broken.source = PatternSource::CUSTOM;
    broken.regex_source = "(";
    broken.regex = std::make_shared<const RE2>("(", options);

    auto result = pipeline.scan_compiled("anything", PatternSet({broken}));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PATTERN_EVALUATION);
    CHECK(result.error_message().find("BROKEN") != std::string::npos);
}
