#include <catch2/catch_test_macros.hpp>
#include "detection/redactor.hpp"

#include <stdexcept>

using namespace sentinel;

TEST_CASE("Redactor: token format", "[redactor]") {
    CHECK(Redactor::token_for("EMAIL") == "[EMAIL]");
    CHECK(Redactor::token_for("EMPLOYEE_ID") == "[EMPLOYEE_ID]");
}

TEST_CASE("Redactor: no matches returns the document unchanged", "[redactor]") {
    CHECK(Redactor::redact("nothing to see", {}) == "nothing to see");
    CHECK(Redactor::redact("", {}).empty());
}

TEST_CASE("Redactor: replaces spans and copies gaps verbatim", "[redactor]") {
    const std::string doc = "Contact jane@example.com or call 555-0100";
    const std::vector<ResolvedMatch> resolved = {
        {"EMAIL", 8, 24, "jane@example.com"},
        {"PHONE", 33, 41, "555-0100"},
    };
    CHECK(Redactor::redact(doc, resolved) == "Contact [EMAIL] or call [PHONE]");
}

TEST_CASE("Redactor: spans at both edges and adjacent spans", "[redactor]") {
    const std::string doc = "123456";
    const std::vector<ResolvedMatch> resolved = {
        {"A", 0, 2, "12"},
        {"B", 2, 4, "34"},
        {"C", 4, 6, "56"},
    };
    CHECK(Redactor::redact(doc, resolved) == "[A][B][C]");
}

TEST_CASE("Redactor: multibyte text outside spans is preserved", "[redactor]") {
    const std::string doc = "नाम: ravi@upi ✓";
    const size_t start = doc.find("ravi");
    const std::vector<ResolvedMatch> resolved = {{"UPI", start, start + 8, "ravi@upi"}};
    CHECK(Redactor::redact(doc, resolved) == "नाम: [UPI] ✓");
}

TEST_CASE("Redactor: rejects malformed match sets", "[redactor]") {
    const std::string doc = "abcdefghij";

    SECTION("Overlapping") {
        const std::vector<ResolvedMatch> resolved = {{"A", 0, 5, "abcde"}, {"B", 4, 6, "ef"}};
        CHECK_THROWS_AS(Redactor::redact(doc, resolved), std::invalid_argument);
    }

    SECTION("Unsorted") {
        const std::vector<ResolvedMatch> resolved = {{"A", 5, 6, "f"}, {"B", 0, 2, "ab"}};
        CHECK_THROWS_AS(Redactor::redact(doc, resolved), std::invalid_argument);
    }

    SECTION("Empty span") {
        const std::vector<ResolvedMatch> resolved = {{"A", 3, 3, ""}};
        CHECK_THROWS_AS(Redactor::redact(doc, resolved), std::invalid_argument);
    }

    SECTION("Past the end") {
        const std::vector<ResolvedMatch> resolved = {{"A", 8, 12, "ij"}};
        CHECK_THROWS_AS(Redactor::redact(doc, resolved), std::invalid_argument);
    }
}
