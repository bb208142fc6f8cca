// tests/test_classifier.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/classifier/failure_classifier.h"

using namespace agentgraph;

TEST_CASE("Arbiter verdicts are classified by their TYPE marker", "[classifier]") {
    SECTION("syntax marker") {
        auto c = classify_failure("TYPE: SYNTAX\nunknown identifier 'Nat.succ_le'");
        REQUIRE(c.kind == FailureKind::SYNTAX);
        REQUIRE_FALSE(c.defaulted);
        REQUIRE(c.critique == "unknown identifier 'Nat.succ_le'");
    }
    SECTION("logic marker") {
        auto c = classify_failure("The induction step assumes the claim.\nTYPE: LOGIC");
        REQUIRE(c.kind == FailureKind::LOGIC);
        REQUIRE(c.critique == "The induction step assumes the claim.");
    }
    SECTION("logic wins when both appear") {
        auto c = classify_failure("TYPE: SYNTAX ... on reflection TYPE: LOGIC");
        REQUIRE(c.kind == FailureKind::LOGIC);
        REQUIRE(c.critique.find("TYPE:") == std::string::npos);
    }
}

TEST_CASE("Verdicts without a marker fall back", "[classifier]") {
    auto c = classify_failure("  the proof is wrong somewhere  ");
    REQUIRE(c.kind == FailureKind::SYNTAX);
    REQUIRE(c.defaulted);
    REQUIRE(c.critique == "the proof is wrong somewhere");

    auto l = classify_failure("no marker", FailureKind::LOGIC);
    REQUIRE(l.kind == FailureKind::LOGIC);
    REQUIRE(l.defaulted);

    REQUIRE(classify_failure("").critique.empty());
}

TEST_CASE("Failure kinds print as their route names", "[classifier]") {
    REQUIRE(to_string(FailureKind::SYNTAX) == "SYNTAX");
    REQUIRE(to_string(FailureKind::LOGIC) == "LOGIC");
}
