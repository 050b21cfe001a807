/**
 * @file test_validation_report.cpp
 * @brief Tests for weighted validation reports and the validator registry
 *
 * Covers:
 * - Score accounting with clamped points and failed checks scoring zero
 * - Pass/fail driven by critical checks; empty reports never pass
 * - Failure reports that keep the full max score
 * - Registry construction, all-critical promotion and lookup errors
 *
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "quest_bench/validation.hpp"
#include "quest_bench/validator_registry.hpp"

#include <stdexcept>
#include <string>

using namespace quest::bench;
using Catch::Matchers::ContainsSubstring;

namespace {

CheckDecl decl(const std::string& name, double weight, bool critical = false) {
    CheckDecl d;
    d.name = name;
    d.kind = "tx_success";
    d.weight = weight;
    d.critical = critical;
    return d;
}

}  // namespace

TEST_CASE("Scores are derived from the recorded checks", "[validation]") {
    ValidationReport report;
    REQUIRE(report.empty());
    REQUIRE_FALSE(report.passed());

    report.add({"tx_success", true, 30.0, 30.0, true, "ok"});
    report.add({"amount", false, 25.0, 25.0, false, "expected 1, actual 2"});
    report.add({"bonus", true, 50.0, 10.0, false, ""});

    REQUIRE(report.score() == 40.0);
    REQUIRE(report.max_score() == 65.0);
    REQUIRE(report.passed());
    REQUIRE(report.checks()[1].points == 0.0);
    REQUIRE(report.checks()[2].points == 10.0);

    const auto feedback = report.feedback();
    REQUIRE_THAT(feedback, ContainsSubstring("Score: 40/65 (PASS)"));
    REQUIRE_THAT(feedback, ContainsSubstring("[FAIL] amount: expected 1, actual 2"));
    REQUIRE_THAT(feedback, ContainsSubstring("[PASS] tx_success (critical)"));

    const auto json = report.to_json();
    REQUIRE(json["checks"].size() == 3);
    REQUIRE(json["passed"] == true);
}

TEST_CASE("A failed critical check fails the report", "[validation]") {
    ValidationReport report;
    report.add({"tx_success", false, 30.0, 30.0, true, "reverted"});
    report.add({"amount", true, 70.0, 70.0, false, ""});
    REQUIRE_FALSE(report.passed());
    REQUIRE(report.score() == 70.0);
}

TEST_CASE("Without critical checks every check must pass", "[validation]") {
    ValidationReport report;
    report.add({"a", true, 1.0, 1.0, false, ""});
    report.add({"b", false, 1.0, 1.0, false, ""});
    REQUIRE_FALSE(report.passed());
}

TEST_CASE("Failure reports keep the configured maximum", "[validation]") {
    const std::vector<Check> checks = {
        {"tx_success", 30.0, true, nullptr},
        {"amount", 70.0, false, nullptr},
    };
    const auto report = failure_report(checks, Failure{FailureKind::Timeout, "Execution timeout after 60000ms", {}});

    REQUIRE(report.checks().size() == 3);
    REQUIRE(report.checks()[0].name == "code_execution");
    REQUIRE(report.checks()[0].critical);
    REQUIRE_THAT(report.checks()[0].message, ContainsSubstring("timeout: Execution timeout"));
    REQUIRE(report.score() == 0.0);
    REQUIRE(report.max_score() == 100.0);
    REQUIRE_FALSE(report.passed());
}

TEST_CASE("Registry builds checks per problem", "[validation][registry]") {
    Catalogue catalogue;
    ProblemSpec a;
    a.id = "a";
    a.checks = {decl("ok", 10.0, true), decl("extra", 5.0)};
    ProblemSpec b;
    b.id = "b";
    b.checks = {decl("x", 1.0), decl("y", 1.0)};
    catalogue.problems = {a, b};

    const auto registry = ValidatorRegistry::from_catalogue(catalogue);
    REQUIRE(registry.size() == 2);
    REQUIRE(registry.contains("a"));

    const auto& checks_a = registry.at("a").terminal;
    REQUIRE(checks_a.size() == 2);
    REQUIRE(checks_a[0].critical);
    REQUIRE_FALSE(checks_a[1].critical);

    SECTION("no critical checks means all are critical") {
        const auto& checks_b = registry.at("b").terminal;
        REQUIRE(checks_b[0].critical);
        REQUIRE(checks_b[1].critical);
    }

    SECTION("lookup and duplicate errors") {
        REQUIRE_THROWS_AS(registry.at("missing"), std::out_of_range);
        ValidatorRegistry again;
        again.add(a);
        REQUIRE_THROWS_WITH(again.add(a), ContainsSubstring("already registered"));
    }

    SECTION("invalid declarations fail at startup") {
        ProblemSpec broken;
        broken.id = "broken";
        auto bad = decl("bad", 1.0);
        bad.kind = "teleport";
        broken.checks = {bad};
        ValidatorRegistry registry2;
        REQUIRE_THROWS_WITH(registry2.add(broken), ContainsSubstring("unknown check kind"));
    }
}
