/**
 * @file test_result_writer.cpp
 * @brief Tests for the JSON summary and HTML report
 *
 * Covers:
 * - Totals and per-status counts
 * - Per-problem fields, check breakdowns and composite session details
 * - HTML escaping of catalogue and candidate text
 *
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "quest_bench/result_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace quest::bench;
using Catch::Matchers::ContainsSubstring;

namespace {

namespace fs = std::filesystem;

ProblemOutcome atomic_outcome() {
    ProblemOutcome o;
    o.problem.id = "bnb_transfer";
    o.problem.category = "native_transfer";
    o.status = "PASS";
    o.score = 65.0;
    o.max_score = 100.0;
    o.passed = true;
    o.result_kind = "transaction";
    o.report.add({"tx_success", true, 30.0, 30.0, true, "mined"});
    o.report.add({"gas_reasonable", false, 10.0, 10.0, false, "used <too> much & more"});
    ReceiptInfo receipt;
    receipt.success = true;
    receipt.gas_used = 21000;
    o.receipt = receipt;
    return o;
}

ProblemOutcome composite_outcome() {
    ProblemOutcome o;
    o.problem.id = "wbnb_wrap_and_send";
    o.problem.category = "composite";
    o.problem.kind = ProblemKind::Composite;
    o.status = "FAIL";
    o.score = 50.0;
    o.max_score = 100.0;
    o.result_kind = "transaction";
    o.composite = nlohmann::json{{"actual_steps", 4},
                                 {"optimal_steps", 2},
                                 {"efficiency_factor", 0.5},
                                 {"base_score", 100.0},
                                 {"plan", {"wrap", "send"}},
                                 {"steps", nlohmann::json::array()}};
    return o;
}

ProblemOutcome error_outcome() {
    ProblemOutcome o;
    o.problem.id = "broken";
    o.problem.category = "native_transfer";
    o.status = "ERROR";
    o.result_kind = "failure";
    o.feedback = "Problem setup failed: unknown fixture 'x<y'";
    return o;
}

std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

}  // namespace

TEST_CASE("Summary totals scores and counts statuses", "[result_writer]") {
    const std::vector<ProblemOutcome> outcomes{atomic_outcome(), composite_outcome(), error_outcome()};
    const auto summary = ResultWriter{}.summary(outcomes);

    REQUIRE(summary.at("total") == 3);
    REQUIRE(summary.at("score") == 115.0);
    REQUIRE(summary.at("max_score") == 200.0);
    REQUIRE(summary.at("by_status").at("PASS") == 1);
    REQUIRE(summary.at("by_status").at("FAIL") == 1);
    REQUIRE(summary.at("by_status").at("ERROR") == 1);

    const auto& first = summary.at("problems").at(0);
    REQUIRE(first.at("id") == "bnb_transfer");
    REQUIRE(first.at("kind") == "atomic");
    REQUIRE(first.at("checks").size() == 2);
    REQUIRE(first.at("checks").at(1).at("points") == 0.0);
    REQUIRE(first.at("receipt").at("gas_used") == 21000);
    REQUIRE_FALSE(first.contains("actual_steps"));

    const auto& second = summary.at("problems").at(1);
    REQUIRE(second.at("actual_steps") == 4);
    REQUIRE(second.at("efficiency_factor") == 0.5);
    REQUIRE(second.at("plan") == nlohmann::json{"wrap", "send"});
}

TEST_CASE("Reports are written to disk with escaped HTML", "[result_writer]") {
    const fs::path dir = fs::temp_directory_path() / "quest_bench_result_writer";
    fs::remove_all(dir);
    const std::vector<ProblemOutcome> outcomes{atomic_outcome(), composite_outcome(), error_outcome()};

    const ResultWriter writer;
    writer.write_summary(dir / "nested" / "summary.json", outcomes);
    writer.write_detailed(dir / "report.html", outcomes);

    const auto summary = nlohmann::json::parse(slurp(dir / "nested" / "summary.json"));
    REQUIRE(summary.at("total") == 3);

    const auto html = slurp(dir / "report.html");
    REQUIRE_THAT(html, ContainsSubstring("<h1>quest-bench Report</h1>"));
    REQUIRE_THAT(html, ContainsSubstring("used &lt;too&gt; much &amp; more"));
    REQUIRE_THAT(html, ContainsSubstring("unknown fixture &#39;x&lt;y&#39;"));
    REQUIRE_THAT(html, ContainsSubstring("class=\"status-ERROR\""));
    REQUIRE_THAT(html, ContainsSubstring("efficiency: 0.5"));

    std::error_code ec;
    fs::remove_all(dir, ec);
}
