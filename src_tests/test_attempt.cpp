/**
 * @file test_attempt.cpp
 * @brief Tests for one execute-submit-validate round
 *
 * Covers:
 * - Transaction intents: submission, state capture, validation, artifacts
 * - Query results: validated without submission
 * - Execution failures and malformed intents scored through the failure report
 * - Attempts with no candidate at all
 * - Artifacts written even when candidate output is not valid UTF-8
 *
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "quest_bench/attempt.hpp"
#include "support/ledger_rig.hpp"

#include <filesystem>
#include <string>
#include <variant>

using namespace quest::bench;
using namespace quest::bench::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace fs = std::filesystem;

TEST_CASE("Intents are submitted and validated against the state change", "[attempt]") {
    LedgerRig rig("attempt_intent");
    rig.script_send("send", "10000000000000000");

    const auto record = rig.runner.run({"send", ".ts", "solutions/send.ts", false}, rig.params, {receipt_ok(30, true)},
                                       rig.targets, rig.artifacts);

    REQUIRE(std::holds_alternative<TransactionIntent>(record.result));
    REQUIRE(record.receipt.has_value());
    REQUIRE(record.receipt->success);
    REQUIRE(record.before.value(rig.recipient) == Wei{0});
    REQUIRE(record.after.value(rig.recipient) == pow10(16));
    REQUIRE(record.report.passed());
    REQUIRE(record.report.score() == 30.0);

    REQUIRE(rig.executor.requests.size() == 1);
    const auto& request = rig.executor.requests[0];
    REQUIRE(request.endpoint == rig.node->endpoint());
    REQUIRE(request.identity == kRigIdentity);
    REQUIRE(request.fixtures.count("usdt") == 1);
    REQUIRE(request.timeout == 1234ms);
    REQUIRE(request.artifact_dir == rig.artifacts);

    REQUIRE(slurp(rig.artifacts / "candidate.ts") == "send");
    const auto result = nlohmann::json::parse(slurp(rig.artifacts / "result.json"));
    REQUIRE(result.at("kind") == "transaction");
    REQUIRE(result.at("receipt").at("success") == true);
    REQUIRE(result.at("after").at("values").at("recipient_balance") == "10000000000000000");
    REQUIRE(result.at("passed") == true);
    REQUIRE_THAT(slurp(rig.artifacts / "report.txt"), ContainsSubstring("Score: 30/30 (PASS)"));
    REQUIRE_THAT(slurp(rig.artifacts / "engine_diag.txt"), ContainsSubstring("candidate: solutions/send.ts"));
}

TEST_CASE("Query results are checked without submission", "[attempt]") {
    LedgerRig rig("attempt_query");
    rig.executor.results["ask"] = QueryResult{nlohmann::json{{"query_result", {{"balance", "0"}}}}};
    const auto sends = rig.node->sent.size();

    const auto record =
        rig.runner.run({"ask", ".ts", {}, false}, rig.params, {query_ok(10), receipt_ok(5, false)}, rig.targets,
                       rig.artifacts);

    REQUIRE(std::holds_alternative<QueryResult>(record.result));
    REQUIRE_FALSE(record.receipt.has_value());
    REQUIRE(rig.node->sent.size() == sends);
    REQUIRE(record.before.block_number == record.after.block_number);
    REQUIRE(record.report.score() == 10.0);
    REQUIRE(record.report.max_score() == 15.0);
}

TEST_CASE("Execution failures are scored through the failure report", "[attempt]") {
    LedgerRig rig("attempt_failure");

    const auto record =
        rig.runner.run({"crash", ".ts", {}, false}, rig.params, {receipt_ok(30, true), query_ok(10)}, rig.targets,
                       rig.artifacts);

    REQUIRE(std::holds_alternative<Failure>(record.result));
    REQUIRE_FALSE(record.report.passed());
    REQUIRE(record.report.score() == 0.0);
    REQUIRE(record.report.max_score() == 40.0);
    REQUIRE(record.report.checks().front().name == "code_execution");
    REQUIRE_THAT(record.diag, ContainsSubstring("runner diagnostics"));

    const auto result = nlohmann::json::parse(slurp(rig.artifacts / "result.json"));
    REQUIRE(result.at("kind") == "failure");
    REQUIRE(result.at("failure").at("kind") == "runtime_error");
    REQUIRE(result.at("failure").at("message") == "unscripted candidate");
}

TEST_CASE("Malformed intents are failures with the intent kept", "[attempt]") {
    LedgerRig rig("attempt_malformed");
    rig.executor.results["bad"] = intent({{"to", "not-an-address"}, {"value", "1"}});
    const auto sends = rig.node->sent.size();

    const auto record =
        rig.runner.run({"bad", ".ts", {}, false}, rig.params, {receipt_ok(30, true)}, rig.targets, rig.artifacts);

    REQUIRE(std::holds_alternative<Failure>(record.result));
    REQUIRE(std::get<Failure>(record.result).kind == FailureKind::MalformedIntent);
    REQUIRE_FALSE(record.receipt.has_value());
    REQUIRE(rig.node->sent.size() == sends);
    REQUIRE(fs::exists(rig.artifacts / "intent.json"));
    REQUIRE(nlohmann::json::parse(slurp(rig.artifacts / "intent.json")).at("to") == "not-an-address");
}

TEST_CASE("Missing candidates score zero", "[attempt]") {
    LedgerRig rig("attempt_missing");

    const auto record = rig.runner.missing("No candidate for problem 'x'", {receipt_ok(30, true)}, rig.targets, rig.artifacts);

    REQUIRE(std::get<Failure>(record.result).kind == FailureKind::MissingEntryPoint);
    REQUIRE(record.report.max_score() == 30.0);
    REQUIRE_FALSE(record.report.passed());
    REQUIRE(rig.executor.requests.empty());
    REQUIRE(fs::exists(rig.artifacts / "report.txt"));
}

TEST_CASE("Artifacts survive candidate output that is not valid UTF-8", "[attempt]") {
    LedgerRig rig("attempt_bytes");
    rig.executor.results["garbled"] = Failure{FailureKind::RuntimeError, std::string("bad \xff" " bytes"), "diag \xfe"};

    const auto record =
        rig.runner.run({"garbled", ".ts", {}, false}, rig.params, {receipt_ok(30, true)}, rig.targets, rig.artifacts);

    REQUIRE_FALSE(record.report.passed());
    REQUIRE(fs::exists(rig.artifacts / "result.json"));
    const auto result = nlohmann::json::parse(slurp(rig.artifacts / "result.json"));
    REQUIRE(result.at("failure").at("message") == "bad \xEF\xBF\xBD bytes");

    SECTION("artifact_json replaces what it cannot encode") {
        std::string text;
        REQUIRE_NOTHROW(text = artifact_json(nlohmann::json{{"stderr", std::string("\xC3")}}));
        REQUIRE_THAT(text, ContainsSubstring("\xEF\xBF\xBD"));
    }
}
