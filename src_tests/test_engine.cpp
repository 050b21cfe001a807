/**
 * @file test_engine.cpp
 * @brief Tests for running catalogue problems end to end
 *
 * Covers:
 * - Atomic problems: PASS and FAIL outcomes, artifacts, snapshot isolation
 * - Setup failures reported as ERROR without aborting the run
 * - The problem id filter
 * - Composite problems reported with their session details
 *
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "quest_bench/engine.hpp"
#include "support/ledger_rig.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace quest::bench;
using namespace quest::bench::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

namespace fs = std::filesystem;

CheckDecl check(const std::string& kind, double weight, bool critical, std::map<std::string, std::string> options = {}) {
    CheckDecl d;
    d.name = kind;
    d.kind = kind;
    d.weight = weight;
    d.critical = critical;
    d.options = std::move(options);
    return d;
}

ParamSpec fixed(const std::string& name, ParamType type, const std::string& value) {
    ParamSpec spec;
    spec.name = name;
    spec.type = type;
    spec.rule = GenerationRule{"fixed", {value}};
    return spec;
}

/// Send 0.01 BNB to the rig's recipient.
ProblemSpec native_send(const std::string& id) {
    ProblemSpec p;
    p.id = id;
    p.category = "native_transfer";
    p.difficulty = "easy";
    p.description = "Move BNB between accounts.";
    p.templates = {"Send {amount} BNB to {recipient}"};
    p.params = {fixed("recipient", ParamType::Address, kRigRecipient.hex), fixed("amount", ParamType::Amount, "0.01")};
    p.state = {{"recipient_balance", StateKind::Native, {"recipient"}}};
    p.checks = {check("tx_success", 50, true),
                check("state_delta", 50, true, {{"state", "recipient_balance"}, {"expect", "amount"}})};
    return p;
}

ProblemSpec drip_workflow() {
    ProblemSpec p;
    p.id = "drip";
    p.category = "composite";
    p.kind = ProblemKind::Composite;
    p.composite = CompositeConfig{2, 2, true};
    p.params = {fixed("recipient", ParamType::Address, kRigRecipient.hex)};
    p.state = {{"recipient_balance", StateKind::Native, {"recipient"}}};
    p.checks = {check("tx_success", 100, true)};
    p.step_checks = {check("tx_success", 1, true)};
    return p;
}

struct EngineRig {
    LedgerRig rig;
    Catalogue catalogue;
    ValidatorRegistry registry;
    ScriptedCandidates candidates;

    explicit EngineRig(const std::string& name) : rig(name) {
        catalogue.problems = {native_send("exact"), native_send("short"), drip_workflow()};
        registry = ValidatorRegistry::from_catalogue(catalogue);
        rig.script_send("pay", "10000000000000000");
        rig.script_send("underpay", "1");
        rig.script_send("drip", "1000");
        candidates.solutions["exact"] = "pay";
        candidates.solutions["short"] = "underpay";
        candidates.steps["drip"] = {"drip", "drip"};
    }

    Engine engine(std::set<std::string> only = {}) {
        return Engine({rig.artifacts, 7, std::move(only)}, rig.runner, registry);
    }
};

}  // namespace

TEST_CASE("Atomic problems pass or fail on their checks", "[engine]") {
    EngineRig env("engine_atomic");
    auto engine = env.engine();

    const auto pass = engine.run_problem(*env.catalogue.find("exact"), env.candidates);
    REQUIRE(pass.status == "PASS");
    REQUIRE(pass.score == 100.0);
    REQUIRE(pass.result_kind == "transaction");
    REQUIRE(pass.receipt.has_value());
    REQUIRE(pass.params.amount("amount") == pow10(16));
    REQUIRE(pass.artifact_dir == env.rig.artifacts / "native_transfer" / "exact");

    SECTION("artifacts describe the attempt") {
        const auto dir = pass.artifact_dir;
        REQUIRE_THAT(slurp(dir / "prompt.txt"), ContainsSubstring("# exact (native_transfer, easy)"));
        REQUIRE_THAT(slurp(dir / "prompt.txt"), ContainsSubstring("Send 0.01 BNB to " + kRigRecipient.hex));
        REQUIRE(nlohmann::json::parse(slurp(dir / "params.json")).at("recipient") == kRigRecipient.hex);
        REQUIRE(fs::exists(dir / "attempt_1" / "result.json"));
        REQUIRE_THAT(slurp(dir / "engine_diag.txt"), ContainsSubstring("PASS exact"));
    }
    SECTION("every attempt starts from the same state") {
        REQUIRE(env.rig.node->balance(kRigRecipient) == Wei{0});
        const auto fail = engine.run_problem(*env.catalogue.find("short"), env.candidates);
        REQUIRE(fail.status == "FAIL");
        REQUIRE(fail.score == 50.0);
        REQUIRE(fail.max_score == 100.0);
        REQUIRE_THAT(fail.feedback, ContainsSubstring("[FAIL] state_delta (critical)"));
        REQUIRE(env.rig.node->count("evm_revert") == 2);
    }
    SECTION("a missing solution fails through the failure report") {
        env.candidates.solutions.erase("exact");
        const auto missing = engine.run_problem(*env.catalogue.find("exact"), env.candidates);
        REQUIRE(missing.status == "FAIL");
        REQUIRE(missing.result_kind == "failure");
        REQUIRE(missing.max_score == 100.0);
        REQUIRE(env.rig.executor.requests.size() == 1);
    }
}

TEST_CASE("Problems that cannot be set up are reported as ERROR", "[engine]") {
    EngineRig env("engine_error");
    auto engine = env.engine();

    SECTION("unknown fixture") {
        auto broken = native_send("exact");
        ParamSpec token;
        token.name = "token";
        token.type = ParamType::Address;
        token.rule = GenerationRule{"fixture", {"missing"}};
        broken.params.push_back(token);

        const auto outcome = engine.run_problem(broken, env.candidates);
        REQUIRE(outcome.status == "ERROR");
        REQUIRE(outcome.result_kind == "failure");
        REQUIRE_THAT(outcome.feedback, ContainsSubstring("Problem setup failed: Parameter 'token'"));
        REQUIRE_THAT(slurp(outcome.artifact_dir / "engine_diag.txt"), ContainsSubstring("unknown fixture 'missing'"));
        REQUIRE_FALSE(fs::exists(outcome.artifact_dir / "prompt.txt"));
    }
    SECTION("no validator") {
        const auto outcome = engine.run_problem(native_send("unregistered"), env.candidates);
        REQUIRE(outcome.status == "ERROR");
        REQUIRE_THAT(outcome.feedback, ContainsSubstring("No validator registered for problem 'unregistered'"));
        REQUIRE(env.rig.executor.requests.empty());
        REQUIRE(env.rig.node->count("evm_snapshot") == 0);
    }
}

TEST_CASE("Runs cover the catalogue or only the selected problems", "[engine]") {
    EngineRig env("engine_run");

    SECTION("everything in catalogue order") {
        auto engine = env.engine();
        const auto outcomes = engine.run(env.catalogue, env.candidates);
        REQUIRE(outcomes.size() == 3);
        REQUIRE(outcomes[0].problem.id == "exact");
        REQUIRE(outcomes[1].status == "FAIL");
        REQUIRE(outcomes[2].problem.kind == ProblemKind::Composite);
    }
    SECTION("filtered") {
        auto engine = env.engine({"short"});
        const auto outcomes = engine.run(env.catalogue, env.candidates);
        REQUIRE(outcomes.size() == 1);
        REQUIRE(outcomes[0].problem.id == "short");
    }
}

TEST_CASE("Composite problems report their session", "[engine]") {
    EngineRig env("engine_composite");
    auto engine = env.engine();

    const auto outcome = engine.run_problem(*env.catalogue.find("drip"), env.candidates);
    REQUIRE(outcome.status == "PASS");
    REQUIRE(outcome.score == 100.0);
    REQUIRE(outcome.result_kind == "transaction");
    REQUIRE(outcome.receipt.has_value());
    REQUIRE(outcome.composite.has_value());
    REQUIRE(outcome.composite->at("actual_steps") == 2);
    REQUIRE(outcome.composite->at("terminal").at("passed") == true);
    REQUIRE(fs::exists(outcome.artifact_dir / "step_2" / "result.json"));
    REQUIRE(env.rig.node->balance(kRigRecipient) == Wei{0});
}
