/**
 * @file test_catalogue_loader.cpp
 * @brief Tests for the line-oriented problem catalogue format
 *
 * Covers:
 * - Atomic and composite blocks with parameters, state declarations and checks
 * - Defaults for id, category and composite knobs
 * - Rejection of malformed lines with file:line context
 * - Directory loading and duplicate id detection across files
 *
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "quest_bench/catalogue_loader.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace quest::bench;
using Catch::Matchers::ContainsSubstring;

namespace {

namespace fs = std::filesystem;

struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& name) : path(fs::temp_directory_path() / ("quest_bench_" + name)) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path write(const std::string& file, const std::string& text) const {
        const auto target = path / file;
        fs::create_directories(target.parent_path());
        std::ofstream(target) << text;
        return target;
    }
};

const char* kNative = R"(# native transfers
id=bnb_transfer
category=native_transfer
difficulty=basic
template=Send {amount} BNB to {recipient}
template=Transfer {amount} BNB to {recipient}
param.recipient=address random
param.amount=amount random:0.001:0.1 decimals=3
state.recipient_balance=native recipient
check.tx_success=tx_success weight=30 critical
check.recipient_delta=state_delta weight=25 state=recipient_balance expect=amount tolerance=0.1%
---
param.token=address fixture:usdt
state.holder=token token identity
check.ok=query_success weight=10
)";

}  // namespace

TEST_CASE("Atomic blocks load with parameters, state and checks", "[catalogue]") {
    TempDir dir("catalogue_atomic");
    const auto file = dir.write("native.qst", kNative);

    const auto catalogue = CatalogueLoader{}.load(file);
    REQUIRE(catalogue.problems.size() == 2);

    const auto& p = catalogue.problems[0];
    REQUIRE(p.id == "bnb_transfer");
    REQUIRE(p.category == "native_transfer");
    REQUIRE(p.difficulty == "basic");
    REQUIRE(p.kind == ProblemKind::Atomic);
    REQUIRE(p.templates.size() == 2);

    REQUIRE(p.params.size() == 2);
    REQUIRE(p.params[1].name == "amount");
    REQUIRE(p.params[1].type == ParamType::Amount);
    REQUIRE(p.params[1].rule.method == "random");
    REQUIRE(p.params[1].rule.args == std::vector<std::string>{"0.001", "0.1"});
    REQUIRE(p.params[1].decimals == 3);
    REQUIRE(p.params[1].unit_decimals == 18);

    REQUIRE(p.state.size() == 1);
    REQUIRE(p.state[0].kind == StateKind::Native);
    REQUIRE(p.state[0].args == std::vector<std::string>{"recipient"});

    REQUIRE(p.checks.size() == 2);
    REQUIRE(p.checks[0].critical);
    REQUIRE(p.checks[0].weight == 30.0);
    REQUIRE_FALSE(p.checks[1].critical);
    REQUIRE(p.checks[1].options.at("tolerance") == "0.1%");
    REQUIRE(p.checks[1].options.at("state") == "recipient_balance");

    SECTION("missing id and category fall back to the file") {
        const auto& q = catalogue.problems[1];
        REQUIRE(q.id == "native#2");
        REQUIRE(q.category == "native");
        REQUIRE(q.params[0].rule.method == "fixture");
        REQUIRE(q.params[0].rule.args == std::vector<std::string>{"usdt"});
    }
}

TEST_CASE("Composite blocks carry workflow settings", "[catalogue]") {
    TempDir dir("catalogue_composite");
    const auto file = dir.write("flow.qst", R"(
id=wrap_and_send
kind=composite
optimal_steps=3
max_rounds_multiplier=3
planning=no
pass_ratio=0.75
step_check.ok=tx_success weight=1
check.done=tx_success weight=10
)");

    const auto catalogue = CatalogueLoader{}.load(file);
    REQUIRE(catalogue.problems.size() == 1);
    const auto& p = catalogue.problems[0];
    REQUIRE(p.kind == ProblemKind::Composite);
    REQUIRE(p.composite.has_value());
    REQUIRE(p.composite->optimal_steps == 3);
    REQUIRE(p.composite->max_rounds_multiplier == 3);
    REQUIRE_FALSE(p.composite->planning);
    REQUIRE(p.pass_ratio == 0.75);
    REQUIRE(p.step_checks.size() == 1);
    REQUIRE(p.checks.size() == 1);
}

TEST_CASE("Malformed catalogues are rejected with location", "[catalogue]") {
    TempDir dir("catalogue_errors");
    const CatalogueLoader loader;

    SECTION("line without key=value") {
        const auto file = dir.write("bad.qst", "id=x\nthis is not an entry\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("bad.qst:2"));
    }
    SECTION("unknown key") {
        const auto file = dir.write("bad.qst", "id=x\ncolour=blue\ncheck.a=tx_success weight=1\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("Unknown key 'colour'"));
    }
    SECTION("check without weight") {
        const auto file = dir.write("bad.qst", "id=x\ncheck.a=tx_success critical\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("missing weight"));
    }
    SECTION("empty amount range") {
        const auto file = dir.write("bad.qst", "id=x\nparam.a=amount random:2:1\ncheck.a=tx_success weight=1\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("Empty amount range"));
    }
    SECTION("amount bounds finer than decimals") {
        const auto file = dir.write("bad.qst", "id=x\nparam.a=amount random:0.0001:1 decimals=3\ncheck.a=tx_success weight=1\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("at most 3 decimals"));
    }
    SECTION("state referencing an undeclared parameter") {
        const auto file = dir.write("bad.qst", "id=x\nstate.b=native nobody\ncheck.a=tx_success weight=1\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("unknown address 'nobody'"));
    }
    SECTION("state with the wrong arity") {
        const auto file = dir.write("bad.qst", "id=x\nstate.b=token identity\ncheck.a=tx_success weight=1\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("takes 2 argument(s)"));
    }
    SECTION("problem without checks") {
        const auto file = dir.write("bad.qst", "id=x\ncategory=c\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("declares no checks"));
    }
    SECTION("composite without optimal_steps") {
        const auto file = dir.write("bad.qst", "id=x\nkind=composite\ncheck.a=tx_success weight=1\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("optimal_steps >= 1"));
    }
    SECTION("atomic problem with step checks") {
        const auto file = dir.write("bad.qst", "id=x\nstep_check.s=tx_success weight=1\ncheck.a=tx_success weight=1\n");
        REQUIRE_THROWS_WITH(loader.load(file), ContainsSubstring("carries composite settings"));
    }
    SECTION("missing file") {
        REQUIRE_THROWS_WITH(loader.load(dir.path / "absent.qst"), ContainsSubstring("does not exist"));
    }
}

TEST_CASE("Directories load in path order and reject duplicate ids", "[catalogue]") {
    TempDir dir("catalogue_dir");
    dir.write("b/second.qst", "id=two\ncheck.a=tx_success weight=1\n");
    dir.write("a/first.qst", "id=one\ncheck.a=tx_success weight=1\n");
    dir.write("notes.txt", "not a catalogue\n");

    const CatalogueLoader loader;
    const auto catalogue = loader.load_directory(dir.path);
    REQUIRE(catalogue.problems.size() == 2);
    REQUIRE(catalogue.problems[0].id == "one");
    REQUIRE(catalogue.problems[1].id == "two");
    REQUIRE(catalogue.find("two") != nullptr);
    REQUIRE(catalogue.find("three") == nullptr);

    dir.write("c/dup.qst", "id=one\ncheck.a=tx_success weight=1\n");
    REQUIRE_THROWS_WITH(loader.load_directory(dir.path), ContainsSubstring("Duplicate problem id 'one'"));
}
