/**
 * @file ledger_rig.hpp
 * @brief Attempt runner wired to the FakeLedger and a scripted executor
 *
 * The identity is funded with 10 BNB, `usdt` is registered as a preset fixture
 * and artifacts go to a per-test temporary directory that is removed afterwards.
 *
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "quest_bench/attempt.hpp"
#include "support/fake_ledger.hpp"
#include "support/scripted_executor.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <string>

namespace quest::bench::testing {

inline const Address kRigIdentity = addr("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
inline const Address kRigRecipient = addr("0x000000000000000000000000000000000000beef");
inline const Address kRigUsdt = addr("0x55d398326f99059ff775485246999027b3197955");

inline std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

/// Passes when a receipt exists and succeeded.
inline Check receipt_ok(double weight, bool critical) {
    return Check{"tx_success", weight, critical, [](const CheckContext& ctx) {
                     const bool ok = ctx.receipt != nullptr && ctx.receipt->success;
                     return CheckOutcome{ok, ok ? "mined" : "no successful receipt"};
                 }};
}

inline Check query_ok(double weight) {
    return Check{"query_success", weight, false, [](const CheckContext& ctx) {
                     const bool ok = ctx.query() != nullptr;
                     return CheckOutcome{ok, ok ? "answered" : "no query result"};
                 }};
}

struct LedgerRig {
    std::shared_ptr<FakeLedger> node = std::make_shared<FakeLedger>();
    ledger::ForkController fork;
    ledger::TransactionExecutor transactions;
    ScriptedExecutor executor;
    AttemptRunner runner;
    std::filesystem::path artifacts;
    StateTarget recipient{StateKind::Native, kRigRecipient, {}, {}, {}};
    std::map<std::string, StateTarget> targets{{"recipient_balance", recipient}};
    ParameterInstance params{{{"recipient", kRigRecipient}}};

    explicit LedgerRig(const std::string& name)
        : fork(config(), node),
          transactions(fork, {std::chrono::milliseconds{200}, std::chrono::milliseconds{10}, 500000}),
          runner({std::chrono::milliseconds{1234}}, fork, executor, transactions),
          artifacts(std::filesystem::temp_directory_path() / ("quest_bench_" + name)) {
        std::filesystem::remove_all(artifacts);
        (void)fork.start("");
        fork.fund_account(kRigIdentity, pow10(19));
        fork.add_preset_fixtures({{"usdt", kRigUsdt}});
        (void)fork.deploy_fixtures();
    }
    ~LedgerRig() {
        std::error_code ec;
        std::filesystem::remove_all(artifacts, ec);
    }

    /// Scripts \a source to send \a wei to the recipient.
    void script_send(const std::string& source, const std::string& wei) {
        executor.results[source] = intent({{"to", kRigRecipient.hex}, {"value", wei}, {"data", "0x"}});
    }

    static ledger::ForkController::Config config() {
        ledger::ForkController::Config cfg;
        cfg.identity = kRigIdentity;
        return cfg;
    }
};

}  // namespace quest::bench::testing
