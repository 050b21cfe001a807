/**
 * @file test_tx_executor.cpp
 * @brief Tests for intent validation and transaction submission
 *
 * Covers:
 * - Malformed intents rejected before any ledger access
 * - Gas defaults, fee fields and wire encoding
 * - Native and token transfers with before/after state
 * - Rejected submissions, reverts and receipts that never arrive
 *
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "quest_bench/tx_executor.hpp"
#include "support/fake_ledger.hpp"

#include <memory>
#include <string>
#include <variant>

using namespace quest::bench;
using namespace quest::bench::ledger;
using namespace quest::bench::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

const Address kIdentity = addr("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
const Address kRecipient = addr("0x000000000000000000000000000000000000beef");
const Address kUsdt = addr("0x55d398326f99059ff775485246999027b3197955");

TransactionIntent intent_of(json fields) {
    TransactionIntent out;
    out.fields = std::move(fields);
    return out;
}

Failure rejection(const json& fields) {
    auto prepared = prepare_intent(intent_of(fields), 500000);
    REQUIRE(std::holds_alternative<Failure>(prepared));
    return std::get<Failure>(prepared);
}

struct Bench {
    std::shared_ptr<FakeLedger> node = std::make_shared<FakeLedger>();
    ForkController fork;
    TransactionExecutor executor;

    Bench() : fork(config(), node), executor(fork, {200ms, 10ms, 500000}) {
        node->add_token(kUsdt, 1);
        (void)fork.start("");
        fork.fund_account(kIdentity, pow10(19), {{kUsdt, Wei{1000}, 1}});
    }

    static ForkController::Config config() {
        ForkController::Config cfg;
        cfg.identity = kIdentity;
        return cfg;
    }
};

}  // namespace

TEST_CASE("Malformed intents are rejected without touching the ledger", "[tx]") {
    REQUIRE(rejection(json::array()).message == "Transaction intent is not an object");
    REQUIRE_THAT(rejection({{"to", 12}}).message, ContainsSubstring("'to' must be an address string"));
    REQUIRE_THAT(rejection({{"to", "0x1234"}}).message, ContainsSubstring("'to' is not a valid address"));
    REQUIRE_THAT(rejection({{"to", kRecipient.hex}, {"value", "1.5"}}).message, ContainsSubstring("'value'"));
    REQUIRE_THAT(rejection({{"to", kRecipient.hex}, {"value", -1}}).message, ContainsSubstring("'value'"));
    REQUIRE_THAT(rejection({{"to", kRecipient.hex}, {"data", "0xabc"}}).message, ContainsSubstring("'data' is not hex"));
    REQUIRE_THAT(rejection({{"to", nullptr}, {"data", "0x"}}).message, ContainsSubstring("Contract creation without bytecode"));
    REQUIRE_THAT(rejection({{"to", kRecipient.hex}, {"gas", "0"}}).message, ContainsSubstring("usable gas limit"));
    REQUIRE_THAT(rejection({{"to", kRecipient.hex}, {"gasPrice", "1"}, {"maxFeePerGas", "2"}}).message,
                 ContainsSubstring("Both 'gasPrice' and EIP-1559"));
    REQUIRE_THAT(rejection({{"to", kRecipient.hex}, {"nonce", "abc"}}).message, ContainsSubstring("'nonce'"));
    REQUIRE(rejection({{"to", 1}}).kind == FailureKind::MalformedIntent);
}

TEST_CASE("Prepared transactions carry defaults and wire quantities", "[tx]") {
    auto prepared = prepare_intent(intent_of({{"to", kRecipient.hex}, {"value", "1000"}, {"data", "0xABCD"}}), 500000);
    REQUIRE(std::holds_alternative<PreparedTransaction>(prepared));
    const auto& tx = std::get<PreparedTransaction>(prepared);
    REQUIRE(tx.gas == 500000);
    REQUIRE(tx.data == "0xABCD");

    const auto wire = tx.to_rpc(kIdentity);
    REQUIRE(wire.at("from") == kIdentity.hex);
    REQUIRE(wire.at("to") == kRecipient.hex);
    REQUIRE(wire.at("value") == "0x3e8");
    REQUIRE(wire.at("gas") == "0x7a120");
    REQUIRE_FALSE(wire.contains("gasPrice"));

    SECTION("gasLimit and fee fields") {
        auto p = prepare_intent(
            intent_of({{"to", kRecipient.hex}, {"gasLimit", 21000}, {"maxFeePerGas", "5"}, {"nonce", "3"}}), 500000);
        const auto& t = std::get<PreparedTransaction>(p);
        REQUIRE(t.gas == 21000);
        REQUIRE(t.value == Wei{0});
        REQUIRE(t.data == "0x");
        REQUIRE(t.to_rpc(kIdentity).at("maxFeePerGas") == "0x5");
        REQUIRE(t.to_rpc(kIdentity).at("nonce") == "0x3");
    }
    SECTION("contract creation") {
        auto p = prepare_intent(intent_of({{"data", "0x6080"}}), 500000);
        const auto& t = std::get<PreparedTransaction>(p);
        REQUIRE_FALSE(t.to.has_value());
        REQUIRE_FALSE(t.to_rpc(kIdentity).contains("to"));
    }
}

TEST_CASE("A native transfer is captured with state around it", "[tx]") {
    Bench bench;
    StateTarget recipient{StateKind::Native, kRecipient, {}, {}, {}};
    const Wei amount = pow10(16);

    std::string diag;
    auto intent = intent_of({{"to", kRecipient.hex}, {"value", to_decimal(amount)}, {"data", "0x"}});
    intent.warnings.push_back("transaction is missing 'gas'");
    const auto outcome = bench.executor.execute(intent, {recipient}, diag);

    REQUIRE(std::holds_alternative<SubmittedTransaction>(outcome));
    const auto& sub = std::get<SubmittedTransaction>(outcome);
    REQUIRE(sub.receipt.success);
    REQUIRE(sub.receipt.gas_used == 21000);
    REQUIRE(sub.receipt.gas_limit == 500000);
    REQUIRE(sub.before.value(recipient) == Wei{0});
    REQUIRE(sub.after.value(recipient) == amount);
    REQUIRE(sub.after.block_number == sub.before.block_number + 1);
    REQUIRE_THAT(diag, ContainsSubstring("Intent warning: transaction is missing 'gas'"));
    REQUIRE(bench.node->sent.back().at("from") == kIdentity.hex);
}

TEST_CASE("Token transfers emit logs", "[tx]") {
    Bench bench;
    StateTarget held{StateKind::TokenBalance, kUsdt, kRecipient, {}, {}};
    const std::string data = "0xa9059cbb" + abi_word(kRecipient) + abi_word(Wei{250});

    std::string diag;
    const auto outcome = bench.executor.execute(intent_of({{"to", kUsdt.hex}, {"value", "0"}, {"data", data}}), {held}, diag);
    const auto& sub = std::get<SubmittedTransaction>(outcome);
    REQUIRE(sub.receipt.success);
    REQUIRE(sub.after.value(held) == Wei{250});
    REQUIRE(sub.receipt.logs.size() == 1);
    REQUIRE(sub.receipt.logs[0].topics[0] == kTransferTopic);
}

TEST_CASE("Submission problems are reported per transaction", "[tx]") {
    Bench bench;
    StateTarget recipient{StateKind::Native, kRecipient, {}, {}, {}};
    const auto intent = intent_of({{"to", kRecipient.hex}, {"value", "1"}});
    std::string diag;

    SECTION("malformed intents never reach the ledger") {
        const auto sends = bench.node->sent.size();
        const auto outcome = bench.executor.execute(intent_of({{"to", "nope"}}), {recipient}, diag);
        REQUIRE(std::get<Failure>(outcome).kind == FailureKind::MalformedIntent);
        REQUIRE(bench.node->sent.size() == sends);
        REQUIRE_THAT(diag, ContainsSubstring("Intent not submitted"));
    }
    SECTION("rejected by the node") {
        bench.node->reject_sends = true;
        const auto outcome = bench.executor.execute(intent, {recipient}, diag);
        const auto& sub = std::get<SubmittedTransaction>(outcome);
        REQUIRE_FALSE(sub.receipt.success);
        REQUIRE_FALSE(sub.receipt.timed_out);
        REQUIRE_THAT(sub.receipt.error, ContainsSubstring("insufficient funds"));
        REQUIRE(sub.after.value(recipient) == Wei{0});
    }
    SECTION("reverted") {
        const Address vault = addr("0x00000000000000000000000000000000000000aa");
        bench.node->add_reverting_contract(vault);
        const auto outcome = bench.executor.execute(intent_of({{"to", vault.hex}, {"data", "0x12345678"}}), {}, diag);
        const auto& sub = std::get<SubmittedTransaction>(outcome);
        REQUIRE_FALSE(sub.receipt.success);
        REQUIRE(sub.receipt.error == "execution reverted");
        REQUIRE(sub.receipt.gas_used == 30000);
        REQUIRE_THAT(diag, ContainsSubstring("reverted"));
    }
    SECTION("receipt never arrives") {
        bench.node->withhold_receipts = true;
        const auto outcome = bench.executor.execute(intent, {recipient}, diag);
        const auto& sub = std::get<SubmittedTransaction>(outcome);
        REQUIRE(sub.receipt.timed_out);
        REQUIRE_FALSE(sub.receipt.tx_hash.empty());
        REQUIRE(sub.receipt.error == "No receipt within 200ms");
    }
    SECTION("an unreachable ledger is an environment error") {
        bench.node->fail_all = true;
        REQUIRE_THROWS_AS(bench.executor.execute(intent, {recipient}, diag), EnvironmentError);
    }
}
