/**
 * @file test_rpc_client.cpp
 * @brief Tests for JSON-RPC response handling and ledger read encoding
 *
 * Covers:
 * - Response unwrapping: result, error objects, malformed replies
 * - The sequential default batch
 * - Quantity decoding and 64-bit range checks
 * - Read requests and reply decoding per state kind
 * - Receipt decoding including logs
 * - Transport failure against a closed port
 *
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "quest_bench/eth.hpp"
#include "quest_bench/rpc_client.hpp"

#include <string>
#include <vector>

using namespace quest::bench;
using namespace quest::bench::ledger;
using Catch::Matchers::ContainsSubstring;
using nlohmann::json;

namespace {

class EchoTransport final : public RpcTransport {
public:
    std::vector<std::string> seen;

    json call(const std::string& method, const json& params) override {
        seen.push_back(method);
        if (method == "boom") throw RpcError(-32000, "boom");
        return params.empty() ? json(method) : params.at(0);
    }
    std::string endpoint() const override { return "echo://"; }
};

const Address kToken = *parse_address("0x55d398326f99059ff775485246999027b3197955");
const Address kHolder = *parse_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");

}  // namespace

TEST_CASE("unwrap_response extracts results and raises errors", "[rpc]") {
    REQUIRE(unwrap_response(json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", "0x1"}}) == "0x1");
    REQUIRE(unwrap_response(json{{"id", 1}, {"result", nullptr}, {"error", nullptr}}).is_null());

    try {
        (void)unwrap_response(json{{"id", 1}, {"error", {{"code", -32601}, {"message", "method not found"}, {"data", "x"}}}});
        FAIL("expected RpcError");
    } catch (const RpcError& e) {
        REQUIRE(e.code() == -32601);
        REQUIRE(std::string{e.what()} == "method not found");
        REQUIRE(e.data() == "x");
    }

    REQUIRE_THROWS_AS(unwrap_response(json::array()), TransportError);
    REQUIRE_THROWS_WITH(unwrap_response(json{{"id", 1}}), ContainsSubstring("neither result nor error"));
}

TEST_CASE("The default batch issues calls in order", "[rpc]") {
    EchoTransport transport;
    const auto results = transport.batch({{"a", json::array({1})}, {"b", json::array()}, {"c", json::array({"z"})}});

    REQUIRE(transport.seen == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(results == std::vector<json>{1, "b", "z"});

    REQUIRE_THROWS_AS(transport.batch({{"a", json::array()}, {"boom", json::array()}}), RpcError);
}

TEST_CASE("Quantities decode from hex", "[rpc][eth]") {
    REQUIRE(eth::to_wei(json("0x0")) == Wei{0});
    REQUIRE(eth::to_wei(json("0x")) == Wei{0});
    REQUIRE(eth::to_wei(json("0xde0b6b3a7640000")) == pow10(18));
    REQUIRE(eth::to_wei(json(7u)) == Wei{7});
    REQUIRE(eth::to_u64(json("0x5208")) == 21000);

    REQUIRE_THROWS_AS(eth::to_wei(json("12")), TransportError);
    REQUIRE_THROWS_AS(eth::to_wei(json(nullptr)), TransportError);
    REQUIRE_THROWS_WITH(eth::to_u64(json("0x10000000000000000")), ContainsSubstring("does not fit 64 bits"));
}

TEST_CASE("Read requests follow the state kind", "[rpc][eth]") {
    StateTarget native{StateKind::Native, kHolder, {}, {}, {}};
    auto call = eth::read_call(native);
    REQUIRE(call.method == "eth_getBalance");
    REQUIRE(call.params == json::array({kHolder.hex, "latest"}));

    StateTarget nonce{StateKind::Nonce, kHolder, {}, {}, {}};
    REQUIRE(eth::read_call(nonce, "0x10").method == "eth_getTransactionCount");
    REQUIRE(eth::read_call(nonce, "0x10").params.at(1) == "0x10");

    StateTarget slot{StateKind::Storage, kToken, {}, {}, "0x3"};
    call = eth::read_call(slot);
    REQUIRE(call.method == "eth_getStorageAt");
    REQUIRE(call.params.at(1) == "0x3");

    StateTarget balance{StateKind::TokenBalance, kToken, kHolder, {}, {}};
    call = eth::read_call(balance);
    REQUIRE(call.method == "eth_call");
    REQUIRE(call.params.at(0).at("to") == kToken.hex);
    REQUIRE(call.params.at(0).at("data") == std::string{eth::kBalanceOf} + abi_word(kHolder));

    StateTarget allowance{StateKind::Allowance, kToken, kHolder, kToken, {}};
    REQUIRE(eth::read_call(allowance).params.at(0).at("data") ==
            std::string{eth::kAllowance} + abi_word(kHolder) + abi_word(kToken));
}

TEST_CASE("Read replies decode per state kind", "[rpc][eth]") {
    const StateTarget native{StateKind::Native, kHolder, {}, {}, {}};
    const StateTarget code{StateKind::CodeSize, kToken, {}, {}, {}};
    const StateTarget balance{StateKind::TokenBalance, kToken, kHolder, {}, {}};

    REQUIRE(eth::decode_read(native, json("0x10")) == Wei{16});
    REQUIRE(eth::decode_read(code, json("0x6001600055")) == Wei{5});
    REQUIRE(eth::decode_read(code, json("0x")) == Wei{0});
    REQUIRE(eth::decode_read(balance, json("0x" + abi_word(Wei{5000}))) == Wei{5000});
    REQUIRE(eth::decode_read(balance, json("0x" + abi_word(Wei{9}) + abi_word(Wei{1}))) == Wei{9});
    REQUIRE(eth::decode_read(balance, json("0x")) == Wei{0});

    REQUIRE_THROWS_AS(eth::decode_read(balance, json(12)), TransportError);
    REQUIRE_THROWS_AS(eth::decode_read(code, json(nullptr)), TransportError);
}

TEST_CASE("Receipts decode status, gas and logs", "[rpc][eth]") {
    const json receipt = {
        {"transactionHash", "0xfeed"},
        {"status", "0x1"},
        {"gasUsed", "0x5208"},
        {"effectiveGasPrice", "0x3b9aca00"},
        {"blockNumber", "0x65"},
        {"contractAddress", nullptr},
        {"logs", json::array({{{"address", kToken.hex}, {"topics", json::array({"0xddf2", "0x01"})}, {"data", "0x05"}}})},
    };

    const auto info = eth::decode_receipt(receipt, 50000);
    REQUIRE(info.success);
    REQUIRE(info.tx_hash == "0xfeed");
    REQUIRE(info.gas_used == 21000);
    REQUIRE(info.gas_limit == 50000);
    REQUIRE(info.block_number == 101);
    REQUIRE(info.gas_cost() == Wei{21000} * Wei{1'000'000'000});
    REQUIRE_FALSE(info.contract_address.has_value());
    REQUIRE(info.error.empty());
    REQUIRE(info.logs.size() == 1);
    REQUIRE(info.logs[0].address == kToken);
    REQUIRE(info.logs[0].topics == std::vector<std::string>{"0xddf2", "0x01"});

    SECTION("reverted receipts carry an error") {
        auto reverted = receipt;
        reverted["status"] = "0x0";
        const auto r = eth::decode_receipt(reverted, 50000);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error == "execution reverted");
    }
}

TEST_CASE("CurlTransport reports unreachable endpoints", "[rpc][curl]") {
    CurlTransport transport({"http://127.0.0.1:1", std::chrono::milliseconds{2000}, std::chrono::milliseconds{1000}});
    REQUIRE(transport.endpoint() == "http://127.0.0.1:1");
    REQUIRE_THROWS_AS(transport.call("eth_chainId", json::array()), TransportError);
    REQUIRE(transport.batch({}).empty());
}
