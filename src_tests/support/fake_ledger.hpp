/**
 * @file fake_ledger.hpp
 * @brief In-process JSON-RPC ledger used by the ledger and engine tests
 *
 * Understands the subset of the anvil/Ethereum RPC surface the harness uses:
 * balance/nonce/code/storage reads, ERC-20 balanceOf/allowance/transfer/deposit,
 * eth_sendTransaction from impersonated accounts, receipts, snapshots and the
 * anvil_* cheat methods. Transactions mine instantly into the next block.
 *
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "quest_bench/primitives.hpp"
#include "quest_bench/rpc_client.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace quest::bench::testing {

using nlohmann::json;
using ledger::RpcError;
using ledger::TransportError;

inline constexpr const char* kTransferTopic = "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";

inline Address addr(const std::string& text) {
    auto parsed = parse_address(text);
    if (!parsed) throw std::invalid_argument("bad test address " + text);
    return *parsed;
}

inline Address addr_of(const json& value) { return addr(value.get<std::string>()); }

inline std::string hex64(std::uint64_t value) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    return std::string(48, '0') + buf;
}

class FakeLedger final : public ledger::RpcTransport {
public:
    struct Token {
        std::uint64_t balance_slot{0};
        bool wraps_native{false};  ///< deposit() mints one token per wei sent
        std::map<std::string, Wei> balances;
        std::map<std::pair<std::string, std::string>, Wei> allowances;
    };

    struct World {
        std::uint64_t block{100};
        std::map<std::string, Wei> balances;
        std::map<std::string, std::uint64_t> nonces;
        std::map<std::string, std::string> code;
        std::map<std::pair<std::string, std::string>, std::string> storage;
        std::map<std::string, Token> tokens;
        std::map<std::string, json> receipts;
        std::set<std::string> reverting;  ///< contracts whose every call reverts
    };

    // Knobs flipped by tests.
    bool fail_all{false};           ///< every call throws TransportError
    bool reject_sends{false};       ///< eth_sendTransaction answers with an RPC error
    bool withhold_receipts{false};  ///< eth_getTransactionReceipt keeps returning null
    bool refuse_revert{false};      ///< evm_revert answers false
    std::uint64_t chain_id{56};
    Wei gas_price{1'000'000'000};

    World world;
    std::set<std::string> impersonated;
    std::vector<std::string> methods;  ///< every method called, in order
    std::vector<json> sent;            ///< eth_sendTransaction payloads
    unsigned resets{0};

    void set_balance(const Address& account, const Wei& value) { world.balances[account.hex] = value; }
    [[nodiscard]] Wei balance(const Address& account) const {
        const auto it = world.balances.find(account.hex);
        return it == world.balances.end() ? Wei{0} : it->second;
    }

    void add_token(const Address& token, std::uint64_t balance_slot, bool wraps_native = false) {
        auto& t = world.tokens[token.hex];
        t.balance_slot = balance_slot;
        t.wraps_native = wraps_native;
        world.code[token.hex] = "0x6080604052";
    }
    void set_token_balance(const Address& token, const Address& holder, const Wei& value) {
        world.tokens.at(token.hex).balances[holder.hex] = value;
    }
    [[nodiscard]] Wei token_balance(const Address& token, const Address& holder) const {
        const auto& balances = world.tokens.at(token.hex).balances;
        const auto it = balances.find(holder.hex);
        return it == balances.end() ? Wei{0} : it->second;
    }

    void add_reverting_contract(const Address& contract) {
        world.code[contract.hex] = "0x60006000fd";
        world.reverting.insert(contract.hex);
    }

    [[nodiscard]] std::size_t count(const std::string& method) const {
        std::size_t n = 0;
        for (const auto& m : methods) n += m == method ? 1 : 0;
        return n;
    }

    json call(const std::string& method, const json& params) override {
        methods.push_back(method);
        if (fail_all) throw TransportError("connect to fake ledger: connection refused");

        if (method == "eth_chainId") return to_quantity(chain_id);
        if (method == "eth_blockNumber") return to_quantity(world.block);
        if (method == "eth_getBalance") return to_quantity(balance(addr_of(params.at(0))));
        if (method == "eth_getTransactionCount") return to_quantity(nonce(params.at(0)));
        if (method == "eth_getCode") {
            const auto it = world.code.find(addr_of(params.at(0)).hex);
            return it == world.code.end() ? std::string{"0x"} : it->second;
        }
        if (method == "eth_getStorageAt") {
            const auto it = world.storage.find({addr_of(params.at(0)).hex, params.at(1).get<std::string>()});
            return "0x" + (it == world.storage.end() ? std::string(64, '0') : it->second);
        }
        if (method == "eth_call") return eth_call(params.at(0));
        if (method == "eth_sendTransaction") return send(params.at(0));
        if (method == "eth_getTransactionReceipt") {
            if (withhold_receipts) return nullptr;
            const auto it = world.receipts.find(params.at(0).get<std::string>());
            return it == world.receipts.end() ? json(nullptr) : it->second;
        }
        if (method == "evm_snapshot") {
            snapshots_.push_back(world);
            return to_quantity(static_cast<std::uint64_t>(snapshots_.size()));
        }
        if (method == "evm_revert") {
            const auto id = parse_wei(params.at(0).get<std::string>());
            if (refuse_revert || !id || *id == Wei{0} || *id > Wei{snapshots_.size()}) return false;
            const auto index = static_cast<std::size_t>(*id) - 1;
            world = snapshots_[index];
            snapshots_.resize(index);
            return true;
        }
        if (method == "anvil_setBalance") {
            world.balances[addr_of(params.at(0)).hex] = *parse_wei(params.at(1).get<std::string>());
            return nullptr;
        }
        if (method == "anvil_setStorageAt") return set_storage(params);
        if (method == "anvil_impersonateAccount") {
            impersonated.insert(addr_of(params.at(0)).hex);
            return nullptr;
        }
        if (method == "anvil_reset") {
            ++resets;
            world = genesis_ ? *genesis_ : World{};
            snapshots_.clear();
            impersonated.clear();
            return nullptr;
        }
        if (method == "web3_sha3") return sha3(params.at(0).get<std::string>());

        throw RpcError(-32601, "Method not found: " + method);
    }

    [[nodiscard]] std::string endpoint() const override { return "http://fake-ledger.invalid:8545"; }

    /// State anvil_reset returns to; defaults to an empty world.
    void freeze_genesis() { genesis_ = world; }

private:
    std::uint64_t nonce(const json& account) const {
        const auto it = world.nonces.find(addr_of(account).hex);
        return it == world.nonces.end() ? 0 : it->second;
    }

    json sha3(const std::string& preimage) {
        auto& key = preimages_[preimage];
        if (key.empty()) key = "0x" + hex64(0xabc000 + preimages_.size());
        return key;
    }

    json set_storage(const json& params) {
        const auto contract = addr_of(params.at(0)).hex;
        const auto key = params.at(1).get<std::string>();
        const auto value = strip_hex_prefix(params.at(2).get<std::string>());
        world.storage[{contract, key}] = value;

        // Reflect writes to a token's balance mapping in balanceOf.
        const auto token = world.tokens.find(contract);
        if (token == world.tokens.end()) return nullptr;
        for (const auto& [preimage, hashed] : preimages_) {
            if (hashed != key) continue;
            const auto body = strip_hex_prefix(preimage);
            const auto holder = word_to_address(body.substr(0, 64));
            const auto slot = word_to_wei(body.substr(64, 64));
            if (holder && slot && *slot == Wei{token->second.balance_slot}) {
                token->second.balances[holder->hex] = *word_to_wei(value);
            }
        }
        return nullptr;
    }

    json eth_call(const json& tx) {
        const auto to = addr(tx.at("to").get<std::string>()).hex;
        const auto data = tx.value("data", std::string{"0x"});
        if (world.reverting.count(to) != 0) throw RpcError(3, "execution reverted");
        const auto token = world.tokens.find(to);
        if (token == world.tokens.end()) return "0x";
        const auto selector = calldata_selector(data);
        if (selector == std::string{"0x70a08231"}) {
            const auto holder = word_to_address(*calldata_word(data, 0));
            const auto it = token->second.balances.find(holder->hex);
            return "0x" + abi_word(it == token->second.balances.end() ? Wei{0} : it->second);
        }
        if (selector == std::string{"0xdd62ed3e"}) {
            const auto owner = word_to_address(*calldata_word(data, 0));
            const auto spender = word_to_address(*calldata_word(data, 1));
            const auto it = token->second.allowances.find({owner->hex, spender->hex});
            return "0x" + abi_word(it == token->second.allowances.end() ? Wei{0} : it->second);
        }
        return "0x";
    }

    json send(const json& tx) {
        sent.push_back(tx);
        if (reject_sends) throw RpcError(-32003, "insufficient funds for gas * price + value");

        const auto from = addr(tx.at("from").get<std::string>()).hex;
        if (impersonated.count(from) == 0) throw RpcError(-32000, "No Signer available for " + from);

        const Wei value = tx.contains("value") ? *parse_wei(tx.at("value").get<std::string>()) : Wei{0};
        const auto data = tx.value("data", std::string{"0x"});
        const std::uint64_t gas_limit =
            tx.contains("gas") ? static_cast<std::uint64_t>(*parse_wei(tx.at("gas").get<std::string>())) : 30'000'000;

        ++world.block;
        const auto hash = "0x" + hex64(0xfeed0000 + world.block);
        json receipt = {{"transactionHash", hash},
                        {"blockNumber", to_quantity(world.block)},
                        {"effectiveGasPrice", to_quantity(gas_price)},
                        {"logs", json::array()},
                        {"contractAddress", nullptr}};

        std::uint64_t gas_used = 21000;
        bool ok = true;
        if (!tx.contains("to") || tx.at("to").is_null()) {
            gas_used = 200000;
            const auto created = "0x" + hex64(0xc0de00 + nonce(tx.at("from"))).substr(24);
            world.code[created] = data;
            receipt["contractAddress"] = created;
        } else {
            const auto to = addr(tx.at("to").get<std::string>()).hex;
            const auto token = world.tokens.find(to);
            if (world.reverting.count(to) != 0) {
                gas_used = 30000;
                ok = false;
            } else if (token != world.tokens.end() && calldata_selector(data) == std::string{"0xa9059cbb"}) {
                gas_used = 51000;
                const auto w0 = calldata_word(data, 0);
                const auto w1 = calldata_word(data, 1);
                const auto recipient = w0 ? word_to_address(*w0) : std::nullopt;
                const auto amount = w1 ? word_to_wei(*w1) : std::nullopt;
                auto& balances = token->second.balances;
                if (!recipient || !amount || balances[from] < *amount) {
                    ok = false;
                } else {
                    balances[from] -= *amount;
                    balances[recipient->hex] += *amount;
                    receipt["logs"].push_back({{"address", to},
                                               {"topics", {kTransferTopic, "0x" + abi_word(addr(from)),
                                                           "0x" + abi_word(*recipient)}},
                                               {"data", "0x" + abi_word(*amount)}});
                }
            } else if (token != world.tokens.end() && token->second.wraps_native &&
                       calldata_selector(data) == std::string{"0xd0e30db0"}) {
                gas_used = 45000;
                token->second.balances[from] += value;
                world.balances[to] += value;
            } else {
                if (data != "0x") gas_used = 25000;
                world.balances[to] += value;
            }
        }

        gas_used = std::min(gas_used, gas_limit);
        const Wei fee = Wei{gas_used} * gas_price;
        world.balances[from] -= fee;
        if (ok) world.balances[from] -= value;
        ++world.nonces[from];

        receipt["status"] = ok ? "0x1" : "0x0";
        receipt["gasUsed"] = to_quantity(gas_used);
        world.receipts[hash] = receipt;
        return hash;
    }

    std::vector<World> snapshots_;
    std::optional<World> genesis_;
    std::map<std::string, std::string> preimages_;
};

}  // namespace quest::bench::testing
