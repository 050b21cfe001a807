#include "quest_bench/eth.hpp"

#include <algorithm>
#include <limits>

namespace quest::bench::ledger::eth {

Wei to_wei(const nlohmann::json& value) {
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text == "0x") return Wei{0};
        if (text.rfind("0x", 0) == 0) {
            if (const auto parsed = parse_wei(text)) return *parsed;
        }
    } else if (value.is_number_unsigned()) {
        return Wei{value.get<std::uint64_t>()};
    }
    throw TransportError("Expected a hex quantity, got " + value.dump());
}

std::uint64_t to_u64(const nlohmann::json& value) {
    const Wei wide = to_wei(value);
    if (wide > Wei{std::numeric_limits<std::uint64_t>::max()}) {
        throw TransportError("Quantity does not fit 64 bits: " + value.dump());
    }
    return static_cast<std::uint64_t>(wide);
}

RpcCall read_call(const StateTarget& target, const std::string& block) {
    switch (target.kind) {
        case StateKind::Native:
            return {"eth_getBalance", {target.address.hex, block}};
        case StateKind::Nonce:
            return {"eth_getTransactionCount", {target.address.hex, block}};
        case StateKind::CodeSize:
            return {"eth_getCode", {target.address.hex, block}};
        case StateKind::Storage:
            return {"eth_getStorageAt", {target.address.hex, target.data, block}};
        case StateKind::TokenBalance: {
            const std::string data = std::string{kBalanceOf} + abi_word(target.holder.value_or(Address{}));
            return {"eth_call", {{{"to", target.address.hex}, {"data", data}}, block}};
        }
        case StateKind::Allowance: {
            const std::string data = std::string{kAllowance} + abi_word(target.holder.value_or(Address{})) +
                                     abi_word(target.spender.value_or(Address{}));
            return {"eth_call", {{{"to", target.address.hex}, {"data", data}}, block}};
        }
        case StateKind::Call:
            return {"eth_call", {{{"to", target.address.hex}, {"data", target.data}}, block}};
    }
    throw TransportError("Unsupported state kind");
}

Wei decode_read(const StateTarget& target, const nlohmann::json& reply) {
    if (target.kind == StateKind::CodeSize) {
        if (!reply.is_string()) throw TransportError("eth_getCode returned " + reply.dump());
        const auto body = strip_hex_prefix(reply.get<std::string>());
        return Wei{static_cast<std::uint64_t>(body.size() / 2)};
    }
    if (target.kind == StateKind::TokenBalance || target.kind == StateKind::Allowance ||
        target.kind == StateKind::Call || target.kind == StateKind::Storage) {
        // Return data wider than one word keeps only the first word.
        if (reply.is_string()) {
            const auto body = strip_hex_prefix(reply.get<std::string>());
            if (body.empty()) return Wei{0};
            if (const auto word = word_to_wei(body.substr(0, std::min<std::size_t>(body.size(), 64)))) return *word;
        }
        throw TransportError("Unexpected call result " + reply.dump());
    }
    return to_wei(reply);
}

ReceiptInfo decode_receipt(const nlohmann::json& receipt, std::uint64_t gas_limit) {
    ReceiptInfo info;
    info.gas_limit = gas_limit;
    info.tx_hash = receipt.value("transactionHash", std::string{});
    info.success = receipt.contains("status") && to_u64(receipt.at("status")) == 1;
    if (receipt.contains("gasUsed")) info.gas_used = to_u64(receipt.at("gasUsed"));
    if (receipt.contains("effectiveGasPrice")) info.effective_gas_price = to_wei(receipt.at("effectiveGasPrice"));
    if (receipt.contains("blockNumber") && !receipt.at("blockNumber").is_null()) {
        info.block_number = to_u64(receipt.at("blockNumber"));
    }
    if (const auto it = receipt.find("contractAddress"); it != receipt.end() && it->is_string()) {
        info.contract_address = parse_address(it->get<std::string>());
    }
    if (!info.success) info.error = "execution reverted";
    if (const auto logs = receipt.find("logs"); logs != receipt.end() && logs->is_array()) {
        for (const auto& log : *logs) {
            LogEntry entry;
            entry.address = parse_address(log.value("address", std::string{})).value_or(Address{});
            entry.data = log.value("data", std::string{"0x"});
            if (const auto topics = log.find("topics"); topics != log.end() && topics->is_array()) {
                for (const auto& topic : *topics) {
                    if (topic.is_string()) entry.topics.push_back(topic.get<std::string>());
                }
            }
            info.logs.push_back(std::move(entry));
        }
    }
    return info;
}

}  // namespace quest::bench::ledger::eth
