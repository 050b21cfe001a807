#pragma once

#include "quest_bench/primitives.hpp"
#include "quest_bench/state.hpp"
#include "rpc_client.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace quest::bench::ledger::eth {

// ERC-20 selectors used for state reads.
inline constexpr const char* kBalanceOf = "0x70a08231";
inline constexpr const char* kAllowance = "0xdd62ed3e";

/// Parses a `0x` quantity or data word; throws TransportError for anything else.
[[nodiscard]] Wei to_wei(const nlohmann::json& value);
[[nodiscard]] std::uint64_t to_u64(const nlohmann::json& value);

/// The JSON-RPC request that reads \a target at block tag \a block.
[[nodiscard]] RpcCall read_call(const StateTarget& target, const std::string& block = "latest");

/// Converts the reply to read_call() into the captured value (code_size counts bytes).
[[nodiscard]] Wei decode_read(const StateTarget& target, const nlohmann::json& reply);

/// Receipt object -> ReceiptInfo; \a gas_limit is what the submission asked for.
[[nodiscard]] ReceiptInfo decode_receipt(const nlohmann::json& receipt, std::uint64_t gas_limit);

}  // namespace quest::bench::ledger::eth
