#pragma once

#include "primitives.hpp"
#include "parameters.hpp"
#include "problem.hpp"

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quest::bench {

/**
 * \brief One readable ledger value.
 *
 * `address` is the account or contract being read. For token balances and
 * allowances it is the token and `holder`/`spender` carry the other parties.
 * `data` holds the storage slot (quantity) or the calldata of a read-only call.
 */
struct StateTarget {
    StateKind kind{StateKind::Native};
    Address address;
    std::optional<Address> holder;
    std::optional<Address> spender;
    std::string data;

    auto operator<=>(const StateTarget&) const = default;

    [[nodiscard]] std::string describe() const;
};

/// Ledger values captured at one block.
struct StateSnapshot {
    std::uint64_t block_number{0};
    std::map<StateTarget, Wei> values;

    [[nodiscard]] std::optional<Wei> value(const StateTarget& target) const {
        const auto it = values.find(target);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }
};

struct LogEntry {
    Address address;
    std::vector<std::string> topics;
    std::string data;
};

/**
 * \brief Outcome of one submitted transaction.
 *
 * `success` is false for reverted, rejected and timed-out submissions alike;
 * `error` and `timed_out` tell them apart.
 */
struct ReceiptInfo {
    bool success{false};
    bool timed_out{false};
    std::string tx_hash;
    std::string error;
    std::uint64_t block_number{0};
    std::uint64_t gas_used{0};
    std::uint64_t gas_limit{0};
    Wei effective_gas_price{0};
    std::optional<Address> contract_address;
    std::vector<LogEntry> logs;

    [[nodiscard]] Wei gas_cost() const { return Wei{gas_used} * effective_gas_price; }
};

[[nodiscard]] const char* to_string(StateKind kind);

/**
 * Binds the catalogue's state declarations to concrete targets for one attempt.
 * Throws std::runtime_error when a reference names an unknown parameter or fixture.
 */
[[nodiscard]] std::map<std::string, StateTarget> bind_targets(const ProblemSpec& problem,
                                                              const ParameterInstance& params,
                                                              const Address& identity,
                                                              const FixtureRegistry& fixtures);

/// Targets in label order, ready for a batched read.
[[nodiscard]] std::vector<StateTarget> target_list(const std::map<std::string, StateTarget>& targets);

}  // namespace quest::bench
