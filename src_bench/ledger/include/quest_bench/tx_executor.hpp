#pragma once

#include "quest_bench/execution_result.hpp"
#include "quest_bench/primitives.hpp"
#include "quest_bench/state.hpp"
#include "fork_controller.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace quest::bench::ledger {

/// Intent fields checked and converted to wire quantities.
struct PreparedTransaction {
    std::optional<Address> to;  ///< empty for contract creation
    Wei value{0};
    std::string data{"0x"};
    std::uint64_t gas{0};
    std::optional<Wei> gas_price;
    std::optional<Wei> max_fee_per_gas;
    std::optional<Wei> max_priority_fee_per_gas;
    std::optional<std::uint64_t> nonce;

    /// eth_sendTransaction object sent from \a from.
    [[nodiscard]] nlohmann::json to_rpc(const Address& from) const;
};

/**
 * Validates an intent without touching the ledger.
 * A destination that is neither an address nor null, an unparseable amount or
 * non-hex data yields a MalformedIntent failure. Missing gas takes \a default_gas.
 */
[[nodiscard]] std::variant<PreparedTransaction, Failure> prepare_intent(const TransactionIntent& intent,
                                                                        std::uint64_t default_gas);

struct SubmittedTransaction {
    PreparedTransaction tx;
    ReceiptInfo receipt;
    StateSnapshot before;
    StateSnapshot after;
};

/**
 * \brief Submits intents from the test identity and captures state around them.
 *
 * Order per call: prepare, read before, submit, wait for the receipt, read after.
 * A rejected submission still yields before/after; a receipt that does not show
 * up within submit_timeout is marked timed_out and left for the snapshot revert.
 */
class TransactionExecutor {
public:
    struct Config {
        std::chrono::milliseconds submit_timeout{30000};
        std::chrono::milliseconds poll_interval{250};
        std::uint64_t default_gas{500000};
    };

    TransactionExecutor(ForkController& ledger, Config cfg);

    /**
     * Returns a MalformedIntent failure before any ledger access when the intent
     * cannot be submitted. EnvironmentError propagates from state reads.
     */
    [[nodiscard]] std::variant<Failure, SubmittedTransaction> execute(const TransactionIntent& intent,
                                                                      const std::vector<StateTarget>& targets,
                                                                      std::string& diag_out);

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

private:
    ReceiptInfo submit(const PreparedTransaction& tx, std::string& diag_out);

    ForkController& ledger_;
    Config cfg_;
};

}  // namespace quest::bench::ledger
