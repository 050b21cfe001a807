#include "quest_bench/tx_executor.hpp"
#include "quest_bench/eth.hpp"

#include <limits>
#include <utility>

using nlohmann::json;

namespace quest::bench::ledger {

namespace {

Failure malformed(std::string message) {
    return Failure{FailureKind::MalformedIntent, std::move(message), {}};
}

// Numeric intent fields arrive as decimal strings; raw numbers are tolerated for callers that skip the classifier.
std::optional<Wei> read_quantity(const json& value) {
    if (value.is_string()) return parse_wei(value.get<std::string>());
    if (value.is_number_unsigned()) return Wei{value.get<std::uint64_t>()};
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return Wei{static_cast<std::uint64_t>(value.get<std::int64_t>())};
    }
    return std::nullopt;
}

std::optional<std::uint64_t> narrow(const Wei& value) {
    if (value > Wei{std::numeric_limits<std::uint64_t>::max()}) return std::nullopt;
    return static_cast<std::uint64_t>(value);
}

const json* present(const json& fields, const char* key) {
    const auto it = fields.find(key);
    if (it == fields.end() || it->is_null()) return nullptr;
    return &*it;
}

}  // namespace

json PreparedTransaction::to_rpc(const Address& from) const {
    json tx = {{"from", from.hex}, {"value", to_quantity(value)}, {"data", data}, {"gas", to_quantity(gas)}};
    if (to) tx["to"] = to->hex;
    if (gas_price) tx["gasPrice"] = to_quantity(*gas_price);
    if (max_fee_per_gas) tx["maxFeePerGas"] = to_quantity(*max_fee_per_gas);
    if (max_priority_fee_per_gas) tx["maxPriorityFeePerGas"] = to_quantity(*max_priority_fee_per_gas);
    if (nonce) tx["nonce"] = to_quantity(*nonce);
    return tx;
}

std::variant<PreparedTransaction, Failure> prepare_intent(const TransactionIntent& intent, std::uint64_t default_gas) {
    const json& fields = intent.fields;
    if (!fields.is_object()) {
        return malformed("Transaction intent is not an object");
    }

    PreparedTransaction tx;

    if (const auto* to = present(fields, "to")) {
        if (!to->is_string()) return malformed("'to' must be an address string, got " + to->dump());
        const auto address = parse_address(to->get<std::string>());
        if (!address) return malformed("'to' is not a valid address: " + to->get<std::string>());
        tx.to = *address;
    }

    if (const auto* value = present(fields, "value")) {
        const auto parsed = read_quantity(*value);
        if (!parsed) return malformed("'value' is not a non-negative integer amount: " + value->dump());
        tx.value = *parsed;
    }

    if (const auto* data = present(fields, "data")) {
        if (!data->is_string() || !is_hex_data(data->get<std::string>())) {
            return malformed("'data' is not hex calldata: " + data->dump());
        }
        const auto body = strip_hex_prefix(data->get<std::string>());
        tx.data = "0x" + body;
    }
    if (!tx.to && tx.data == "0x") {
        return malformed("Contract creation without bytecode ('to' is null and 'data' is empty)");
    }

    tx.gas = default_gas;
    for (const char* key : {"gas", "gasLimit"}) {
        if (const auto* gas = present(fields, key)) {
            const auto parsed = read_quantity(*gas);
            const auto small = parsed ? narrow(*parsed) : std::nullopt;
            if (!small || *small == 0) return malformed(std::string{"'"} + key + "' is not a usable gas limit: " + gas->dump());
            tx.gas = *small;
            break;
        }
    }

    const std::pair<const char*, std::optional<Wei>*> fees[] = {
        {"gasPrice", &tx.gas_price},
        {"maxFeePerGas", &tx.max_fee_per_gas},
        {"maxPriorityFeePerGas", &tx.max_priority_fee_per_gas},
    };
    for (const auto& [key, slot] : fees) {
        if (const auto* fee = present(fields, key)) {
            const auto parsed = read_quantity(*fee);
            if (!parsed) return malformed(std::string{"'"} + key + "' is not an integer quantity: " + fee->dump());
            *slot = *parsed;
        }
    }
    if (tx.gas_price && (tx.max_fee_per_gas || tx.max_priority_fee_per_gas)) {
        return malformed("Both 'gasPrice' and EIP-1559 fee fields are set");
    }

    if (const auto* nonce = present(fields, "nonce")) {
        const auto parsed = read_quantity(*nonce);
        const auto small = parsed ? narrow(*parsed) : std::nullopt;
        if (!small) return malformed("'nonce' is not an integer: " + nonce->dump());
        tx.nonce = *small;
    }

    return tx;
}

TransactionExecutor::TransactionExecutor(ForkController& ledger, Config cfg) : ledger_(ledger), cfg_(std::move(cfg)) {}

ReceiptInfo TransactionExecutor::submit(const PreparedTransaction& tx, std::string& diag_out) {
    ReceiptInfo rejected;
    rejected.gas_limit = tx.gas;

    std::string hash;
    try {
        const auto reply = ledger_.rpc().call("eth_sendTransaction", json::array({tx.to_rpc(ledger_.identity())}));
        if (!reply.is_string()) {
            throw EnvironmentError("eth_sendTransaction returned " + reply.dump());
        }
        hash = reply.get<std::string>();
    } catch (const RpcError& e) {
        // Rejected up front (revert during gas estimation, nonce, funds): nothing was mined.
        rejected.error = e.what();
        diag_out += "Submission rejected: " + rejected.error + "\n";
        return rejected;
    } catch (const TransportError& e) {
        throw EnvironmentError(std::string("eth_sendTransaction failed: ") + e.what());
    }

    std::optional<json> receipt;
    try {
        receipt = ledger_.wait_for_receipt(hash, cfg_.submit_timeout, cfg_.poll_interval);
    } catch (const RpcError& e) {
        throw EnvironmentError(std::string("eth_getTransactionReceipt failed: ") + e.what());
    } catch (const TransportError& e) {
        throw EnvironmentError(std::string("eth_getTransactionReceipt failed: ") + e.what());
    }

    if (!receipt) {
        ReceiptInfo pending;
        pending.gas_limit = tx.gas;
        pending.tx_hash = hash;
        pending.timed_out = true;
        pending.error = "No receipt within " + std::to_string(cfg_.submit_timeout.count()) + "ms";
        diag_out += "Submission " + hash + ": " + pending.error + "\n";
        return pending;
    }

    try {
        auto info = eth::decode_receipt(*receipt, tx.gas);
        if (info.tx_hash.empty()) info.tx_hash = hash;
        if (!info.success) diag_out += "Transaction " + hash + " reverted\n";
        return info;
    } catch (const TransportError& e) {
        throw EnvironmentError(std::string("Malformed receipt for ") + hash + ": " + e.what());
    }
}

std::variant<Failure, SubmittedTransaction> TransactionExecutor::execute(const TransactionIntent& intent,
                                                                         const std::vector<StateTarget>& targets,
                                                                         std::string& diag_out) {
    auto prepared = prepare_intent(intent, cfg_.default_gas);
    if (auto* failure = std::get_if<Failure>(&prepared)) {
        diag_out += std::string{"Intent not submitted: "} + failure->message + "\n";
        return std::move(*failure);
    }

    SubmittedTransaction out;
    out.tx = std::get<PreparedTransaction>(std::move(prepared));
    for (const auto& warning : intent.warnings) {
        diag_out += "Intent warning: " + warning + "\n";
    }

    out.before = ledger_.read_state(targets);
    out.receipt = submit(out.tx, diag_out);
    out.after = ledger_.read_state(targets);
    return out;
}

}  // namespace quest::bench::ledger
