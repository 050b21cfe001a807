#include "quest_bench/attempt.hpp"

#include <filesystem>
#include <fstream>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using nlohmann::json;

namespace quest::bench {

namespace {

json result_to_json(const ExecutionResult& result) {
    json out = {{"kind", result_kind(result)}};
    if (const auto* intent = std::get_if<TransactionIntent>(&result)) {
        out["intent"] = intent->fields;
        out["warnings"] = intent->warnings;
    } else if (const auto* query = std::get_if<QueryResult>(&result)) {
        out["query"] = query->payload;
    } else if (const auto* failure = std::get_if<Failure>(&result)) {
        out["failure"] = {{"kind", to_string(failure->kind)}, {"message", failure->message}};
    }
    return out;
}

json snapshot_to_json(const StateSnapshot& snap, const std::map<std::string, StateTarget>& targets) {
    json values = json::object();
    for (const auto& [label, target] : targets) {
        const auto value = snap.value(target);
        values[label] = value ? json(to_decimal(*value)) : json(nullptr);
    }
    return {{"block_number", snap.block_number}, {"values", std::move(values)}};
}

}  // namespace

bool write_text(const fs::path& path, const std::string& text, std::string& diag) {
    std::error_code ec;
    if (const auto parent = path.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            diag += "create_directories failed: " + parent.string() + ": " + ec.message() + "\n";
            return false;
        }
    }
    std::ofstream ofs(path);
    if (!ofs) { diag += "open failed: " + path.string() + "\n"; return false; }
    ofs << text;
    if (!ofs) { diag += "write failed: " + path.string() + "\n"; return false; }
    return true;
}

std::string artifact_json(const json& value) {
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

json receipt_to_json(const ReceiptInfo& receipt) {
    json out = {{"success", receipt.success},
                {"timed_out", receipt.timed_out},
                {"tx_hash", receipt.tx_hash},
                {"block_number", receipt.block_number},
                {"gas_used", receipt.gas_used},
                {"gas_limit", receipt.gas_limit},
                {"effective_gas_price", to_decimal(receipt.effective_gas_price)},
                {"logs", receipt.logs.size()}};
    if (!receipt.error.empty()) out["error"] = receipt.error;
    if (receipt.contract_address) out["contract_address"] = receipt.contract_address->hex;
    return out;
}

json attempt_to_json(const AttemptRecord& record, const std::map<std::string, StateTarget>& targets) {
    json out = result_to_json(record.result);
    if (record.receipt) out["receipt"] = receipt_to_json(*record.receipt);
    out["before"] = snapshot_to_json(record.before, targets);
    out["after"] = snapshot_to_json(record.after, targets);
    out["score"] = record.report.score();
    out["max_score"] = record.report.max_score();
    out["passed"] = record.report.passed();
    return out;
}

AttemptRunner::AttemptRunner(Config cfg, ledger::ForkController& ledger, CodeExecutor& executor,
                             ledger::TransactionExecutor& transactions)
    : cfg_(std::move(cfg)), ledger_(ledger), executor_(executor), transactions_(transactions) {}

AttemptRecord AttemptRunner::run(const CandidateUnit& unit,
                                 const ParameterInstance& params,
                                 const std::vector<Check>& checks,
                                 const std::map<std::string, StateTarget>& targets,
                                 const fs::path& artifact_dir) {
    AttemptRecord record;
    record.artifact_dir = artifact_dir;
    (void)write_text(artifact_dir / ("candidate" + unit.extension), unit.source, record.diag);
    if (!unit.origin.empty()) record.diag += "candidate: " + unit.origin.string() + "\n";

    ExecutionRequest request;
    request.source = unit.source;
    request.source_extension = unit.extension;
    request.endpoint = ledger_.endpoint();
    request.identity = ledger_.identity();
    request.fixtures = ledger_.fixtures();
    request.timeout = cfg_.code_timeout;
    request.artifact_dir = artifact_dir;

    record.result = executor_.execute(request, record.diag);
    const auto list = target_list(targets);

    if (auto* intent = std::get_if<TransactionIntent>(&record.result)) {
        auto submitted = transactions_.execute(*intent, list, record.diag);
        if (auto* malformed = std::get_if<Failure>(&submitted)) {
            // The intent stays visible in result.json; scoring treats it as a failed execution.
            (void)write_text(artifact_dir / "intent.json", artifact_json(intent->fields), record.diag);
            record.result = std::move(*malformed);
        } else {
            auto& done = std::get<ledger::SubmittedTransaction>(submitted);
            record.receipt = std::move(done.receipt);
            record.before = std::move(done.before);
            record.after = std::move(done.after);
            const CheckContext ctx{record.result, &*record.receipt, record.before, record.after, params,
                                   targets, ledger_.identity(), ledger_.fixtures()};
            record.report = run_checks(checks, ctx);
            finish(record, targets);
            return record;
        }
    }

    if (std::holds_alternative<QueryResult>(record.result)) {
        // Queries never reach the executor; both reads show whether anything wrote to the ledger.
        record.before = ledger_.read_state(list);
        record.after = ledger_.read_state(list);
        const CheckContext ctx{record.result, nullptr, record.before, record.after, params,
                               targets, ledger_.identity(), ledger_.fixtures()};
        record.report = run_checks(checks, ctx);
    } else {
        const auto& failure = std::get<Failure>(record.result);
        if (!failure.diagnostics.empty()) record.diag += "runner diagnostics:\n" + failure.diagnostics + "\n";
        record.before = ledger_.read_state(list);
        record.after = record.before;
        record.report = failure_report(checks, failure);
    }
    finish(record, targets);
    return record;
}

AttemptRecord AttemptRunner::missing(const std::string& reason,
                                     const std::vector<Check>& checks,
                                     const std::map<std::string, StateTarget>& targets,
                                     const fs::path& artifact_dir) {
    AttemptRecord record;
    record.artifact_dir = artifact_dir;
    const Failure failure{FailureKind::MissingEntryPoint, reason, {}};
    record.result = failure;
    record.before = ledger_.read_state(target_list(targets));
    record.after = record.before;
    record.report = failure_report(checks, failure);
    record.diag += reason + "\n";
    finish(record, targets);
    return record;
}

void AttemptRunner::finish(AttemptRecord& record, const std::map<std::string, StateTarget>& targets) {
    (void)write_text(record.artifact_dir / "result.json", artifact_json(attempt_to_json(record, targets)), record.diag);
    (void)write_text(record.artifact_dir / "report.txt", record.report.feedback(), record.diag);
    (void)write_text(record.artifact_dir / "engine_diag.txt", record.diag, record.diag);
}

}  // namespace quest::bench
