#pragma once

#include "quest_bench/candidates.hpp"
#include "quest_bench/execution_result.hpp"
#include "quest_bench/fork_controller.hpp"
#include "quest_bench/parameters.hpp"
#include "quest_bench/problem.hpp"
#include "quest_bench/state.hpp"
#include "quest_bench/tx_executor.hpp"
#include "quest_bench/validation.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quest::bench {

/// Everything one execute-submit-validate round produced.
struct AttemptRecord {
    ExecutionResult result{Failure{}};
    std::optional<ReceiptInfo> receipt;
    StateSnapshot before;
    StateSnapshot after;
    ValidationReport report;
    std::string diag;
    std::filesystem::path artifact_dir;
};

/**
 * \brief Runs one candidate unit to a ValidationReport.
 *
 * Does not snapshot or revert; callers bracket attempts (one per atomic problem,
 * one per composite session). Artifacts land in the directory passed to run():
 * candidate source, runner output, result.json, report.txt and engine_diag.txt.
 * EnvironmentError propagates untouched.
 */
class AttemptRunner {
public:
    struct Config {
        std::chrono::milliseconds code_timeout{60000};
    };

    AttemptRunner(Config cfg, ledger::ForkController& ledger, CodeExecutor& executor,
                  ledger::TransactionExecutor& transactions);

    [[nodiscard]] AttemptRecord run(const CandidateUnit& unit,
                                    const ParameterInstance& params,
                                    const std::vector<Check>& checks,
                                    const std::map<std::string, StateTarget>& targets,
                                    const std::filesystem::path& artifact_dir);

    /// Scores an attempt that has no candidate unit at all.
    [[nodiscard]] AttemptRecord missing(const std::string& reason,
                                        const std::vector<Check>& checks,
                                        const std::map<std::string, StateTarget>& targets,
                                        const std::filesystem::path& artifact_dir);

    [[nodiscard]] ledger::ForkController& ledger() noexcept { return ledger_; }

private:
    void finish(AttemptRecord& record, const std::map<std::string, StateTarget>& targets);

    Config cfg_;
    ledger::ForkController& ledger_;
    CodeExecutor& executor_;
    ledger::TransactionExecutor& transactions_;
};

/// result.json body: the classified result plus receipt and captured state.
[[nodiscard]] nlohmann::json attempt_to_json(const AttemptRecord& record,
                                             const std::map<std::string, StateTarget>& targets);

/// Receipt summary as written to result artifacts.
[[nodiscard]] nlohmann::json receipt_to_json(const ReceiptInfo& receipt);

/// Indented JSON for artifacts. Invalid UTF-8 from candidate output is replaced with U+FFFD.
[[nodiscard]] std::string artifact_json(const nlohmann::json& value);

/// Writes \a text to \a path, creating parent directories. Failures go to \a diag.
bool write_text(const std::filesystem::path& path, const std::string& text, std::string& diag);

}  // namespace quest::bench
