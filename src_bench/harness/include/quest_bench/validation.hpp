#pragma once

#include "execution_result.hpp"
#include "parameters.hpp"
#include "state.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace quest::bench {

struct CheckResult {
    std::string name;
    bool passed{false};
    double points{0.0};
    double max_points{0.0};
    bool critical{false};
    std::string message;
};

/**
 * \brief Ordered, append-only list of check results.
 *
 * Scores are derived from the entries, never stored separately, so that
 * score() <= max_score() holds by construction.
 */
class ValidationReport {
public:
    /// Appends a result; points are clamped into [0, max_points] and zeroed when the check failed.
    void add(CheckResult result);

    [[nodiscard]] const std::vector<CheckResult>& checks() const noexcept { return checks_; }
    [[nodiscard]] bool empty() const noexcept { return checks_.empty(); }

    [[nodiscard]] double score() const;
    [[nodiscard]] double max_score() const;

    /// True when every critical check passed. An empty report never passes.
    [[nodiscard]] bool passed() const;

    /// Human readable summary; every failing check contributes its reason.
    [[nodiscard]] std::string feedback() const;

    [[nodiscard]] nlohmann::json to_json() const;

private:
    std::vector<CheckResult> checks_;
};

/**
 * \brief Read-only view handed to every check.
 *
 * `receipt` is null when nothing was submitted (query results and failures).
 * For query results `before` and `after` are both captured; they are equal on a
 * ledger nobody wrote to.
 */
struct CheckContext {
    const ExecutionResult& result;
    const ReceiptInfo* receipt{nullptr};
    const StateSnapshot& before;
    const StateSnapshot& after;
    const ParameterInstance& params;
    const std::map<std::string, StateTarget>& targets;
    const Address& identity;
    const FixtureRegistry& fixtures;

    [[nodiscard]] const TransactionIntent* intent() const { return std::get_if<TransactionIntent>(&result); }
    [[nodiscard]] const QueryResult* query() const { return std::get_if<QueryResult>(&result); }
    [[nodiscard]] const Failure* failure() const { return std::get_if<Failure>(&result); }
};

struct CheckOutcome {
    bool passed{false};
    std::string message;
};

using CheckFn = std::function<CheckOutcome(const CheckContext&)>;

/// A configured check: the pure predicate plus the catalogue's weight and criticality.
struct Check {
    std::string name;
    double weight{0.0};
    bool critical{false};
    CheckFn fn;
};

/// Runs \a checks in order against \a context.
[[nodiscard]] ValidationReport run_checks(const std::vector<Check>& checks, const CheckContext& context);

/**
 * Report for an attempt that never reached validation: a failed critical
 * `code_execution` entry carrying the failure, followed by every configured
 * check scored zero so that max_score() still reflects the problem.
 */
[[nodiscard]] ValidationReport failure_report(const std::vector<Check>& checks, const Failure& failure);

}  // namespace quest::bench
