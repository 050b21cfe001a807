/**
 * @file scripted_executor.hpp
 * @brief CodeExecutor and CandidateSource doubles for engine-level tests
 *
 * ScriptedExecutor maps candidate source text to a canned ExecutionResult, so a
 * test names its candidates by what they "return". ScriptedCandidates hands out
 * fixed solutions, plans and step lists per problem id.
 *
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include "quest_bench/candidates.hpp"
#include "quest_bench/execution_result.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quest::bench::testing {

class ScriptedExecutor final : public CodeExecutor {
public:
    std::map<std::string, ExecutionResult> results;  ///< source -> result
    std::vector<ExecutionRequest> requests;

    ExecutionResult execute(const ExecutionRequest& request, std::string& diag_out) override {
        requests.push_back(request);
        const auto it = results.find(request.source);
        if (it == results.end()) {
            diag_out += "no scripted result for source\n";
            return Failure{FailureKind::RuntimeError, "unscripted candidate", "stack: <scripted>"};
        }
        return it->second;
    }
};

inline TransactionIntent intent(nlohmann::json fields) {
    TransactionIntent out;
    out.fields = std::move(fields);
    return out;
}

class ScriptedCandidates final : public CandidateSource {
public:
    std::map<std::string, std::string> solutions;                     ///< problem id -> source
    std::map<std::string, std::vector<std::string>> plans;            ///< problem id -> plan
    std::map<std::string, std::vector<std::string>> steps;            ///< problem id -> step sources
    std::map<std::string, unsigned> final_after;                      ///< problem id -> step that declares completion
    std::vector<const ValidationReport*> previous_reports;

    std::optional<CandidateUnit> solution(const ProblemSpec& problem, const ParameterInstance&) override {
        const auto it = solutions.find(problem.id);
        if (it == solutions.end()) return std::nullopt;
        return CandidateUnit{it->second, ".ts", "scripted/" + problem.id, false};
    }

    std::optional<std::vector<std::string>> plan(const ProblemSpec& problem, const ParameterInstance&) override {
        const auto it = plans.find(problem.id);
        if (it == plans.end()) return std::nullopt;
        return it->second;
    }

    std::optional<CandidateUnit> next_step(const ProblemSpec& problem,
                                           const ParameterInstance&,
                                           unsigned step,
                                           const ValidationReport* previous) override {
        previous_reports.push_back(previous);
        const auto it = steps.find(problem.id);
        if (it == steps.end() || step == 0 || step > it->second.size()) return std::nullopt;
        const auto fin = final_after.find(problem.id);
        const bool is_final = fin != final_after.end() && fin->second == step;
        return CandidateUnit{it->second[step - 1], ".ts", "scripted/" + problem.id, is_final};
    }
};

}  // namespace quest::bench::testing
