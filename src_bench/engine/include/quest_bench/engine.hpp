#pragma once

#include "quest_bench/attempt.hpp"
#include "quest_bench/candidates.hpp"
#include "quest_bench/parameters.hpp"
#include "quest_bench/problem.hpp"
#include "quest_bench/validator_registry.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace quest::bench {

struct ProblemOutcome {
    ProblemSpec problem;
    ParameterInstance params;
    std::string status;  ///< PASS / FAIL / ERROR
    double score{0.0};
    double max_score{0.0};
    bool passed{false};
    std::string feedback;
    ValidationReport report;  ///< terminal report for composite problems
    std::string result_kind;
    std::optional<ReceiptInfo> receipt;
    std::optional<nlohmann::json> composite;  ///< CompositeSession::to_json() for composite problems
    std::filesystem::path artifact_dir;
};

/**
 * \brief Runs a catalogue problem by problem.
 *
 * For every problem: generate parameters, bind state targets, fetch the candidate,
 * then either one snapshot-bracketed attempt (atomic) or a composite session.
 * Candidate misbehaviour ends up in the outcome; problems the harness cannot
 * set up are reported as ERROR; EnvironmentError aborts the run.
 */
class Engine {
public:
    struct Config {
        std::filesystem::path artifact_root{};
        std::uint64_t seed{42};
        std::set<std::string> only;  ///< run just these problem ids when non-empty
    };

    Engine(Config config, AttemptRunner& runner, const ValidatorRegistry& registry);

    [[nodiscard]] std::vector<ProblemOutcome> run(const Catalogue& catalogue, CandidateSource& candidates);

    [[nodiscard]] ProblemOutcome run_problem(const ProblemSpec& problem, CandidateSource& candidates);

private:
    Config config_;
    AttemptRunner& runner_;
    const ValidatorRegistry& registry_;
    ParameterGenerator generator_;
};

}  // namespace quest::bench
