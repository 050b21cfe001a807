#pragma once

#include "quest_bench/attempt.hpp"
#include "quest_bench/candidates.hpp"
#include "quest_bench/composite_session.hpp"
#include "quest_bench/validator_registry.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace quest::bench {

struct CompositeRun {
    CompositeSession session;
    std::vector<AttemptRecord> steps;
    StateSnapshot initial;
    StateSnapshot final;
};

/**
 * \brief Drives one multi-step problem through its session.
 *
 * The whole session runs under a single ledger snapshot so that steps see each
 * other's effects; the snapshot is reverted once the session is finalized.
 * Per-step checks judge each step on its own before/after pair, the terminal
 * checks judge the state at session start against the state after the last step.
 */
class CompositeOrchestrator {
public:
    explicit CompositeOrchestrator(AttemptRunner& runner);

    /// Throws std::invalid_argument for a problem without composite settings.
    [[nodiscard]] CompositeRun run(const ProblemSpec& problem,
                                   const ParameterInstance& params,
                                   const ProblemChecks& checks,
                                   const std::map<std::string, StateTarget>& targets,
                                   CandidateSource& candidates,
                                   const std::filesystem::path& artifact_dir);

private:
    void drive(CompositeRun& out,
               const ProblemSpec& problem,
               const ParameterInstance& params,
               const ProblemChecks& checks,
               const std::map<std::string, StateTarget>& targets,
               CandidateSource& candidates,
               const std::filesystem::path& artifact_dir);

    AttemptRunner& runner_;
};

}  // namespace quest::bench
