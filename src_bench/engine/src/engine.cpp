#include "quest_bench/engine.hpp"
#include "quest_bench/composite.hpp"
#include "quest_bench/state.hpp"

#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using quest::bench::ParameterInstance;
using quest::bench::ProblemSpec;

std::string render_prompt(const ProblemSpec& problem, const ParameterInstance& params) {
    std::ostringstream oss;
    oss << "# " << problem.id << " (" << problem.category;
    if (!problem.difficulty.empty()) oss << ", " << problem.difficulty;
    oss << ")\n";
    if (!problem.description.empty()) oss << problem.description << "\n";
    for (std::size_t i = 0; i < problem.templates.size(); ++i) {
        oss << "\n[template " << (i + 1) << "]\n" << quest::bench::render_template(problem.templates[i], params) << "\n";
    }
    return oss.str();
}

}  // namespace

namespace quest::bench {

Engine::Engine(Config config, AttemptRunner& runner, const ValidatorRegistry& registry)
    : config_{std::move(config)}, runner_(runner), registry_(registry), generator_(config_.seed) {}

std::vector<ProblemOutcome> Engine::run(const Catalogue& catalogue, CandidateSource& candidates) {
    std::vector<ProblemOutcome> outcomes;
    outcomes.reserve(catalogue.problems.size());
    for (const auto& problem : catalogue.problems) {
        if (!config_.only.empty() && config_.only.count(problem.id) == 0) continue;
        outcomes.push_back(run_problem(problem, candidates));
    }
    return outcomes;
}

ProblemOutcome Engine::run_problem(const ProblemSpec& problem, CandidateSource& candidates) {
    auto& ledger = runner_.ledger();

    ProblemOutcome outcome{};
    outcome.problem = problem;
    outcome.artifact_dir = config_.artifact_root / problem.category / problem.id;
    std::string diag;

    std::map<std::string, StateTarget> targets;
    try {
        outcome.params = generator_.generate(problem, GenerationContext{ledger.identity(), ledger.fixtures()});
        targets = bind_targets(problem, outcome.params, ledger.identity(), ledger.fixtures());
    } catch (const EnvironmentError&) {
        throw;
    } catch (const std::runtime_error& e) {
        outcome.status = "ERROR";
        outcome.feedback = std::string("Problem setup failed: ") + e.what();
    }
    if (outcome.status.empty() && !registry_.contains(problem.id)) {
        outcome.status = "ERROR";
        outcome.feedback = "No validator registered for problem '" + problem.id + "'";
    }
    if (!outcome.status.empty()) {
        outcome.result_kind = "failure";
        (void)write_text(outcome.artifact_dir / "engine_diag.txt", diag + outcome.feedback + "\n", diag);
        return outcome;
    }

    const auto& checks = registry_.at(problem.id);
    (void)write_text(outcome.artifact_dir / "prompt.txt", render_prompt(problem, outcome.params), diag);
    (void)write_text(outcome.artifact_dir / "params.json", artifact_json(outcome.params.to_json()), diag);

    if (problem.kind == ProblemKind::Composite) {
        CompositeOrchestrator orchestrator(runner_);
        auto run = orchestrator.run(problem, outcome.params, checks, targets, candidates, outcome.artifact_dir);
        const auto& session = run.session;
        outcome.score = session.final_score();
        outcome.max_score = session.max_score();
        outcome.passed = session.passed();
        outcome.feedback = session.feedback();
        outcome.report = session.terminal_report();
        outcome.composite = session.to_json();
        (*outcome.composite)["terminal"] = session.terminal_report().to_json();
        if (!run.steps.empty()) {
            outcome.result_kind = result_kind(run.steps.back().result);
            outcome.receipt = run.steps.back().receipt;
        } else {
            outcome.result_kind = "failure";
        }
    } else {
        auto unit = candidates.solution(problem, outcome.params);
        const auto attempt_dir = outcome.artifact_dir / "attempt_1";

        AttemptRecord record;
        const auto snapshot_id = ledger.snapshot();
        try {
            record = unit ? runner_.run(*unit, outcome.params, checks.terminal, targets, attempt_dir)
                          : runner_.missing("No solution supplied for " + problem.id, checks.terminal, targets,
                                            attempt_dir);
        } catch (...) {
            ledger.revert(snapshot_id);
            throw;
        }
        ledger.revert(snapshot_id);

        outcome.score = record.report.score();
        outcome.max_score = record.report.max_score();
        outcome.passed = record.report.passed();
        outcome.feedback = record.report.feedback();
        outcome.result_kind = result_kind(record.result);
        outcome.receipt = record.receipt;
        outcome.report = std::move(record.report);
    }

    outcome.status = outcome.passed ? "PASS" : "FAIL";
    (void)write_text(outcome.artifact_dir / "engine_diag.txt",
                     diag + outcome.status + " " + problem.id + "\n" + outcome.feedback, diag);
    return outcome;
}

}  // namespace quest::bench
