#include "quest_bench/composite.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace quest::bench {

CompositeOrchestrator::CompositeOrchestrator(AttemptRunner& runner) : runner_(runner) {}

CompositeRun CompositeOrchestrator::run(const ProblemSpec& problem,
                                        const ParameterInstance& params,
                                        const ProblemChecks& checks,
                                        const std::map<std::string, StateTarget>& targets,
                                        CandidateSource& candidates,
                                        const fs::path& artifact_dir) {
    if (!problem.composite) {
        throw std::invalid_argument("Problem " + problem.id + " has no composite settings");
    }
    const auto& settings = *problem.composite;
    CompositeRun out{CompositeSession(settings.optimal_steps, settings.max_rounds_multiplier, settings.planning,
                                      problem.pass_ratio),
                     {}, {}, {}};

    auto& ledger = runner_.ledger();
    const auto snapshot_id = ledger.snapshot();
    try {
        drive(out, problem, params, checks, targets, candidates, artifact_dir);
    } catch (...) {
        ledger.revert(snapshot_id);
        throw;
    }
    ledger.revert(snapshot_id);
    return out;
}

void CompositeOrchestrator::drive(CompositeRun& out,
                                  const ProblemSpec& problem,
                                  const ParameterInstance& params,
                                  const ProblemChecks& checks,
                                  const std::map<std::string, StateTarget>& targets,
                                  CandidateSource& candidates,
                                  const fs::path& artifact_dir) {
    auto& ledger = runner_.ledger();
    auto& session = out.session;
    std::string diag;

    const auto list = target_list(targets);
    out.initial = ledger.read_state(list);

    if (session.state() == SessionState::Planning) {
        auto plan = candidates.plan(problem, params);
        if (!plan) diag += "No plan supplied; continuing with an empty plan\n";
        session.submit_plan(plan.value_or(std::vector<std::string>{}));
        (void)write_text(artifact_dir / "plan.json", artifact_json(nlohmann::json(session.plan())), diag);
    }

    const ValidationReport* previous = nullptr;
    for (unsigned step = 1;; ++step) {
        if (session.at_cap()) {
            diag += "Step cap of " + std::to_string(session.max_steps()) + " reached\n";
            break;
        }
        auto unit = candidates.next_step(problem, params, step, previous);
        if (!unit) {
            diag += "No step " + std::to_string(step) + " supplied; workflow complete\n";
            break;
        }
        auto record = runner_.run(*unit, params, checks.per_step, targets,
                                  artifact_dir / ("step_" + std::to_string(step)));
        session.record_step(record.report);
        out.steps.push_back(std::move(record));
        previous = &session.step_reports().back();
        if (unit->final) {
            diag += "Step " + std::to_string(step) + " declared the workflow complete\n";
            break;
        }
    }

    out.final = ledger.read_state(list);

    ValidationReport terminal;
    if (out.steps.empty()) {
        terminal = failure_report(checks.terminal,
                                  Failure{FailureKind::MissingEntryPoint, "No workflow step was executed", {}});
    } else {
        const auto& last = out.steps.back();
        const CheckContext ctx{last.result,
                               last.receipt ? &*last.receipt : nullptr,
                               out.initial,
                               out.final,
                               params,
                               targets,
                               ledger.identity(),
                               ledger.fixtures()};
        terminal = run_checks(checks.terminal, ctx);
    }
    session.finalize(std::move(terminal));

    const auto terminal_dir = artifact_dir / "terminal";
    (void)write_text(terminal_dir / "report.txt", session.feedback(), diag);
    (void)write_text(terminal_dir / "session.json", artifact_json(session.to_json()), diag);
    (void)write_text(artifact_dir / "session_diag.txt", diag, diag);
}

}  // namespace quest::bench
