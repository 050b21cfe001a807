#include "quest_bench/validator_registry.hpp"
#include "quest_bench/checks.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace quest::bench {

namespace {

std::vector<Check> build_list(const std::vector<CheckDecl>& decls, const ProblemSpec& problem) {
    std::vector<Check> checks;
    checks.reserve(decls.size());
    for (const auto& decl : decls) {
        checks.push_back(CheckFactory::build(decl, problem));
    }
    const bool any_critical = std::any_of(checks.begin(), checks.end(), [](const auto& c) { return c.critical; });
    if (!any_critical) {
        for (auto& check : checks) check.critical = true;
    }
    return checks;
}

}  // namespace

ValidatorRegistry ValidatorRegistry::from_catalogue(const Catalogue& catalogue) {
    ValidatorRegistry registry;
    for (const auto& problem : catalogue.problems) {
        registry.add(problem);
    }
    return registry;
}

void ValidatorRegistry::add(const ProblemSpec& problem) {
    if (entries_.count(problem.id) != 0) {
        throw std::runtime_error("Validator already registered for problem '" + problem.id + "'");
    }
    ProblemChecks entry;
    entry.terminal = build_list(problem.checks, problem);
    entry.per_step = build_list(problem.step_checks, problem);
    entries_.emplace(problem.id, std::move(entry));
}

bool ValidatorRegistry::contains(const std::string& problem_id) const { return entries_.count(problem_id) != 0; }

const ProblemChecks& ValidatorRegistry::at(const std::string& problem_id) const {
    const auto it = entries_.find(problem_id);
    if (it == entries_.end()) {
        throw std::out_of_range("No validator registered for problem '" + problem_id + "'");
    }
    return it->second;
}

}  // namespace quest::bench
