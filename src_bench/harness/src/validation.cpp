#include "quest_bench/validation.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

namespace quest::bench {

namespace {

std::string format_points(double value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

}  // namespace

void ValidationReport::add(CheckResult result) {
    result.max_points = std::max(0.0, result.max_points);
    result.points = result.passed ? std::clamp(result.points, 0.0, result.max_points) : 0.0;
    checks_.emplace_back(std::move(result));
}

double ValidationReport::score() const {
    double total = 0.0;
    for (const auto& check : checks_) total += check.points;
    return total;
}

double ValidationReport::max_score() const {
    double total = 0.0;
    for (const auto& check : checks_) total += check.max_points;
    return total;
}

bool ValidationReport::passed() const {
    if (checks_.empty()) return false;
    const bool any_critical = std::any_of(checks_.begin(), checks_.end(), [](const auto& c) { return c.critical; });
    return std::all_of(checks_.begin(), checks_.end(),
                       [&](const auto& c) { return c.passed || (any_critical && !c.critical); });
}

std::string ValidationReport::feedback() const {
    std::ostringstream os;
    os << "Score: " << format_points(score()) << "/" << format_points(max_score()) << " ("
       << (passed() ? "PASS" : "FAIL") << ")\n";
    for (const auto& check : checks_) {
        os << (check.passed ? "[PASS] " : "[FAIL] ") << check.name;
        if (check.critical) os << " (critical)";
        if (!check.message.empty()) os << ": " << check.message;
        os << "\n";
    }
    return os.str();
}

nlohmann::json ValidationReport::to_json() const {
    nlohmann::json checks = nlohmann::json::array();
    for (const auto& check : checks_) {
        checks.push_back({{"name", check.name},
                          {"passed", check.passed},
                          {"points", check.points},
                          {"max_points", check.max_points},
                          {"critical", check.critical},
                          {"message", check.message}});
    }
    return {{"score", score()}, {"max_score", max_score()}, {"passed", passed()}, {"checks", std::move(checks)}};
}

ValidationReport run_checks(const std::vector<Check>& checks, const CheckContext& context) {
    ValidationReport report;
    for (const auto& check : checks) {
        const auto outcome = check.fn(context);
        report.add({check.name, outcome.passed, check.weight, check.weight, check.critical, outcome.message});
    }
    return report;
}

ValidationReport failure_report(const std::vector<Check>& checks, const Failure& failure) {
    ValidationReport report;
    report.add({"code_execution", false, 0.0, 0.0, true,
                std::string{to_string(failure.kind)} + ": " + failure.message});
    for (const auto& check : checks) {
        report.add({check.name, false, 0.0, check.weight, check.critical, "not evaluated, code execution failed"});
    }
    return report;
}

}  // namespace quest::bench
