#include "quest_bench/composite_session.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace quest::bench {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Planning: return "PLANNING";
        case SessionState::Executing: return "EXECUTING";
        case SessionState::Finalized: return "FINALIZED";
    }
    return "UNKNOWN";
}

CompositeSession::CompositeSession(unsigned optimal_steps,
                                   unsigned max_rounds_multiplier,
                                   bool planning,
                                   double pass_ratio)
    : state_(planning ? SessionState::Planning : SessionState::Executing),
      optimal_steps_(optimal_steps),
      max_steps_(optimal_steps * std::max(1U, max_rounds_multiplier)),
      pass_ratio_(pass_ratio) {
    if (optimal_steps == 0) {
        throw std::invalid_argument("Composite session requires optimal_steps >= 1");
    }
}

void CompositeSession::require(SessionState expected, const char* operation) const {
    if (state_ != expected) {
        throw std::logic_error(std::string{operation} + " is not allowed in state " + to_string(state_));
    }
}

void CompositeSession::submit_plan(std::vector<std::string> plan) {
    require(SessionState::Planning, "submit_plan");
    plan_ = std::move(plan);
    state_ = SessionState::Executing;
}

void CompositeSession::record_step(ValidationReport report) {
    require(SessionState::Executing, "record_step");
    if (at_cap()) {
        throw std::logic_error("Step cap of " + std::to_string(max_steps_) + " already reached");
    }
    ++actual_steps_;
    steps_.emplace_back(std::move(report));
}

void CompositeSession::finalize(ValidationReport terminal) {
    if (state_ == SessionState::Planning) {
        // A candidate that never planned or stepped is finalized from planning directly.
        state_ = SessionState::Executing;
    }
    require(SessionState::Executing, "finalize");
    terminal_ = std::move(terminal);
    state_ = SessionState::Finalized;
}

const ValidationReport& CompositeSession::terminal_report() const {
    if (!terminal_) {
        throw std::logic_error("terminal_report is not available in state " + std::string{to_string(state_)});
    }
    return *terminal_;
}

double CompositeSession::efficiency(unsigned optimal_steps, unsigned actual_steps) {
    if (actual_steps == 0) return 0.0;
    return std::min(1.0, static_cast<double>(optimal_steps) / static_cast<double>(actual_steps));
}

double CompositeSession::base_score() const { return terminal_report().score(); }

double CompositeSession::max_score() const { return terminal_report().max_score(); }

double CompositeSession::final_score() const { return base_score() * efficiency_factor(); }

bool CompositeSession::passed() const {
    return terminal_report().passed() && final_score() >= pass_ratio_ * max_score();
}

std::string CompositeSession::feedback() const {
    std::ostringstream os;
    os << "Steps: " << actual_steps_ << " used, optimal " << optimal_steps_ << ", cap " << max_steps_
       << ", efficiency " << efficiency_factor() << "\n";
    os << "Final score: " << final_score() << "/" << max_score() << " (base " << base_score() << ")"
       << (passed() ? " PASS" : " FAIL") << "\n";
    os << terminal_report().feedback();
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        if (!steps_[i].empty() && !steps_[i].passed()) {
            os << "Step " << (i + 1) << " checks failed:\n" << steps_[i].feedback();
        }
    }
    return os.str();
}

nlohmann::json CompositeSession::to_json() const {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : steps_) steps.push_back(step.to_json());
    nlohmann::json out = {{"state", to_string(state_)},
                          {"plan", plan_},
                          {"actual_steps", actual_steps_},
                          {"optimal_steps", optimal_steps_},
                          {"max_steps", max_steps_},
                          {"efficiency_factor", efficiency_factor()},
                          {"steps", std::move(steps)}};
    if (terminal_) {
        out["base_score"] = base_score();
        out["final_score"] = final_score();
    }
    return out;
}

}  // namespace quest::bench
