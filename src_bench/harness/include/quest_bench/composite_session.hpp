#pragma once

#include "validation.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace quest::bench {

enum class SessionState { Planning, Executing, Finalized };

[[nodiscard]] const char* to_string(SessionState state);

/**
 * \brief Bookkeeping for one multi-step workflow attempt.
 *
 * PLANNING -> EXECUTING -> FINALIZED, strictly forward. The plan is stored but
 * never scored. Every step that reached execution counts, including failed
 * ones. Calls made in the wrong state throw std::logic_error.
 */
class CompositeSession {
public:
    CompositeSession(unsigned optimal_steps, unsigned max_rounds_multiplier, bool planning, double pass_ratio);

    [[nodiscard]] SessionState state() const noexcept { return state_; }

    void submit_plan(std::vector<std::string> plan);

    /// Records one executed step and its per-step report.
    void record_step(ValidationReport report);

    [[nodiscard]] bool at_cap() const noexcept { return actual_steps_ >= max_steps_; }

    /// Closes the session with the report of the terminal checks.
    void finalize(ValidationReport terminal);

    [[nodiscard]] unsigned optimal_steps() const noexcept { return optimal_steps_; }
    [[nodiscard]] unsigned max_steps() const noexcept { return max_steps_; }
    [[nodiscard]] unsigned actual_steps() const noexcept { return actual_steps_; }
    [[nodiscard]] const std::vector<std::string>& plan() const noexcept { return plan_; }
    [[nodiscard]] const std::vector<ValidationReport>& step_reports() const noexcept { return steps_; }

    /// Only valid once finalized.
    [[nodiscard]] const ValidationReport& terminal_report() const;

    [[nodiscard]] double efficiency_factor() const { return efficiency(optimal_steps_, actual_steps_); }
    [[nodiscard]] double base_score() const;
    [[nodiscard]] double max_score() const;
    [[nodiscard]] double final_score() const;
    [[nodiscard]] bool passed() const;

    [[nodiscard]] std::string feedback() const;
    [[nodiscard]] nlohmann::json to_json() const;

    /// min(1, optimal / actual); zero steps score zero.
    [[nodiscard]] static double efficiency(unsigned optimal_steps, unsigned actual_steps);

private:
    void require(SessionState expected, const char* operation) const;

    SessionState state_{SessionState::Planning};
    unsigned optimal_steps_{0};
    unsigned max_steps_{0};
    double pass_ratio_{0.6};
    unsigned actual_steps_{0};
    std::vector<std::string> plan_;
    std::vector<ValidationReport> steps_;
    std::optional<ValidationReport> terminal_;
};

}  // namespace quest::bench
