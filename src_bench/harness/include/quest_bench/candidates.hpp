#pragma once

#include "parameters.hpp"
#include "problem.hpp"
#include "validation.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quest::bench {

/// One source unit handed to the execution bridge.
struct CandidateUnit {
    std::string source;
    std::string extension{".ts"};
    std::filesystem::path origin;
    bool final{false};  ///< composite: the candidate declares the workflow complete after this step
};

/**
 * \brief Supplies candidate code for problems.
 *
 * This is the seam where a code generator plugs in; the harness never looks
 * behind it. Returning nullopt means "nothing to offer".
 */
class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    virtual std::optional<CandidateUnit> solution(const ProblemSpec& problem, const ParameterInstance& params) = 0;

    virtual std::optional<std::vector<std::string>> plan(const ProblemSpec& problem,
                                                         const ParameterInstance& params) = 0;

    /// \a step is 1-based; \a previous is the report of the prior step, if any.
    virtual std::optional<CandidateUnit> next_step(const ProblemSpec& problem,
                                                   const ParameterInstance& params,
                                                   unsigned step,
                                                   const ValidationReport* previous) = 0;
};

/**
 * \brief Candidates laid out on disk.
 *
 *   - atomic:    `<root>/<problem-id>.{ts,js,mjs}`
 *   - composite: `<root>/<problem-id>/plan.json` (JSON array of strings) and
 *                `<root>/<problem-id>/step_<n>.{ts,js,mjs}`, n from 1. A step whose
 *                first line contains `@final` ends the workflow after it.
 */
class DirectoryCandidates final : public CandidateSource {
public:
    explicit DirectoryCandidates(std::filesystem::path root);

    std::optional<CandidateUnit> solution(const ProblemSpec& problem, const ParameterInstance& params) override;
    std::optional<std::vector<std::string>> plan(const ProblemSpec& problem, const ParameterInstance& params) override;
    std::optional<CandidateUnit> next_step(const ProblemSpec& problem,
                                           const ParameterInstance& params,
                                           unsigned step,
                                           const ValidationReport* previous) override;

private:
    std::filesystem::path root_;
};

}  // namespace quest::bench
