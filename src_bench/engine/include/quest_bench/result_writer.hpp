#pragma once

#include "engine.hpp"

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

namespace quest::bench {

/**
 * \brief Emits machine-readable and human-friendly reports for benchmark runs.
 *
 * - write_summary(): JSON document with per-problem scores, check breakdowns and counts by status.
 * - write_detailed(): HTML report with a tabular view of the outcomes.
 */
class ResultWriter {
public:
    ResultWriter() = default;

    [[nodiscard]] nlohmann::json summary(const std::vector<ProblemOutcome>& outcomes) const;

    void write_summary(const std::filesystem::path& destination, const std::vector<ProblemOutcome>& outcomes) const;

    void write_detailed(const std::filesystem::path& destination, const std::vector<ProblemOutcome>& outcomes) const;
};

}  // namespace quest::bench
