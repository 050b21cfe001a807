#include "quest_bench/candidates.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace quest::bench {

namespace {

constexpr std::array<const char*, 3> kExtensions = {".ts", ".js", ".mjs"};
constexpr const char* kFinalMarker = "@final";

std::optional<std::string> read_text(const fs::path& p) {
    std::ifstream ifs(p);
    if (!ifs) return std::nullopt;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

std::optional<CandidateUnit> load_unit(const fs::path& stem_path) {
    for (const char* ext : kExtensions) {
        fs::path candidate = stem_path;
        candidate += ext;
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) continue;
        auto text = read_text(candidate);
        if (!text) continue;

        CandidateUnit unit;
        unit.extension = ext;
        unit.origin = candidate;
        const auto first_line = text->substr(0, text->find('\n'));
        unit.final = first_line.find(kFinalMarker) != std::string::npos;
        unit.source = std::move(*text);
        return unit;
    }
    return std::nullopt;
}

}  // namespace

DirectoryCandidates::DirectoryCandidates(fs::path root) : root_(std::move(root)) {}

std::optional<CandidateUnit> DirectoryCandidates::solution(const ProblemSpec& problem, const ParameterInstance&) {
    return load_unit(root_ / problem.id);
}

std::optional<std::vector<std::string>> DirectoryCandidates::plan(const ProblemSpec& problem,
                                                                  const ParameterInstance&) {
    const auto text = read_text(root_ / problem.id / "plan.json");
    if (!text) return std::nullopt;
    const auto doc = nlohmann::json::parse(*text, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) return std::nullopt;
    std::vector<std::string> steps;
    for (const auto& item : doc) {
        steps.push_back(item.is_string() ? item.get<std::string>() : item.dump());
    }
    return steps;
}

std::optional<CandidateUnit> DirectoryCandidates::next_step(const ProblemSpec& problem,
                                                            const ParameterInstance&,
                                                            unsigned step,
                                                            const ValidationReport*) {
    return load_unit(root_ / problem.id / ("step_" + std::to_string(step)));
}

}  // namespace quest::bench
