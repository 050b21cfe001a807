#include "quest_bench/result_writer.hpp"
#include "quest_bench/attempt.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using nlohmann::json;
using quest::bench::ProblemOutcome;

json outcome_to_json(const ProblemOutcome& outcome) {
    json out = {
        {"id", outcome.problem.id},
        {"category", outcome.problem.category},
        {"kind", quest::bench::to_string(outcome.problem.kind)},
        {"difficulty", outcome.problem.difficulty},
        {"status", outcome.status},
        {"score", outcome.score},
        {"max_score", outcome.max_score},
        {"passed", outcome.passed},
        {"feedback", outcome.feedback},
        {"checks", outcome.report.to_json()["checks"]},
        {"result_kind", outcome.result_kind},
        {"params", outcome.params.to_json()},
        {"artifact_dir", outcome.artifact_dir.string()},
    };
    if (outcome.receipt) {
        out["receipt"] = quest::bench::receipt_to_json(*outcome.receipt);
    }
    if (outcome.composite) {
        const auto& session = *outcome.composite;
        out["actual_steps"] = session.value("actual_steps", 0U);
        out["optimal_steps"] = session.value("optimal_steps", 0U);
        out["efficiency_factor"] = session.value("efficiency_factor", 0.0);
        out["base_score"] = session.value("base_score", 0.0);
        out["steps"] = session.value("steps", json::array());
        out["plan"] = session.value("plan", json::array());
    }
    return out;
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string checks_to_html(const quest::bench::ValidationReport& report) {
    if (report.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "<ul>";
    for (const auto& check : report.checks()) {
        oss << "<li class=\"" << (check.passed ? "check-pass" : "check-fail") << "\">"
            << (check.passed ? "[PASS] " : "[FAIL] ") << "<strong>" << escape_html(check.name) << "</strong>"
            << (check.critical ? " (critical)" : "") << " " << check.points << "/" << check.max_points;
        if (!check.message.empty()) {
            oss << ": " << escape_html(check.message);
        }
        oss << "</li>";
    }
    oss << "</ul>";
    return oss.str();
}

std::string composite_to_html(const ProblemOutcome& outcome) {
    if (!outcome.composite) {
        return {};
    }
    const auto& session = *outcome.composite;
    std::ostringstream oss;
    oss << std::setprecision(4);
    oss << "<ul>"
        << "<li>steps: " << session.value("actual_steps", 0U) << " (optimal " << session.value("optimal_steps", 0U)
        << ")</li>"
        << "<li>efficiency: " << session.value("efficiency_factor", 0.0) << "</li>"
        << "<li>base score: " << session.value("base_score", 0.0) << "</li>"
        << "</ul>";
    return oss.str();
}

std::string render_html(const std::vector<ProblemOutcome>& outcomes) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>quest-bench Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << "ul{margin:0;padding-left:1.2rem;}"
        << ".status-PASS{color:#0a7c2f;font-weight:bold;}"
        << ".status-FAIL{color:#c1121f;font-weight:bold;}"
        << ".status-ERROR{color:#b000b5;font-weight:bold;}"
        << ".check-fail{color:#c1121f;}"
        << "</style></head><body>";

    oss << "<h1>quest-bench Report</h1>";

    std::map<std::string, std::size_t> counts;
    double total_score = 0.0;
    double total_max = 0.0;
    for (const auto& outcome : outcomes) {
        ++counts[outcome.status];
        total_score += outcome.score;
        total_max += outcome.max_score;
    }

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Total problems: " << outcomes.size() << "</li>";
    for (const auto& [status, count] : counts) {
        oss << "<li>" << escape_html(status) << ": " << count << "</li>";
    }
    oss << "<li>Points: " << total_score << " / " << total_max << "</li>";
    oss << "</ul></section>";

    oss << "<section><h2>Problems</h2><table>";
    oss << "<thead><tr>"
        << "<th>#</th>"
        << "<th>Category</th>"
        << "<th>Problem</th>"
        << "<th>Status</th>"
        << "<th>Score</th>"
        << "<th>Result</th>"
        << "<th>Checks</th>"
        << "<th>Workflow</th>"
        << "</tr></thead><tbody>";

    for (std::size_t index = 0; index < outcomes.size(); ++index) {
        const auto& outcome = outcomes[index];
        const auto status_class = "status-" + outcome.status;

        oss << "<tr>";
        oss << "<td>" << (index + 1) << "</td>";
        oss << "<td>" << escape_html(outcome.problem.category) << "</td>";
        oss << "<td>" << escape_html(outcome.problem.id) << "</td>";
        oss << "<td class=\"" << escape_html(status_class) << "\">" << escape_html(outcome.status) << "</td>";
        oss << "<td>" << outcome.score << " / " << outcome.max_score << "</td>";
        oss << "<td>" << escape_html(outcome.result_kind) << "</td>";
        oss << "<td>" << (outcome.report.empty() ? escape_html(outcome.feedback) : checks_to_html(outcome.report))
            << "</td>";
        oss << "<td>" << composite_to_html(outcome) << "</td>";
        oss << "</tr>";
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace quest::bench {

json ResultWriter::summary(const std::vector<ProblemOutcome>& outcomes) const {
    json summary = {
        {"total", outcomes.size()},
        {"by_status", json::object()},
        {"score", 0.0},
        {"max_score", 0.0},
        {"problems", json::array()},
    };

    double score = 0.0;
    double max_score = 0.0;
    auto& by_status = summary["by_status"];
    for (const auto& outcome : outcomes) {
        summary["problems"].push_back(outcome_to_json(outcome));
        auto& counter = by_status[outcome.status];
        if (!counter.is_number()) {
            counter = 0;
        }
        counter = counter.get<std::size_t>() + 1;
        score += outcome.score;
        max_score += outcome.max_score;
    }
    summary["score"] = score;
    summary["max_score"] = max_score;

    return summary;
}

void ResultWriter::write_summary(const std::filesystem::path& destination,
                                 const std::vector<ProblemOutcome>& outcomes) const {
    write_file(destination, artifact_json(summary(outcomes)));
}

void ResultWriter::write_detailed(const std::filesystem::path& destination,
                                  const std::vector<ProblemOutcome>& outcomes) const {
    const auto html = render_html(outcomes);
    write_file(destination, html);
}

}  // namespace quest::bench
