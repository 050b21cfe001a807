#include "quest_bench/node_bridge.hpp"
#include "quest_bench/process.hpp"
#include "quest_bench/result_classifier.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include <unistd.h>

namespace fs = std::filesystem;

namespace quest::bench::node_bridge {

static bool write_text(const fs::path& p, const std::string& text, std::string& diag) {
    std::error_code ec;
    if (auto parent = p.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            diag += "Failed to create directory " + parent.string() + ": " + ec.message() + "\n";
            return false;
        }
    }
    std::ofstream ofs(p);
    if (!ofs) {
        diag += "Failed to open for write: " + p.string() + "\n";
        return false;
    }
    ofs << text;
    if (!ofs) {
        diag += "Short write: " + p.string() + "\n";
        return false;
    }
    return true;
}

static fs::path make_unique_dir(const fs::path& base, const std::string& prefix, unsigned long long seq) {
    auto now = std::chrono::system_clock::now();
    auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    std::ostringstream os;
    os << prefix << ::getpid() << "_" << since_epoch << "_" << seq;
    return base / os.str();
}

static std::string fixtures_json(const FixtureRegistry& fixtures) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, address] : fixtures) out[name] = address.hex;
    return out.dump();
}

Session::Session(Config cfg) : cfg_(std::move(cfg)) {}

bool Session::init(std::string& diag_out) {
    if (ready_) return true;

    if (cfg_.runner_script.empty() || !fs::exists(cfg_.runner_script)) {
        diag_out += "Runner script not found at: " + cfg_.runner_script.string() + "\n";
        return false;
    }

    std::error_code ec;
    work_root_ = cfg_.work_dir.empty() ? fs::temp_directory_path(ec) / "quest_bench" : cfg_.work_dir;
    fs::create_directories(work_root_, ec);
    if (ec) {
        diag_out += "Failed to create work_dir: " + work_root_.string() + " : " + ec.message() + "\n";
        return false;
    }

    ProcessSpec probe;
    probe.executable = cfg_.runtime;
    probe.args = {"--version"};
    const auto version = run_process(probe, std::chrono::seconds{10});
    if (!version.exited_cleanly()) {
        diag_out += "Runtime '" + cfg_.runtime + "' is not usable";
        if (!version.stderr_text.empty()) diag_out += ": " + version.stderr_text;
        diag_out += "\n";
        return false;
    }
    diag_out += "Runtime " + cfg_.runtime + " " + version.stdout_text;
    if (!version.stdout_text.empty() && version.stdout_text.back() != '\n') diag_out += "\n";

    ready_ = true;
    return true;
}

ExecutionResult Session::execute(const ExecutionRequest& request, std::string& diag_out) {
    if (!ready_) {
        return Failure{FailureKind::SpawnError, "Execution bridge is not initialised", {}};
    }

    const fs::path dir = make_unique_dir(work_root_, "exec_", ++counter_);
    const fs::path source_path = dir / ("candidate" + request.source_extension);
    if (!write_text(source_path, request.source, diag_out)) {
        return Failure{FailureKind::SpawnError, "Unable to stage candidate source", diag_out};
    }

    ProcessSpec spec;
    spec.executable = cfg_.runtime;
    spec.args = cfg_.runtime_args;
    spec.args.push_back(fs::absolute(cfg_.runner_script).string());
    spec.args.push_back(source_path.string());
    spec.args.push_back(request.endpoint);
    spec.args.push_back(request.identity.hex);
    spec.args.push_back(fixtures_json(request.fixtures));
    spec.args.push_back(std::to_string(request.timeout.count()));
    spec.working_dir = dir;

    const auto process = run_process(spec, request.timeout + cfg_.kill_grace);
    diag_out += "runtime: exit=" + std::to_string(process.exit_code) + " signal=" + std::to_string(process.term_signal) +
                " timed_out=" + (process.timed_out ? "true" : "false") + " elapsed_ms=" +
                std::to_string(process.elapsed.count()) + "\n";

    if (!request.artifact_dir.empty()) {
        (void)write_text(request.artifact_dir / "runner_stdout.txt", process.stdout_text, diag_out);
        (void)write_text(request.artifact_dir / "runner_stderr.txt", process.stderr_text, diag_out);
    }

    auto result = classify_process(process, request.timeout, diag_out);

    if (!cfg_.keep_work_dirs) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) diag_out += "Failed to remove " + dir.string() + ": " + ec.message() + "\n";
    }
    return result;
}

} // namespace quest::bench::node_bridge
