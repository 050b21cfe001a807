#pragma once

#include "quest_bench/execution_result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace quest::bench::node_bridge
{

/**
 * JavaScript/TypeScript execution bridge.
 *
 * Each execution writes the candidate source into a fresh directory and runs a new
 * runtime process (bun by default, node works for .js/.mjs) on the runner script:
 *
 *   <runtime> [runtime_args...] run_candidate.mjs <source> <endpoint> <identity> <fixtures-json> <timeout-ms>
 *
 * The runner imports the module, calls `executeSkill(providerUrl, agentAddress,
 * deployedContracts)` and prints one JSON envelope as its last stdout line. The
 * runner enforces the timeout itself; the bridge kills the process group at
 * timeout + kill_grace in case the runtime does not cooperate.
 */
class Session final : public CodeExecutor
{
public:
    struct Config
    {
        // Runtime executable ("bun", "node", or an absolute path).
        std::string runtime{"bun"};

        // Extra arguments placed before the runner script (e.g. "--experimental-strip-types").
        std::vector<std::string> runtime_args;

        // Path to runner/run_candidate.mjs.
        std::filesystem::path runner_script;

        // Root for per-execution directories. Falls back to the system temp directory.
        std::filesystem::path work_dir;

        // Slack on top of the request timeout before the bridge kills the runtime itself.
        std::chrono::milliseconds kill_grace{1000};

        // Keep per-execution directories after the run (they are removed otherwise).
        bool keep_work_dirs{false};
    };

    explicit Session(Config cfg);

    [[nodiscard]] bool initialized() const noexcept { return ready_; }

    /**
     * Verifies the runner script and probes the runtime with `--version`.
     * Returns true on success. Diagnostics appended to diag_out.
     */
    bool init(std::string& diag_out);

    ExecutionResult execute(const ExecutionRequest& request, std::string& diag_out) override;

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

private:
    Config cfg_;
    std::filesystem::path work_root_;
    unsigned long long counter_{0};
    bool ready_{false};
};

} // namespace quest::bench::node_bridge
