#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace quest::bench {

struct ProcessSpec {
    std::string executable;          ///< resolved through PATH when it has no slash
    std::vector<std::string> args;   ///< argv[1..]
    std::filesystem::path working_dir;
};

struct ProcessResult {
    int exit_code{-1};
    int term_signal{0};
    bool timed_out{false};
    bool spawn_failed{false};
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool exited_cleanly() const noexcept {
        return !timed_out && !spawn_failed && term_signal == 0 && exit_code == 0;
    }
};

/// Exit status the child reports when exec itself fails.
inline constexpr int kExecFailedStatus = 127;

/**
 * Runs a child to completion in its own process group with captured output.
 *
 * When \a timeout elapses the whole group is killed with SIGKILL and the result is
 * marked timed_out. Each stream keeps at most \a output_cap bytes; the rest is
 * read and discarded so the child never blocks on a full pipe.
 */
[[nodiscard]] ProcessResult run_process(const ProcessSpec& spec,
                                        std::chrono::milliseconds timeout,
                                        std::size_t output_cap = 1U << 20);

/**
 * \brief Long-lived child (the ledger simulator).
 *
 * stdout is discarded; stderr is drained whenever liveness or the tail is queried, into a bounded ring of lines so
 * that a failed start can be reported with the simulator's own words. The
 * destructor terminates the process group.
 */
class ChildProcess {
public:
    /// Throws std::runtime_error when the pipe or fork fails.
    [[nodiscard]] static std::unique_ptr<ChildProcess> spawn(const ProcessSpec& spec, std::size_t tail_lines = 30);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// Non-blocking liveness check; reaps the child when it has exited and drains pending stderr.
    [[nodiscard]] bool running();
    [[nodiscard]] std::optional<int> exit_status() const noexcept { return status_; }

    /// SIGTERM to the group, SIGKILL after \a grace. Idempotent.
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds{2000});

    /// Last lines written to stderr (drains pending output first).
    [[nodiscard]] std::string stderr_tail();

private:
    ChildProcess(pid_t pid, int err_fd, std::size_t tail_lines);
    void drain();

    pid_t pid_{-1};
    int err_fd_{-1};
    std::size_t tail_lines_{30};
    std::deque<std::string> tail_;
    std::string partial_;
    std::optional<int> status_;
};

}  // namespace quest::bench
