#include "quest_bench/process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace quest::bench {

namespace {

using Clock = std::chrono::steady_clock;

/// Output left behind by grandchildren is collected for at most this long after the child exits.
constexpr std::chrono::milliseconds kLingerAfterExit{200};
constexpr int kPollSliceMs = 50;
constexpr std::size_t kMaxPartialLine = 64U * 1024U;

void set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// Reads what is available; returns false on EOF or a hard error.
bool pump(int fd, std::string& sink, std::size_t cap) {
    char buf[4096];
    while (true) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            const std::size_t room = cap > sink.size() ? cap - sink.size() : 0;
            sink.append(buf, std::min(room, static_cast<std::size_t>(n)));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

std::vector<char*> make_argv(const ProcessSpec& spec, std::vector<std::string>& storage) {
    storage.clear();
    storage.push_back(spec.executable);
    storage.insert(storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) argv.push_back(arg.data());
    argv.push_back(nullptr);
    return argv;
}

/// Child side after fork(): own process group, redirected stdio, exec. Never returns.
[[noreturn]] void exec_child(const ProcessSpec& spec, char* const* argv, int out_fd, int err_fd) {
    ::setpgid(0, 0);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);
    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
        const std::string msg = "chdir failed: " + spec.working_dir.string() + ": " + std::strerror(errno) + "\n";
        (void)!::write(STDERR_FILENO, msg.data(), msg.size());
        ::_exit(kExecFailedStatus);
    }
    ::execvp(argv[0], argv);
    const std::string msg = "exec failed: " + spec.executable + ": " + std::strerror(errno) + "\n";
    (void)!::write(STDERR_FILENO, msg.data(), msg.size());
    ::_exit(kExecFailedStatus);
}

void decode_status(int status, ProcessResult& out) {
    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.term_signal = WTERMSIG(status);
    }
}

}  // namespace

ProcessResult run_process(const ProcessSpec& spec, std::chrono::milliseconds timeout, std::size_t output_cap) {
    ProcessResult result;
    const auto started = Clock::now();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) != 0) {
        result.spawn_failed = true;
        result.stderr_text = std::string{"pipe failed: "} + std::strerror(errno);
        return result;
    }
    if (::pipe(err_pipe) != 0) {
        result.spawn_failed = true;
        result.stderr_text = std::string{"pipe failed: "} + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return result;
    }

    std::vector<std::string> argv_storage;
    auto argv = make_argv(spec, argv_storage);

    const pid_t child = ::fork();
    if (child < 0) {
        result.spawn_failed = true;
        result.stderr_text = std::string{"fork failed: "} + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) close_fd(*fd);
        return result;
    }
    if (child == 0) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        exec_child(spec, argv.data(), out_pipe[1], err_pipe[1]);
    }

    // Parent also sets the group so killpg() cannot race the child's own setpgid().
    ::setpgid(child, child);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    const auto deadline = started + timeout;
    bool reaped = false;
    Clock::time_point reaped_at{};
    int status = 0;

    while (true) {
        const auto now = Clock::now();
        if (!reaped && now >= deadline) {
            ::killpg(child, SIGKILL);
            ::waitpid(child, &status, 0);
            result.timed_out = true;
            if (out_fd >= 0) (void)pump(out_fd, result.stdout_text, output_cap);
            if (err_fd >= 0) (void)pump(err_fd, result.stderr_text, output_cap);
            break;
        }
        if (reaped && (out_fd < 0 && err_fd < 0)) break;
        if (reaped && now - reaped_at >= kLingerAfterExit) {
            ::killpg(child, SIGKILL);
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};
        if (count > 0) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            const int slice = static_cast<int>(std::clamp<long long>(remaining, 1, kPollSliceMs));
            (void)::poll(fds, count, slice);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }

        if (out_fd >= 0 && !pump(out_fd, result.stdout_text, output_cap)) close_fd(out_fd);
        if (err_fd >= 0 && !pump(err_fd, result.stderr_text, output_cap)) close_fd(err_fd);

        if (!reaped) {
            const pid_t w = ::waitpid(child, &status, WNOHANG);
            if (w == child) {
                reaped = true;
                reaped_at = Clock::now();
            }
        }
    }

    close_fd(out_fd);
    close_fd(err_fd);
    if (!result.timed_out) decode_status(status, result);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    return result;
}

ChildProcess::ChildProcess(pid_t pid, int err_fd, std::size_t tail_lines)
    : pid_(pid), err_fd_(err_fd), tail_lines_(tail_lines) {}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const ProcessSpec& spec, std::size_t tail_lines) {
    int err_pipe[2] = {-1, -1};
    if (::pipe(err_pipe) != 0) {
        throw std::runtime_error(std::string{"pipe failed: "} + std::strerror(errno));
    }

    std::vector<std::string> argv_storage;
    auto argv = make_argv(spec, argv_storage);

    const pid_t child = ::fork();
    if (child < 0) {
        const std::string why = std::strerror(errno);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw std::runtime_error("fork failed: " + why);
    }
    if (child == 0) {
        ::close(err_pipe[0]);
        const int devnull = ::open("/dev/null", O_WRONLY);
        exec_child(spec, argv.data(), devnull >= 0 ? devnull : STDOUT_FILENO, err_pipe[1]);
    }

    ::setpgid(child, child);
    ::close(err_pipe[1]);
    set_nonblocking(err_pipe[0]);
    return std::unique_ptr<ChildProcess>(new ChildProcess(child, err_pipe[0], tail_lines));
}

ChildProcess::~ChildProcess() {
    terminate(std::chrono::milliseconds{500});
    close_fd(err_fd_);
}

bool ChildProcess::running() {
    drain();
    if (status_ || pid_ <= 0) return false;
    int status = 0;
    const pid_t w = ::waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
        status_ = status;
        return false;
    }
    return true;
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!running()) return;

    ::killpg(pid_, SIGTERM);
    const auto deadline = Clock::now() + grace;
    while (Clock::now() < deadline) {
        if (!running()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    ::killpg(pid_, SIGKILL);
    int status = 0;
    if (::waitpid(pid_, &status, 0) == pid_) status_ = status;
}

void ChildProcess::drain() {
    if (err_fd_ < 0) return;
    std::string chunk;
    const bool open = pump(err_fd_, chunk, 1U << 20);
    partial_ += chunk;
    std::size_t pos = 0;
    while (true) {
        const auto nl = partial_.find('\n', pos);
        if (nl == std::string::npos) break;
        tail_.emplace_back(partial_.substr(pos, nl - pos));
        if (tail_.size() > tail_lines_) tail_.pop_front();
        pos = nl + 1;
    }
    partial_.erase(0, pos);
    if (partial_.size() > kMaxPartialLine) partial_.erase(0, partial_.size() - kMaxPartialLine);
    if (!open) close_fd(err_fd_);
}

std::string ChildProcess::stderr_tail() {
    drain();
    std::string out;
    for (const auto& line : tail_) {
        out += line;
        out += '\n';
    }
    if (!partial_.empty()) out += partial_ + '\n';
    return out;
}

}  // namespace quest::bench
