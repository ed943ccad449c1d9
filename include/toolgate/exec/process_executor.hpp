#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "toolgate/exec/types.hpp"

namespace toolgate::exec {

using boost::asio::awaitable;

/// Everything needed to start one child process.
struct LaunchSpec {
    std::filesystem::path binary;      // absolute path; empty means "not found"
    std::vector<std::string> argv;     // argv[0] included
    EnvMap env;
    std::filesystem::path working_dir;
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds kill_grace{2000};
    size_t max_output_bytes = 1024 * 1024;
};

/// Terminal state of one supervised child.
struct ProcessOutcome {
    ExecutionState state = ExecutionState::Pending;
    std::optional<int> return_code;     // exit code, or -signal when signalled
    std::optional<int> term_signal;
    std::string stdout_text;
    std::string stderr_text;
    bool truncated = false;
    std::chrono::milliseconds duration{0};
    std::string spawn_error;            // full OS error, for the audit record only
};

enum class OutputStream {
    Stdout,
    Stderr,
};

/// Bounded capture for both streams of one child. The ceiling applies to the
/// combined size; bytes past it are counted and discarded.
class OutputCapture {
public:
    explicit OutputCapture(size_t max_bytes);

    void append(OutputStream stream, std::string_view chunk);

    [[nodiscard]] auto truncated() const noexcept -> bool { return truncated_; }
    [[nodiscard]] auto captured_bytes() const noexcept -> size_t;
    [[nodiscard]] auto discarded_bytes() const noexcept -> uint64_t { return discarded_; }

    auto take_stdout() -> std::string { return std::move(stdout_); }
    auto take_stderr() -> std::string { return std::move(stderr_); }

private:
    size_t max_bytes_;
    std::string stdout_;
    std::string stderr_;
    uint64_t discarded_ = 0;
    bool truncated_ = false;
};

/// Spawns and supervises child processes without a shell.
///
/// Each run forks the binary directly from an argument vector into its own
/// process group, drains stdout/stderr into an OutputCapture, and arms a
/// watchdog that sends SIGTERM to the group on timeout and SIGKILL after the
/// grace window. The group is killed and the child reaped before run()
/// returns, so nothing outlives the call.
///
/// All supervision for one run happens on a private strand; concurrent runs
/// share nothing but the counters below.
class ProcessExecutor {
public:
    ProcessExecutor() = default;

    ProcessExecutor(const ProcessExecutor&) = delete;
    ProcessExecutor& operator=(const ProcessExecutor&) = delete;

    /// Runs `spec` to completion. Never throws for child-side failures;
    /// they are reported through ProcessOutcome::state.
    auto run(LaunchSpec spec) -> awaitable<ProcessOutcome>;

    /// Number of spawn attempts since construction.
    [[nodiscard]] auto spawn_count() const noexcept -> uint64_t { return spawns_.load(); }

    /// Number of children currently being supervised.
    [[nodiscard]] auto active_count() const noexcept -> uint64_t { return active_.load(); }

private:
    auto supervise(LaunchSpec spec) -> awaitable<ProcessOutcome>;

    std::atomic<uint64_t> spawns_{0};
    std::atomic<uint64_t> active_{0};
};

} // namespace toolgate::exec
