#include "toolgate/exec/process_executor.hpp"

#include "toolgate/core/logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <expected>
#include <memory>
#include <system_error>

#include <fcntl.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace toolgate::exec {

namespace net = boost::asio;
using SteadyClock = std::chrono::steady_clock;
using std::chrono::milliseconds;

namespace {

constexpr milliseconds kExitPollInterval{20};
constexpr milliseconds kDrainGrace{500};
constexpr size_t kReadChunk = 16 * 1024;

// Where the child failed before exec replaced it.
constexpr int kStageSetup = 1;
constexpr int kStageChdir = 2;
constexpr int kStageExec = 3;

struct ChildFailure {
    int stage = 0;
    int error = 0;
};

auto errno_message(int err) -> std::string {
    return std::error_code(err, std::generic_category()).message();
}

/// Owns a raw descriptor until it is handed to Asio.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.release();
        }
        return *this;
    }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }

    auto release() noexcept -> int {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset() noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

auto make_pipe() -> std::expected<Pipe, int> {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(errno);
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

struct SpawnedChild {
    pid_t pid = -1;
    UniqueFd stdout_fd;
    UniqueFd stderr_fd;
};

void reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

/// Runs in the forked child. Only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const char* binary, char* const* argv, char* const* envp,
                             const char* workdir, int stdin_fd, int stdout_fd,
                             int stderr_fd, int status_fd) {
    auto report = [status_fd](int stage) {
        ChildFailure failure{stage, errno};
        ssize_t written = ::write(status_fd, &failure, sizeof(failure));
        (void)written;
        ::_exit(127);
    };

    ::setpgid(0, 0);

    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    ::sigemptyset(&dfl.sa_mask);
    ::sigaction(SIGPIPE, &dfl, nullptr);
    ::sigaction(SIGCHLD, &dfl, nullptr);

    if (::dup2(stdin_fd, STDIN_FILENO) < 0 ||
        ::dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        ::dup2(stderr_fd, STDERR_FILENO) < 0) {
        report(kStageSetup);
    }

    if (::chdir(workdir) != 0) {
        report(kStageChdir);
    }

    ::execve(binary, argv, envp);
    report(kStageExec);
    ::_exit(127);
}

/// Forks and execs `spec` directly (no shell). Returns once exec has either
/// succeeded or the child has reported why it could not.
auto spawn_child(const LaunchSpec& spec) -> std::expected<SpawnedChild, std::string> {
    if (spec.binary.empty()) {
        return std::unexpected("executable not found on the tool search path");
    }
    if (spec.argv.empty()) {
        return std::unexpected("empty argument vector");
    }

    // Everything the child reads is laid out before fork().
    std::vector<std::string> arg_storage = spec.argv;
    std::vector<char*> argv;
    argv.reserve(arg_storage.size() + 1);
    for (auto& arg : arg_storage) argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    env_storage.reserve(spec.env.size());
    for (const auto& [key, value] : spec.env) env_storage.push_back(key + "=" + value);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) envp.push_back(entry.data());
    envp.push_back(nullptr);

    const std::string binary = spec.binary.string();
    const std::string workdir = spec.working_dir.string();

    auto out = make_pipe();
    auto err = make_pipe();
    auto status = make_pipe();
    if (!out || !err || !status) {
        int e = !out ? out.error() : !err ? err.error() : status.error();
        return std::unexpected("pipe2 failed: " + errno_message(e));
    }

    UniqueFd devnull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (devnull.get() < 0) {
        return std::unexpected("open /dev/null failed: " + errno_message(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected("fork failed: " + errno_message(errno));
    }

    if (pid == 0) {
        exec_child(binary.c_str(), argv.data(), envp.data(), workdir.c_str(),
                   devnull.get(), out->write.get(), err->write.get(), status->write.get());
    }

    // Mirrors the child's own setpgid; EACCES once it has exec'd is harmless.
    ::setpgid(pid, pid);

    out->write.reset();
    err->write.reset();
    status->write.reset();
    devnull.reset();

    ChildFailure failure;
    ssize_t n = 0;
    do {
        n = ::read(status->read.get(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        reap(pid);
        std::string stage = failure.stage == kStageChdir ? "chdir " + workdir
                          : failure.stage == kStageExec  ? "execve " + binary
                                                         : std::string("stdio setup");
        return std::unexpected(stage + ": " + errno_message(failure.error));
    }

    return SpawnedChild{pid, std::move(out->read), std::move(err->read)};
}

/// Shared state for one supervised child. Only touched from its strand.
struct Supervision {
    Supervision(const net::any_io_executor& ex, pid_t child_pid, size_t max_output)
        : stdout_pipe(ex)
        , stderr_pipe(ex)
        , watchdog(ex)
        , drain_deadline(ex)
        , done(ex)
        , capture(max_output)
        , pid(child_pid) {
        done.expires_at(net::steady_timer::time_point::max());
    }

    void finish_one() {
        if (--pending == 0) {
            done.cancel();
        }
    }

    net::posix::stream_descriptor stdout_pipe;
    net::posix::stream_descriptor stderr_pipe;
    net::steady_timer watchdog;
    net::steady_timer drain_deadline;
    net::steady_timer done;
    OutputCapture capture;
    pid_t pid;
    int pending = 3;  // stdout drain, stderr drain, exit waiter
    bool exited = false;
    bool timed_out = false;
    int wait_status = 0;
};

auto capture_output(std::shared_ptr<Supervision> sup, OutputStream stream) -> awaitable<void> {
    auto& pipe = stream == OutputStream::Stdout ? sup->stdout_pipe : sup->stderr_pipe;
    std::array<char, kReadChunk> buffer{};

    for (;;) {
        boost::system::error_code ec;
        auto n = co_await pipe.async_read_some(
            net::buffer(buffer), net::redirect_error(net::use_awaitable, ec));
        if (n > 0) {
            sup->capture.append(stream, std::string_view(buffer.data(), n));
        }
        if (ec) {
            if (ec != net::error::eof && ec != net::error::operation_aborted) {
                LOG_DEBUG("Output drain for pid {} stopped: {}", sup->pid, ec.message());
            }
            break;
        }
    }
    sup->finish_one();
}

auto await_exit(std::shared_ptr<Supervision> sup) -> awaitable<void> {
    auto ex = co_await net::this_coro::executor;
    boost::system::error_code ec;
    bool observed = false;

#ifdef SYS_pidfd_open
    int pidfd = static_cast<int>(::syscall(SYS_pidfd_open, sup->pid, 0));
    if (pidfd >= 0) {
        net::posix::stream_descriptor exit_watch(ex);
        exit_watch.assign(pidfd, ec);
        if (ec) {
            ::close(pidfd);
        } else {
            co_await exit_watch.async_wait(net::posix::stream_descriptor::wait_read,
                                           net::redirect_error(net::use_awaitable, ec));
            observed = !ec;
        }
    }
#endif

    if (!observed) {
        // WNOWAIT keeps the child unreaped so its group id stays reserved.
        net::steady_timer poll(ex);
        for (;;) {
            siginfo_t info{};
            int rc = ::waitid(P_PID, static_cast<id_t>(sup->pid), &info,
                              WEXITED | WNOHANG | WNOWAIT);
            if ((rc == 0 && info.si_pid == sup->pid) || (rc < 0 && errno != EINTR)) {
                break;
            }
            poll.expires_after(kExitPollInterval);
            co_await poll.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
    }

    sup->exited = true;
    sup->watchdog.cancel();

    // Stragglers in the group die before the leader is reaped.
    ::kill(-sup->pid, SIGKILL);
    int status = 0;
    while (::waitpid(sup->pid, &status, 0) < 0 && errno == EINTR) {
    }
    sup->wait_status = status;
    sup->finish_one();

    // A process that left the group can still hold the pipes open.
    sup->drain_deadline.expires_after(kDrainGrace);
    co_await sup->drain_deadline.async_wait(net::redirect_error(net::use_awaitable, ec));
    if (!ec && sup->pending > 0) {
        LOG_WARN("Output pipes of pid {} still open after exit, closing", sup->pid);
        boost::system::error_code ignored;
        sup->stdout_pipe.cancel(ignored);
        sup->stderr_pipe.cancel(ignored);
    }
}

auto enforce_timeout(std::shared_ptr<Supervision> sup, milliseconds timeout,
                     milliseconds grace) -> awaitable<void> {
    if (sup->exited) co_return;

    boost::system::error_code ec;
    sup->watchdog.expires_after(timeout);
    co_await sup->watchdog.async_wait(net::redirect_error(net::use_awaitable, ec));
    if (ec || sup->exited) co_return;

    sup->timed_out = true;
    LOG_WARN("Watchdog: pid {} exceeded {}ms, sending SIGTERM", sup->pid, timeout.count());
    ::kill(-sup->pid, SIGTERM);

    sup->watchdog.expires_after(grace);
    co_await sup->watchdog.async_wait(net::redirect_error(net::use_awaitable, ec));
    if (ec || sup->exited) co_return;

    LOG_WARN("Watchdog: pid {} still running {}ms after SIGTERM, sending SIGKILL",
             sup->pid, grace.count());
    ::kill(-sup->pid, SIGKILL);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// OutputCapture
// ---------------------------------------------------------------------------

OutputCapture::OutputCapture(size_t max_bytes) : max_bytes_(max_bytes) {}

void OutputCapture::append(OutputStream stream, std::string_view chunk) {
    auto used = captured_bytes();
    auto room = max_bytes_ > used ? max_bytes_ - used : 0;
    auto take = std::min(room, chunk.size());

    auto& target = stream == OutputStream::Stdout ? stdout_ : stderr_;
    target.append(chunk.data(), take);

    if (take < chunk.size()) {
        truncated_ = true;
        discarded_ += chunk.size() - take;
    }
}

auto OutputCapture::captured_bytes() const noexcept -> size_t {
    return stdout_.size() + stderr_.size();
}

// ---------------------------------------------------------------------------
// ProcessExecutor
// ---------------------------------------------------------------------------

auto ProcessExecutor::run(LaunchSpec spec) -> awaitable<ProcessOutcome> {
    auto strand = net::make_strand(co_await net::this_coro::executor);
    co_return co_await net::co_spawn(strand, supervise(std::move(spec)), net::use_awaitable);
}

auto ProcessExecutor::supervise(LaunchSpec spec) -> awaitable<ProcessOutcome> {
    auto ex = co_await net::this_coro::executor;
    auto started = SteadyClock::now();
    auto elapsed = [&started] {
        return std::chrono::duration_cast<milliseconds>(SteadyClock::now() - started);
    };

    ProcessOutcome outcome;
    spawns_.fetch_add(1);

    auto child = spawn_child(spec);
    if (!child) {
        outcome.state = ExecutionState::SpawnFailed;
        outcome.spawn_error = std::move(child.error());
        outcome.duration = elapsed();
        LOG_WARN("Spawn failed for {}: {}", spec.argv.empty() ? spec.binary.string() : spec.argv.front(),
                 outcome.spawn_error);
        co_return outcome;
    }

    active_.fetch_add(1);
    struct ActiveGuard {
        std::atomic<uint64_t>& count;
        ~ActiveGuard() { count.fetch_sub(1); }
    } guard{active_};

    outcome.state = ExecutionState::Running;
    LOG_DEBUG("Spawned pid {} for {} (timeout={}ms)", child->pid, spec.binary.string(),
              spec.timeout.count());

    auto sup = std::make_shared<Supervision>(ex, child->pid, spec.max_output_bytes);

    std::string attach_error;
    try {
        sup->stdout_pipe.assign(child->stdout_fd.get());
        child->stdout_fd.release();
        sup->stderr_pipe.assign(child->stderr_fd.get());
        child->stderr_fd.release();
    } catch (const boost::system::system_error& e) {
        attach_error = e.what();
    }

    if (!attach_error.empty()) {
        ::kill(-child->pid, SIGKILL);
        reap(child->pid);
        outcome.state = ExecutionState::SpawnFailed;
        outcome.spawn_error = "failed to attach output pipes: " + attach_error;
        outcome.duration = elapsed();
        LOG_ERROR("Supervision setup failed for pid {}: {}", child->pid, attach_error);
        co_return outcome;
    }

    net::co_spawn(ex, capture_output(sup, OutputStream::Stdout), net::detached);
    net::co_spawn(ex, capture_output(sup, OutputStream::Stderr), net::detached);
    net::co_spawn(ex, await_exit(sup), net::detached);
    net::co_spawn(ex, enforce_timeout(sup, spec.timeout, spec.kill_grace), net::detached);

    while (sup->pending > 0) {
        boost::system::error_code ec;
        co_await sup->done.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    sup->drain_deadline.cancel();
    sup->watchdog.cancel();

    outcome.duration = elapsed();
    outcome.truncated = sup->capture.truncated();
    outcome.stdout_text = sup->capture.take_stdout();
    outcome.stderr_text = sup->capture.take_stderr();

    int status = sup->wait_status;
    if (WIFEXITED(status)) {
        outcome.return_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
        outcome.return_code = -WTERMSIG(status);
    }

    if (sup->timed_out) {
        outcome.state = ExecutionState::TimedOut;
    } else if (outcome.term_signal) {
        outcome.state = ExecutionState::Killed;
    } else {
        outcome.state = ExecutionState::Completed;
    }

    if (outcome.truncated) {
        LOG_WARN("Output of pid {} truncated at {} bytes ({} discarded)", child->pid,
                 spec.max_output_bytes, sup->capture.discarded_bytes());
    }
    LOG_DEBUG("pid {} finished: state={} rc={} duration={}ms", child->pid,
              to_string(outcome.state), outcome.return_code.value_or(-1),
              outcome.duration.count());

    co_return outcome;
}

} // namespace toolgate::exec
