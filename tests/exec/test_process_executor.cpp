#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>

#include "test_support.hpp"
#include "toolgate/exec/process_executor.hpp"

using namespace toolgate::exec;
using namespace std::chrono_literals;
using toolgate::testing::run_sync;
using toolgate::testing::write_script;
namespace fs = std::filesystem;

namespace {

auto launch(const fs::path& script, const fs::path& workdir,
            std::vector<std::string> args = {}) -> LaunchSpec {
    LaunchSpec spec;
    spec.binary = script;
    spec.argv.push_back(script.filename().string());
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.env = {{"PATH", "/usr/local/bin:/usr/bin:/bin"}, {"HOME", workdir.string()}};
    spec.working_dir = workdir;
    spec.timeout = 10s;
    spec.kill_grace = 500ms;
    spec.max_output_bytes = 64 * 1024;
    return spec;
}

} // namespace

TEST_CASE("OutputCapture bounds the combined streams", "[exec][executor]") {
    OutputCapture capture(10);

    capture.append(OutputStream::Stdout, "hello");
    CHECK_FALSE(capture.truncated());
    capture.append(OutputStream::Stderr, "world");
    CHECK_FALSE(capture.truncated());
    CHECK(capture.captured_bytes() == 10);

    capture.append(OutputStream::Stdout, "!!!");
    CHECK(capture.truncated());
    CHECK(capture.discarded_bytes() == 3);
    CHECK(capture.take_stdout() == "hello");
    CHECK(capture.take_stderr() == "world");
}

TEST_CASE("OutputCapture keeps the prefix of an oversized chunk", "[exec][executor]") {
    OutputCapture capture(4);
    capture.append(OutputStream::Stdout, "abcdefgh");
    CHECK(capture.truncated());
    CHECK(capture.discarded_bytes() == 4);
    CHECK(capture.take_stdout() == "abcd");
}

TEST_CASE("ProcessExecutor captures output and exit code", "[exec][executor]") {
    toolgate::testing::TempDir dir;
    auto script = write_script(dir.path(), "report",
        "echo out-line\n"
        "echo err-line >&2\n"
        "exit 3");

    ProcessExecutor executor;
    auto outcome = run_sync(executor.run(launch(script, dir.path())));

    CHECK(outcome.state == ExecutionState::Completed);
    CHECK(outcome.return_code == 3);
    CHECK_FALSE(outcome.term_signal.has_value());
    CHECK(outcome.stdout_text == "out-line\n");
    CHECK(outcome.stderr_text == "err-line\n");
    CHECK_FALSE(outcome.truncated);
    CHECK(outcome.spawn_error.empty());
    CHECK(executor.spawn_count() == 1);
    CHECK(executor.active_count() == 0);
}

TEST_CASE("ProcessExecutor passes argv literally without a shell", "[exec][executor]") {
    toolgate::testing::TempDir dir;
    auto script = write_script(dir.path(), "args", "printf '%s\\n' \"$@\"");

    ProcessExecutor executor;
    auto outcome = run_sync(executor.run(
        launch(script, dir.path(), {"two words", "*", "'quoted'", "--flag=x"})));

    CHECK(outcome.state == ExecutionState::Completed);
    CHECK(outcome.stdout_text == "two words\n*\n'quoted'\n--flag=x\n");
}

TEST_CASE("ProcessExecutor uses exactly the given environment and directory",
          "[exec][executor]") {
    toolgate::testing::TempDir dir;
    auto work = dir.make_subdir("work");
    auto script = write_script(dir.path(), "envdump",
        "echo \"marker=${TOOLGATE_MARKER:-unset}\"\n"
        "echo \"secret=${TOOLGATE_SECRET:-unset}\"\n"
        "pwd");

    ::setenv("TOOLGATE_SECRET", "leaked", 1);
    auto spec = launch(script, work);
    spec.env["TOOLGATE_MARKER"] = "set";

    ProcessExecutor executor;
    auto outcome = run_sync(executor.run(spec));
    ::unsetenv("TOOLGATE_SECRET");

    CHECK(outcome.state == ExecutionState::Completed);
    CHECK(outcome.stdout_text ==
          "marker=set\nsecret=unset\n" + fs::canonical(work).string() + "\n");
}

TEST_CASE("ProcessExecutor truncates output but keeps draining", "[exec][executor]") {
    toolgate::testing::TempDir dir;
    auto script = write_script(dir.path(), "chatty",
        "i=0\n"
        "while [ $i -lt 2000 ]; do\n"
        "  echo 0123456789012345678901234567890123456789\n"
        "  i=$((i+1))\n"
        "done\n"
        "exit 0");

    auto spec = launch(script, dir.path());
    spec.max_output_bytes = 1000;

    ProcessExecutor executor;
    auto outcome = run_sync(executor.run(spec));

    CHECK(outcome.state == ExecutionState::Completed);
    CHECK(outcome.return_code == 0);
    CHECK(outcome.truncated);
    CHECK(outcome.stdout_text.size() == 1000);
}

TEST_CASE("ProcessExecutor enforces the timeout", "[exec][executor]") {
    toolgate::testing::TempDir dir;

    SECTION("SIGTERM ends a cooperative child") {
        auto script = write_script(dir.path(), "sleeper", "echo started\nsleep 30");
        auto spec = launch(script, dir.path());
        spec.timeout = 300ms;

        ProcessExecutor executor;
        auto started = std::chrono::steady_clock::now();
        auto outcome = run_sync(executor.run(spec));
        auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK(outcome.state == ExecutionState::TimedOut);
        CHECK(outcome.term_signal == SIGTERM);
        CHECK(outcome.stdout_text == "started\n");
        CHECK(elapsed < 5s);
    }

    SECTION("SIGKILL follows when SIGTERM is ignored") {
        auto script = write_script(dir.path(), "stubborn",
            "trap '' TERM\n"
            "while :; do sleep 1; done");
        auto spec = launch(script, dir.path());
        spec.timeout = 300ms;
        spec.kill_grace = 300ms;

        ProcessExecutor executor;
        auto started = std::chrono::steady_clock::now();
        auto outcome = run_sync(executor.run(spec));
        auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK(outcome.state == ExecutionState::TimedOut);
        CHECK(outcome.term_signal == SIGKILL);
        CHECK(outcome.return_code == -SIGKILL);
        CHECK(elapsed < 5s);
    }
}

TEST_CASE("ProcessExecutor reports a child killed by a signal", "[exec][executor]") {
    toolgate::testing::TempDir dir;
    auto script = write_script(dir.path(), "suicide", "kill -9 $$");

    ProcessExecutor executor;
    auto outcome = run_sync(executor.run(launch(script, dir.path())));

    CHECK(outcome.state == ExecutionState::Killed);
    CHECK(outcome.term_signal == SIGKILL);
    CHECK(outcome.return_code == -SIGKILL);
}

TEST_CASE("ProcessExecutor leaves no background processes behind", "[exec][executor]") {
    toolgate::testing::TempDir dir;
    auto script = write_script(dir.path(), "forker", "sleep 30 &\necho parent-done");

    ProcessExecutor executor;
    auto started = std::chrono::steady_clock::now();
    auto outcome = run_sync(executor.run(launch(script, dir.path())));
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(outcome.state == ExecutionState::Completed);
    CHECK(outcome.return_code == 0);
    CHECK(outcome.stdout_text == "parent-done\n");
    CHECK(elapsed < 5s);
}

TEST_CASE("ProcessExecutor reports spawn failures", "[exec][executor]") {
    toolgate::testing::TempDir dir;
    ProcessExecutor executor;

    SECTION("binary not resolved") {
        auto spec = launch(dir.path() / "unused", dir.path());
        spec.binary.clear();
        auto outcome = run_sync(executor.run(spec));
        CHECK(outcome.state == ExecutionState::SpawnFailed);
        CHECK(outcome.spawn_error == "executable not found on the tool search path");
        CHECK_FALSE(outcome.return_code.has_value());
    }

    SECTION("binary missing on disk") {
        auto outcome = run_sync(executor.run(launch(dir.path() / "missing", dir.path())));
        CHECK(outcome.state == ExecutionState::SpawnFailed);
        CHECK(outcome.spawn_error.starts_with("execve "));
    }

    SECTION("working directory missing") {
        auto script = write_script(dir.path(), "ok", "exit 0");
        auto outcome = run_sync(executor.run(launch(script, dir.path() / "gone")));
        CHECK(outcome.state == ExecutionState::SpawnFailed);
        CHECK(outcome.spawn_error.starts_with("chdir "));
    }

    SECTION("file without execute permission") {
        auto script = write_script(dir.path(), "noexec", "exit 0");
        fs::permissions(script, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
        auto outcome = run_sync(executor.run(launch(script, dir.path())));
        CHECK(outcome.state == ExecutionState::SpawnFailed);
    }

    CHECK(executor.active_count() == 0);
}
