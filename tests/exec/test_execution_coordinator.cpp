#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "toolgate/exec/execution_coordinator.hpp"

using namespace toolgate::exec;
using namespace std::chrono_literals;
using toolgate::testing::MemoryAuditSink;
using toolgate::testing::run_sync;
using toolgate::testing::write_script;
namespace fs = std::filesystem;

namespace {

auto make_limits(const fs::path& root, const std::function<void(ResourceLimits&)>& tweak)
    -> ResourceLimits {
    ResourceLimits limits;
    limits.sandbox_root = root;
    limits.max_timeout = 30s;
    limits.default_timeout = 10s;
    limits.max_output_bytes = 64 * 1024;
    limits.kill_grace = 200ms;
    if (tweak) tweak(limits);
    return limits;
}

auto prepare_bin(const toolgate::testing::TempDir& dir) -> fs::path {
    auto bin = dir.make_subdir("bin");
    write_script(bin, "echo-args", "printf '%s\\n' \"$@\"");
    write_script(bin, "fail-tool", "echo partial\necho oops >&2\nexit 2");
    write_script(bin, "slow-tool", "echo started\nsleep 30");
    write_script(bin, "chatty-tool",
        "i=0\n"
        "while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done");
    write_script(bin, "env-tool",
        "echo \"HOME=$HOME\"\n"
        "echo \"SECRET=${TOOLGATE_SECRET_TOKEN:-none}\"\n"
        "pwd");
    return bin;
}

/// Registry of script tools, a sandbox root and an in-memory audit trail.
struct Harness {
    explicit Harness(const std::function<void(ResourceLimits&)>& tweak = {})
        : bin(prepare_bin(dir))
        , root(dir.make_subdir("sandbox"))
        , registry(ToolRegistry::Options{
              .extra_tools = {"echo-args", "fail-tool", "slow-tool", "chatty-tool",
                              "env-tool", "ghost-tool"},
              .search_path = bin.string(),
              .default_timeout = 10s,
              .probe_directory = root,
          })
        , audit(std::make_unique<MemoryAuditSink>(store))
        , coordinator(registry, make_limits(root, tweak), executor, audit) {
        dir.make_subdir("sandbox/work");
    }

    auto run(ExecutionRequest request) -> ExecutionResult {
        return run_sync(coordinator.execute(std::move(request)));
    }

    auto events() -> std::vector<AuditEvent> {
        audit.flush();
        return store->snapshot();
    }

    toolgate::testing::TempDir dir;
    fs::path bin;
    fs::path root;
    std::shared_ptr<MemoryAuditSink::Store> store = std::make_shared<MemoryAuditSink::Store>();
    ToolRegistry registry;
    ProcessExecutor executor;
    AuditLogger audit;
    ExecutionCoordinator coordinator;
};

} // namespace

TEST_CASE("ExecutionCoordinator runs a permitted tool", "[exec][coordinator]") {
    Harness h;
    auto request = make_request("echo-args", {"hello world", "-v"});
    auto id = request.request_id;

    auto result = h.run(std::move(request));

    CHECK(result.outcome == Outcome::Success);
    CHECK(result.request_id == id);
    CHECK(result.tool == "echo-args");
    CHECK(result.stdout_text == "hello world\n-v\n");
    CHECK(result.return_code == 0);
    CHECK_FALSE(result.truncated);
    CHECK_FALSE(result.security_violation);
    CHECK(result.message.empty());

    auto events = h.events();
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == AuditEventKind::ExecutionStart);
    CHECK(events[1].kind == AuditEventKind::ExecutionEnd);
    CHECK(events[0].request_id == id);
    CHECK(events[1].request_id == id);
    CHECK(events[0].sequence < events[1].sequence);
    CHECK(events[1].detail.find("outcome=success") != std::string::npos);
}

TEST_CASE("ExecutionCoordinator assigns a request id when missing", "[exec][coordinator]") {
    Harness h;
    ExecutionRequest request;
    request.tool = "echo-args";

    auto result = h.run(std::move(request));
    CHECK(result.request_id.size() == 36);
}

TEST_CASE("ExecutionCoordinator reports a non-zero exit as a tool error", "[exec][coordinator]") {
    Harness h;
    auto result = h.run(make_request("fail-tool"));

    CHECK(result.outcome == Outcome::ToolError);
    CHECK(result.return_code == 2);
    CHECK(result.stdout_text == "partial\n");
    CHECK(result.stderr_text == "oops\n");
    CHECK(result.message == "tool exited with code 2");
}

TEST_CASE("ExecutionCoordinator refuses tools outside the registry", "[exec][coordinator]") {
    Harness h;

    SECTION("well-formed but unregistered") {
        auto result = h.run(make_request("bash", {"-c", "id"}));
        CHECK(result.outcome == Outcome::InvalidToolName);
        CHECK(result.security_violation);
        CHECK(result.message == "tool is not permitted");
        CHECK_FALSE(result.return_code.has_value());

        auto events = h.events();
        REQUIRE(events.size() == 2);
        CHECK(events[0].kind == AuditEventKind::SecurityViolation);
        CHECK(events[0].input["args"] == json::array({"-c", "id"}));
        CHECK(events[1].kind == AuditEventKind::ValidationFailure);
        CHECK(events[1].input["tool"] == "bash");
        CHECK(std::ranges::count_if(events, [](const AuditEvent& e) {
                  return is_terminal(e.kind);
              }) == 1);
    }

    SECTION("malformed name") {
        auto result = h.run(make_request("echo-args;id"));
        CHECK(result.outcome == Outcome::InvalidToolName);
        CHECK(result.security_violation);

        auto events = h.events();
        REQUIRE(events.size() == 2);
        CHECK(events[0].kind == AuditEventKind::SecurityViolation);
        CHECK(events[1].kind == AuditEventKind::ValidationFailure);
        CHECK(events[1].input["tool"] == "echo-args;id");
    }

    SECTION("case differs") {
        auto result = h.run(make_request("ECHO-ARGS"));
        CHECK(result.outcome == Outcome::InvalidToolName);
    }

    CHECK(h.executor.spawn_count() == 0);
}

TEST_CASE("ExecutionCoordinator refuses dangerous arguments", "[exec][coordinator]") {
    Harness h;
    auto result = h.run(make_request("echo-args", {"127.0.0.1; cat /etc/passwd"}));

    CHECK(result.outcome == Outcome::DisallowedArgument);
    CHECK(result.security_violation);
    CHECK(result.message == "arguments contain potentially dangerous characters");
    CHECK(result.stdout_text.empty());
    CHECK(h.executor.spawn_count() == 0);

    auto events = h.events();
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == AuditEventKind::SecurityViolation);
    CHECK(events[0].input["args"][0] == "127.0.0.1; cat /etc/passwd");
    // The detail names the offending byte; the caller-facing message does not.
    CHECK(events[0].detail.find("';'") != std::string::npos);
    CHECK(events[1].kind == AuditEventKind::ValidationFailure);
}

TEST_CASE("ExecutionCoordinator rejects names and arguments that are not UTF-8",
          "[exec][coordinator]") {
    Harness h;

    SECTION("tool name") {
        auto result = h.run(make_request("nm\xff" "ap"));
        CHECK(result.outcome == Outcome::InvalidToolName);
        CHECK(result.security_violation);
    }

    SECTION("argument with a control byte after a high byte") {
        auto result = h.run(make_request("echo-args", {"caf\xe9\n"}));
        CHECK(result.outcome == Outcome::DisallowedArgument);
    }

    auto events = h.events();
    REQUIRE(events.size() == 2);
    CHECK(events[1].kind == AuditEventKind::ValidationFailure);
    CHECK(h.coordinator.metrics().rejected == 1);
    CHECK(h.audit.health().healthy);
    CHECK(h.audit.health().written == 2);
    CHECK(h.executor.spawn_count() == 0);
}

TEST_CASE("ExecutionCoordinator is deterministic for identical input", "[exec][coordinator]") {
    Harness h;
    std::vector<ExecutionResult> results;
    for (int i = 0; i < 3; ++i) {
        results.push_back(h.run(make_request("fail-tool", {"--version"})));
        results.push_back(h.run(make_request("echo-args", {"--version"})));
    }

    for (size_t i = 2; i < results.size(); ++i) {
        CHECK(results[i].outcome == results[i % 2].outcome);
        CHECK(results[i].return_code == results[i % 2].return_code);
        CHECK(results[i].stdout_text == results[i % 2].stdout_text);
    }
    CHECK(results[0].outcome == Outcome::ToolError);
    CHECK(results[0].return_code == 2);
    CHECK(results[1].outcome == Outcome::Success);
    CHECK(results[1].return_code == 0);
}

TEST_CASE("ExecutionCoordinator confines the working directory", "[exec][coordinator]") {
    Harness h;

    SECTION("relative directory inside the sandbox") {
        auto result = h.run(make_request("env-tool", {}, std::nullopt, "work"));
        REQUIRE(result.outcome == Outcome::Success);
        CHECK(result.stdout_text.ends_with(fs::canonical(h.root / "work").string() + "\n"));
    }

    SECTION("defaults to the sandbox root") {
        auto result = h.run(make_request("env-tool"));
        REQUIRE(result.outcome == Outcome::Success);
        CHECK(result.stdout_text.ends_with(fs::canonical(h.root).string() + "\n"));
    }

    SECTION("traversal is rejected before spawning") {
        auto result = h.run(make_request("env-tool", {}, std::nullopt, "../bin"));
        CHECK(result.outcome == Outcome::PathEscapesSandbox);
        CHECK_FALSE(result.security_violation);
        CHECK(h.executor.spawn_count() == 0);

        auto events = h.events();
        REQUIRE(events.size() == 1);
        CHECK(events[0].kind == AuditEventKind::ValidationFailure);
        CHECK(events[0].input.is_null());
    }

    SECTION("missing directory is rejected") {
        auto result = h.run(make_request("env-tool", {}, std::nullopt, "nowhere"));
        CHECK(result.outcome == Outcome::PathEscapesSandbox);
    }
}

TEST_CASE("ExecutionCoordinator gives the child a scrubbed environment", "[exec][coordinator]") {
    ::setenv("TOOLGATE_SECRET_TOKEN", "s3cr3t", 1);
    Harness h;
    ::unsetenv("TOOLGATE_SECRET_TOKEN");

    auto result = h.run(make_request("env-tool"));
    REQUIRE(result.outcome == Outcome::Success);
    CHECK(result.stdout_text.starts_with("HOME=" + h.root.string() + "\nSECRET=none\n"));
}

TEST_CASE("ExecutionCoordinator enforces timeouts", "[exec][coordinator]") {
    SECTION("requested timeout") {
        Harness h;
        auto started = std::chrono::steady_clock::now();
        auto result = h.run(make_request("slow-tool", {}, 1));
        auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK(result.outcome == Outcome::TimedOut);
        CHECK(result.message == "execution timed out");
        CHECK(result.stdout_text == "started\n");
        CHECK(elapsed < 5s);
        CHECK(h.coordinator.metrics().timed_out == 1);
    }

    SECTION("timeouts beyond the int range are clamped, not wrapped") {
        Harness h([](ResourceLimits& l) { l.max_timeout = 2s; });
        auto request = parse_execution_request(
            json{{"tool", "slow-tool"}, {"timeout", 3000000000LL}});
        REQUIRE(request.has_value());
        REQUIRE(request->timeout.has_value());
        CHECK(*request->timeout > 0);

        auto started = std::chrono::steady_clock::now();
        auto result = h.run(std::move(*request));
        auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK(result.outcome == Outcome::TimedOut);
        CHECK(elapsed >= 1800ms);
        CHECK(elapsed < 5s);
    }

    SECTION("requests above the ceiling are clamped") {
        Harness h([](ResourceLimits& l) { l.max_timeout = 1s; });
        auto started = std::chrono::steady_clock::now();
        auto result = h.run(make_request("slow-tool", {}, 3600));
        auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK(result.outcome == Outcome::TimedOut);
        CHECK(elapsed < 5s);
    }
}

TEST_CASE("ExecutionCoordinator flags truncated output", "[exec][coordinator]") {
    Harness h([](ResourceLimits& l) { l.max_output_bytes = 100; });
    auto result = h.run(make_request("chatty-tool"));

    CHECK(result.outcome == Outcome::Truncated);
    CHECK(result.truncated);
    CHECK(result.return_code == 0);
    CHECK(result.stdout_text.size() == 100);
}

TEST_CASE("ExecutionCoordinator reports a registered tool that cannot start",
          "[exec][coordinator]") {
    Harness h;
    auto result = h.run(make_request("ghost-tool", {"--help"}));

    CHECK(result.outcome == Outcome::SpawnFailed);
    CHECK(result.message == "tool could not be started");
    CHECK_FALSE(result.return_code.has_value());

    auto events = h.events();
    REQUIRE(events.size() == 2);
    CHECK(events[1].kind == AuditEventKind::ExecutionEnd);
    CHECK(events[1].detail.find("error=") != std::string::npos);
}

TEST_CASE("ExecutionCoordinator aggregates metrics", "[exec][coordinator]") {
    Harness h;
    h.run(make_request("echo-args", {"ok"}));
    h.run(make_request("fail-tool"));
    h.run(make_request("bash"));
    h.run(make_request("echo-args", {"$(id)"}));

    auto m = h.coordinator.metrics();
    CHECK(m.total == 4);
    CHECK(m.succeeded == 1);
    CHECK(m.failed == 1);
    CHECK(m.rejected == 2);
    CHECK(m.security_violations == 2);
    CHECK(m.active == 0);

    REQUIRE(m.per_tool.contains("echo-args"));
    CHECK(m.per_tool["echo-args"].executions == 1);
    CHECK(m.per_tool["echo-args"].failures == 0);
    REQUIRE(m.per_tool.contains("fail-tool"));
    CHECK(m.per_tool["fail-tool"].failures == 1);
    CHECK_FALSE(m.per_tool.contains("bash"));

    auto last = h.coordinator.last_error();
    REQUIRE(last.has_value());
    CHECK(last->outcome == Outcome::DisallowedArgument);
    CHECK(last->tool == "echo-args");

    json j = m;
    CHECK(j["total"] == 4);
    CHECK(j["per_tool"]["fail-tool"]["failures"] == 1);
}

TEST_CASE("ExecutionCoordinator handles concurrent requests", "[exec][coordinator]") {
    Harness h;
    boost::asio::io_context ioc;
    std::vector<ExecutionResult> results;

    for (int i = 0; i < 8; ++i) {
        boost::asio::co_spawn(ioc,
            h.coordinator.execute(make_request("echo-args", {"run-" + std::to_string(i)})),
            [&results](std::exception_ptr ep, ExecutionResult r) {
                if (!ep) results.push_back(std::move(r));
            });
    }
    ioc.run();

    REQUIRE(results.size() == 8);
    for (const auto& r : results) {
        CHECK(r.outcome == Outcome::Success);
        CHECK(r.stdout_text.starts_with("run-"));
    }
    CHECK(h.coordinator.metrics().succeeded == 8);
    CHECK(h.events().size() == 16);
}

TEST_CASE("ExecutionCoordinator isolates a timing-out request from its neighbours",
          "[exec][coordinator]") {
    Harness h;
    boost::asio::io_context ioc;
    std::optional<ExecutionResult> slow;
    std::optional<ExecutionResult> fast;

    auto started = std::chrono::steady_clock::now();
    boost::asio::co_spawn(ioc, h.coordinator.execute(make_request("slow-tool", {}, 1)),
        [&slow](std::exception_ptr ep, ExecutionResult r) {
            if (!ep) slow = std::move(r);
        });
    boost::asio::co_spawn(ioc, h.coordinator.execute(make_request("echo-args", {"quick"})),
        [&fast](std::exception_ptr ep, ExecutionResult r) {
            if (!ep) fast = std::move(r);
        });
    ioc.run();
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(slow.has_value());
    REQUIRE(fast.has_value());
    CHECK(slow->outcome == Outcome::TimedOut);
    CHECK(fast->outcome == Outcome::Success);
    CHECK(fast->duration < 1000ms);
    CHECK(elapsed < 5s);
}
