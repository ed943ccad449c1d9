#include "toolgate/exec/execution_coordinator.hpp"

#include "toolgate/core/utils.hpp"

#include <algorithm>
#include <chrono>

namespace toolgate::exec {

namespace fs = std::filesystem;
using std::chrono::milliseconds;

namespace {

auto epoch_ms(Clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

/// The request exactly as received, for forensic audit records.
auto request_input(const ExecutionRequest& request) -> json {
    json j = {
        {"tool", request.tool},
        {"args", request.args},
    };
    if (request.timeout) j["timeout"] = *request.timeout;
    if (request.working_dir) j["working_dir"] = *request.working_dir;
    return j;
}

auto classify(const ProcessOutcome& outcome, size_t max_output) -> std::pair<Outcome, std::string> {
    switch (outcome.state) {
        case ExecutionState::SpawnFailed:
            return {Outcome::SpawnFailed, "tool could not be started"};
        case ExecutionState::TimedOut:
            return {Outcome::TimedOut, "execution timed out"};
        case ExecutionState::Killed:
            return {Outcome::Killed,
                    "tool was terminated by signal " + std::to_string(outcome.term_signal.value_or(0))};
        case ExecutionState::Completed:
            break;
        default:
            return {Outcome::SpawnFailed, "tool did not complete"};
    }

    auto code = outcome.return_code.value_or(-1);
    if (code != 0) {
        return {Outcome::ToolError, "tool exited with code " + std::to_string(code)};
    }
    if (outcome.truncated) {
        return {Outcome::Truncated,
                "output truncated at " + std::to_string(max_output) + " bytes"};
    }
    return {Outcome::Success, ""};
}

} // anonymous namespace

void to_json(json& j, const ExecutionMetrics& m) {
    json per_tool = json::object();
    for (const auto& [name, c] : m.per_tool) {
        per_tool[name] = {
            {"executions", c.executions},
            {"failures", c.failures},
            {"cumulative_ms", c.cumulative_ms},
        };
    }
    j = json{
        {"total", m.total},
        {"succeeded", m.succeeded},
        {"failed", m.failed},
        {"rejected", m.rejected},
        {"security_violations", m.security_violations},
        {"timed_out", m.timed_out},
        {"spawn_failed", m.spawn_failed},
        {"truncated", m.truncated},
        {"cumulative_ms", m.cumulative_ms},
        {"active", m.active},
        {"per_tool", per_tool},
    };
}

void to_json(json& j, const LastError& e) {
    j = json{
        {"request_id", e.request_id},
        {"tool", e.tool},
        {"outcome", e.outcome},
        {"message", e.message},
        {"at", epoch_ms(e.at)},
    };
}

ExecutionCoordinator::ExecutionCoordinator(const ToolRegistry& registry, ResourceLimits limits,
                                           ProcessExecutor& executor, AuditLogger& audit)
    : registry_(registry)
    , builder_(std::move(limits))
    , executor_(executor)
    , audit_(audit)
    , parent_env_(SandboxEnvironmentBuilder::current_environment()) {}

auto ExecutionCoordinator::reject(const ExecutionRequest& request, const ValidationError& error)
    -> ExecutionResult {
    ExecutionResult result;
    result.request_id = request.request_id;
    result.tool = request.tool;
    result.outcome = to_outcome(error.kind);
    result.message = error.message;
    result.security_violation = error.security_violation;

    auto detail = std::string(to_string(result.outcome)) + ": " + error.detail;
    json input = error.security_violation ? request_input(request) : json(nullptr);

    // Forensic record first; the validation_failure that follows is the
    // request's single terminal event.
    if (error.security_violation) {
        audit_.record(AuditEventKind::SecurityViolation, request.request_id, request.tool,
                      detail, input);
    }
    audit_.record(AuditEventKind::ValidationFailure, request.request_id, request.tool,
                  std::move(detail), std::move(input));

    account(result, false);
    return result;
}

auto ExecutionCoordinator::execute(ExecutionRequest request)
    -> boost::asio::awaitable<ExecutionResult> {
    if (request.request_id.empty()) {
        request.request_id = utils::generate_uuid();
    }

    if (auto valid = validate_tool_name(request.tool); !valid) {
        co_return reject(request, valid.error());
    }

    auto descriptor = registry_.lookup(request.tool);
    if (!descriptor) {
        co_return reject(request, ValidationError{
            .kind = RejectionKind::InvalidToolName,
            .message = "tool is not permitted",
            .detail = "not in the tool registry",
            .security_violation = true,
        });
    }

    if (auto valid = sanitize_arguments(request.args); !valid) {
        co_return reject(request, valid.error());
    }

    std::optional<fs::path> requested_dir;
    if (request.working_dir) {
        auto checked = validate_working_directory(*request.working_dir, limits().sandbox_root);
        if (!checked) {
            co_return reject(request, checked.error());
        }
        requested_dir = std::move(*checked);
    }

    auto workdir = builder_.resolve_working_directory(requested_dir);
    if (!workdir) {
        co_return reject(request, ValidationError{
            .kind = RejectionKind::PathEscapesSandbox,
            .message = "working directory is unavailable",
            .detail = workdir.error().what(),
        });
    }

    std::optional<std::chrono::seconds> request_timeout;
    if (request.timeout) request_timeout = std::chrono::seconds(*request.timeout);
    auto exec_limits = builder_.build_resource_limits(request_timeout, descriptor->default_timeout);

    LaunchSpec spec;
    spec.binary = descriptor->binary_path;
    spec.argv.reserve(request.args.size() + 1);
    spec.argv.push_back(descriptor->binary_path.empty()
                            ? descriptor->name
                            : descriptor->binary_path.filename().string());
    spec.argv.insert(spec.argv.end(), request.args.begin(), request.args.end());
    spec.env = builder_.build_environment(parent_env_, *workdir);
    spec.working_dir = *workdir;
    spec.timeout = exec_limits.timeout;
    spec.kill_grace = exec_limits.kill_grace;
    spec.max_output_bytes = exec_limits.max_output_bytes;

    audit_.record(AuditEventKind::ExecutionStart, request.request_id, request.tool,
                  "argc=" + std::to_string(request.args.size()) +
                      " timeout=" + std::to_string(exec_limits.timeout.count()) + "s" +
                      " workdir=" + workdir->string());

    ProcessOutcome outcome;
    try {
        outcome = co_await executor_.run(std::move(spec));
    } catch (const std::exception& e) {
        outcome = ProcessOutcome{};
        outcome.state = ExecutionState::SpawnFailed;
        outcome.spawn_error = std::string("supervision failed: ") + e.what();
    }

    auto [kind, message] = classify(outcome, exec_limits.max_output_bytes);

    ExecutionResult result;
    result.request_id = request.request_id;
    result.tool = request.tool;
    result.stdout_text = std::move(outcome.stdout_text);
    result.stderr_text = std::move(outcome.stderr_text);
    result.return_code = outcome.return_code;
    result.duration = outcome.duration;
    result.truncated = outcome.truncated;
    result.outcome = kind;
    result.message = std::move(message);

    std::string detail = "outcome=" + std::string(to_string(kind)) +
        " state=" + std::string(to_string(outcome.state)) +
        " rc=" + (outcome.return_code ? std::to_string(*outcome.return_code) : "none") +
        " duration_ms=" + std::to_string(outcome.duration.count()) +
        " truncated=" + (outcome.truncated ? "true" : "false");
    if (!outcome.spawn_error.empty()) {
        detail += " error=" + outcome.spawn_error;
    }
    audit_.record(AuditEventKind::ExecutionEnd, request.request_id, request.tool, detail);

    account(result, true);
    co_return result;
}

void ExecutionCoordinator::account(const ExecutionResult& result, bool registered) {
    total_.fetch_add(1);
    auto ms = static_cast<uint64_t>(std::max<int64_t>(result.duration.count(), 0));
    bool failure = result.outcome != Outcome::Success && result.outcome != Outcome::Truncated;

    if (is_rejection(result.outcome)) {
        rejected_.fetch_add(1);
        if (result.security_violation) security_violations_.fetch_add(1);
    } else if (failure) {
        failed_.fetch_add(1);
    } else {
        succeeded_.fetch_add(1);
    }
    if (result.outcome == Outcome::TimedOut) timed_out_.fetch_add(1);
    if (result.outcome == Outcome::SpawnFailed) spawn_failed_.fetch_add(1);
    if (result.truncated) truncated_.fetch_add(1);
    cumulative_ms_.fetch_add(ms);

    if (!registered && !failure) return;

    std::lock_guard lock(mutex_);
    if (registered) {
        auto& counters = per_tool_[result.tool];
        counters.executions++;
        if (failure) counters.failures++;
        counters.cumulative_ms += ms;
    }
    if (failure) {
        last_error_ = LastError{
            .request_id = result.request_id,
            .tool = result.tool,
            .outcome = result.outcome,
            .message = result.message,
            .at = Clock::now(),
        };
    }
}

auto ExecutionCoordinator::metrics() const -> ExecutionMetrics {
    ExecutionMetrics m;
    m.total = total_.load();
    m.succeeded = succeeded_.load();
    m.failed = failed_.load();
    m.rejected = rejected_.load();
    m.security_violations = security_violations_.load();
    m.timed_out = timed_out_.load();
    m.spawn_failed = spawn_failed_.load();
    m.truncated = truncated_.load();
    m.cumulative_ms = cumulative_ms_.load();
    m.active = executor_.active_count();
    std::lock_guard lock(mutex_);
    m.per_tool = per_tool_;
    return m;
}

auto ExecutionCoordinator::last_error() const -> std::optional<LastError> {
    std::lock_guard lock(mutex_);
    return last_error_;
}

} // namespace toolgate::exec
