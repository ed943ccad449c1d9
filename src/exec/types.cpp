#include "toolgate/exec/types.hpp"

#include "toolgate/core/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace toolgate::exec {

namespace {

auto to_epoch_ms(Clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

} // anonymous namespace

void to_json(json& j, const ToolDescriptor& d) {
    j = json{
        {"name", d.name},
        {"category", d.category},
        {"available", d.available},
        {"version", d.version.empty() ? json(nullptr) : json(d.version)},
    };
}

auto make_request(std::string tool,
                  std::vector<std::string> args,
                  std::optional<int> timeout,
                  std::optional<std::string> working_dir) -> ExecutionRequest {
    ExecutionRequest req;
    req.request_id = utils::generate_uuid();
    req.tool = std::move(tool);
    req.args = std::move(args);
    req.timeout = timeout;
    req.working_dir = std::move(working_dir);
    req.created_at = Clock::now();
    return req;
}

auto parse_execution_request(const json& j) -> Result<ExecutionRequest> {
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "request body must be a JSON object"));
    }

    if (!j.contains("tool") || !j["tool"].is_string()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "tool is required and must be a string"));
    }

    std::vector<std::string> args;
    if (j.contains("args") && !j["args"].is_null()) {
        const auto& arr = j["args"];
        if (!arr.is_array()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "args must be an array of strings"));
        }
        args.reserve(arr.size());
        for (const auto& item : arr) {
            if (!item.is_string()) {
                return std::unexpected(make_error(ErrorCode::InvalidArgument,
                    "args must be an array of strings"));
            }
            args.push_back(item.get<std::string>());
        }
    }

    std::optional<int> timeout;
    if (j.contains("timeout") && !j["timeout"].is_null()) {
        if (!j["timeout"].is_number_integer()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "timeout must be an integer number of seconds"));
        }
        // Saturate to the int range.
        const auto& value = j["timeout"];
        if (value.is_number_unsigned()) {
            timeout = static_cast<int>(std::min<uint64_t>(
                value.get<uint64_t>(), std::numeric_limits<int>::max()));
        } else {
            timeout = static_cast<int>(std::clamp<int64_t>(value.get<int64_t>(),
                std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
        }
    }

    std::optional<std::string> working_dir;
    if (j.contains("working_dir") && !j["working_dir"].is_null()) {
        if (!j["working_dir"].is_string()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "working_dir must be a string"));
        }
        auto dir = j["working_dir"].get<std::string>();
        if (!dir.empty()) {
            working_dir = std::move(dir);
        }
    }

    return make_request(j["tool"].get<std::string>(), std::move(args),
                        timeout, std::move(working_dir));
}

auto to_string(ExecutionState state) -> std::string_view {
    switch (state) {
        case ExecutionState::Pending: return "pending";
        case ExecutionState::Running: return "running";
        case ExecutionState::Completed: return "completed";
        case ExecutionState::TimedOut: return "timed_out";
        case ExecutionState::Killed: return "killed";
        case ExecutionState::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}

auto to_string(Outcome outcome) -> std::string_view {
    switch (outcome) {
        case Outcome::Success: return "success";
        case Outcome::ToolError: return "tool_error";
        case Outcome::Truncated: return "truncated";
        case Outcome::TimedOut: return "timed_out";
        case Outcome::Killed: return "killed";
        case Outcome::SpawnFailed: return "spawn_failed";
        case Outcome::InvalidToolName: return "invalid_tool_name";
        case Outcome::DisallowedArgument: return "disallowed_argument";
        case Outcome::PathEscapesSandbox: return "path_escapes_sandbox";
    }
    return "unknown";
}

auto is_rejection(Outcome outcome) -> bool {
    return outcome == Outcome::InvalidToolName ||
           outcome == Outcome::DisallowedArgument ||
           outcome == Outcome::PathEscapesSandbox;
}

auto to_outcome(RejectionKind kind) -> Outcome {
    switch (kind) {
        case RejectionKind::InvalidToolName: return Outcome::InvalidToolName;
        case RejectionKind::DisallowedArgument: return Outcome::DisallowedArgument;
        case RejectionKind::PathEscapesSandbox: return Outcome::PathEscapesSandbox;
    }
    return Outcome::InvalidToolName;
}

void to_json(json& j, const ExecutionResult& r) {
    j = json{
        {"request_id", r.request_id},
        {"tool", r.tool},
        {"stdout", r.stdout_text},
        {"stderr", r.stderr_text},
        {"return_code", r.return_code ? json(*r.return_code) : json(nullptr)},
        {"duration_ms", r.duration.count()},
        {"truncated", r.truncated},
        {"outcome", r.outcome},
        {"security_violation", r.security_violation},
    };
    if (!r.message.empty()) {
        j["message"] = r.message;
    }
}

auto to_string(AuditEventKind kind) -> std::string_view {
    switch (kind) {
        case AuditEventKind::ValidationFailure: return "validation_failure";
        case AuditEventKind::SecurityViolation: return "security_violation";
        case AuditEventKind::ExecutionStart: return "execution_start";
        case AuditEventKind::ExecutionEnd: return "execution_end";
    }
    return "unknown";
}

auto is_terminal(AuditEventKind kind) -> bool {
    return kind == AuditEventKind::ValidationFailure || kind == AuditEventKind::ExecutionEnd;
}

void to_json(json& j, const AuditEvent& e) {
    j = json{
        {"seq", e.sequence},
        {"ts", to_epoch_ms(e.timestamp)},
        {"kind", e.kind},
        {"request_id", e.request_id},
        {"tool", e.tool},
        {"detail", e.detail},
    };
    if (!e.input.is_null()) {
        j["input"] = e.input;
    }
}

} // namespace toolgate::exec
