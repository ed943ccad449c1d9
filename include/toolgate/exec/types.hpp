#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "toolgate/core/error.hpp"

namespace toolgate::exec {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;

/// Environment passed to a child process, sorted by variable name.
using EnvMap = std::map<std::string, std::string>;

/// A permitted tool and its probed metadata.
struct ToolDescriptor {
    std::string name;
    std::filesystem::path binary_path;  // empty when not found on the search path
    std::string category;
    std::chrono::seconds default_timeout{60};
    bool available = false;
    std::optional<Clock::time_point> last_probe;
    std::string version;
};

/// Catalog projection: {name, category, available, version}.
void to_json(json& j, const ToolDescriptor& d);

struct ExecutionRequest {
    std::string request_id;
    std::string tool;
    std::vector<std::string> args;
    std::optional<int> timeout;            // seconds
    std::optional<std::string> working_dir;
    Clock::time_point created_at = Clock::now();
};

/// Builds a request with a fresh UUID and the current timestamp.
auto make_request(std::string tool,
                  std::vector<std::string> args = {},
                  std::optional<int> timeout = std::nullopt,
                  std::optional<std::string> working_dir = std::nullopt) -> ExecutionRequest;

/// Parses `{tool, args?, timeout?, working_dir?}`. `args` must be an array
/// of strings; a single shell-style string is rejected.
auto parse_execution_request(const json& j) -> Result<ExecutionRequest>;

/// Process-wide limits, fixed at startup.
struct ResourceLimits {
    std::chrono::seconds max_timeout{300};
    std::chrono::seconds default_timeout{60};
    size_t max_output_bytes = 1024 * 1024;
    std::filesystem::path sandbox_root = "/tmp/toolgate";
    std::chrono::milliseconds kill_grace{2000};
};

/// Per-execution state machine. Pending and Running are transient.
enum class ExecutionState {
    Pending,
    Running,
    Completed,
    TimedOut,
    Killed,
    SpawnFailed,
};

auto to_string(ExecutionState state) -> std::string_view;

/// Outcome reported to callers.
enum class Outcome {
    Success,
    ToolError,
    Truncated,
    TimedOut,
    Killed,
    SpawnFailed,
    InvalidToolName,
    DisallowedArgument,
    PathEscapesSandbox,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Outcome, {
    {Outcome::Success, "success"},
    {Outcome::ToolError, "tool_error"},
    {Outcome::Truncated, "truncated"},
    {Outcome::TimedOut, "timed_out"},
    {Outcome::Killed, "killed"},
    {Outcome::SpawnFailed, "spawn_failed"},
    {Outcome::InvalidToolName, "invalid_tool_name"},
    {Outcome::DisallowedArgument, "disallowed_argument"},
    {Outcome::PathEscapesSandbox, "path_escapes_sandbox"},
})

auto to_string(Outcome outcome) -> std::string_view;

/// True for outcomes produced before any process was created.
auto is_rejection(Outcome outcome) -> bool;

enum class RejectionKind {
    InvalidToolName,
    DisallowedArgument,
    PathEscapesSandbox,
};

auto to_outcome(RejectionKind kind) -> Outcome;

/// Why a request was refused. `message` is safe to return to the caller;
/// `detail` is for the audit record only.
struct ValidationError {
    RejectionKind kind;
    std::string message;
    std::string detail;
    bool security_violation = false;   // whitelist miss or disallowed character
};

struct ExecutionResult {
    std::string request_id;
    std::string tool;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> return_code;
    std::chrono::milliseconds duration{0};
    bool truncated = false;
    Outcome outcome = Outcome::SpawnFailed;
    std::string message;
    bool security_violation = false;
};

void to_json(json& j, const ExecutionResult& r);

enum class AuditEventKind {
    ValidationFailure,
    SecurityViolation,
    ExecutionStart,
    ExecutionEnd,
};

NLOHMANN_JSON_SERIALIZE_ENUM(AuditEventKind, {
    {AuditEventKind::ValidationFailure, "validation_failure"},
    {AuditEventKind::SecurityViolation, "security_violation"},
    {AuditEventKind::ExecutionStart, "execution_start"},
    {AuditEventKind::ExecutionEnd, "execution_end"},
})

auto to_string(AuditEventKind kind) -> std::string_view;

/// True for the event kinds that close a request.
auto is_terminal(AuditEventKind kind) -> bool;

struct AuditEvent {
    AuditEventKind kind = AuditEventKind::ExecutionStart;
    std::string request_id;
    std::string tool;
    std::string detail;
    Clock::time_point timestamp = Clock::now();
    uint64_t sequence = 0;
    json input;  // full original input for rejected requests, null otherwise
};

void to_json(json& j, const AuditEvent& e);

} // namespace toolgate::exec
