#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "toolgate/exec/audit_logger.hpp"
#include "toolgate/exec/input_validator.hpp"
#include "toolgate/exec/process_executor.hpp"
#include "toolgate/exec/sandbox_environment.hpp"
#include "toolgate/exec/tool_registry.hpp"
#include "toolgate/exec/types.hpp"

namespace toolgate::exec {

struct ToolCounters {
    uint64_t executions = 0;
    uint64_t failures = 0;
    uint64_t cumulative_ms = 0;
};

/// Point-in-time copy of the aggregate counters.
struct ExecutionMetrics {
    uint64_t total = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t rejected = 0;
    uint64_t security_violations = 0;
    uint64_t timed_out = 0;
    uint64_t spawn_failed = 0;
    uint64_t truncated = 0;
    uint64_t cumulative_ms = 0;
    uint64_t active = 0;
    std::map<std::string, ToolCounters> per_tool;
};

void to_json(json& j, const ExecutionMetrics& m);

/// Most recent request that did not end in Success.
struct LastError {
    std::string request_id;
    std::string tool;
    Outcome outcome = Outcome::SpawnFailed;
    std::string message;
    Clock::time_point at;
};

void to_json(json& j, const LastError& e);

/// Drives one request through validate, sandbox, spawn, classify and audit.
///
/// Rejections never reach the executor. Every call yields a well-formed
/// ExecutionResult; nothing thrown below escapes execute().
class ExecutionCoordinator {
public:
    ExecutionCoordinator(const ToolRegistry& registry, ResourceLimits limits,
                         ProcessExecutor& executor, AuditLogger& audit);

    ExecutionCoordinator(const ExecutionCoordinator&) = delete;
    ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

    auto execute(ExecutionRequest request) -> boost::asio::awaitable<ExecutionResult>;

    [[nodiscard]] auto metrics() const -> ExecutionMetrics;
    [[nodiscard]] auto last_error() const -> std::optional<LastError>;

    [[nodiscard]] auto limits() const noexcept -> const ResourceLimits& {
        return builder_.limits();
    }

private:
    auto reject(const ExecutionRequest& request, const ValidationError& error) -> ExecutionResult;
    void account(const ExecutionResult& result, bool registered);

    const ToolRegistry& registry_;
    SandboxEnvironmentBuilder builder_;
    ProcessExecutor& executor_;
    AuditLogger& audit_;
    EnvMap parent_env_;

    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> security_violations_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> spawn_failed_{0};
    std::atomic<uint64_t> truncated_{0};
    std::atomic<uint64_t> cumulative_ms_{0};

    mutable std::mutex mutex_;
    std::map<std::string, ToolCounters> per_tool_;
    std::optional<LastError> last_error_;
};

} // namespace toolgate::exec
