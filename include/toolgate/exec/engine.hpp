#pragma once

#include <memory>

#include "toolgate/core/config.hpp"
#include "toolgate/core/error.hpp"
#include "toolgate/exec/audit_logger.hpp"
#include "toolgate/exec/execution_coordinator.hpp"
#include "toolgate/exec/process_executor.hpp"
#include "toolgate/exec/tool_registry.hpp"

namespace toolgate::exec {

/// Owns every long-lived piece of the execution engine, built from one
/// config snapshot. Front ends hold a reference and never reach for globals.
class Engine {
public:
    /// Creates the sandbox root, loads the registry and opens the audit sink.
    static auto create(const Config& config) -> Result<std::unique_ptr<Engine>>;

    /// Builds an engine around a caller-provided sink (used by tests).
    Engine(const Config& config, std::unique_ptr<AuditSink> sink);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]] auto config() const noexcept -> const Config& { return config_; }
    [[nodiscard]] auto limits() const noexcept -> const ResourceLimits& { return limits_; }

    auto registry() noexcept -> ToolRegistry& { return registry_; }
    auto executor() noexcept -> ProcessExecutor& { return executor_; }
    auto audit() noexcept -> AuditLogger& { return audit_; }
    auto coordinator() noexcept -> ExecutionCoordinator& { return coordinator_; }

    /// The PATH used for binary lookup: tool_search_path, else the host PATH,
    /// else kFallbackPath.
    static auto tool_search_path(const ExecutionConfig& config) -> std::string;

private:
    Config config_;
    ResourceLimits limits_;
    ToolRegistry registry_;
    ProcessExecutor executor_;
    AuditLogger audit_;
    ExecutionCoordinator coordinator_;
};

} // namespace toolgate::exec
