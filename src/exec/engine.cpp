#include "toolgate/exec/engine.hpp"

#include "toolgate/core/logger.hpp"
#include "toolgate/exec/sandbox_environment.hpp"

#include <cstdlib>

namespace toolgate::exec {

namespace {

auto registry_options(const Config& config, const ResourceLimits& limits)
    -> ToolRegistry::Options {
    return ToolRegistry::Options{
        .extra_tools = config.execution.extra_tools,
        .search_path = Engine::tool_search_path(config.execution),
        .default_timeout = limits.default_timeout,
        .probe_directory = limits.sandbox_root,
    };
}

} // anonymous namespace

auto Engine::tool_search_path(const ExecutionConfig& config) -> std::string {
    if (config.tool_search_path && !config.tool_search_path->empty()) {
        return *config.tool_search_path;
    }
    if (const char* path = std::getenv("PATH"); path && *path) {
        return path;
    }
    return std::string(kFallbackPath);
}

Engine::Engine(const Config& config, std::unique_ptr<AuditSink> sink)
    : config_(config)
    , limits_(make_resource_limits(config.execution))
    , registry_(registry_options(config_, limits_))
    , audit_(std::move(sink))
    , coordinator_(registry_, limits_, executor_, audit_) {}

auto Engine::create(const Config& config) -> Result<std::unique_ptr<Engine>> {
    auto limits = make_resource_limits(config.execution);
    SandboxEnvironmentBuilder builder(limits);
    if (auto ready = builder.ensure_sandbox_root(); !ready) {
        return std::unexpected(ready.error());
    }

    std::unique_ptr<AuditSink> sink;
    if (config.audit.enabled) {
        auto path = resolve_audit_path(config);
        LOG_INFO("Audit log: {}", path.string());
        sink = std::make_unique<JsonlAuditSink>(path);
    } else {
        LOG_INFO("Audit file disabled; audit events go to the log only");
        sink = std::make_unique<NullAuditSink>();
    }

    auto engine = std::make_unique<Engine>(config, std::move(sink));
    LOG_INFO("Engine ready: sandbox={} max_timeout={}s default_timeout={}s max_output={}B",
             engine->limits().sandbox_root.string(), engine->limits().max_timeout.count(),
             engine->limits().default_timeout.count(), engine->limits().max_output_bytes);
    return engine;
}

} // namespace toolgate::exec
