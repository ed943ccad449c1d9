#pragma once

#include <array>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>

#include "toolgate/core/config.hpp"
#include "toolgate/core/error.hpp"
#include "toolgate/exec/types.hpp"

namespace toolgate::exec {

/// Variables copied from the parent environment. Everything else is dropped.
inline constexpr std::array<std::string_view, 6> kEnvironmentAllowList = {
    "PATH", "HOME", "LANG", "LC_ALL", "USER", "TZ",
};

inline constexpr std::string_view kFallbackPath =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

/// Lower bound applied to every effective timeout.
static constexpr std::chrono::seconds kMinimumTimeout{1};

/// True for dynamic-loader and proxy variables, which are never forwarded.
auto is_blocked_env_var(std::string_view name) -> bool;

/// Builds the ResourceLimits snapshot from the execution config.
auto make_resource_limits(const ExecutionConfig& config) -> ResourceLimits;

/// Limits that apply to one execution.
struct ExecutionLimits {
    std::chrono::seconds timeout{60};
    size_t max_output_bytes = 0;
    std::chrono::milliseconds kill_grace{2000};
};

/// Derives the child environment, working directory and limits for a request.
class SandboxEnvironmentBuilder {
public:
    explicit SandboxEnvironmentBuilder(ResourceLimits limits);

    /// Snapshot of the current process environment.
    [[nodiscard]] static auto current_environment() -> EnvMap;

    /// Minimal environment derived from `parent`: allow-listed variables only,
    /// HOME pinned to the sandbox root, PWD set to `workdir`.
    [[nodiscard]] auto build_environment(const EnvMap& parent,
                                         const std::filesystem::path& workdir) const -> EnvMap;

    /// Same, using the current process environment as the parent.
    [[nodiscard]] auto build_environment(const std::filesystem::path& workdir) const -> EnvMap;

    /// Uses `requested` (already validated) or falls back to `fallback`.
    /// The directory must exist below the sandbox root; nothing is created.
    [[nodiscard]] auto resolve_working_directory(
        const std::optional<std::filesystem::path>& requested,
        const std::filesystem::path& fallback) const -> Result<std::filesystem::path>;

    /// Same, falling back to the sandbox root.
    [[nodiscard]] auto resolve_working_directory(
        const std::optional<std::filesystem::path>& requested) const
        -> Result<std::filesystem::path>;

    /// effective = min(request or default, global max), at least kMinimumTimeout.
    [[nodiscard]] static auto effective_timeout(std::optional<std::chrono::seconds> request_timeout,
                                                std::chrono::seconds global_max,
                                                std::chrono::seconds default_timeout)
        -> std::chrono::seconds;

    /// Per-execution limits for a request timeout and a tool default.
    [[nodiscard]] auto build_resource_limits(std::optional<std::chrono::seconds> request_timeout,
                                             std::chrono::seconds default_timeout) const
        -> ExecutionLimits;

    /// Creates the sandbox root itself if it is missing.
    auto ensure_sandbox_root() const -> VoidResult;

    [[nodiscard]] auto limits() const noexcept -> const ResourceLimits& { return limits_; }

private:
    ResourceLimits limits_;
};

} // namespace toolgate::exec
