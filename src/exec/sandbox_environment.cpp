#include "toolgate/exec/sandbox_environment.hpp"

#include "toolgate/core/logger.hpp"
#include "toolgate/exec/input_validator.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <unistd.h>

extern char** environ;

namespace toolgate::exec {

namespace fs = std::filesystem;

namespace {

auto to_upper_ascii(std::string_view s) -> std::string {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // anonymous namespace

auto is_blocked_env_var(std::string_view name) -> bool {
    auto upper = to_upper_ascii(name);
    std::string_view view(upper);
    return view.starts_with("LD_") || view.starts_with("DYLD_") ||
           view.ends_with("_PROXY") || view == "PROXY";
}

auto make_resource_limits(const ExecutionConfig& config) -> ResourceLimits {
    ResourceLimits limits;
    limits.max_timeout = std::chrono::seconds(std::max(config.max_timeout, 1));
    limits.default_timeout = std::chrono::seconds(
        std::clamp(config.default_timeout, 1, std::max(config.max_timeout, 1)));
    limits.max_output_bytes = config.max_output_size;
    limits.sandbox_root = config.sandbox_root;
    limits.kill_grace = std::chrono::milliseconds(std::max(config.kill_grace_ms, 0));
    return limits;
}

SandboxEnvironmentBuilder::SandboxEnvironmentBuilder(ResourceLimits limits)
    : limits_(std::move(limits)) {}

auto SandboxEnvironmentBuilder::current_environment() -> EnvMap {
    EnvMap env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;
        env.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    return env;
}

auto SandboxEnvironmentBuilder::build_environment(const EnvMap& parent,
                                                  const fs::path& workdir) const -> EnvMap {
    EnvMap env;
    for (auto name : kEnvironmentAllowList) {
        auto it = parent.find(std::string(name));
        if (it == parent.end() || is_blocked_env_var(it->first)) continue;
        env.emplace(it->first, it->second);
    }

    if (!env.contains("PATH") || env["PATH"].empty()) {
        env["PATH"] = std::string(kFallbackPath);
    }
    env["HOME"] = limits_.sandbox_root.string();
    env["PWD"] = workdir.string();
    return env;
}

auto SandboxEnvironmentBuilder::build_environment(const fs::path& workdir) const -> EnvMap {
    return build_environment(current_environment(), workdir);
}

auto SandboxEnvironmentBuilder::resolve_working_directory(
    const std::optional<fs::path>& requested,
    const fs::path& fallback) const -> Result<fs::path> {
    std::error_code ec;
    auto root = fs::canonical(limits_.sandbox_root, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Sandbox root is unavailable",
            limits_.sandbox_root.string() + ": " + ec.message()));
    }

    const auto& chosen = requested ? *requested : fallback;
    auto resolved = fs::canonical(chosen, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Working directory does not exist",
            chosen.string() + ": " + ec.message()));
    }

    if (!is_path_within(root, resolved)) {
        return std::unexpected(make_error(ErrorCode::Forbidden,
            "Working directory is outside the sandbox root",
            resolved.string()));
    }

    if (!fs::is_directory(resolved, ec) || ec) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Working directory is not a directory", resolved.string()));
    }

    return resolved;
}

auto SandboxEnvironmentBuilder::resolve_working_directory(
    const std::optional<fs::path>& requested) const -> Result<fs::path> {
    return resolve_working_directory(requested, limits_.sandbox_root);
}

auto SandboxEnvironmentBuilder::effective_timeout(
    std::optional<std::chrono::seconds> request_timeout,
    std::chrono::seconds global_max,
    std::chrono::seconds default_timeout) -> std::chrono::seconds {
    auto wanted = request_timeout.value_or(default_timeout);
    auto effective = std::min(wanted, global_max);
    return std::max(effective, kMinimumTimeout);
}

auto SandboxEnvironmentBuilder::build_resource_limits(
    std::optional<std::chrono::seconds> request_timeout,
    std::chrono::seconds default_timeout) const -> ExecutionLimits {
    return ExecutionLimits{
        .timeout = effective_timeout(request_timeout, limits_.max_timeout, default_timeout),
        .max_output_bytes = limits_.max_output_bytes,
        .kill_grace = limits_.kill_grace,
    };
}

auto SandboxEnvironmentBuilder::ensure_sandbox_root() const -> VoidResult {
    std::error_code ec;
    fs::create_directories(limits_.sandbox_root, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to create sandbox root",
            limits_.sandbox_root.string() + ": " + ec.message()));
    }
    if (!fs::is_directory(limits_.sandbox_root, ec)) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Sandbox root is not a directory", limits_.sandbox_root.string()));
    }
    LOG_DEBUG("Sandbox root ready: {}", limits_.sandbox_root.string());
    return {};
}

} // namespace toolgate::exec
