#include "toolgate/exec/tool_registry.hpp"

#include "toolgate/core/logger.hpp"
#include "toolgate/core/utils.hpp"
#include "toolgate/exec/input_validator.hpp"
#include "toolgate/exec/process_executor.hpp"

#include <algorithm>
#include <system_error>

#include <unistd.h>

namespace toolgate::exec {

namespace fs = std::filesystem;

namespace {

constexpr size_t kProbeOutputLimit = 4096;
constexpr std::chrono::milliseconds kProbeKillGrace{500};

auto first_line(std::string_view text) -> std::string {
    auto end = text.find('\n');
    return utils::trim(text.substr(0, end));
}

/// Executable name for a tool: the builtin table entry, else the tool name.
auto binary_name_for(std::string_view tool) -> std::string_view {
    auto it = std::ranges::find(kBuiltinTools, tool, &BuiltinTool::name);
    return it != kBuiltinTools.end() ? it->binary : tool;
}

} // anonymous namespace

ToolRegistry::ToolRegistry(Options options)
    : options_(std::move(options)) {
    std::vector<std::string> rejected;
    catalog_ = build_catalog(options_.extra_tools, rejected);
    LOG_INFO("Tool registry loaded {} tools ({} builtin, {} rejected extensions)",
             catalog_->size(), kBuiltinTools.size(), rejected.size());
}

auto ToolRegistry::resolve_binary(std::string_view binary, std::string_view search_path)
    -> fs::path {
    if (binary.empty()) return {};

    std::error_code ec;
    if (binary.find('/') != std::string_view::npos) {
        fs::path direct(binary);
        if (fs::is_regular_file(direct, ec) && ::access(direct.c_str(), X_OK) == 0) {
            return direct;
        }
        return {};
    }

    for (const auto& dir : utils::split(search_path, ':')) {
        if (dir.empty()) continue;
        auto candidate = fs::path(dir) / binary;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

auto ToolRegistry::build_catalog(const std::vector<std::string>& extra_tools,
                                 std::vector<std::string>& rejected) const
    -> std::shared_ptr<const Catalog> {
    auto catalog = std::make_shared<Catalog>();

    auto add = [&](std::string name, std::string_view binary, std::string_view category) {
        ToolDescriptor d;
        d.name = std::move(name);
        d.binary_path = resolve_binary(binary, options_.search_path);
        d.category = std::string(category);
        d.default_timeout = options_.default_timeout;
        d.available = !d.binary_path.empty();
        if (!d.available) {
            LOG_DEBUG("Tool {} has no binary '{}' on the search path", d.name, binary);
        }
        auto key = d.name;
        catalog->insert_or_assign(std::move(key), std::move(d));
    };

    for (const auto& tool : kBuiltinTools) {
        add(std::string(tool.name), tool.binary, tool.category);
    }

    for (const auto& raw : extra_tools) {
        auto name = utils::trim(raw);
        if (name.empty()) continue;

        if (auto valid = validate_tool_name(name); !valid) {
            LOG_WARN("Skipping extension tool '{}': {}", name, valid.error().message);
            rejected.push_back(name);
            continue;
        }
        if (catalog->contains(name)) {
            LOG_DEBUG("Extension tool {} is already registered", name);
            continue;
        }
        add(name, name, kExtensionCategory);
    }

    return catalog;
}

auto ToolRegistry::snapshot() const -> std::shared_ptr<const Catalog> {
    std::lock_guard lock(mutex_);
    return catalog_;
}

auto ToolRegistry::with_probe(ToolDescriptor descriptor) const -> ToolDescriptor {
    std::lock_guard lock(mutex_);
    auto it = probes_.find(descriptor.name);
    if (it != probes_.end()) {
        descriptor.binary_path = it->second.binary_path;
        descriptor.available = it->second.available;
        descriptor.version = it->second.version;
        descriptor.last_probe = it->second.checked_at;
    }
    return descriptor;
}

auto ToolRegistry::lookup(std::string_view name) const -> Result<ToolDescriptor> {
    auto catalog = snapshot();
    auto it = catalog->find(name);
    if (it == catalog->end()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Tool is not registered", std::string(name)));
    }
    return with_probe(it->second);
}

auto ToolRegistry::contains(std::string_view name) const -> bool {
    return snapshot()->contains(name);
}

auto ToolRegistry::list() const -> std::vector<ToolDescriptor> {
    auto catalog = snapshot();
    std::vector<ToolDescriptor> out;
    out.reserve(catalog->size());
    for (const auto& [name, descriptor] : *catalog) {
        out.push_back(with_probe(descriptor));
    }
    return out;
}

auto ToolRegistry::size() const -> std::size_t {
    return snapshot()->size();
}

auto ToolRegistry::reload(std::vector<std::string> extra_tools) -> VoidResult {
    std::vector<std::string> rejected;
    auto next = build_catalog(extra_tools, rejected);
    {
        std::lock_guard lock(mutex_);
        catalog_ = next;
        options_.extra_tools = std::move(extra_tools);
        std::erase_if(probes_, [&next](const auto& entry) {
            return !next->contains(entry.first);
        });
    }
    LOG_INFO("Tool registry reloaded: {} tools", next->size());

    if (!rejected.empty()) {
        std::string names;
        for (const auto& name : rejected) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Invalid extension tool names skipped", names));
    }
    return {};
}

auto ToolRegistry::refresh_availability(const ToolDescriptor& descriptor,
                                        ProcessExecutor& executor)
    -> boost::asio::awaitable<ToolDescriptor> {
    auto now = Clock::now();
    {
        std::lock_guard lock(mutex_);
        auto it = probes_.find(descriptor.name);
        if (it != probes_.end() && now - it->second.checked_at < kProbeTtl) {
            auto cached = descriptor;
            cached.binary_path = it->second.binary_path;
            cached.available = it->second.available;
            cached.version = it->second.version;
            cached.last_probe = it->second.checked_at;
            co_return cached;
        }
    }

    auto binary_name = descriptor.binary_path.empty()
        ? std::string(binary_name_for(descriptor.name))
        : descriptor.binary_path.filename().string();
    auto binary = descriptor.binary_path;
    if (binary.empty() || !fs::exists(binary)) {
        binary = resolve_binary(binary_name, options_.search_path);
    }

    ProbeState state;
    state.binary_path = binary;
    state.checked_at = now;

    if (!binary.empty()) {
        LaunchSpec spec;
        spec.binary = binary;
        spec.argv = {binary_name, "--version"};
        spec.env = {{"PATH", options_.search_path},
                    {"HOME", options_.probe_directory.string()}};
        spec.working_dir = options_.probe_directory;
        spec.timeout = kProbeTimeout;
        spec.kill_grace = kProbeKillGrace;
        spec.max_output_bytes = kProbeOutputLimit;

        auto outcome = co_await executor.run(std::move(spec));
        state.available = outcome.state != ExecutionState::SpawnFailed;
        if (outcome.state == ExecutionState::Completed && outcome.return_code == 0) {
            state.version = first_line(outcome.stdout_text.empty() ? outcome.stderr_text
                                                                   : outcome.stdout_text);
        }
        LOG_DEBUG("Probed {}: state={} available={} version='{}'", descriptor.name,
                  to_string(outcome.state), state.available, state.version);
    } else {
        LOG_DEBUG("Probed {}: binary not found", descriptor.name);
    }

    {
        std::lock_guard lock(mutex_);
        probes_.insert_or_assign(descriptor.name, state);
    }

    auto refreshed = descriptor;
    refreshed.binary_path = state.binary_path;
    refreshed.available = state.available;
    refreshed.version = state.version;
    refreshed.last_probe = state.checked_at;
    co_return refreshed;
}

} // namespace toolgate::exec
