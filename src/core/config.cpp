#include "toolgate/core/config.hpp"
#include "toolgate/core/logger.hpp"
#include "toolgate/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace toolgate {

namespace {

template <typename T>
auto parse_env_number(const char* name, T& target) -> void {
    auto* val = std::getenv(name);
    if (!val) return;

    std::string_view text(val);
    T parsed{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        LOG_WARN("Config: ignoring malformed {}='{}'", name, text);
        return;
    }
    target = parsed;
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("TOOLGATE_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".toolgate";
}

void apply_env_overrides(Config& config) {
    auto& exec = config.execution;

    parse_env_number("MAX_TIMEOUT", exec.max_timeout);
    parse_env_number("DEFAULT_TIMEOUT", exec.default_timeout);
    parse_env_number("MAX_OUTPUT_SIZE", exec.max_output_size);
    parse_env_number("KILL_GRACE_MS", exec.kill_grace_ms);

    if (auto* val = std::getenv("SANDBOX_ROOT")) {
        exec.sandbox_root = val;
    } else if (auto* legacy = std::getenv("WORKING_DIRECTORY")) {
        exec.sandbox_root = legacy;
    }

    if (auto* val = std::getenv("EXTRA_TOOLS")) {
        for (auto& tool : parse_tool_list(val)) {
            exec.extra_tools.push_back(std::move(tool));
        }
    }

    if (auto* val = std::getenv("TOOL_SEARCH_PATH")) {
        exec.tool_search_path = val;
    }
    if (auto* val = std::getenv("AUDIT_LOG")) {
        config.audit.path = val;
    }
    if (auto* val = std::getenv("LOG_LEVEL")) {
        auto level = utils::trim(val);
        std::ranges::transform(level, level.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        config.log_level = std::move(level);
    }

    parse_env_number("TOOLGATE_PORT", config.http.port);
    if (auto* val = std::getenv("TOOLGATE_BIND")) {
        config.http.bind = (std::string_view(val) == "all") ? BindMode::All : BindMode::Loopback;
    }
}

auto parse_tool_list(std::string_view csv) -> std::vector<std::string> {
    std::vector<std::string> tools;
    for (const auto& part : utils::split(csv, ',')) {
        auto name = utils::trim(part);
        if (!name.empty()) {
            tools.push_back(std::move(name));
        }
    }
    return tools;
}

auto resolve_audit_path(const Config& config) -> std::filesystem::path {
    if (config.audit.path) {
        return *config.audit.path;
    }
    auto base = config.data_dir ? std::filesystem::path(*config.data_dir) : default_data_dir();
    return base / "audit.jsonl";
}

} // namespace toolgate
