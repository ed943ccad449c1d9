#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// std::optional serializer for nlohmann/json so the NLOHMANN_DEFINE macros
// accept optional fields.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace toolgate {

using json = nlohmann::json;

enum class BindMode {
    Loopback,
    All,
};

NLOHMANN_JSON_SERIALIZE_ENUM(BindMode, {
    {BindMode::Loopback, "loopback"},
    {BindMode::All, "all"},
})

struct HttpConfig {
    uint16_t port = 5000;
    BindMode bind = BindMode::Loopback;
    size_t max_body_bytes = 1024 * 1024;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(HttpConfig, port, bind, max_body_bytes)

struct ExecutionConfig {
    int max_timeout = 300;                 // seconds
    int default_timeout = 60;              // seconds
    size_t max_output_size = 1024 * 1024;  // bytes, stdout + stderr combined
    std::string sandbox_root = "/tmp/toolgate";
    std::vector<std::string> extra_tools;
    int kill_grace_ms = 2000;
    std::optional<std::string> tool_search_path;  // defaults to the sandbox PATH
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExecutionConfig, max_timeout, default_timeout,
    max_output_size, sandbox_root, extra_tools, kill_grace_ms, tool_search_path)

struct AuditConfig {
    bool enabled = true;
    std::optional<std::string> path;  // defaults to <data_dir>/audit.jsonl
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AuditConfig, enabled, path)

struct Config {
    HttpConfig http;
    ExecutionConfig execution;
    AuditConfig audit;
    std::string log_level = "info";
    std::optional<std::string> data_dir;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, http, execution, audit, log_level, data_dir)

auto load_config(const std::filesystem::path& path) -> Config;
auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Applies MAX_TIMEOUT, DEFAULT_TIMEOUT, MAX_OUTPUT_SIZE, SANDBOX_ROOT
/// (or WORKING_DIRECTORY), EXTRA_TOOLS, AUDIT_LOG, LOG_LEVEL, TOOLGATE_PORT
/// and TOOLGATE_BIND on top of `config`. Malformed numbers are ignored with
/// a warning.
void apply_env_overrides(Config& config);

/// Parses a comma separated tool list, trimming blanks and dropping empties.
auto parse_tool_list(std::string_view csv) -> std::vector<std::string>;

/// Resolves the audit log location from the config.
auto resolve_audit_path(const Config& config) -> std::filesystem::path;

} // namespace toolgate
