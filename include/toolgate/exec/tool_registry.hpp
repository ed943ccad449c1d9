#pragma once

#include <array>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "toolgate/core/error.hpp"
#include "toolgate/exec/types.hpp"

namespace toolgate::exec {

class ProcessExecutor;

/// One row of the curated tool table.
struct BuiltinTool {
    std::string_view name;
    std::string_view binary;
    std::string_view category;
};

inline constexpr std::array<BuiltinTool, 26> kBuiltinTools = {{
    {"nmap", "nmap", "network"},
    {"sqlmap", "sqlmap", "web"},
    {"hydra", "hydra", "password"},
    {"john", "john", "password"},
    {"nikto", "nikto", "web"},
    {"aircrack-ng", "aircrack-ng", "wireless"},
    {"metasploit-framework", "msfconsole", "exploitation"},
    {"gobuster", "gobuster", "web"},
    {"dirb", "dirb", "web"},
    {"wfuzz", "wfuzz", "web"},
    {"cewl", "cewl", "password"},
    {"hashcat", "hashcat", "password"},
    {"crunch", "crunch", "password"},
    {"medusa", "medusa", "password"},
    {"ncrack", "ncrack", "password"},
    {"enum4linux", "enum4linux", "smb"},
    {"smbclient", "smbclient", "smb"},
    {"rpcclient", "rpcclient", "smb"},
    {"ldapsearch", "ldapsearch", "directory"},
    {"dig", "dig", "dns"},
    {"nslookup", "nslookup", "dns"},
    {"whois", "whois", "recon"},
    {"traceroute", "traceroute", "network"},
    {"ping", "ping", "network"},
    {"netstat", "netstat", "network"},
    {"ss", "ss", "network"},
}};

inline constexpr std::string_view kExtensionCategory = "extension";

/// How long a probe result stays valid.
static constexpr std::chrono::seconds kProbeTtl{60};

/// Upper bound on one `--version` probe.
static constexpr std::chrono::seconds kProbeTimeout{5};

/// The closed set of tools that may be executed.
///
/// The catalog is built once from kBuiltinTools plus a validated extension
/// list and replaced wholesale on reload(); readers take a snapshot and never
/// see a half-built catalog. Probe results live beside the catalog and are
/// merged into the descriptors handed out.
class ToolRegistry {
public:
    using Catalog = std::map<std::string, ToolDescriptor, std::less<>>;

    struct Options {
        std::vector<std::string> extra_tools;
        std::string search_path;                  // PATH-style, ':' separated
        std::chrono::seconds default_timeout{60};
        std::filesystem::path probe_directory = "/tmp";
    };

    explicit ToolRegistry(Options options);

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Exact, case-sensitive lookup. NotFound for anything not in the catalog.
    [[nodiscard]] auto lookup(std::string_view name) const -> Result<ToolDescriptor>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// All descriptors, sorted by name.
    [[nodiscard]] auto list() const -> std::vector<ToolDescriptor>;

    [[nodiscard]] auto size() const -> std::size_t;

    /// Current catalog snapshot.
    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const Catalog>;

    /// Rebuilds the catalog with a new extension list and swaps it in.
    /// Invalid entries are skipped; the swap still happens, but the call
    /// reports InvalidConfig naming them.
    auto reload(std::vector<std::string> extra_tools) -> VoidResult;

    /// Probes `descriptor` with `<binary> --version` unless a result younger
    /// than kProbeTtl is cached. Never takes longer than kProbeTimeout plus
    /// the kill grace.
    auto refresh_availability(const ToolDescriptor& descriptor, ProcessExecutor& executor)
        -> boost::asio::awaitable<ToolDescriptor>;

    /// `which`-style search of `search_path` for an executable named `binary`.
    /// Returns an empty path when nothing is found.
    [[nodiscard]] static auto resolve_binary(std::string_view binary,
                                             std::string_view search_path)
        -> std::filesystem::path;

    [[nodiscard]] auto search_path() const noexcept -> const std::string& {
        return options_.search_path;
    }

private:
    struct ProbeState {
        std::filesystem::path binary_path;
        bool available = false;
        std::string version;
        Clock::time_point checked_at;
    };

    auto build_catalog(const std::vector<std::string>& extra_tools,
                       std::vector<std::string>& rejected) const -> std::shared_ptr<const Catalog>;
    auto with_probe(ToolDescriptor descriptor) const -> ToolDescriptor;

    Options options_;

    mutable std::mutex mutex_;
    std::shared_ptr<const Catalog> catalog_;
    std::map<std::string, ProbeState, std::less<>> probes_;
};

} // namespace toolgate::exec
