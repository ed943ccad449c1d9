#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "toolgate/core/config.hpp"
#include "toolgate/exec/types.hpp"

namespace toolgate::cli {

/// Global options shared by every subcommand.
struct CommandContext {
    std::string config_path;
    std::string log_level;   // empty: use the config value
    int exit_code = 0;

    /// Loads the config file (if any), applies environment overrides and
    /// --log-level, and initializes the logger.
    [[nodiscard]] auto load() const -> Config;
};

/// Exit code of `run` for a finished request: 0 for success or truncated
/// output, 2 for rejected requests, 1 for everything else.
auto exit_code_for(exec::Outcome outcome) -> int;

/// `serve`: starts the HTTP front end.
void register_serve_command(CLI::App& app, CommandContext& context);

/// `run`: executes one tool and prints the result as JSON.
void register_run_command(CLI::App& app, CommandContext& context);

/// `tools`: prints the tool catalog.
void register_tools_command(CLI::App& app, CommandContext& context);

/// `config`: prints or validates the effective configuration.
void register_config_command(CLI::App& app, CommandContext& context);

/// `version`: prints the build version.
void register_version_command(CLI::App& app);

} // namespace toolgate::cli
