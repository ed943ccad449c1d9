#include "toolgate/cli/app.hpp"
#include "toolgate/core/logger.hpp"
#include "toolgate/core/version.hpp"

namespace toolgate::cli {

App::App()
    : cli_("toolgate", "Sandboxed tool execution gateway")
{
    cli_.set_version_flag("--version", std::string(kVersion),
                          "Display version information");

    cli_.add_option("-c,--config", context_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("TOOLGATE_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", context_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}));

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    Logger::flush();
    return context_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::context() -> CommandContext& {
    return context_;
}

void App::setup_commands() {
    register_serve_command(cli_, context_);
    register_run_command(cli_, context_);
    register_tools_command(cli_, context_);
    register_config_command(cli_, context_);
    register_version_command(cli_);
}

} // namespace toolgate::cli
