#include "toolgate/cli/commands.hpp"
#include "toolgate/core/logger.hpp"
#include "toolgate/core/version.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <nlohmann/json.hpp>

#include "toolgate/exec/engine.hpp"
#include "toolgate/exec/sandbox_environment.hpp"
#include "toolgate/gateway/http_routes.hpp"
#include "toolgate/gateway/http_server.hpp"
#include "toolgate/gateway/rpc_dispatcher.hpp"
#include "toolgate/gateway/tool_service.hpp"

namespace toolgate::cli {

using json = nlohmann::json;
namespace net = boost::asio;

namespace {

constexpr std::chrono::milliseconds kDrainPollInterval{100};

auto dump(const json& j, bool pretty) -> std::string {
    return j.dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace);
}

auto create_engine(const Config& config) -> std::unique_ptr<exec::Engine> {
    auto engine = exec::Engine::create(config);
    if (!engine) {
        LOG_ERROR("Failed to start engine: {}", engine.error().what());
        throw CLI::RuntimeError(1);
    }
    return std::move(*engine);
}

/// Waits for supervised children to finish (bounded by the longest allowed
/// run), then stops the io_context.
auto drain_and_stop(net::io_context& ioc, exec::Engine& engine) -> net::awaitable<void> {
    auto deadline = std::chrono::steady_clock::now() + engine.limits().max_timeout +
                    engine.limits().kill_grace + std::chrono::seconds(1);
    net::steady_timer timer(ioc);
    while (engine.executor().active_count() > 0 &&
           std::chrono::steady_clock::now() < deadline) {
        LOG_INFO("Waiting for {} running executions", engine.executor().active_count());
        timer.expires_after(kDrainPollInterval);
        co_await timer.async_wait(net::use_awaitable);
    }
    ioc.stop();
}

} // anonymous namespace

auto CommandContext::load() const -> Config {
    Logger::init("toolgate", log_level.empty() ? "info" : log_level);

    Config config = config_path.empty()
        ? default_config()
        : load_config(std::filesystem::path(config_path));
    if (!config_path.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path);
    }

    apply_env_overrides(config);
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
    Logger::set_level(config.log_level);
    return config;
}

auto exit_code_for(exec::Outcome outcome) -> int {
    if (outcome == exec::Outcome::Success || outcome == exec::Outcome::Truncated) {
        return 0;
    }
    return exec::is_rejection(outcome) ? 2 : 1;
}

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("serve", "Start the HTTP gateway");

    struct Options {
        uint16_t port = 0;
        std::string bind;
        unsigned threads = 0;
    };
    auto opts = std::make_shared<Options>();

    sub->add_option("-p,--port", opts->port, "Listen port (overrides config)");
    sub->add_option("-b,--bind", opts->bind, "Bind mode: loopback or all")
        ->check(CLI::IsMember({"loopback", "all"}));
    sub->add_option("--threads", opts->threads, "I/O threads (default: hardware concurrency)");

    sub->callback([&context, opts]() {
        auto config = context.load();
        if (opts->port != 0) {
            config.http.port = opts->port;
        }
        if (!opts->bind.empty()) {
            config.http.bind = (opts->bind == "all") ? BindMode::All : BindMode::Loopback;
        }

        auto engine = create_engine(config);

        net::io_context ioc;
        gateway::RpcDispatcher dispatcher;
        gateway::ToolService service(*engine);
        service.register_rpc_methods(dispatcher);
        gateway::HttpRoutes routes(service, dispatcher);
        gateway::HttpServer server(ioc, routes);

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            LOG_INFO("Received signal {}, shutting down", sig);
            server.stop();
            net::co_spawn(ioc, drain_and_stop(ioc, *engine), net::detached);
        });

        net::co_spawn(ioc, server.start(config.http), [&](std::exception_ptr ep) {
            if (!ep) return;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTP server failed: {}", e.what());
            }
            context.exit_code = 1;
            ioc.stop();
        });

        LOG_INFO("toolgate {} serving {} tools on port {} ({})", kVersion,
                 engine->registry().size(), config.http.port,
                 config.http.bind == BindMode::All ? "all interfaces" : "loopback");

        auto thread_count = opts->threads != 0
            ? opts->threads
            : std::max(2u, std::thread::hardware_concurrency());
        std::vector<std::thread> workers;
        workers.reserve(thread_count - 1);
        for (unsigned i = 1; i < thread_count; ++i) {
            workers.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (auto& t : workers) {
            t.join();
        }

        engine->audit().flush();
        LOG_INFO("Gateway stopped.");
    });
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("run", "Execute one tool and print the result as JSON");

    struct Options {
        std::string tool;
        std::vector<std::string> args;
        int timeout = 0;
        std::string working_dir;
        bool pretty = false;
    };
    auto opts = std::make_shared<Options>();

    sub->add_option("tool", opts->tool, "Tool name")->required();
    sub->add_option("args", opts->args, "Tool arguments (put them after --)");
    auto* timeout = sub->add_option("-t,--timeout", opts->timeout, "Timeout in seconds");
    sub->add_option("-w,--working-dir", opts->working_dir,
                    "Working directory inside the sandbox root");
    sub->add_flag("--pretty", opts->pretty, "Pretty-print the result");

    sub->callback([&context, opts, timeout]() {
        auto config = context.load();
        auto engine = create_engine(config);
        gateway::ToolService service(*engine);

        auto request = exec::make_request(
            opts->tool, opts->args,
            timeout->count() > 0 ? std::optional<int>(opts->timeout) : std::nullopt,
            opts->working_dir.empty() ? std::nullopt
                                      : std::optional<std::string>(opts->working_dir));

        net::io_context ioc;
        std::optional<exec::ExecutionResult> result;
        std::exception_ptr failure;
        net::co_spawn(ioc, service.run(std::move(request)),
            [&](std::exception_ptr ep, exec::ExecutionResult r) {
                if (ep) {
                    failure = ep;
                } else {
                    result = std::move(r);
                }
            });
        ioc.run();

        if (!result) {
            try {
                if (failure) std::rethrow_exception(failure);
            } catch (const std::exception& e) {
                LOG_ERROR("Execution failed: {}", e.what());
            }
            throw CLI::RuntimeError(1);
        }

        std::cout << dump(json(*result), opts->pretty) << "\n";
        context.exit_code = exit_code_for(result->outcome);
    });
}

// ---------------------------------------------------------------------------
// tools command
// ---------------------------------------------------------------------------

void register_tools_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("tools", "Print the tool catalog");

    struct Options {
        bool no_probe = false;
        bool pretty = false;
    };
    auto opts = std::make_shared<Options>();

    sub->add_flag("--no-probe", opts->no_probe, "Skip the --version availability probe");
    sub->add_flag("--pretty", opts->pretty, "Pretty-print the catalog");

    sub->callback([&context, opts]() {
        auto config = context.load();
        auto engine = create_engine(config);
        gateway::ToolService service(*engine);

        net::io_context ioc;
        std::vector<exec::ToolDescriptor> tools;
        net::co_spawn(ioc, service.catalog(!opts->no_probe),
            [&](std::exception_ptr ep, std::vector<exec::ToolDescriptor> list) {
                if (!ep) tools = std::move(list);
            });
        ioc.run();

        std::cout << dump(json{{"tools", tools}, {"count", tools.size()}}, opts->pretty) << "\n";
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("config", "Show or validate the effective configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&context, validate_only]() {
        auto config = context.load();

        if (*validate_only) {
            auto limits = exec::make_resource_limits(config.execution);
            if (config.execution.default_timeout > config.execution.max_timeout) {
                LOG_WARN("default_timeout {}s exceeds max_timeout {}s; clamped to {}s",
                         config.execution.default_timeout, config.execution.max_timeout,
                         limits.default_timeout.count());
            }
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = config;
        j["effective"] = {
            {"audit_log", config.audit.enabled ? json(resolve_audit_path(config).string())
                                               : json(nullptr)},
            {"tool_search_path", exec::Engine::tool_search_path(config.execution)},
        };
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "toolgate " << kVersion << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace toolgate::cli
