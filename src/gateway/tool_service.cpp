#include "toolgate/gateway/tool_service.hpp"

#include "toolgate/core/logger.hpp"
#include "toolgate/core/utils.hpp"
#include "toolgate/core/version.hpp"

#include <algorithm>
#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace toolgate::gateway {

namespace net = boost::asio;
using exec::ToolDescriptor;

ToolService::ToolService(exec::Engine& engine)
    : engine_(engine) {}

auto ToolService::catalog(bool probe) -> awaitable<std::vector<ToolDescriptor>> {
    auto tools = engine_.registry().list();
    if (!probe || tools.empty()) {
        co_return tools;
    }
    auto strand = net::make_strand(co_await net::this_coro::executor);
    co_return co_await net::co_spawn(strand, probe_all(std::move(tools)), net::use_awaitable);
}

auto ToolService::probe_all(std::vector<ToolDescriptor> tools)
    -> awaitable<std::vector<ToolDescriptor>> {
    auto ex = co_await net::this_coro::executor;

    // Counts outstanding probes; all updates happen on this strand.
    struct Latch {
        explicit Latch(const net::any_io_executor& executor, std::vector<ToolDescriptor> t)
            : results(std::move(t)), remaining(results.size()), done(executor) {
            done.expires_at(net::steady_timer::time_point::max());
        }
        std::vector<ToolDescriptor> results;
        std::size_t remaining;
        net::steady_timer done;
    };
    auto latch = std::make_shared<Latch>(ex, std::move(tools));

    for (std::size_t i = 0; i < latch->results.size(); ++i) {
        net::co_spawn(ex, [this, latch, i]() -> awaitable<void> {
            try {
                latch->results[i] = co_await engine_.registry().refresh_availability(
                    latch->results[i], engine_.executor());
            } catch (const std::exception& e) {
                LOG_WARN("Probe of {} failed: {}", latch->results[i].name, e.what());
            }
            if (--latch->remaining == 0) {
                latch->done.cancel();
            }
        }, net::detached);
    }

    while (latch->remaining > 0) {
        boost::system::error_code ec;
        co_await latch->done.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    co_return std::move(latch->results);
}

auto ToolService::tool_info(std::string name) -> awaitable<Result<ToolDescriptor>> {
    auto descriptor = engine_.registry().lookup(name);
    if (!descriptor) {
        co_return make_fail(descriptor.error());
    }
    auto probed = co_await engine_.registry().refresh_availability(*descriptor,
                                                                   engine_.executor());
    co_return probed;
}

auto ToolService::run(const json& body) -> awaitable<Result<exec::ExecutionResult>> {
    auto request = exec::parse_execution_request(body);
    if (!request) {
        co_return make_fail(request.error());
    }
    co_return co_await engine_.coordinator().execute(std::move(*request));
}

auto ToolService::run(exec::ExecutionRequest request) -> awaitable<exec::ExecutionResult> {
    co_return co_await engine_.coordinator().execute(std::move(request));
}

auto ToolService::health() const -> json {
    auto audit = engine_.audit().health();
    auto tools = engine_.registry().list();
    auto available = std::ranges::count_if(tools, [](const auto& t) { return t.available; });
    auto last_error = engine_.coordinator().last_error();

    return json{
        {"status", audit.healthy ? "healthy" : "degraded"},
        {"version", std::string(kVersion)},
        {"timestamp", utils::timestamp_iso()},
        {"audit", audit},
        {"tools", {
            {"total", tools.size()},
            {"available", available},
        }},
        {"active_executions", engine_.executor().active_count()},
        {"last_error", last_error ? json(*last_error) : json(nullptr)},
    };
}

auto ToolService::metrics() const -> json {
    json j = engine_.coordinator().metrics();
    j["spawns"] = engine_.executor().spawn_count();
    j["audit"] = engine_.audit().health();
    return j;
}

auto ToolService::info() const -> json {
    const auto& limits = engine_.limits();
    return json{
        {"name", "toolgate"},
        {"version", std::string(kVersion)},
        {"endpoints", {
            {"GET /", "Service information"},
            {"GET /health", "Health status"},
            {"GET /tools", "Tool catalog"},
            {"GET /tools/{name}", "Tool details"},
            {"GET /metrics", "Execution counters"},
            {"POST /run", "Execute a tool"},
            {"POST /rpc", "JSON-RPC 2.0 endpoint"},
        }},
        {"limits", {
            {"max_timeout", limits.max_timeout.count()},
            {"default_timeout", limits.default_timeout.count()},
            {"max_output_size", limits.max_output_bytes},
        }},
    };
}

void ToolService::register_rpc_methods(RpcDispatcher& dispatcher) {
    dispatcher.register_method("list_tools",
        [this](json params) -> awaitable<Result<json>> {
            bool probe = params.is_object() ? params.value("probe", true) : true;
            auto tools = co_await catalog(probe);
            co_return json{{"tools", tools}};
        },
        "List registered tools with availability");

    dispatcher.register_method("get_tool_info",
        [this](json params) -> awaitable<Result<json>> {
            if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
                co_return make_fail(make_error(ErrorCode::InvalidArgument,
                    "Missing required parameter: name"));
            }
            auto descriptor = co_await tool_info(params["name"].get<std::string>());
            if (!descriptor) {
                co_return make_fail(descriptor.error());
            }
            co_return json(*descriptor);
        },
        "Describe one tool");

    dispatcher.register_method("run_tool",
        [this](json params) -> awaitable<Result<json>> {
            if (!params.is_object()) {
                co_return make_fail(make_error(ErrorCode::InvalidArgument,
                    "params must be an object"));
            }
            auto result = co_await run(params);
            if (!result) {
                co_return make_fail(result.error());
            }
            co_return json(*result);
        },
        "Execute a tool with an argument list");
}

} // namespace toolgate::gateway
