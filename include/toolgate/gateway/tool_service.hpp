#pragma once

#include <string>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "toolgate/core/error.hpp"
#include "toolgate/exec/engine.hpp"
#include "toolgate/exec/types.hpp"
#include "toolgate/gateway/rpc_dispatcher.hpp"

namespace toolgate::gateway {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Operations shared by the HTTP routes, the JSON-RPC methods and the CLI.
class ToolService {
public:
    explicit ToolService(exec::Engine& engine);

    /// Every registered tool, sorted by name. With `probe`, stale entries
    /// are re-probed concurrently before returning.
    auto catalog(bool probe = true) -> awaitable<std::vector<exec::ToolDescriptor>>;

    /// One descriptor, freshly probed. NotFound for unregistered names.
    auto tool_info(std::string name) -> awaitable<Result<exec::ToolDescriptor>>;

    /// Parses a `{tool, args, timeout, working_dir}` body and executes it.
    /// Malformed bodies are InvalidArgument; everything else is a result.
    auto run(const json& body) -> awaitable<Result<exec::ExecutionResult>>;

    auto run(exec::ExecutionRequest request) -> awaitable<exec::ExecutionResult>;

    [[nodiscard]] auto health() const -> json;
    [[nodiscard]] auto metrics() const -> json;
    [[nodiscard]] auto info() const -> json;

    /// Registers list_tools, get_tool_info and run_tool.
    void register_rpc_methods(RpcDispatcher& dispatcher);

    auto engine() noexcept -> exec::Engine& { return engine_; }

private:
    auto probe_all(std::vector<exec::ToolDescriptor> tools)
        -> awaitable<std::vector<exec::ToolDescriptor>>;

    exec::Engine& engine_;
};

} // namespace toolgate::gateway
