#pragma once

#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <nlohmann/json.hpp>

#include "toolgate/exec/types.hpp"
#include "toolgate/gateway/rpc_dispatcher.hpp"
#include "toolgate/gateway/tool_service.hpp"

namespace toolgate::gateway {

namespace http = boost::beast::http;
using json = nlohmann::json;
using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/// HTTP status for a POST /run result.
auto status_for(const exec::ExecutionResult& result) -> http::status;

auto make_json_response(http::status status, const json& body,
                        unsigned version = 11, bool keep_alive = false) -> HttpResponse;

/// `{error, status_code, timestamp}`
auto make_error_response(http::status status, std::string_view message,
                         unsigned version = 11, bool keep_alive = false) -> HttpResponse;

/// Routes one parsed request. Independent of the socket layer.
///
///   GET  /              service info
///   GET  /health        health and audit state
///   GET  /tools         catalog (?probe=false skips probing)
///   GET  /tools/{name}  one descriptor
///   GET  /metrics       execution counters
///   POST /run           execute a tool
///   POST /rpc           JSON-RPC 2.0
class HttpRoutes {
public:
    HttpRoutes(ToolService& service, RpcDispatcher& dispatcher);

    auto handle(const HttpRequest& request) -> awaitable<HttpResponse>;

private:
    auto handle_run(const HttpRequest& request) -> awaitable<HttpResponse>;
    auto handle_rpc(const HttpRequest& request) -> awaitable<HttpResponse>;

    ToolService& service_;
    RpcDispatcher& dispatcher_;
};

} // namespace toolgate::gateway
