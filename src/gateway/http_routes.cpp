#include "toolgate/gateway/http_routes.hpp"

#include "toolgate/core/logger.hpp"
#include "toolgate/core/utils.hpp"
#include "toolgate/core/version.hpp"

#include <string>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>

namespace toolgate::gateway {

namespace {

constexpr std::string_view kToolsPrefix = "/tools/";

struct Target {
    std::string path;
    std::string query;
};

auto split_target(const HttpRequest& request) -> Target {
    auto raw = request.target();
    std::string target(raw.data(), raw.size());
    auto q = target.find('?');
    if (q == std::string::npos) {
        return {target, ""};
    }
    return {target.substr(0, q), target.substr(q + 1)};
}

/// True unless the query string carries `key=false` or `key=0`.
auto query_flag(std::string_view query, std::string_view key, bool fallback) -> bool {
    for (const auto& pair : utils::split(query, '&')) {
        auto eq = pair.find('=');
        if (pair.substr(0, eq) != key) continue;
        if (eq == std::string::npos) return true;
        auto value = pair.substr(eq + 1);
        return !(value == "false" || value == "0" || value == "no");
    }
    return fallback;
}

} // anonymous namespace

auto status_for(const exec::ExecutionResult& result) -> http::status {
    if (result.security_violation) {
        return http::status::forbidden;
    }
    if (exec::is_rejection(result.outcome)) {
        return http::status::bad_request;
    }
    switch (result.outcome) {
        case exec::Outcome::TimedOut: return http::status::request_timeout;
        case exec::Outcome::SpawnFailed: return http::status::internal_server_error;
        default: return http::status::ok;
    }
}

auto make_json_response(http::status status, const json& body, unsigned version,
                        bool keep_alive) -> HttpResponse {
    HttpResponse res{status, version};
    res.set(http::field::server, "toolgate/" + std::string(kVersion));
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

auto make_error_response(http::status status, std::string_view message, unsigned version,
                         bool keep_alive) -> HttpResponse {
    return make_json_response(status, json{
        {"error", std::string(message)},
        {"status_code", static_cast<unsigned>(status)},
        {"timestamp", utils::timestamp_iso()},
    }, version, keep_alive);
}

HttpRoutes::HttpRoutes(ToolService& service, RpcDispatcher& dispatcher)
    : service_(service), dispatcher_(dispatcher) {}

auto HttpRoutes::handle(const HttpRequest& request) -> awaitable<HttpResponse> {
    auto [path, query] = split_target(request);
    auto version = request.version();
    auto keep_alive = request.keep_alive();
    auto method = request.method();

    LOG_DEBUG("HTTP {} {}", std::string(http::to_string(method)), path);

    if (path == "/run") {
        if (method != http::verb::post) {
            co_return make_error_response(http::status::method_not_allowed,
                                          "Use POST /run", version, keep_alive);
        }
        co_return co_await handle_run(request);
    }

    if (path == "/rpc") {
        if (method != http::verb::post) {
            co_return make_error_response(http::status::method_not_allowed,
                                          "Use POST /rpc", version, keep_alive);
        }
        co_return co_await handle_rpc(request);
    }

    if (method != http::verb::get) {
        co_return make_error_response(http::status::method_not_allowed,
                                      "Method not allowed", version, keep_alive);
    }

    if (path == "/") {
        co_return make_json_response(http::status::ok, service_.info(), version, keep_alive);
    }

    if (path == "/health") {
        co_return make_json_response(http::status::ok, service_.health(), version, keep_alive);
    }

    if (path == "/metrics") {
        co_return make_json_response(http::status::ok, service_.metrics(), version, keep_alive);
    }

    if (path == "/tools") {
        auto tools = co_await service_.catalog(query_flag(query, "probe", true));
        co_return make_json_response(http::status::ok,
            json{{"tools", tools}, {"count", tools.size()}}, version, keep_alive);
    }

    if (path.starts_with(kToolsPrefix) && path.size() > kToolsPrefix.size()) {
        auto name = path.substr(kToolsPrefix.size());
        auto descriptor = co_await service_.tool_info(name);
        if (!descriptor) {
            co_return make_error_response(http::status::not_found,
                                          "Tool not found", version, keep_alive);
        }
        co_return make_json_response(http::status::ok, json(*descriptor), version, keep_alive);
    }

    co_return make_error_response(http::status::not_found, "Not found", version, keep_alive);
}

auto HttpRoutes::handle_run(const HttpRequest& request) -> awaitable<HttpResponse> {
    auto version = request.version();
    auto keep_alive = request.keep_alive();

    json body = json::parse(request.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        co_return make_error_response(http::status::bad_request,
                                      "Request body must be a JSON object", version, keep_alive);
    }

    auto result = co_await service_.run(body);
    if (!result) {
        co_return make_error_response(http::status::bad_request,
                                      result.error().what(), version, keep_alive);
    }

    co_return make_json_response(status_for(*result), json(*result), version, keep_alive);
}

auto HttpRoutes::handle_rpc(const HttpRequest& request) -> awaitable<HttpResponse> {
    auto response = co_await dispatcher_.dispatch_text(request.body());
    if (response.is_null()) {
        HttpResponse res{http::status::no_content, request.version()};
        res.set(http::field::server, "toolgate/" + std::string(kVersion));
        res.keep_alive(request.keep_alive());
        res.prepare_payload();
        co_return res;
    }
    co_return make_json_response(http::status::ok, response, request.version(),
                                 request.keep_alive());
}

} // namespace toolgate::gateway
