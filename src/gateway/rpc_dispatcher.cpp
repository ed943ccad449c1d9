#include "toolgate/gateway/rpc_dispatcher.hpp"

#include "toolgate/core/logger.hpp"

#include <optional>

namespace toolgate::gateway {

auto rpc_code_for(ErrorCode code) -> int {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::SerializationError:
            return rpc_error::kInvalidParams;
        case ErrorCode::ProtocolError:
            return rpc_error::kInvalidRequest;
        case ErrorCode::InternalError:
            return rpc_error::kInternalError;
        default:
            return rpc_error::kServerError;
    }
}

auto make_rpc_error(const json& id, int code, std::string_view message, const json& data)
    -> json {
    json error = {
        {"code", code},
        {"message", std::string(message)},
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", std::move(error)},
    };
}

void RpcDispatcher::register_method(std::string name, MethodHandler handler,
                                    std::string description) {
    LOG_DEBUG("Registering RPC method: {}", name);
    auto key = name;
    methods_.insert_or_assign(std::move(key), Entry{
        .handler = std::move(handler),
        .info = MethodInfo{
            .name = std::move(name),
            .description = std::move(description),
        },
    });
}

auto RpcDispatcher::has_method(std::string_view name) const -> bool {
    return methods_.contains(name);
}

auto RpcDispatcher::methods() const -> std::vector<MethodInfo> {
    std::vector<MethodInfo> result;
    result.reserve(methods_.size());
    for (const auto& [_, entry] : methods_) {
        result.push_back(entry.info);
    }
    return result;
}

auto RpcDispatcher::dispatch(const json& request) -> awaitable<json> {
    if (!request.is_object()) {
        co_return make_rpc_error(nullptr, rpc_error::kInvalidRequest,
                                 "Request must be a JSON object");
    }

    json id = request.contains("id") ? request["id"] : json(nullptr);
    bool notification = !request.contains("id");
    if (!id.is_null() && !id.is_string() && !id.is_number_integer()) {
        co_return make_rpc_error(nullptr, rpc_error::kInvalidRequest,
                                 "id must be a string, integer or null");
    }

    if (request.value("jsonrpc", "") != "2.0") {
        co_return make_rpc_error(id, rpc_error::kInvalidRequest,
                                 "jsonrpc must be \"2.0\"");
    }

    auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string()) {
        co_return make_rpc_error(id, rpc_error::kInvalidRequest, "method must be a string");
    }
    auto method = method_it->get<std::string>();

    json params = request.contains("params") ? request["params"] : json(nullptr);
    if (!params.is_null() && !params.is_object()) {
        co_return make_rpc_error(id, rpc_error::kInvalidParams,
                                 "params must be an object");
    }

    auto entry = methods_.find(method);
    if (entry == methods_.end()) {
        co_return make_rpc_error(id, rpc_error::kMethodNotFound,
                                 "Method not found: " + method);
    }

    LOG_DEBUG("RPC dispatch method={} id={}", method, id.dump());

    Result<json> result = std::unexpected(make_error(ErrorCode::InternalError, "not run"));
    std::optional<std::string> failure;
    try {
        result = co_await entry->second.handler(std::move(params));
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (failure) {
        LOG_ERROR("RPC method {} threw exception: {}", method, *failure);
        co_return make_rpc_error(id, rpc_error::kInternalError, "Method execution failed");
    }

    if (notification) {
        co_return json(nullptr);
    }

    if (!result) {
        const auto& err = result.error();
        co_return make_rpc_error(id, rpc_code_for(err.code()), err.message(),
                                 json{{"code", std::string(error_code_to_string(err.code()))}});
    }

    co_return json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(*result)},
    };
}

auto RpcDispatcher::dispatch_text(std::string_view body) -> awaitable<json> {
    json request = json::parse(body, nullptr, false);
    if (request.is_discarded()) {
        LOG_DEBUG("RPC parse error in {} byte body", body.size());
        co_return make_rpc_error(nullptr, rpc_error::kParseError, "Parse error");
    }
    co_return co_await dispatch(request);
}

} // namespace toolgate::gateway
