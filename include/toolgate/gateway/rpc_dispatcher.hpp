#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "toolgate/core/error.hpp"

namespace toolgate::gateway {

using json = nlohmann::json;
using boost::asio::awaitable;

/// JSON-RPC 2.0 error codes.
namespace rpc_error {
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kServerError = -32000;
} // namespace rpc_error

/// Receives params (object or null), returns the result value.
using MethodHandler = std::function<awaitable<Result<json>>(json params)>;

struct MethodInfo {
    std::string name;
    std::string description;
};

/// Maps an ErrorCode to the JSON-RPC error code reported for it.
auto rpc_code_for(ErrorCode code) -> int;

/// Builds `{"jsonrpc":"2.0","id":id,"error":{code,message[,data]}}`.
auto make_rpc_error(const json& id, int code, std::string_view message,
                    const json& data = nullptr) -> json;

/// Method table plus JSON-RPC 2.0 envelope handling.
class RpcDispatcher {
public:
    void register_method(std::string name, MethodHandler handler,
                         std::string description = "");

    [[nodiscard]] auto has_method(std::string_view name) const -> bool;

    /// Registered methods, sorted by name.
    [[nodiscard]] auto methods() const -> std::vector<MethodInfo>;

    /// Handles one parsed request envelope. Returns the response envelope,
    /// or null for a notification (no "id").
    auto dispatch(const json& request) -> awaitable<json>;

    /// Parses `body` and dispatches it. Malformed JSON yields a -32700 error.
    auto dispatch_text(std::string_view body) -> awaitable<json>;

private:
    struct Entry {
        MethodHandler handler;
        MethodInfo info;
    };

    std::map<std::string, Entry, std::less<>> methods_;
};

} // namespace toolgate::gateway
