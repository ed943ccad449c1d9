#include <catch2/catch_test_macros.hpp>

#include <algorithm>

#include "gateway/gateway_fixture.hpp"

using namespace toolgate::gateway;
using toolgate::ErrorCode;
using toolgate::exec::Outcome;
using toolgate::exec::ToolDescriptor;
using toolgate::exec::kBuiltinTools;
using toolgate::testing::GatewayFixture;
using toolgate::testing::run_sync;

namespace {

auto find_tool(const std::vector<ToolDescriptor>& tools, std::string_view name)
    -> const ToolDescriptor* {
    auto it = std::ranges::find(tools, name, &ToolDescriptor::name);
    return it == tools.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("ToolService catalog", "[gateway][service]") {
    GatewayFixture f;

    SECTION("without probing") {
        auto tools = run_sync(f.service.catalog(false));
        CHECK(tools.size() == kBuiltinTools.size() + 3);
        CHECK(std::ranges::is_sorted(tools, {}, &ToolDescriptor::name));
        CHECK(f.engine.executor().spawn_count() == 0);

        auto* echo = find_tool(tools, "echo-args");
        REQUIRE(echo != nullptr);
        CHECK(echo->available);
        CHECK(echo->version.empty());
    }

    SECTION("with probing") {
        auto tools = run_sync(f.service.catalog(true));
        CHECK(tools.size() == kBuiltinTools.size() + 3);

        auto* echo = find_tool(tools, "echo-args");
        REQUIRE(echo != nullptr);
        CHECK(echo->version == "echo-args 2.0");

        auto* ghost = find_tool(tools, "ghost-tool");
        REQUIRE(ghost != nullptr);
        CHECK_FALSE(ghost->available);
    }
}

TEST_CASE("ToolService tool_info", "[gateway][service]") {
    GatewayFixture f;

    auto echo = run_sync(f.service.tool_info("echo-args"));
    REQUIRE(echo.has_value());
    CHECK(echo->available);
    CHECK(echo->version == "echo-args 2.0");

    auto missing = run_sync(f.service.tool_info("rm"));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::NotFound);
}

TEST_CASE("ToolService run", "[gateway][service]") {
    GatewayFixture f;

    SECTION("well-formed body") {
        auto result = run_sync(f.service.run(json{{"tool", "echo-args"}, {"args", {"hi"}}}));
        REQUIRE(result.has_value());
        CHECK(result->outcome == Outcome::Success);
        CHECK(result->stdout_text == "hi\n");
    }

    SECTION("malformed body is not executed") {
        auto result = run_sync(f.service.run(json{{"tool", "echo-args"}, {"args", "hi there"}}));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
        CHECK(f.engine.executor().spawn_count() == 0);
    }
}

TEST_CASE("ToolService health and metrics", "[gateway][service]") {
    GatewayFixture f;

    auto health = f.service.health();
    CHECK(health["status"] == "healthy");
    CHECK(health["tools"]["total"] == kBuiltinTools.size() + 3);
    CHECK(health["tools"]["available"].get<int>() >= 2);
    CHECK(health["active_executions"] == 0);
    CHECK(health["last_error"].is_null());
    CHECK(health["audit"]["healthy"] == true);
    CHECK(health.contains("version"));

    run_sync(f.service.run(toolgate::exec::make_request("ghost-tool")));

    health = f.service.health();
    REQUIRE_FALSE(health["last_error"].is_null());
    CHECK(health["last_error"]["outcome"] == "spawn_failed");
    CHECK(health["last_error"]["tool"] == "ghost-tool");

    auto metrics = f.service.metrics();
    CHECK(metrics["total"] == 1);
    CHECK(metrics["spawn_failed"] == 1);
    CHECK(metrics["spawns"] == 1);
    CHECK(metrics.contains("audit"));

    SECTION("audit failures degrade health") {
        f.store->fail = true;
        run_sync(f.service.run(toolgate::exec::make_request("echo-args")));
        f.engine.audit().flush();
        CHECK(f.service.health()["status"] == "degraded");
    }
}

TEST_CASE("ToolService info", "[gateway][service]") {
    GatewayFixture f;
    auto info = f.service.info();
    CHECK(info["name"] == "toolgate");
    CHECK(info["limits"]["max_timeout"] == 1);
    CHECK(info["endpoints"].contains("POST /run"));
}

TEST_CASE("ToolService RPC methods", "[gateway][service][rpc]") {
    GatewayFixture f;
    CHECK(f.dispatcher.has_method("list_tools"));
    CHECK(f.dispatcher.has_method("get_tool_info"));
    CHECK(f.dispatcher.has_method("run_tool"));

    auto call = [&](std::string method, json params) {
        return run_sync(f.dispatcher.dispatch(
            json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}, {"params", params}}));
    };

    SECTION("list_tools") {
        auto res = call("list_tools", {{"probe", false}});
        CHECK(res["result"]["tools"].size() == kBuiltinTools.size() + 3);
    }

    SECTION("get_tool_info") {
        auto res = call("get_tool_info", {{"name", "echo-args"}});
        CHECK(res["result"]["name"] == "echo-args");
        CHECK(res["result"]["version"] == "echo-args 2.0");

        auto missing = call("get_tool_info", {{"name", "rm"}});
        CHECK(missing["error"]["code"] == rpc_error::kServerError);
        CHECK(missing["error"]["data"]["code"] == "NOT_FOUND");

        auto no_name = call("get_tool_info", json::object());
        CHECK(no_name["error"]["code"] == rpc_error::kInvalidParams);
    }

    SECTION("run_tool") {
        auto res = call("run_tool", {{"tool", "echo-args"}, {"args", {"a", "b"}}});
        CHECK(res["result"]["outcome"] == "success");
        CHECK(res["result"]["stdout"] == "a\nb\n");

        auto rejected = call("run_tool", {{"tool", "echo-args"}, {"args", {"a|b"}}});
        CHECK(rejected["result"]["outcome"] == "disallowed_argument");
        CHECK(rejected["result"]["security_violation"] == true);

        auto malformed = call("run_tool", {{"args", {"a"}}});
        CHECK(malformed["error"]["code"] == rpc_error::kInvalidParams);
    }
}
