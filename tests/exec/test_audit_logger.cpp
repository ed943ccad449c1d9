#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "toolgate/exec/audit_logger.hpp"

using namespace toolgate::exec;
using toolgate::testing::MemoryAuditSink;
namespace fs = std::filesystem;

namespace {

auto read_lines(const fs::path& path) -> std::vector<std::string> {
    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TEST_CASE("AuditLogger delivers events in order with sequence numbers", "[exec][audit]") {
    auto store = std::make_shared<MemoryAuditSink::Store>();
    AuditLogger audit(std::make_unique<MemoryAuditSink>(store));

    auto first = audit.record(AuditEventKind::ExecutionStart, "req-1", "nmap", "argc=1");
    auto second = audit.record(AuditEventKind::ExecutionEnd, "req-1", "nmap", "outcome=success");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*second == *first + 1);

    audit.flush();
    auto events = store->snapshot();
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == AuditEventKind::ExecutionStart);
    CHECK(events[0].sequence == *first);
    CHECK(events[1].kind == AuditEventKind::ExecutionEnd);
    CHECK(events[1].request_id == "req-1");

    auto health = audit.health();
    CHECK(health.healthy);
    CHECK(health.written == 2);
    CHECK(health.dropped == 0);
    CHECK(health.pending == 0);
    CHECK_FALSE(health.last_error.has_value());
}

TEST_CASE("AuditLogger keeps the full input of rejected requests", "[exec][audit]") {
    auto store = std::make_shared<MemoryAuditSink::Store>();
    AuditLogger audit(std::make_unique<MemoryAuditSink>(store));

    json input = {{"tool", "nmap"}, {"args", {"127.0.0.1; cat /etc/shadow"}}};
    audit.record(AuditEventKind::SecurityViolation, "req-2", "nmap",
                 "disallowed_argument: argument 0 contains ';'", input);
    audit.flush();

    auto events = store->snapshot();
    REQUIRE(events.size() == 1);
    CHECK(events[0].input == input);
}

TEST_CASE("AuditLogger survives sink failures", "[exec][audit]") {
    auto store = std::make_shared<MemoryAuditSink::Store>();
    AuditLogger audit(std::make_unique<MemoryAuditSink>(store));

    store->fail = true;
    auto seq = audit.record(AuditEventKind::ExecutionStart, "req-3", "dig", "");
    CHECK(seq.has_value());
    audit.flush();

    auto health = audit.health();
    CHECK_FALSE(health.healthy);
    REQUIRE(health.last_error.has_value());
    CHECK(health.last_error->find("sink unavailable") != std::string::npos);
    CHECK(health.written == 0);

    store->fail = false;
    audit.record(AuditEventKind::ExecutionEnd, "req-3", "dig", "");
    audit.flush();
    CHECK(audit.health().healthy);
    CHECK(audit.health().written == 1);
}

TEST_CASE("AuditLogger drops events when the queue is full", "[exec][audit]") {
    auto store = std::make_shared<MemoryAuditSink::Store>();
    AuditLogger audit(std::make_unique<MemoryAuditSink>(store), 0);

    auto seq = audit.record(AuditEventKind::ExecutionStart, "req-4", "ping", "");
    CHECK_FALSE(seq.has_value());

    auto health = audit.health();
    CHECK(health.dropped == 1);
    CHECK_FALSE(health.healthy);
    audit.flush();
    CHECK(store->snapshot().empty());
}

TEST_CASE("JsonlAuditSink appends one JSON object per line", "[exec][audit]") {
    toolgate::testing::TempDir dir;
    auto path = dir.path() / "logs" / "audit.jsonl";

    {
        AuditLogger audit(std::make_unique<JsonlAuditSink>(path));
        audit.record(AuditEventKind::ValidationFailure, "req-5", "nmap",
                     "path_escapes_sandbox: /etc is outside /tmp");
        audit.record(AuditEventKind::ExecutionStart, "req-6", "dig", "argc=2");
    }

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);
    auto first = json::parse(lines[0]);
    CHECK(first["kind"] == "validation_failure");
    CHECK(first["request_id"] == "req-5");
    CHECK(first["seq"] == 1);
    auto second = json::parse(lines[1]);
    CHECK(second["kind"] == "execution_start");

    SECTION("reopening appends instead of truncating") {
        {
            AuditLogger audit(std::make_unique<JsonlAuditSink>(path));
            audit.record(AuditEventKind::ExecutionEnd, "req-6", "dig", "outcome=success");
        }
        CHECK(read_lines(path).size() == 3);
    }
}

TEST_CASE("JsonlAuditSink records input that is not valid UTF-8", "[exec][audit]") {
    toolgate::testing::TempDir dir;
    auto path = dir.path() / "audit.jsonl";
    const std::string hostile = "nm\xff" "ap";

    AuditHealth health;
    {
        AuditLogger audit(std::make_unique<JsonlAuditSink>(path));
        REQUIRE(audit.record(AuditEventKind::SecurityViolation, "req-8", hostile,
                             "invalid_tool_name: byte 0xff at offset 2",
                             json{{"tool", hostile}, {"args", {"\xc3("}}}).has_value());
        audit.flush();
        health = audit.health();
    }

    CHECK(health.healthy);
    CHECK(health.written == 1);

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    auto event = json::parse(lines[0]);
    CHECK(event["tool"] == "nm\xef\xbf\xbd" "ap");
    CHECK(event["input"]["tool"] == event["tool"]);
}

TEST_CASE("JsonlAuditSink reports an unwritable location", "[exec][audit]") {
    toolgate::testing::TempDir dir;
    auto blocker = dir.path() / "blocker";
    {
        std::ofstream out(blocker);
        out << "a file, not a directory\n";
    }

    JsonlAuditSink sink(blocker / "audit.jsonl");
    AuditEvent event;
    event.request_id = "req-7";
    auto result = sink.write(event);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == toolgate::ErrorCode::IoError);
}

TEST_CASE("AuditHealth serialization", "[exec][audit]") {
    AuditHealth h;
    h.healthy = false;
    h.last_error = "Failed to open audit log: /var/log/x";
    h.dropped = 3;

    json j = h;
    CHECK(j["healthy"] == false);
    CHECK(j["last_error"] == "Failed to open audit log: /var/log/x");
    CHECK(j["dropped"] == 3);
}
