#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "toolgate/core/error.hpp"
#include "toolgate/exec/types.hpp"

namespace toolgate::exec {

/// Destination for audit events. Called from a single writer thread.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual auto write(const AuditEvent& event) -> VoidResult = 0;
    virtual auto flush() -> VoidResult { return {}; }
};

/// Appends one JSON object per line to `path`.
///
/// The file is opened lazily in append mode and its parent directory is
/// created on demand. After a failed write the stream is closed and reopened
/// on the next event.
class JsonlAuditSink : public AuditSink {
public:
    explicit JsonlAuditSink(std::filesystem::path path);

    auto write(const AuditEvent& event) -> VoidResult override;
    auto flush() -> VoidResult override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    auto open() -> VoidResult;

    std::filesystem::path path_;
    std::ofstream out_;
};

/// Discards everything. Used when the audit file is disabled; events still
/// reach the log.
class NullAuditSink : public AuditSink {
public:
    auto write(const AuditEvent&) -> VoidResult override { return {}; }
};

struct AuditHealth {
    bool healthy = true;
    std::optional<std::string> last_error;
    uint64_t written = 0;
    uint64_t dropped = 0;
    uint64_t pending = 0;
};

void to_json(json& j, const AuditHealth& h);

/// Fire-and-forget audit trail.
///
/// record() stamps a sequence number, mirrors the event to the log and hands
/// it to a single background writer. It never blocks on the sink and never
/// fails; sink errors only show up in health().
class AuditLogger {
public:
    static constexpr std::size_t kMaxPendingEvents = 10000;

    explicit AuditLogger(std::unique_ptr<AuditSink> sink,
                         std::size_t max_pending = kMaxPendingEvents);
    ~AuditLogger();

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    /// Queues `event`. Returns the sequence number it was given, or nullopt
    /// when the queue was full and the event was dropped.
    auto record(AuditEvent event) -> std::optional<uint64_t>;

    auto record(AuditEventKind kind, std::string request_id, std::string tool,
                std::string detail, json input = nullptr) -> std::optional<uint64_t>;

    [[nodiscard]] auto health() const -> AuditHealth;

    /// Blocks until every event queued before the call has reached the sink.
    /// Must not be called from the writer thread.
    void flush();

private:
    void write_one(const AuditEvent& event);

    std::unique_ptr<AuditSink> sink_;
    std::size_t max_pending_;

    boost::asio::thread_pool pool_{1};
    boost::asio::strand<boost::asio::thread_pool::executor_type> strand_;

    std::atomic<uint64_t> sequence_{0};
    std::atomic<uint64_t> pending_{0};
    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<bool> healthy_{true};

    mutable std::mutex error_mutex_;
    std::optional<std::string> last_error_;
};

} // namespace toolgate::exec
