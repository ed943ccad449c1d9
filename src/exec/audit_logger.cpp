#include "toolgate/exec/audit_logger.hpp"

#include "toolgate/core/logger.hpp"
#include "toolgate/core/utils.hpp"

#include <future>
#include <system_error>

#include <boost/asio/post.hpp>

namespace toolgate::exec {

namespace fs = std::filesystem;

void to_json(json& j, const AuditHealth& h) {
    j = json{
        {"healthy", h.healthy},
        {"last_error", h.last_error ? json(*h.last_error) : json(nullptr)},
        {"written", h.written},
        {"dropped", h.dropped},
        {"pending", h.pending},
    };
}

// ---------------------------------------------------------------------------
// JsonlAuditSink
// ---------------------------------------------------------------------------

JsonlAuditSink::JsonlAuditSink(fs::path path)
    : path_(std::move(path)) {}

auto JsonlAuditSink::open() -> VoidResult {
    if (out_.is_open()) return {};

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Failed to create audit log directory",
                path_.parent_path().string() + ": " + ec.message()));
        }
    }

    out_.clear();
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to open audit log", path_.string()));
    }
    return {};
}

auto JsonlAuditSink::write(const AuditEvent& event) -> VoidResult {
    if (auto opened = open(); !opened) {
        return opened;
    }

    try {
        json j = event;
        out_ << j.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Failed to serialize audit event", e.what()));
    }

    out_.flush();
    if (!out_) {
        out_.close();
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to write audit log", path_.string()));
    }
    return {};
}

auto JsonlAuditSink::flush() -> VoidResult {
    if (!out_.is_open()) return {};
    out_.flush();
    if (!out_) {
        out_.close();
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to flush audit log", path_.string()));
    }
    return {};
}

// ---------------------------------------------------------------------------
// AuditLogger
// ---------------------------------------------------------------------------

AuditLogger::AuditLogger(std::unique_ptr<AuditSink> sink, std::size_t max_pending)
    : sink_(sink ? std::move(sink) : std::make_unique<NullAuditSink>())
    , max_pending_(max_pending)
    , strand_(boost::asio::make_strand(pool_.get_executor())) {}

AuditLogger::~AuditLogger() {
    flush();
    pool_.join();
}

auto AuditLogger::record(AuditEvent event) -> std::optional<uint64_t> {
    event.sequence = sequence_.fetch_add(1) + 1;

    std::string digest;
    if (!event.input.is_null()) {
        digest = utils::sha256(event.input.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    switch (event.kind) {
        case AuditEventKind::SecurityViolation:
            LOG_WARN("[audit #{}] {} request={} tool={} detail={} input_sha256={}",
                     event.sequence, to_string(event.kind), event.request_id,
                     event.tool, event.detail, digest);
            break;
        case AuditEventKind::ValidationFailure:
            LOG_INFO("[audit #{}] {} request={} tool={} detail={} input_sha256={}",
                     event.sequence, to_string(event.kind), event.request_id,
                     event.tool, event.detail, digest);
            break;
        default:
            LOG_INFO("[audit #{}] {} request={} tool={} {}", event.sequence,
                     to_string(event.kind), event.request_id, event.tool, event.detail);
            break;
    }

    if (pending_.fetch_add(1) >= max_pending_) {
        pending_.fetch_sub(1);
        auto dropped = dropped_.fetch_add(1) + 1;
        healthy_.store(false);
        {
            std::lock_guard lock(error_mutex_);
            last_error_ = "audit queue full, " + std::to_string(dropped) + " events dropped";
        }
        LOG_WARN("Audit queue full ({} pending), dropped event #{}", max_pending_,
                 event.sequence);
        return std::nullopt;
    }

    auto sequence = event.sequence;
    boost::asio::post(strand_, [this, event = std::move(event)] {
        write_one(event);
        pending_.fetch_sub(1);
    });
    return sequence;
}

auto AuditLogger::record(AuditEventKind kind, std::string request_id, std::string tool,
                         std::string detail, json input) -> std::optional<uint64_t> {
    AuditEvent event;
    event.kind = kind;
    event.request_id = std::move(request_id);
    event.tool = std::move(tool);
    event.detail = std::move(detail);
    event.input = std::move(input);
    return record(std::move(event));
}

void AuditLogger::write_one(const AuditEvent& event) {
    auto result = sink_->write(event);
    if (result) {
        written_.fetch_add(1);
        healthy_.store(true);
        return;
    }

    healthy_.store(false);
    {
        std::lock_guard lock(error_mutex_);
        last_error_ = result.error().what();
    }
    LOG_ERROR("Audit sink write failed for event #{}: {}", event.sequence,
              result.error().what());
}

auto AuditLogger::health() const -> AuditHealth {
    AuditHealth h;
    h.healthy = healthy_.load();
    h.written = written_.load();
    h.dropped = dropped_.load();
    h.pending = pending_.load();
    std::lock_guard lock(error_mutex_);
    h.last_error = last_error_;
    return h;
}

void AuditLogger::flush() {
    std::promise<void> done;
    auto future = done.get_future();
    boost::asio::post(strand_, [this, &done] {
        if (auto flushed = sink_->flush(); !flushed) {
            healthy_.store(false);
            std::lock_guard lock(error_mutex_);
            last_error_ = flushed.error().what();
        }
        done.set_value();
    });
    future.wait();
}

} // namespace toolgate::exec
