/*
 * sandterm C++ - Audit Logger Implementation
 */
#include <sandterm/audit/audit_log.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

#include <exception>

namespace sandterm {

AuditLogger::AuditLogger(AuditSink& sink, size_t max_queue)
    : sink_(sink)
    , max_queue_(max_queue == 0 ? 1 : max_queue)
    , running_(false)
    , writing_(false)
    , written_(0)
    , failed_(0)
    , dropped_(0)
{
}

AuditLogger::~AuditLogger() {
    stop();
}

void AuditLogger::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    writer_ = std::thread(&AuditLogger::writer_loop, this);
    LOG_DEBUG("[Audit] Writer started");
}

void AuditLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
    LOG_DEBUG("[Audit] Writer stopped (%llu written, %llu failed, %llu dropped)",
              static_cast<unsigned long long>(written_),
              static_cast<unsigned long long>(failed_),
              static_cast<unsigned long long>(dropped_));
}

void AuditLogger::record(const AuditRecord& record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= max_queue_) {
            queue_.pop_front();
            ++dropped_;
            LOG_WARN("[Audit] Queue full, dropped oldest record");
        }
        queue_.push_back(record);
        if (queue_.back().executed_at == 0) {
            queue_.back().executed_at = current_timestamp_ms();
        }
    }
    cv_.notify_one();
}

void AuditLogger::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() {
        return !running_ || (queue_.empty() && !writing_);
    });
}

uint64_t AuditLogger::written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

uint64_t AuditLogger::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

uint64_t AuditLogger::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void AuditLogger::writer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });
        if (queue_.empty() && !running_) {
            break;
        }

        AuditRecord rec = queue_.front();
        queue_.pop_front();
        writing_ = true;
        lock.unlock();

        bool ok = false;
        try {
            ok = sink_.append(rec);
        } catch (const std::exception& e) {
            LOG_ERROR("[Audit] Sink threw: %s", e.what());
        }
        if (!ok) {
            LOG_ERROR("[Audit] Failed to record %s command for user %s",
                      rec.status.c_str(), rec.user_id.c_str());
        }

        lock.lock();
        writing_ = false;
        if (ok) ++written_;
        else ++failed_;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

} // namespace sandterm
