/*
 * sandterm C++ - Audit Logger
 *
 * record() only enqueues; a writer thread appends to the sink. Sink failures
 * are logged here and never reach the caller.
 */
#ifndef sandterm_AUDIT_AUDIT_LOG_HPP
#define sandterm_AUDIT_AUDIT_LOG_HPP

#include <sandterm/audit/audit_store.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

namespace sandterm {

class AuditLogger {
public:
    explicit AuditLogger(AuditSink& sink, size_t max_queue = 10000);
    ~AuditLogger();

    void start();

    // Drain what is queued, then join the writer
    void stop();

    // Fire-and-forget. Fills executed_at when unset.
    void record(const AuditRecord& record);

    // Block until everything queued so far has been handed to the sink
    void flush();

    uint64_t written() const;
    uint64_t failed() const;
    uint64_t dropped() const;

private:
    AuditLogger(const AuditLogger&);
    AuditLogger& operator=(const AuditLogger&);

    void writer_loop();

    AuditSink& sink_;
    size_t max_queue_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<AuditRecord> queue_;
    bool running_;
    bool writing_;
    std::thread writer_;

    uint64_t written_;
    uint64_t failed_;
    uint64_t dropped_;
};

} // namespace sandterm

#endif // sandterm_AUDIT_AUDIT_LOG_HPP
