/*
 * sandterm C++ - Streaming Executor
 *
 * Runs one invocation on a worker thread and reports it through callbacks:
 *
 *   on_started          always first
 *   on_output(stream)   zero or more, in order within each stream
 *   on_completed(code)  terminal: the process exited (any exit code)
 *   on_error(err)       terminal: infrastructure failure, timeout or cancel
 *
 * Exactly one terminal callback fires and nothing follows it. All callbacks
 * run on the worker thread.
 */
#ifndef sandterm_EXEC_STREAMING_EXECUTOR_HPP
#define sandterm_EXEC_STREAMING_EXECUTOR_HPP

#include <sandterm/exec/backend.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sandterm {

struct ExecCallbacks {
    std::function<void()> on_started;
    std::function<void(OutputStream, const std::string&)> on_output;
    std::function<void(int)> on_completed;
    std::function<void(const ExecError&)> on_error;
};

struct ExecLimits {
    int64_t timeout_ms;
    size_t max_output_bytes;    // 0 = unlimited

    ExecLimits() : timeout_ms(300 * 1000), max_output_bytes(10 * 1024 * 1024) {}
};

class StreamingExecutor : public std::enable_shared_from_this<StreamingExecutor> {
public:
    static std::shared_ptr<StreamingExecutor> create(ExecutionBackend& backend,
                                                     const ExecRequest& request,
                                                     const ExecLimits& limits,
                                                     const ExecCallbacks& callbacks);
    ~StreamingExecutor();

    // Launch the worker. The executor keeps itself alive until the worker ends.
    void start();

    // Request termination. No-op when nothing is running or already finished.
    void cancel();

    // Join the worker (no-op from the worker thread itself)
    void wait();

    bool finished() const { return finished_.load(); }
    InvocationOutcome outcome() const;
    int exit_code() const;
    const ExecRequest& request() const { return request_; }

private:
    StreamingExecutor(ExecutionBackend& backend, const ExecRequest& request,
                      const ExecLimits& limits, const ExecCallbacks& callbacks);
    StreamingExecutor(const StreamingExecutor&);
    StreamingExecutor& operator=(const StreamingExecutor&);

    void run();
    void emit_output(OutputStream stream, const std::string& data);
    void flush_pending();
    void finish_completed(int exit_code);
    void finish_error(InvocationOutcome outcome, const ExecError& error);

    ExecutionBackend& backend_;
    ExecRequest request_;
    ExecLimits limits_;
    ExecCallbacks callbacks_;

    std::thread worker_;
    std::mutex state_mutex_;
    std::atomic<bool> started_;
    std::atomic<bool> cancel_requested_;
    std::atomic<bool> finished_;
    InvocationOutcome outcome_;
    int exit_code_;

    // Worker-only state
    size_t output_bytes_;
    bool had_output_;
    bool limit_notified_;
    std::string pending_stdout_;    // Incomplete trailing UTF-8 sequences
    std::string pending_stderr_;
};

// Length of the longest prefix of `data` that does not end inside a UTF-8 sequence
size_t utf8_complete_prefix(const std::string& data);

} // namespace sandterm

#endif // sandterm_EXEC_STREAMING_EXECUTOR_HPP
