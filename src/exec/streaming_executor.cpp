/*
 * sandterm C++ - Streaming Executor Implementation
 */
#include <sandterm/exec/streaming_executor.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

#include <exception>

namespace sandterm {

// Output still arriving after the process exited (a daemonized grandchild
// holding the pipe) is read for at most this long
static const int64_t EXIT_DRAIN_MS = 500;
static const int POLL_INTERVAL_MS = 50;

size_t utf8_complete_prefix(const std::string& data) {
    const size_t size = data.size();
    size_t back = 0;
    while (back < 4 && back < size) {
        unsigned char c = static_cast<unsigned char>(data[size - 1 - back]);
        if ((c & 0xC0) != 0x80) {
            size_t lead = size - 1 - back;
            size_t expected = 1;
            if ((c & 0xE0) == 0xC0) expected = 2;
            else if ((c & 0xF0) == 0xE0) expected = 3;
            else if ((c & 0xF8) == 0xF0) expected = 4;
            return lead + expected > size ? lead : size;
        }
        ++back;
    }
    return size;
}

std::shared_ptr<StreamingExecutor> StreamingExecutor::create(ExecutionBackend& backend,
                                                             const ExecRequest& request,
                                                             const ExecLimits& limits,
                                                             const ExecCallbacks& callbacks) {
    return std::shared_ptr<StreamingExecutor>(
        new StreamingExecutor(backend, request, limits, callbacks));
}

StreamingExecutor::StreamingExecutor(ExecutionBackend& backend, const ExecRequest& request,
                                     const ExecLimits& limits, const ExecCallbacks& callbacks)
    : backend_(backend)
    , request_(request)
    , limits_(limits)
    , callbacks_(callbacks)
    , started_(false)
    , cancel_requested_(false)
    , finished_(false)
    , outcome_(InvocationOutcome::RUNNING)
    , exit_code_(-1)
    , output_bytes_(0)
    , had_output_(false)
    , limit_notified_(false)
{
}

StreamingExecutor::~StreamingExecutor() {
    cancel();
    if (worker_.joinable()) {
        // The last reference can be dropped by the worker itself
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void StreamingExecutor::start() {
    if (started_.exchange(true)) return;

    std::shared_ptr<StreamingExecutor> self = shared_from_this();
    std::lock_guard<std::mutex> lock(state_mutex_);
    worker_ = std::thread([self]() {
        try {
            self->run();
        } catch (const std::exception& e) {
            LOG_ERROR("[Executor] Invocation %s aborted: %s",
                      self->request_.invocation_id.c_str(), e.what());
        }
    });
}

void StreamingExecutor::cancel() {
    if (finished_.load()) return;
    if (!cancel_requested_.exchange(true)) {
        LOG_DEBUG("[Executor] Cancel requested for %s", request_.invocation_id.c_str());
    }
}

void StreamingExecutor::wait() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

InvocationOutcome StreamingExecutor::outcome() const {
    return finished_.load() ? outcome_ : InvocationOutcome::RUNNING;
}

int StreamingExecutor::exit_code() const {
    return finished_.load() ? exit_code_ : -1;
}

void StreamingExecutor::emit_output(OutputStream stream, const std::string& data) {
    if (!callbacks_.on_output) return;

    if (stream == OutputStream::INFO || stream == OutputStream::ERROR) {
        callbacks_.on_output(stream, data);
        return;
    }

    std::string& pending = stream == OutputStream::STDOUT ? pending_stdout_ : pending_stderr_;
    pending += data;
    size_t complete = utf8_complete_prefix(pending);
    if (complete == 0) return;
    std::string chunk = pending.substr(0, complete);
    pending.erase(0, complete);

    if (limits_.max_output_bytes > 0) {
        if (output_bytes_ >= limits_.max_output_bytes) {
            return;
        }
        if (output_bytes_ + chunk.size() > limits_.max_output_bytes) {
            chunk = truncate_safe(chunk, limits_.max_output_bytes - output_bytes_);
            output_bytes_ = limits_.max_output_bytes;
            if (!chunk.empty()) {
                had_output_ = true;
                callbacks_.on_output(stream, chunk);
            }
            if (!limit_notified_) {
                limit_notified_ = true;
                callbacks_.on_output(OutputStream::INFO,
                    "Output limit reached (" + std::to_string(limits_.max_output_bytes) +
                    " bytes); further output is discarded\n");
            }
            return;
        }
    }

    output_bytes_ += chunk.size();
    had_output_ = true;
    callbacks_.on_output(stream, chunk);
}

void StreamingExecutor::flush_pending() {
    // Whatever is left is an invalid sequence; the frame encoder replaces it
    if (!pending_stdout_.empty()) {
        std::string rest;
        rest.swap(pending_stdout_);
        pending_stdout_.clear();
        if (limits_.max_output_bytes == 0 || output_bytes_ < limits_.max_output_bytes) {
            had_output_ = true;
            if (callbacks_.on_output) callbacks_.on_output(OutputStream::STDOUT, rest);
        }
    }
    if (!pending_stderr_.empty()) {
        std::string rest;
        rest.swap(pending_stderr_);
        if (limits_.max_output_bytes == 0 || output_bytes_ < limits_.max_output_bytes) {
            had_output_ = true;
            if (callbacks_.on_output) callbacks_.on_output(OutputStream::STDERR, rest);
        }
    }
}

void StreamingExecutor::finish_completed(int exit_code) {
    if (exit_code != 0 && !had_output_) {
        emit_output(OutputStream::INFO,
            "Command finished with no output (exit code: " + std::to_string(exit_code) + ")\n");
    }

    outcome_ = exit_code == 0 ? InvocationOutcome::SUCCESS : InvocationOutcome::FAILURE;
    exit_code_ = exit_code;
    finished_.store(true);

    LOG_DEBUG("[Executor] %s exited with %d", request_.invocation_id.c_str(), exit_code);
    if (callbacks_.on_completed) callbacks_.on_completed(exit_code);
}

void StreamingExecutor::finish_error(InvocationOutcome outcome, const ExecError& error) {
    outcome_ = outcome;
    exit_code_ = error.exit_code;
    finished_.store(true);

    LOG_DEBUG("[Executor] %s ended: %s (%s)", request_.invocation_id.c_str(),
              outcome_name(outcome), error.message.c_str());
    if (callbacks_.on_error) callbacks_.on_error(error);
}

void StreamingExecutor::run() {
    if (callbacks_.on_started) callbacks_.on_started();

    const ExecError canceled(ErrorKind::CANCELLATION, "Command canceled");
    if (cancel_requested_.load()) {
        finish_error(InvocationOutcome::CANCELED, canceled);
        return;
    }

    InfoSink info = [this](const std::string& line) {
        emit_output(OutputStream::INFO, line + "\n");
    };

    std::unique_ptr<ExecHandle> handle;
    BackendResult r = backend_.exec(request_, info, handle);
    if (!r.success) {
        finish_error(InvocationOutcome::FAILURE, r.error);
        return;
    }

    const int64_t deadline = monotonic_ms() + limits_.timeout_ms;
    OutputSink sink = [this](OutputStream stream, const std::string& data) {
        emit_output(stream, data);
    };

    bool exited = false;
    int exit_code = -1;
    int64_t exited_at = 0;

    for (;;) {
        if (cancel_requested_.load()) {
            handle->terminate();
            handle.reset();
            flush_pending();
            finish_error(InvocationOutcome::CANCELED, canceled);
            return;
        }

        if (!exited && monotonic_ms() >= deadline) {
            LOG_WARN("[Executor] %s exceeded %lld ms, killing", request_.invocation_id.c_str(),
                     static_cast<long long>(limits_.timeout_ms));
            handle->terminate();
            handle.reset();
            flush_pending();
            finish_error(InvocationOutcome::TIMEOUT, ExecError(ErrorKind::TIMEOUT,
                "Command timed out after " + std::to_string(limits_.timeout_ms / 1000) + " seconds"));
            return;
        }

        bool open = handle->read_some(POLL_INTERVAL_MS, sink);

        if (!exited && handle->try_wait(exit_code)) {
            exited = true;
            exited_at = monotonic_ms();
        }

        if (exited) {
            if (!open || monotonic_ms() - exited_at > EXIT_DRAIN_MS) break;
        } else if (!open) {
            sleep_ms(10);
        }
    }

    handle.reset();
    flush_pending();
    finish_completed(exit_code);
}

} // namespace sandterm
