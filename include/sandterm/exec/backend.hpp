/*
 * sandterm C++ - Execution Backend Interface
 *
 * A backend provisions a user's isolated environment and runs one validated
 * command inside it as a fresh `/bin/sh -c` (no shell state survives between
 * invocations; the logical cwd is passed in every time).
 *
 * Implementations: DockerBackend (default), NativeBackend (same host, Landlock
 * jail), SshBackend (remote host).
 */
#ifndef sandterm_EXEC_BACKEND_HPP
#define sandterm_EXEC_BACKEND_HPP

#include <sandterm/core/types.hpp>
#include <sandterm/exec/subprocess.hpp>
#include <functional>
#include <memory>
#include <string>

namespace sandterm {

// Success, or an error with its kind and a client-safe message
struct BackendResult {
    bool success;
    ExecError error;

    BackendResult() : success(true) {}

    static BackendResult ok() {
        return BackendResult();
    }

    static BackendResult fail(ErrorKind kind, const std::string& message,
                              const std::string& remediation = "") {
        BackendResult r;
        r.success = false;
        r.error = ExecError(kind, message, remediation);
        return r;
    }
};

// Provisioning progress shown to the user ("Starting container...")
typedef std::function<void(const std::string&)> InfoSink;

struct ExecRequest {
    UserContext user;
    std::string invocation_id;
    std::string cwd;            // Logical, already inside the sandbox root
    std::string command;        // Validated raw command text
};

// `cd "<cwd>" && <command>`, the form recorded for audit and shown in logs
std::string resolved_command(const ExecRequest& request);

// One running execution. Owned by a single StreamingExecutor worker.
class ExecHandle {
public:
    virtual ~ExecHandle() {}

    // Wait up to timeout_ms for output. False once all output has been read.
    virtual bool read_some(int timeout_ms, const OutputSink& sink) = 0;

    // Non-blocking; true with exit_code once the process has exited
    virtual bool try_wait(int& exit_code) = 0;

    // Force-kill the command and everything it spawned, then reap it
    virtual void terminate() = 0;
};

class ExecutionBackend {
public:
    virtual ~ExecutionBackend() {}

    virtual const char* name() const = 0;

    // Idempotent; concurrent callers for the same user converge on one environment
    virtual BackendResult ensure_running(const UserContext& user, const InfoSink& info) = 0;

    // Ensure the environment and start `request` inside it
    virtual BackendResult exec(const ExecRequest& request, const InfoSink& info,
                               std::unique_ptr<ExecHandle>& handle) = 0;

    // Explicit stop. Fails while an invocation is in flight for the user.
    virtual BackendResult stop(const UserContext& user) = 0;

    virtual bool is_running(const UserContext& user) = 0;

    // Existence probe run inside the environment, never on the path string alone
    virtual BackendResult probe_directory(const UserContext& user, const std::string& logical_path,
                                          const InfoSink& info, bool& exists) = 0;

    // Stop environments idle longer than the configured timeout. Returns how many stopped.
    virtual size_t reap_idle() { return 0; }
};

} // namespace sandterm

#endif // sandterm_EXEC_BACKEND_HPP
