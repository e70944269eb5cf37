/*
 * sandterm C++ - Terminal Service
 *
 * Per-session event dispatcher. Turns client events into validated
 * invocations and reports them back as frames:
 *
 *   execute_command  -> command_started, command_output*, command_completed | command_error
 *   cancel_command   -> (terminal event of the running invocation)
 *   terminal_status  -> terminal_status{running, backend}
 *   start_terminal   -> terminal_status{running:true} | error
 *   stop_terminal    -> terminal_status{running:false} | error
 *   ping             -> pong
 *
 * One invocation per session: a second execute_command while one is running
 * is rejected and the first is left alone. Every outgoing string passes
 * through the sandbox redactor.
 */
#ifndef sandterm_SERVER_TERMINAL_SERVICE_HPP
#define sandterm_SERVER_TERMINAL_SERVICE_HPP

#include <sandterm/core/json.hpp>
#include <sandterm/core/types.hpp>
#include <sandterm/exec/streaming_executor.hpp>
#include <sandterm/security/command_validator.hpp>
#include <sandterm/session/session_store.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace sandterm {

class AuditLogger;
class ProcessRegistry;
class Sandbox;
class SchemaChangeHook;

// Delivers one event to the session's connection. Called from reader and
// worker threads; implementations serialize their own writes.
typedef std::function<void(const std::string& event, const Json& data)> EventEmitter;

struct TerminalOptions {
    ExecLimits limits;
    bool record_rejections;

    TerminalOptions() : record_rejections(true) {}
};

class TerminalService {
public:
    TerminalService(ExecutionBackend& backend, const PolicyTables& policy,
                    SessionStore& sessions, ProcessRegistry& registry,
                    AuditLogger* audit, const Sandbox* sandbox,
                    const TerminalOptions& options = TerminalOptions());
    ~TerminalService();

    void set_schema_hook(SchemaChangeHook* hook) { schema_hook_ = hook; }

    // Register the session and greet it with `connected`
    bool connect(const std::string& session_id, const UserContext& user, const EventEmitter& emit);

    // Drop the session; a running invocation is force-canceled and reaped
    void disconnect(const std::string& session_id);

    void handle_event(const std::string& session_id, const std::string& event, const Json& data);

    void execute_command(const std::string& session_id, const Json& data);
    void cancel_command(const std::string& session_id);
    void terminal_status(const std::string& session_id);
    void start_terminal(const std::string& session_id);
    void stop_terminal(const std::string& session_id);

    // Cancel and join every running invocation
    void shutdown();

    const CommandValidator& validator() const { return validator_; }

private:
    TerminalService(const TerminalService&);
    TerminalService& operator=(const TerminalService&);

    void emit(const std::string& session_id, const std::string& event, const Json& data);
    Json redact_json(const Json& value) const;

    bool run_builtin(const std::string& session_id, const Session& session,
                     const std::string& invocation_id, const std::string& command);
    void run_cd(const std::string& session_id, const Session& session,
                const std::string& invocation_id, const std::string& command,
                const std::string& target);
    void start_invocation(const std::string& session_id, const Session& session,
                          const std::string& invocation_id, const std::string& command);

    void on_invocation_completed(const std::string& session_id, const Session& session,
                                 const std::string& invocation_id, const std::string& command,
                                 int exit_code);
    void on_invocation_error(const std::string& session_id, const Session& session,
                             const std::string& invocation_id, const std::string& command,
                             const ExecError& error);
    void release(const std::string& session_id, const std::string& invocation_id);

    void audit(const Session& session, const std::string& invocation_id,
               const std::string& command, const char* backend,
               InvocationOutcome outcome, const std::string& error, int exit_code);

    Json started_payload(const Session& session, const std::string& command) const;
    std::string help_text() const;

    ExecutionBackend& backend_;
    CommandValidator validator_;
    SessionStore& sessions_;
    ProcessRegistry& registry_;
    AuditLogger* audit_;
    const Sandbox* sandbox_;
    TerminalOptions options_;
    SchemaChangeHook* schema_hook_;

    std::mutex emitters_mutex_;
    std::map<std::string, EventEmitter> emitters_;
};

} // namespace sandterm

#endif // sandterm_SERVER_TERMINAL_SERVICE_HPP
