/*
 * sandterm C++ - Terminal Service Implementation
 */
#include <sandterm/server/terminal_service.hpp>
#include <sandterm/server/events.hpp>
#include <sandterm/server/schema_hook.hpp>
#include <sandterm/audit/audit_log.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/sandbox.hpp>
#include <sandterm/core/utils.hpp>
#include <sandterm/exec/process_registry.hpp>

#include <memory>
#include <vector>

namespace sandterm {

static const char* const BUSY_MESSAGE =
    "A command is already running. Cancel it or wait for it to finish.";

// "cd 'my site'" -> my site
static std::string cd_argument(const std::string& command) {
    std::string rest = trim(command);
    size_t space = rest.find_first_of(" \t");
    if (space == std::string::npos) {
        return "";
    }
    rest = trim(rest.substr(space + 1));
    if (rest.size() >= 2 && (rest[0] == '"' || rest[0] == '\'') && rest[rest.size() - 1] == rest[0]) {
        rest = rest.substr(1, rest.size() - 2);
    }
    return rest;
}

TerminalService::TerminalService(ExecutionBackend& backend, const PolicyTables& policy,
                                 SessionStore& sessions, ProcessRegistry& registry,
                                 AuditLogger* audit, const Sandbox* sandbox,
                                 const TerminalOptions& options)
    : backend_(backend)
    , validator_(policy)
    , sessions_(sessions)
    , registry_(registry)
    , audit_(audit)
    , sandbox_(sandbox)
    , options_(options)
    , schema_hook_(nullptr)
{
}

TerminalService::~TerminalService() {
    shutdown();
}

bool TerminalService::connect(const std::string& session_id, const UserContext& user,
                              const EventEmitter& emit_fn) {
    if (!sessions_.create(session_id, user)) {
        LOG_WARN("[Terminal] Session %s already exists", session_id.c_str());
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(emitters_mutex_);
        emitters_[session_id] = emit_fn;
    }

    LOG_INFO("[Terminal] User %s connected (session %s)", user.user_id.c_str(), session_id.c_str());

    Json data;
    data["sandbox_root"] = sessions_.sandbox_root();
    data["backend"] = backend_.name();
    emit(session_id, events::CONNECTED, data);
    return true;
}

void TerminalService::disconnect(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(emitters_mutex_);
        emitters_.erase(session_id);
    }

    std::string active = sessions_.destroy(session_id);
    std::shared_ptr<StreamingExecutor> executor = registry_.take(session_id);
    if (executor) {
        LOG_INFO("[Terminal] Session %s closed with %s running, terminating",
                 session_id.c_str(), executor->request().invocation_id.c_str());
        executor->cancel();
        executor->wait();
    } else if (!active.empty()) {
        LOG_DEBUG("[Terminal] Session %s closed during invocation %s setup",
                  session_id.c_str(), active.c_str());
    }
    LOG_INFO("[Terminal] Session %s disconnected", session_id.c_str());
}

void TerminalService::handle_event(const std::string& session_id, const std::string& event,
                                   const Json& data) {
    if (event == events::EXECUTE_COMMAND) {
        execute_command(session_id, data);
    } else if (event == events::CANCEL_COMMAND) {
        cancel_command(session_id);
    } else if (event == events::TERMINAL_STATUS) {
        terminal_status(session_id);
    } else if (event == events::START_TERMINAL) {
        start_terminal(session_id);
    } else if (event == events::STOP_TERMINAL) {
        stop_terminal(session_id);
    } else if (event == events::PING) {
        Json pong;
        pong["timestamp"] = current_timestamp_ms();
        emit(session_id, events::PONG, pong);
    } else {
        LOG_DEBUG("[Terminal] Unknown event '%s' from %s", event.c_str(), session_id.c_str());
        Json err;
        err["error"] = "Unknown event: " + event;
        emit(session_id, events::ERROR, err);
    }
}

void TerminalService::execute_command(const std::string& session_id, const Json& data) {
    if (!data.is_object() || !data.contains("command") || !data["command"].is_string()) {
        emit(session_id, events::COMMAND_ERROR,
             error_payload(ExecError(ErrorKind::VALIDATION, "Missing command")));
        return;
    }
    const std::string command = data["command"].get<std::string>();

    std::string site_id;
    if (data.contains("siteId")) {
        const Json& site = data["siteId"];
        if (site.is_string()) {
            site_id = site.get<std::string>();
        } else if (site.is_number_integer()) {
            site_id = std::to_string(site.get<int64_t>());
        }
    }

    const std::string invocation_id = generate_uuid();
    std::string running;
    if (!sessions_.try_begin(session_id, invocation_id, running)) {
        if (running.empty()) {
            LOG_WARN("[Terminal] execute_command for unknown session %s", session_id.c_str());
            return;
        }
        LOG_DEBUG("[Terminal] Session %s busy with %s", session_id.c_str(), running.c_str());
        emit(session_id, events::COMMAND_ERROR,
             error_payload(ExecError(ErrorKind::VALIDATION, BUSY_MESSAGE)));
        return;
    }

    Session session;
    if (!sessions_.get(session_id, session)) {
        return;
    }

    if (!site_id.empty() && site_id != session.site_id) {
        CwdResult bound = sessions_.set_site_binding(session_id, site_id);
        if (!bound.success) {
            emit(session_id, events::COMMAND_ERROR, error_payload(bound.error));
            sessions_.finish(session_id, invocation_id);
            return;
        }
        if (!sessions_.get(session_id, session)) {
            return;
        }
    }

    if (run_builtin(session_id, session, invocation_id, command)) {
        return;
    }

    ValidationResult verdict = validator_.validate(command);
    if (!verdict.allowed) {
        LOG_INFO("[Validator] Rejected command from user %s: %s",
                 session.user.user_id.c_str(), verdict.reason.c_str());
        if (options_.record_rejections) {
            audit(session, invocation_id, command, backend_.name(),
                  InvocationOutcome::REJECTED, verdict.reason, -1);
        }
        emit(session_id, events::COMMAND_ERROR,
             error_payload(ExecError(ErrorKind::VALIDATION, verdict.reason)));
        sessions_.finish(session_id, invocation_id);
        return;
    }

    if (verdict.primary == "cd") {
        run_cd(session_id, session, invocation_id, command, cd_argument(command));
        return;
    }

    start_invocation(session_id, session, invocation_id, command);
}

void TerminalService::cancel_command(const std::string& session_id) {
    std::shared_ptr<StreamingExecutor> executor = registry_.find(session_id);
    if (!executor) {
        LOG_DEBUG("[Terminal] Nothing to cancel for %s", session_id.c_str());
        return;
    }
    executor->cancel();
}

void TerminalService::terminal_status(const std::string& session_id) {
    Session session;
    if (!sessions_.get(session_id, session)) return;

    Json data;
    data["running"] = backend_.is_running(session.user);
    data["backend"] = backend_.name();
    data["busy"] = !session.active_invocation.empty();
    data["cwd"] = session.cwd;
    emit(session_id, events::TERMINAL_STATUS, data);
}

void TerminalService::start_terminal(const std::string& session_id) {
    Session session;
    if (!sessions_.get(session_id, session)) return;

    InfoSink info = [this, &session_id](const std::string& line) {
        emit(session_id, events::COMMAND_OUTPUT, output_payload(OutputStream::INFO, line + "\n"));
    };
    BackendResult started = backend_.ensure_running(session.user, info);
    if (!started.success) {
        LOG_WARN("[Terminal] Could not start terminal for user %s: %s",
                 session.user.user_id.c_str(), started.error.message.c_str());
        emit(session_id, events::ERROR, error_payload(started.error));
        return;
    }

    Json data;
    data["running"] = true;
    data["backend"] = backend_.name();
    emit(session_id, events::TERMINAL_STATUS, data);
}

void TerminalService::stop_terminal(const std::string& session_id) {
    Session session;
    if (!sessions_.get(session_id, session)) return;

    if (!session.active_invocation.empty()) {
        emit(session_id, events::ERROR,
             error_payload(ExecError(ErrorKind::VALIDATION, BUSY_MESSAGE)));
        return;
    }

    BackendResult stopped = backend_.stop(session.user);
    if (!stopped.success) {
        emit(session_id, events::ERROR, error_payload(stopped.error));
        return;
    }

    LOG_INFO("[Terminal] User %s stopped their terminal", session.user.user_id.c_str());
    Json data;
    data["running"] = false;
    data["backend"] = backend_.name();
    emit(session_id, events::TERMINAL_STATUS, data);
}

void TerminalService::shutdown() {
    std::vector<std::shared_ptr<StreamingExecutor>> running = registry_.take_all();
    if (!running.empty()) {
        LOG_INFO("[Terminal] Terminating %zu running command(s)", running.size());
    }
    for (size_t i = 0; i < running.size(); ++i) {
        running[i]->cancel();
    }
    for (size_t i = 0; i < running.size(); ++i) {
        running[i]->wait();
    }
}

void TerminalService::emit(const std::string& session_id, const std::string& event, const Json& data) {
    EventEmitter emit_fn;
    {
        std::lock_guard<std::mutex> lock(emitters_mutex_);
        auto it = emitters_.find(session_id);
        if (it == emitters_.end()) return;
        emit_fn = it->second;
    }
    emit_fn(event, redact_json(data));
}

Json TerminalService::redact_json(const Json& value) const {
    if (!sandbox_) return value;

    if (value.is_string()) {
        return sandbox_->redact(value.get<std::string>());
    }
    if (value.is_object()) {
        Json out = Json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = redact_json(it.value());
        }
        return out;
    }
    if (value.is_array()) {
        Json out = Json::array();
        for (size_t i = 0; i < value.size(); ++i) {
            out.push_back(redact_json(value[i]));
        }
        return out;
    }
    return value;
}

bool TerminalService::run_builtin(const std::string& session_id, const Session& session,
                                  const std::string& invocation_id, const std::string& command) {
    const std::string name = to_lower(trim(command));

    if (name == "clear") {
        emit(session_id, events::TERMINAL_CLEAR, Json::object());
    } else if (name == "help" || name == "pwd") {
        emit(session_id, events::COMMAND_STARTED, started_payload(session, command));
        const std::string text = name == "help" ? help_text() : session.cwd + "\n";
        emit(session_id, events::COMMAND_OUTPUT, output_payload(OutputStream::STDOUT, text));
    } else {
        return false;
    }

    audit(session, invocation_id, command, "builtin", InvocationOutcome::SUCCESS, "", 0);
    Json done;
    done["exitCode"] = 0;
    emit(session_id, events::COMMAND_COMPLETED, done);
    sessions_.finish(session_id, invocation_id);
    return true;
}

void TerminalService::run_cd(const std::string& session_id, const Session& session,
                             const std::string& invocation_id, const std::string& command,
                             const std::string& target) {
    emit(session_id, events::COMMAND_STARTED, started_payload(session, command));

    InfoSink info = [this, &session_id](const std::string& line) {
        emit(session_id, events::COMMAND_OUTPUT, output_payload(OutputStream::INFO, line + "\n"));
    };
    CwdResult moved = sessions_.change_dir(session_id, target, backend_, info);

    if (!moved.success) {
        LOG_DEBUG("[Terminal] cd failed for %s: %s", session_id.c_str(), moved.error.message.c_str());
        audit(session, invocation_id, command, backend_.name(), InvocationOutcome::FAILURE,
              moved.error.message, -1);
        emit(session_id, events::COMMAND_ERROR, error_payload(moved.error));
        sessions_.finish(session_id, invocation_id);
        return;
    }

    audit(session, invocation_id, command, backend_.name(), InvocationOutcome::SUCCESS, "", 0);
    emit(session_id, events::COMMAND_OUTPUT, output_payload(OutputStream::STDOUT, moved.cwd + "\n"));
    Json done;
    done["exitCode"] = 0;
    emit(session_id, events::COMMAND_COMPLETED, done);
    sessions_.finish(session_id, invocation_id);
}

void TerminalService::start_invocation(const std::string& session_id, const Session& session,
                                       const std::string& invocation_id, const std::string& command) {
    ExecRequest request;
    request.user = session.user;
    request.invocation_id = invocation_id;
    request.cwd = session.cwd;
    request.command = command;

    ExecCallbacks cb;
    cb.on_started = [this, session_id, session, command]() {
        emit(session_id, events::COMMAND_STARTED, started_payload(session, command));
    };
    cb.on_output = [this, session_id](OutputStream stream, const std::string& text) {
        emit(session_id, events::COMMAND_OUTPUT, output_payload(stream, text));
    };
    cb.on_completed = [this, session_id, session, invocation_id, command](int exit_code) {
        on_invocation_completed(session_id, session, invocation_id, command, exit_code);
    };
    cb.on_error = [this, session_id, session, invocation_id, command](const ExecError& error) {
        on_invocation_error(session_id, session, invocation_id, command, error);
    };

    std::shared_ptr<StreamingExecutor> executor =
        StreamingExecutor::create(backend_, request, options_.limits, cb);

    if (!registry_.add(session_id, executor)) {
        LOG_ERROR("[Terminal] Session %s already has a registered invocation", session_id.c_str());
        sessions_.finish(session_id, invocation_id);
        emit(session_id, events::COMMAND_ERROR,
             error_payload(ExecError(ErrorKind::VALIDATION, BUSY_MESSAGE)));
        return;
    }

    // The connection may have closed while the command was being prepared
    Session current;
    if (!sessions_.get(session_id, current)) {
        registry_.remove(session_id, invocation_id);
        LOG_DEBUG("[Terminal] Session %s gone before %s started", session_id.c_str(),
                  invocation_id.c_str());
        return;
    }

    LOG_INFO("[Terminal] %s (user %s) running: %s", invocation_id.c_str(),
             session.user.user_id.c_str(), resolved_command(request).c_str());
    executor->start();
}

void TerminalService::on_invocation_completed(const std::string& session_id, const Session& session,
                                              const std::string& invocation_id,
                                              const std::string& command, int exit_code) {
    audit(session, invocation_id, command, backend_.name(),
          exit_code == 0 ? InvocationOutcome::SUCCESS : InvocationOutcome::FAILURE, "", exit_code);

    std::string operation;
    if (exit_code == 0 && detect_schema_change(command, operation)) {
        if (schema_hook_) {
            SchemaChangeEvent change;
            change.user = session.user;
            change.site_id = session.site_id;
            change.command = command;
            change.operation = operation;
            schema_hook_->on_schema_change(change);
        }
        Json changed;
        changed["operation"] = operation;
        changed["command"] = command;
        if (!session.site_id.empty()) changed["siteId"] = session.site_id;
        emit(session_id, events::DATABASE_CHANGED, changed);
    }

    Json done;
    done["exitCode"] = exit_code;
    emit(session_id, events::COMMAND_COMPLETED, done);

    // Released only after the terminal frame so a follow-up cannot interleave
    release(session_id, invocation_id);
}

void TerminalService::on_invocation_error(const std::string& session_id, const Session& session,
                                          const std::string& invocation_id,
                                          const std::string& command, const ExecError& error) {
    InvocationOutcome outcome = InvocationOutcome::FAILURE;
    if (error.kind == ErrorKind::TIMEOUT) outcome = InvocationOutcome::TIMEOUT;
    else if (error.kind == ErrorKind::CANCELLATION) outcome = InvocationOutcome::CANCELED;

    if (error.kind == ErrorKind::INFRASTRUCTURE) {
        LOG_ERROR("[Terminal] %s failed: %s", invocation_id.c_str(), error.message.c_str());
    }
    audit(session, invocation_id, command, backend_.name(), outcome, error.message, error.exit_code);
    emit(session_id, events::COMMAND_ERROR, error_payload(error));
    release(session_id, invocation_id);
}

void TerminalService::release(const std::string& session_id, const std::string& invocation_id) {
    registry_.remove(session_id, invocation_id);
    sessions_.finish(session_id, invocation_id);
}

void TerminalService::audit(const Session& session, const std::string& invocation_id,
                            const std::string& command, const char* backend,
                            InvocationOutcome outcome, const std::string& error, int exit_code) {
    if (!audit_) return;

    AuditRecord rec;
    rec.invocation_id = invocation_id;
    rec.user_id = session.user.user_id;
    rec.site_id = session.site_id;
    rec.command = command;
    rec.backend = backend;
    rec.status = outcome_name(outcome);
    rec.error = error;
    rec.exit_code = exit_code;
    audit_->record(rec);
}

Json TerminalService::started_payload(const Session& session, const std::string& command) const {
    Json data;
    data["command"] = command;
    data["backend"] = backend_.name();
    data["site"] = session.site_id.empty() ? Json() : Json(session.site_id);
    data["cwd"] = session.cwd;
    return data;
}

std::string TerminalService::help_text() const {
    std::map<std::string, std::vector<std::string>> groups;
    const PolicyTables& policy = validator_.policy();
    for (auto it = policy.allowlist.begin(); it != policy.allowlist.end(); ++it) {
        groups[it->second.group].push_back(it->first);
    }

    std::string text = "Available commands:\n";
    for (auto it = groups.begin(); it != groups.end(); ++it) {
        text += "  " + it->first + ": " + join(it->second, ", ") + "\n";
    }
    text += "\n";
    text += "Tip: cd persists between commands (cd mysite, then ls).\n";
    text += "Commands run one at a time inside " + sessions_.sandbox_root() +
            "; chaining, pipes and redirection are not available.\n";
    return text;
}

} // namespace sandterm
