/*
 * sandterm C++ - SSH Execution Backend Implementation
 */
#include <sandterm/exec/ssh_backend.hpp>
#include <sandterm/exec/process_handle.hpp>
#include <sandterm/core/config.hpp>
#include <sandterm/core/sandbox.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

static const int SSH_CONTROL_TIMEOUT_MS = 15000;

// ssh reserves 255 for its own failures (auth, network)
static const int SSH_ERROR_EXIT = 255;

static BackendResult remote_unreachable() {
    return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
        "Cannot reach the remote execution host.",
        "Check the ssh.* settings and that the host accepts the configured key.");
}

SshSettings SshSettings::from_config(const Config& cfg) {
    SshSettings s;
    s.binary = cfg.get_string("ssh.binary", s.binary);
    s.host = cfg.get_string("ssh.host");
    s.port = static_cast<int>(cfg.get_int("ssh.port", s.port));
    s.user = cfg.get_string("ssh.user");
    s.root = cfg.get_string("ssh.root", s.root);
    s.identity_file = cfg.get_string("ssh.identity_file");
    while (s.root.size() > 1 && s.root.back() == '/') {
        s.root.pop_back();
    }
    return s;
}

SshBackend::SshBackend(const SshSettings& settings, const Sandbox& sandbox)
    : settings_(settings)
    , sandbox_(sandbox)
{
    if (settings_.host.empty()) {
        LOG_WARN("[SSH] ssh.host is not configured");
    }
}

std::vector<std::string> SshBackend::base_argv() const {
    std::vector<std::string> argv = {
        settings_.binary,
        "-p", std::to_string(settings_.port),
        "-o", "BatchMode=yes",
        "-o", "ConnectTimeout=10",
        "-o", "StrictHostKeyChecking=accept-new",
    };
    if (!settings_.identity_file.empty()) {
        argv.push_back("-i");
        argv.push_back(settings_.identity_file);
    }
    argv.push_back(settings_.user.empty() ? settings_.host : settings_.user + "@" + settings_.host);
    return argv;
}

std::string SshBackend::remote_root(const UserContext& user) const {
    return join_path(settings_.root, user.username);
}

BackendResult SshBackend::ensure_running(const UserContext& user, const InfoSink& info) {
    (void)info;
    if (!Sandbox::is_safe_username(user.username)) {
        LOG_ERROR("[SSH] Refusing unsafe username for user %s", user.user_id.c_str());
        return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
            "Your storage folder could not be prepared.",
            "Contact support if this keeps happening.");
    }
    if (settings_.host.empty()) {
        return remote_unreachable();
    }

    {
        std::lock_guard<std::mutex> lock(prepared_mutex_);
        if (prepared_users_.count(user.user_id)) return BackendResult::ok();
    }

    std::vector<std::string> argv = base_argv();
    argv.push_back("mkdir -p " + shell_quote(remote_root(user)));
    CaptureResult r = run_capture(argv, SSH_CONTROL_TIMEOUT_MS);
    if (!r.success()) {
        LOG_ERROR("[SSH] Preparing %s on %s failed (exit %d%s): %s", user.username.c_str(),
                  settings_.host.c_str(), r.exit_code, r.timed_out ? ", timed out" : "",
                  r.started ? trim(r.err).c_str() : r.error.c_str());
        return remote_unreachable();
    }

    std::lock_guard<std::mutex> lock(prepared_mutex_);
    prepared_users_.insert(user.user_id);
    return BackendResult::ok();
}

BackendResult SshBackend::exec(const ExecRequest& request, const InfoSink& info,
                               std::unique_ptr<ExecHandle>& handle) {
    BackendResult r = ensure_running(request.user, info);
    if (!r.success) return r;

    const std::string root = remote_root(request.user);
    std::string remote_cwd = sandbox_.to_host_path(root, request.cwd);
    if (remote_cwd.empty()) {
        return BackendResult::fail(ErrorKind::VALIDATION,
            "Access denied: Can only navigate within " + sandbox_.logical_root());
    }

    SubprocessOptions options;
    options.argv = base_argv();
    options.argv.push_back(tracked_shell_script(request.invocation_id, remote_cwd, request.command));

    std::unique_ptr<Subprocess> proc(new Subprocess());
    std::string error;
    if (!proc->start(options, error)) {
        LOG_ERROR("[SSH] Failed to start ssh: %s", error.c_str());
        return remote_unreachable();
    }

    std::vector<std::string> kill_argv = base_argv();
    kill_argv.push_back(kill_tracked_script(request.invocation_id));
    ProcessExecHandle::KillStep kill_remote = [kill_argv]() {
        CaptureResult k = run_capture(kill_argv, SSH_CONTROL_TIMEOUT_MS);
        if (!k.success()) {
            LOG_WARN("[SSH] Remote kill failed (exit %d)", k.exit_code);
        }
    };

    LOG_DEBUG("[SSH] %s: %s", settings_.host.c_str(), resolved_command(request).c_str());
    handle.reset(new ProcessExecHandle(std::move(proc), kill_remote));
    return BackendResult::ok();
}

BackendResult SshBackend::stop(const UserContext& user) {
    std::lock_guard<std::mutex> lock(prepared_mutex_);
    prepared_users_.erase(user.user_id);
    return BackendResult::ok();
}

bool SshBackend::is_running(const UserContext& user) {
    std::lock_guard<std::mutex> lock(prepared_mutex_);
    return prepared_users_.count(user.user_id) > 0;
}

BackendResult SshBackend::probe_directory(const UserContext& user, const std::string& logical_path,
                                          const InfoSink& info, bool& exists) {
    BackendResult r = ensure_running(user, info);
    if (!r.success) return r;

    exists = false;
    std::string remote_path = sandbox_.to_host_path(remote_root(user), logical_path);
    if (remote_path.empty()) return BackendResult::ok();

    std::vector<std::string> argv = base_argv();
    argv.push_back("test -d " + shell_quote(remote_path));
    CaptureResult c = run_capture(argv, SSH_CONTROL_TIMEOUT_MS);
    if (!c.started || c.timed_out || c.exit_code == SSH_ERROR_EXIT) {
        return remote_unreachable();
    }
    exists = c.exit_code == 0;
    return BackendResult::ok();
}

} // namespace sandterm
