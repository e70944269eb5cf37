/*
 * sandterm C++ - Native Execution Backend Implementation
 */
#include <sandterm/exec/native_backend.hpp>
#include <sandterm/exec/process_handle.hpp>
#include <sandterm/core/sandbox.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

#include <sys/stat.h>

namespace sandterm {

NativeBackend::NativeBackend(const Sandbox& sandbox, bool use_landlock)
    : sandbox_(sandbox)
    , use_landlock_(use_landlock)
{
    if (!use_landlock_) {
        LOG_WARN("[Native] Landlock disabled: commands are confined by the validator only");
    }
}

BackendResult NativeBackend::user_root(const UserContext& user, std::string& host_root) {
    host_root = sandbox_.ensure_user_storage(user);
    if (host_root.empty()) {
        return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
            "Your storage folder could not be prepared.",
            "Contact support if this keeps happening.");
    }
    return BackendResult::ok();
}

BackendResult NativeBackend::ensure_running(const UserContext& user, const InfoSink& info) {
    (void)info;
    if (use_landlock_ && !LandlockJail::supported()) {
        return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
            "Command sandboxing is not available on this server.",
            "Run on a kernel with Landlock (5.13+) or switch to the docker backend.");
    }
    std::string host_root;
    return user_root(user, host_root);
}

BackendResult NativeBackend::exec(const ExecRequest& request, const InfoSink& info,
                                  std::unique_ptr<ExecHandle>& handle) {
    BackendResult r = ensure_running(request.user, info);
    if (!r.success) return r;

    std::string host_root;
    r = user_root(request.user, host_root);
    if (!r.success) return r;

    std::string host_cwd = sandbox_.to_host_path(host_root, request.cwd);
    if (host_cwd.empty()) {
        return BackendResult::fail(ErrorKind::VALIDATION,
            "Access denied: Can only navigate within " + sandbox_.logical_root());
    }

    LandlockJail jail;
    SubprocessOptions options;
    options.argv = {"/bin/sh", "-c", request.command};
    options.working_dir = host_cwd;
    options.env = {
        "HOME=" + host_root,
        "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
        "TERM=dumb",
        "LANG=C.UTF-8",
    };

    if (use_landlock_) {
        jail.allow_system_defaults();
        jail.allow_rw(host_root);
        if (!jail.prepare()) {
            return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
                "Command sandbox could not be prepared.",
                "Contact support if this keeps happening.");
        }
        options.jail = &jail;
    }

    std::unique_ptr<Subprocess> proc(new Subprocess());
    std::string error;
    if (!proc->start(options, error)) {
        LOG_ERROR("[Native] Failed to start command for %s: %s",
                  request.user.username.c_str(), error.c_str());
        return BackendResult::fail(ErrorKind::INFRASTRUCTURE, "Failed to start the command.");
    }

    LOG_DEBUG("[Native] pid %d: %s", static_cast<int>(proc->pid()), resolved_command(request).c_str());
    handle.reset(new ProcessExecHandle(std::move(proc)));
    return BackendResult::ok();
}

BackendResult NativeBackend::stop(const UserContext& user) {
    (void)user;
    return BackendResult::ok();
}

bool NativeBackend::is_running(const UserContext& user) {
    (void)user;
    return true;
}

BackendResult NativeBackend::probe_directory(const UserContext& user, const std::string& logical_path,
                                             const InfoSink& info, bool& exists) {
    (void)info;
    std::string host_root;
    BackendResult r = user_root(user, host_root);
    if (!r.success) return r;

    exists = false;
    std::string host_path = sandbox_.to_host_path(host_root, logical_path);
    if (host_path.empty()) return BackendResult::ok();

    // lstat: a symlink inside the sandbox must not lead the cwd elsewhere
    struct stat st;
    if (lstat(host_path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        exists = true;
    }
    return BackendResult::ok();
}

} // namespace sandterm
