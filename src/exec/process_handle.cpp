/*
 * sandterm C++ - Process-backed ExecHandle Implementation
 */
#include <sandterm/exec/process_handle.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

#include <signal.h>

namespace sandterm {

const char* const TRACKED_PID_DIR = "/tmp/.sandterm";

std::string resolved_command(const ExecRequest& request) {
    return "cd \"" + request.cwd + "\" && " + request.command;
}

std::string tracked_shell_script(const std::string& invocation_id,
                                 const std::string& cwd,
                                 const std::string& command) {
    const std::string pid_file = std::string(TRACKED_PID_DIR) + "/" + invocation_id + ".pid";
    return "mkdir -p " + std::string(TRACKED_PID_DIR) + " 2>/dev/null; "
           "echo $$ > " + pid_file + "; "
           "cd " + shell_quote(cwd) + " && " + command + "; "
           "rc=$?; rm -f " + pid_file + "; exit $rc";
}

std::string kill_tracked_script(const std::string& invocation_id) {
    const std::string pid_file = std::string(TRACKED_PID_DIR) + "/" + invocation_id + ".pid";
    return "f=" + pid_file + "; [ -f \"$f\" ] || exit 0; "
           "kt() { for c in $(cat /proc/$1/task/$1/children 2>/dev/null); do kt $c; done; "
           "kill -9 $1 2>/dev/null; }; "
           "kt $(cat \"$f\"); rm -f \"$f\"";
}

ProcessExecHandle::ProcessExecHandle(std::unique_ptr<Subprocess> proc, KillStep remote_kill)
    : proc_(std::move(proc))
    , remote_kill_(remote_kill)
    , terminated_(false)
{
}

ProcessExecHandle::~ProcessExecHandle() {
    int code = 0;
    if (proc_ && !proc_->try_wait(code)) {
        terminate();
    }
}

bool ProcessExecHandle::read_some(int timeout_ms, const OutputSink& sink) {
    return proc_->read_some(timeout_ms, sink);
}

bool ProcessExecHandle::try_wait(int& exit_code) {
    return proc_->try_wait(exit_code);
}

void ProcessExecHandle::terminate() {
    if (terminated_) return;
    terminated_ = true;

    // Remote side first: the local client may be what keeps the remote shell attached
    if (remote_kill_) {
        remote_kill_();
    }
    proc_->kill_tree(SIGKILL);
    proc_->wait();
    LOG_DEBUG("[Exec] Terminated pid %d", static_cast<int>(proc_->pid()));
}

} // namespace sandterm
