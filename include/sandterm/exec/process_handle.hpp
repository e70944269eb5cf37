/*
 * sandterm C++ - Process-backed ExecHandle
 *
 * Wraps a local Subprocess. For docker and ssh the local process is only a
 * client; the real command runs elsewhere, so those backends wrap the user
 * command in a "tracked" script that records the shell pid in a pid file and
 * pass a remote kill step that walks the remote process tree.
 */
#ifndef sandterm_EXEC_PROCESS_HANDLE_HPP
#define sandterm_EXEC_PROCESS_HANDLE_HPP

#include <sandterm/exec/backend.hpp>
#include <sandterm/exec/subprocess.hpp>
#include <functional>
#include <memory>
#include <string>

namespace sandterm {

// Directory (inside the environment) holding one pid file per running invocation
extern const char* const TRACKED_PID_DIR;

// `/bin/sh -c` body: record $$, cd to cwd, run command, remove the pid file, keep the exit code
std::string tracked_shell_script(const std::string& invocation_id,
                                 const std::string& cwd,
                                 const std::string& command);

// `/bin/sh -c` body that SIGKILLs the tracked shell and all of its descendants
std::string kill_tracked_script(const std::string& invocation_id);

class ProcessExecHandle : public ExecHandle {
public:
    typedef std::function<void()> KillStep;

    explicit ProcessExecHandle(std::unique_ptr<Subprocess> proc, KillStep remote_kill = KillStep());
    ~ProcessExecHandle();

    bool read_some(int timeout_ms, const OutputSink& sink);
    bool try_wait(int& exit_code);
    void terminate();

private:
    std::unique_ptr<Subprocess> proc_;
    KillStep remote_kill_;
    bool terminated_;
};

} // namespace sandterm

#endif // sandterm_EXEC_PROCESS_HANDLE_HPP
