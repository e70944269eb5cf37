/*
 * sandterm C++ - Subprocess
 *
 * fork/exec with separate stdout and stderr pipes. The child runs in its own
 * session (setsid) so the whole process group can be signalled at once.
 * stdin is /dev/null: nothing here is interactive.
 */
#ifndef sandterm_EXEC_SUBPROCESS_HPP
#define sandterm_EXEC_SUBPROCESS_HPP

#include <sandterm/core/types.hpp>
#include <functional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace sandterm {

class LandlockJail;

// Receives one chunk of process output
typedef std::function<void(OutputStream, const std::string&)> OutputSink;

struct SubprocessOptions {
    std::vector<std::string> argv;      // argv[0] is looked up in PATH
    std::vector<std::string> env;       // "KEY=VALUE"; empty inherits the parent environment
    std::string working_dir;            // chdir in the child when set
    const LandlockJail* jail;           // applied in the child when set

    SubprocessOptions() : jail(NULL) {}
};

class Subprocess {
public:
    Subprocess();
    // Kills and reaps a child that is still running
    ~Subprocess();

    // Returns false with `error` set when fork or exec fails
    bool start(const SubprocessOptions& options, std::string& error);

    // Wait up to timeout_ms for output and hand every chunk to `sink`.
    // Returns false once both pipes have reached EOF.
    bool read_some(int timeout_ms, const OutputSink& sink);

    // Non-blocking reap. True once the child has exited; exit_code is
    // 128+signal for a signalled child.
    bool try_wait(int& exit_code);

    // Blocking reap
    int wait();

    // Signal the process group and every descendant still reachable
    void kill_tree(int sig);

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !reaped_; }
    bool streams_open() const { return out_fd_ >= 0 || err_fd_ >= 0; }

private:
    Subprocess(const Subprocess&);
    Subprocess& operator=(const Subprocess&);

    void close_pipes();

    pid_t pid_;
    int out_fd_;
    int err_fd_;
    bool reaped_;
    int exit_code_;
};

// Result of a short, fully buffered run (probes, pre-flight checks)
struct CaptureResult {
    bool started;
    bool timed_out;
    int exit_code;
    std::string out;
    std::string err;
    std::string error;      // Spawn failure text when !started

    CaptureResult() : started(false), timed_out(false), exit_code(-1) {}

    bool success() const { return started && !timed_out && exit_code == 0; }
};

// Run argv to completion, killing it after timeout_ms
CaptureResult run_capture(const std::vector<std::string>& argv, int timeout_ms);

// Recursively SIGKILL pid and its children via /proc/<pid>/task/<pid>/children
void kill_process_tree(pid_t pid);

} // namespace sandterm

#endif // sandterm_EXEC_SUBPROCESS_HPP
