/*
 * sandterm C++ - Subprocess Implementation
 */
#include <sandterm/exec/subprocess.hpp>
#include <sandterm/core/sandbox.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandterm {

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Child side: report errno through the status pipe and exit
static void child_fail(int status_fd, int err) {
    ssize_t n = write(status_fd, &err, sizeof(err));
    (void)n;
    _exit(127);
}

void kill_process_tree(pid_t pid) {
    if (pid <= 0) return;

    // Stop the parent first so it cannot fork while its children are collected
    kill(pid, SIGSTOP);

    char proc_path[64];
    snprintf(proc_path, sizeof(proc_path), "/proc/%d/task/%d/children", pid, pid);
    FILE* fp = fopen(proc_path, "r");
    if (fp) {
        int child_pid;
        while (fscanf(fp, "%d", &child_pid) == 1) {
            if (child_pid > 0) {
                kill_process_tree(static_cast<pid_t>(child_pid));
            }
        }
        fclose(fp);
    }

    kill(pid, SIGKILL);
}

// ============================================================================
// Subprocess
// ============================================================================

Subprocess::Subprocess()
    : pid_(-1), out_fd_(-1), err_fd_(-1), reaped_(false), exit_code_(-1) {}

Subprocess::~Subprocess() {
    if (running()) {
        kill_tree(SIGKILL);
        wait();
    }
    close_pipes();
}

void Subprocess::close_pipes() {
    if (out_fd_ >= 0) { close(out_fd_); out_fd_ = -1; }
    if (err_fd_ >= 0) { close(err_fd_); err_fd_ = -1; }
}

bool Subprocess::start(const SubprocessOptions& options, std::string& error) {
    if (options.argv.empty()) {
        error = "no command given";
        return false;
    }
    if (pid_ > 0) {
        error = "process already started";
        return false;
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> argv;
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(NULL);

    std::vector<char*> envp;
    for (const auto& kv : options.env) {
        envp.push_back(const_cast<char*>(kv.c_str()));
    }
    envp.push_back(NULL);

    const char* workdir = options.working_dir.empty() ? NULL : options.working_dir.c_str();

    int out_pipe[2], err_pipe[2], status_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + strerror(errno);
        return false;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        return false;
    }
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork: ") + strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        close(status_pipe[0]); close(status_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only from here on
        setsid();

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        signal(SIGPIPE, SIG_DFL);

        if (workdir && chdir(workdir) != 0) {
            child_fail(status_pipe[1], errno);
        }
        if (options.jail && options.jail->apply_in_child() != 0) {
            child_fail(status_pipe[1], errno ? errno : EPERM);
        }

        if (options.env.empty()) {
            execvp(argv[0], argv.data());
        } else {
            execvpe(argv[0], argv.data(), envp.data());
        }
        child_fail(status_pipe[1], errno);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    // EOF on the status pipe means exec succeeded (it is close-on-exec)
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        error = "failed to start " + options.argv[0] + ": " + strerror(child_errno);
        return false;
    }

    pid_ = pid;
    out_fd_ = out_pipe[0];
    err_fd_ = err_pipe[0];
    reaped_ = false;
    exit_code_ = -1;
    set_nonblocking(out_fd_);
    set_nonblocking(err_fd_);

    LOG_DEBUG("[Subprocess] Started pid %d: %s", static_cast<int>(pid_), options.argv[0].c_str());
    return true;
}

bool Subprocess::read_some(int timeout_ms, const OutputSink& sink) {
    if (!streams_open()) return false;

    struct pollfd fds[2];
    int* owners[2];
    OutputStream kinds[2];
    int nfds = 0;
    if (out_fd_ >= 0) {
        fds[nfds].fd = out_fd_;
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        owners[nfds] = &out_fd_;
        kinds[nfds] = OutputStream::STDOUT;
        ++nfds;
    }
    if (err_fd_ >= 0) {
        fds[nfds].fd = err_fd_;
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        owners[nfds] = &err_fd_;
        kinds[nfds] = OutputStream::STDERR;
        ++nfds;
    }

    int ready = poll(fds, nfds, timeout_ms < 0 ? 0 : timeout_ms);
    if (ready < 0) {
        if (errno == EINTR) return true;
        LOG_ERROR("[Subprocess] poll failed: %s", strerror(errno));
        close_pipes();
        return false;
    }
    if (ready == 0) return true;

    char buffer[4096];
    for (int i = 0; i < nfds; ++i) {
        if (fds[i].revents == 0) continue;
        for (;;) {
            ssize_t n = read(*owners[i], buffer, sizeof(buffer));
            if (n > 0) {
                if (sink) sink(kinds[i], std::string(buffer, static_cast<size_t>(n)));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
            // EOF or hard error
            close(*owners[i]);
            *owners[i] = -1;
            break;
        }
    }

    return streams_open();
}

bool Subprocess::try_wait(int& exit_code) {
    if (pid_ <= 0) return false;
    if (reaped_) {
        exit_code = exit_code_;
        return true;
    }

    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        reaped_ = true;
        exit_code_ = decode_status(status);
        exit_code = exit_code_;
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        reaped_ = true;
        exit_code = exit_code_;
        return true;
    }
    return false;
}

int Subprocess::wait() {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    reaped_ = true;
    exit_code_ = r == pid_ ? decode_status(status) : -1;
    return exit_code_;
}

void Subprocess::kill_tree(int sig) {
    if (!running()) return;

    if (sig == SIGKILL) {
        kill_process_tree(pid_);
    }
    // The child called setsid(), so its pid is also its process group id
    kill(-pid_, sig);
    kill(pid_, sig);
}

// ============================================================================
// run_capture
// ============================================================================

CaptureResult run_capture(const std::vector<std::string>& argv, int timeout_ms) {
    CaptureResult result;

    SubprocessOptions options;
    options.argv = argv;

    Subprocess proc;
    if (!proc.start(options, result.error)) {
        return result;
    }
    result.started = true;

    int64_t deadline = monotonic_ms() + timeout_ms;
    OutputSink sink = [&result](OutputStream stream, const std::string& chunk) {
        if (stream == OutputStream::STDOUT) result.out += chunk;
        else result.err += chunk;
    };

    for (;;) {
        int64_t remaining = deadline - monotonic_ms();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        if (proc.streams_open()) {
            proc.read_some(static_cast<int>(remaining < 100 ? remaining : 100), sink);
            continue;
        }

        int code = 0;
        if (proc.try_wait(code)) {
            result.exit_code = code;
            return result;
        }
        sleep_ms(10);
    }

    proc.kill_tree(SIGKILL);
    result.exit_code = proc.wait();
    return result;
}

} // namespace sandterm
