/*
 * sandterm C++ - Docker CLI Runtime
 *
 * Every call is a short-lived docker CLI process. Engine stderr is logged but
 * never returned to clients: it routinely contains host paths.
 */
#include <sandterm/exec/container_runtime.hpp>
#include <sandterm/exec/process_handle.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

static const int DOCKER_INFO_TIMEOUT_MS = 5000;
static const int DOCKER_CONTROL_TIMEOUT_MS = 30000;
static const int DOCKER_CREATE_TIMEOUT_MS = 120000;
static const int DOCKER_PROBE_TIMEOUT_MS = 10000;

const char* container_status_name(ContainerStatus status) {
    switch (status) {
        case ContainerStatus::ABSENT: return "absent";
        case ContainerStatus::STOPPED: return "stopped";
        case ContainerStatus::RUNNING: return "running";
    }
    return "unknown";
}

static bool daemon_unreachable(const CaptureResult& r) {
    return r.err.find("Cannot connect to the Docker daemon") != std::string::npos ||
           r.err.find("Is the docker daemon running") != std::string::npos ||
           r.err.find("error during connect") != std::string::npos;
}

static BackendResult runtime_down() {
    return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
        "Docker is not running.",
        "Start the Docker daemon and try again.");
}

DockerCliRuntime::DockerCliRuntime(const std::string& binary)
    : binary_(binary.empty() ? "docker" : binary) {}

BackendResult DockerCliRuntime::check_ready(const std::string& image) {
    CaptureResult info = run_capture({binary_, "info", "--format", "{{.ServerVersion}}"},
                                     DOCKER_INFO_TIMEOUT_MS);
    if (!info.started) {
        LOG_ERROR("[Docker] Cannot run %s: %s", binary_.c_str(), info.error.c_str());
        return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
            "Docker is not installed on the server.",
            "Install Docker and make sure the docker binary is on PATH.");
    }
    if (!info.success()) {
        LOG_ERROR("[Docker] docker info failed (exit %d%s): %s", info.exit_code,
                  info.timed_out ? ", timed out" : "", trim(info.err).c_str());
        return runtime_down();
    }
    LOG_DEBUG("[Docker] Engine version %s", trim(info.out).c_str());

    CaptureResult img = run_capture({binary_, "image", "inspect", "--format", "{{.Id}}", image},
                                    DOCKER_INFO_TIMEOUT_MS);
    if (!img.success()) {
        LOG_ERROR("[Docker] Image %s not available: %s", image.c_str(), trim(img.err).c_str());
        if (daemon_unreachable(img)) return runtime_down();
        return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
            "Terminal image \"" + image + "\" not found.",
            "Build it first: docker build -t " + image + " docker/");
    }
    return BackendResult::ok();
}

BackendResult DockerCliRuntime::inspect(const std::string& name, ContainerStatus& status) {
    CaptureResult r = run_capture({binary_, "inspect", "--format", "{{.State.Running}}", name},
                                  DOCKER_INFO_TIMEOUT_MS);
    if (!r.started) {
        LOG_ERROR("[Docker] Cannot run %s: %s", binary_.c_str(), r.error.c_str());
        return runtime_down();
    }
    if (r.success()) {
        status = trim(r.out) == "true" ? ContainerStatus::RUNNING : ContainerStatus::STOPPED;
        return BackendResult::ok();
    }
    if (r.err.find("No such") != std::string::npos) {
        status = ContainerStatus::ABSENT;
        return BackendResult::ok();
    }
    LOG_ERROR("[Docker] inspect %s failed: %s", name.c_str(), trim(r.err).c_str());
    return runtime_down();
}

BackendResult DockerCliRuntime::create(const ContainerSpec& spec) {
    std::vector<std::string> argv = {
        binary_, "run", "-d",
        "--name", spec.name,
        "--cpus", spec.cpus,
        "--memory", spec.memory,
        "--network", spec.network,
        "--security-opt", "no-new-privileges",
        "--workdir", spec.workdir,
        "-v", spec.host_mount + ":" + spec.workdir,
        spec.image,
        "tail", "-f", "/dev/null"
    };

    LOG_INFO("[Docker] Creating container %s (image %s, cpus %s, memory %s, network %s)",
             spec.name.c_str(), spec.image.c_str(), spec.cpus.c_str(),
             spec.memory.c_str(), spec.network.c_str());

    CaptureResult r = run_capture(argv, DOCKER_CREATE_TIMEOUT_MS);
    if (r.success()) {
        return BackendResult::ok();
    }

    LOG_ERROR("[Docker] Failed to create %s (exit %d%s): %s", spec.name.c_str(), r.exit_code,
              r.timed_out ? ", timed out" : "", trim(r.err).c_str());
    if (!r.started || daemon_unreachable(r)) return runtime_down();

    // Lost a race with another process using the same name
    if (r.err.find("Conflict") != std::string::npos) {
        return start(spec.name);
    }
    return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
        "Failed to start your terminal container.",
        "Try again in a moment; contact support if it keeps failing.");
}

BackendResult DockerCliRuntime::start(const std::string& name) {
    CaptureResult r = run_capture({binary_, "start", name}, DOCKER_CONTROL_TIMEOUT_MS);
    if (r.success()) {
        LOG_INFO("[Docker] Started container %s", name.c_str());
        return BackendResult::ok();
    }
    LOG_ERROR("[Docker] Failed to start %s: %s", name.c_str(), trim(r.err).c_str());
    if (!r.started || daemon_unreachable(r)) return runtime_down();
    return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
        "Failed to start your terminal container.",
        "Try again in a moment; contact support if it keeps failing.");
}

BackendResult DockerCliRuntime::stop(const std::string& name) {
    CaptureResult r = run_capture({binary_, "stop", "-t", "5", name}, DOCKER_CONTROL_TIMEOUT_MS);
    if (r.success()) {
        LOG_INFO("[Docker] Stopped container %s", name.c_str());
        return BackendResult::ok();
    }
    LOG_ERROR("[Docker] Failed to stop %s: %s", name.c_str(), trim(r.err).c_str());
    if (!r.started || daemon_unreachable(r)) return runtime_down();
    return BackendResult::fail(ErrorKind::INFRASTRUCTURE, "Failed to stop your terminal container.");
}

BackendResult DockerCliRuntime::exec(const std::string& name, const std::string& invocation_id,
                                     const std::string& cwd, const std::string& command,
                                     std::unique_ptr<ExecHandle>& handle) {
    SubprocessOptions options;
    options.argv = {
        binary_, "exec", name, "/bin/sh", "-c",
        tracked_shell_script(invocation_id, cwd, command)
    };

    std::unique_ptr<Subprocess> proc(new Subprocess());
    std::string error;
    if (!proc->start(options, error)) {
        LOG_ERROR("[Docker] exec in %s failed: %s", name.c_str(), error.c_str());
        return runtime_down();
    }

    const std::string binary = binary_;
    ProcessExecHandle::KillStep kill_remote = [binary, name, invocation_id]() {
        CaptureResult r = run_capture(
            {binary, "exec", name, "/bin/sh", "-c", kill_tracked_script(invocation_id)},
            DOCKER_PROBE_TIMEOUT_MS);
        if (!r.success()) {
            LOG_WARN("[Docker] Remote kill for %s in %s failed (exit %d): %s",
                     invocation_id.c_str(), name.c_str(), r.exit_code, trim(r.err).c_str());
        }
    };

    handle.reset(new ProcessExecHandle(std::move(proc), kill_remote));
    return BackendResult::ok();
}

BackendResult DockerCliRuntime::probe_directory(const std::string& name, const std::string& path,
                                                bool& exists) {
    CaptureResult r = run_capture({binary_, "exec", name, "test", "-d", path},
                                  DOCKER_PROBE_TIMEOUT_MS);
    if (!r.started || r.timed_out || daemon_unreachable(r)) {
        LOG_ERROR("[Docker] Directory probe in %s failed: %s", name.c_str(),
                  r.started ? trim(r.err).c_str() : r.error.c_str());
        return runtime_down();
    }
    // docker exec itself reports 125-127 when it could not run the probe
    if (r.exit_code >= 125) {
        LOG_ERROR("[Docker] Directory probe in %s could not run: %s", name.c_str(), trim(r.err).c_str());
        return BackendResult::fail(ErrorKind::INFRASTRUCTURE, "Your terminal container is not available.",
                                   "Run the command again to restart it.");
    }
    exists = r.exit_code == 0;
    return BackendResult::ok();
}

} // namespace sandterm
