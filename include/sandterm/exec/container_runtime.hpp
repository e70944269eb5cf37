/*
 * sandterm C++ - Container Runtime
 *
 * The narrow surface the lifecycle manager needs from a container engine:
 * create (image, limits, one bind mount), start, stop, inspect, exec.
 * DockerCliRuntime drives the docker CLI; tests substitute a fake.
 */
#ifndef sandterm_EXEC_CONTAINER_RUNTIME_HPP
#define sandterm_EXEC_CONTAINER_RUNTIME_HPP

#include <sandterm/exec/backend.hpp>
#include <memory>
#include <string>

namespace sandterm {

class Config;

enum class ContainerStatus {
    ABSENT,
    STOPPED,
    RUNNING
};

const char* container_status_name(ContainerStatus status);

struct ContainerSpec {
    std::string name;
    std::string image;
    std::string cpus;
    std::string memory;
    std::string network;
    std::string host_mount;     // User's host storage directory
    std::string workdir;        // Mount point and working directory in the container
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() {}

    // Pre-flight: engine reachable and image present
    virtual BackendResult check_ready(const std::string& image) = 0;

    virtual BackendResult inspect(const std::string& name, ContainerStatus& status) = 0;

    // Create and start a detached container that idles until exec'd into
    virtual BackendResult create(const ContainerSpec& spec) = 0;

    virtual BackendResult start(const std::string& name) = 0;
    virtual BackendResult stop(const std::string& name) = 0;

    // One-shot `/bin/sh -c` of `cd <cwd> && <command>` inside the container
    virtual BackendResult exec(const std::string& name, const std::string& invocation_id,
                               const std::string& cwd, const std::string& command,
                               std::unique_ptr<ExecHandle>& handle) = 0;

    virtual BackendResult probe_directory(const std::string& name, const std::string& path,
                                          bool& exists) = 0;
};

class DockerCliRuntime : public ContainerRuntime {
public:
    explicit DockerCliRuntime(const std::string& binary = "docker");

    BackendResult check_ready(const std::string& image);
    BackendResult inspect(const std::string& name, ContainerStatus& status);
    BackendResult create(const ContainerSpec& spec);
    BackendResult start(const std::string& name);
    BackendResult stop(const std::string& name);
    BackendResult exec(const std::string& name, const std::string& invocation_id,
                       const std::string& cwd, const std::string& command,
                       std::unique_ptr<ExecHandle>& handle);
    BackendResult probe_directory(const std::string& name, const std::string& path, bool& exists);

private:
    std::string binary_;
};

} // namespace sandterm

#endif // sandterm_EXEC_CONTAINER_RUNTIME_HPP
