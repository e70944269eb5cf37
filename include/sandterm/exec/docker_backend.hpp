/*
 * sandterm C++ - Docker Execution Backend
 *
 * Runs commands in the user's long-lived container. The user's host storage
 * directory is the container's only bind mount, at the logical sandbox root.
 */
#ifndef sandterm_EXEC_DOCKER_BACKEND_HPP
#define sandterm_EXEC_DOCKER_BACKEND_HPP

#include <sandterm/exec/backend.hpp>
#include <sandterm/exec/container_lifecycle.hpp>

namespace sandterm {

class Sandbox;

class DockerBackend : public ExecutionBackend {
public:
    DockerBackend(ContainerLifecycleManager& lifecycle, const Sandbox& sandbox);

    const char* name() const { return "docker"; }

    BackendResult ensure_running(const UserContext& user, const InfoSink& info);
    BackendResult exec(const ExecRequest& request, const InfoSink& info,
                       std::unique_ptr<ExecHandle>& handle);
    BackendResult stop(const UserContext& user);
    bool is_running(const UserContext& user);
    BackendResult probe_directory(const UserContext& user, const std::string& logical_path,
                                  const InfoSink& info, bool& exists);
    size_t reap_idle();

private:
    BackendResult lease(const UserContext& user, const InfoSink& info,
                        ContainerLifecycleManager::Lease& out);

    ContainerLifecycleManager& lifecycle_;
    const Sandbox& sandbox_;
};

} // namespace sandterm

#endif // sandterm_EXEC_DOCKER_BACKEND_HPP
