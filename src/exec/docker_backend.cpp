/*
 * sandterm C++ - Docker Execution Backend Implementation
 */
#include <sandterm/exec/docker_backend.hpp>
#include <sandterm/core/sandbox.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

namespace {

// Keeps the container lease for as long as the exec is alive
class LeasedExecHandle : public ExecHandle {
public:
    LeasedExecHandle(std::unique_ptr<ExecHandle> inner, ContainerLifecycleManager::Lease lease)
        : inner_(std::move(inner)), lease_(std::move(lease)) {}

    ~LeasedExecHandle() {
        // Handle first: the process must be gone before the container counts as idle
        inner_.reset();
        lease_.release();
    }

    bool read_some(int timeout_ms, const OutputSink& sink) { return inner_->read_some(timeout_ms, sink); }
    bool try_wait(int& exit_code) { return inner_->try_wait(exit_code); }
    void terminate() { inner_->terminate(); }

private:
    std::unique_ptr<ExecHandle> inner_;
    ContainerLifecycleManager::Lease lease_;
};

} // namespace

DockerBackend::DockerBackend(ContainerLifecycleManager& lifecycle, const Sandbox& sandbox)
    : lifecycle_(lifecycle)
    , sandbox_(sandbox)
{
}

BackendResult DockerBackend::lease(const UserContext& user, const InfoSink& info,
                                   ContainerLifecycleManager::Lease& out) {
    std::string host_mount = sandbox_.ensure_user_storage(user);
    if (host_mount.empty()) {
        return BackendResult::fail(ErrorKind::INFRASTRUCTURE,
            "Your storage folder could not be prepared.",
            "Contact support if this keeps happening.");
    }
    return lifecycle_.acquire(user, host_mount, info, out);
}

BackendResult DockerBackend::ensure_running(const UserContext& user, const InfoSink& info) {
    ContainerLifecycleManager::Lease held;
    return lease(user, info, held);
}

BackendResult DockerBackend::exec(const ExecRequest& request, const InfoSink& info,
                                  std::unique_ptr<ExecHandle>& handle) {
    ContainerLifecycleManager::Lease held;
    BackendResult r = lease(request.user, info, held);
    if (!r.success) return r;

    std::unique_ptr<ExecHandle> inner;
    r = lifecycle_.runtime().exec(held.container_name(), request.invocation_id,
                                  request.cwd, request.command, inner);
    if (!r.success) return r;

    LOG_DEBUG("[Docker] %s: %s", held.container_name().c_str(), resolved_command(request).c_str());
    handle.reset(new LeasedExecHandle(std::move(inner), std::move(held)));
    return BackendResult::ok();
}

BackendResult DockerBackend::stop(const UserContext& user) {
    return lifecycle_.stop(user.user_id);
}

bool DockerBackend::is_running(const UserContext& user) {
    return lifecycle_.is_running(user.user_id);
}

BackendResult DockerBackend::probe_directory(const UserContext& user, const std::string& logical_path,
                                             const InfoSink& info, bool& exists) {
    ContainerLifecycleManager::Lease held;
    BackendResult r = lease(user, info, held);
    if (!r.success) return r;
    return lifecycle_.runtime().probe_directory(held.container_name(), logical_path, exists);
}

size_t DockerBackend::reap_idle() {
    return lifecycle_.reap_idle(monotonic_ms());
}

} // namespace sandterm
