/*
 * sandterm C++ - Native Execution Backend
 *
 * Same-host execution for machines without a container engine. The logical
 * sandbox root maps to storage_root/<username>; each child is jailed there
 * with Landlock (system directories read-only) before exec.
 */
#ifndef sandterm_EXEC_NATIVE_BACKEND_HPP
#define sandterm_EXEC_NATIVE_BACKEND_HPP

#include <sandterm/exec/backend.hpp>

namespace sandterm {

class Sandbox;

class NativeBackend : public ExecutionBackend {
public:
    NativeBackend(const Sandbox& sandbox, bool use_landlock);

    const char* name() const { return "native"; }

    BackendResult ensure_running(const UserContext& user, const InfoSink& info);
    BackendResult exec(const ExecRequest& request, const InfoSink& info,
                       std::unique_ptr<ExecHandle>& handle);
    BackendResult stop(const UserContext& user);
    bool is_running(const UserContext& user);
    BackendResult probe_directory(const UserContext& user, const std::string& logical_path,
                                  const InfoSink& info, bool& exists);

private:
    BackendResult user_root(const UserContext& user, std::string& host_root);

    const Sandbox& sandbox_;
    bool use_landlock_;
};

} // namespace sandterm

#endif // sandterm_EXEC_NATIVE_BACKEND_HPP
