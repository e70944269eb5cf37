/*
 * sandterm C++ - SSH Execution Backend
 *
 * Runs commands on a remote host through the ssh client (key auth, BatchMode).
 * The logical sandbox root maps to <ssh.root>/<username> on that host.
 */
#ifndef sandterm_EXEC_SSH_BACKEND_HPP
#define sandterm_EXEC_SSH_BACKEND_HPP

#include <sandterm/exec/backend.hpp>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sandterm {

class Config;
class Sandbox;

struct SshSettings {
    std::string binary;
    std::string host;
    int port;
    std::string user;
    std::string root;
    std::string identity_file;

    SshSettings() : binary("ssh"), port(22), root("/home/sandterm") {}

    static SshSettings from_config(const Config& cfg);
};

class SshBackend : public ExecutionBackend {
public:
    SshBackend(const SshSettings& settings, const Sandbox& sandbox);

    const char* name() const { return "ssh"; }

    BackendResult ensure_running(const UserContext& user, const InfoSink& info);
    BackendResult exec(const ExecRequest& request, const InfoSink& info,
                       std::unique_ptr<ExecHandle>& handle);
    BackendResult stop(const UserContext& user);
    bool is_running(const UserContext& user);
    BackendResult probe_directory(const UserContext& user, const std::string& logical_path,
                                  const InfoSink& info, bool& exists);

    // ssh argv up to and including the destination
    std::vector<std::string> base_argv() const;

    std::string remote_root(const UserContext& user) const;

private:
    SshSettings settings_;
    const Sandbox& sandbox_;

    std::mutex prepared_mutex_;
    std::set<std::string> prepared_users_;
};

} // namespace sandterm

#endif // sandterm_EXEC_SSH_BACKEND_HPP
