/*
 * sandterm C++ - Session State Store
 *
 * One Session per live connection: its user, bound site, logical cwd and the
 * id of the invocation currently running (at most one). The cwd is always
 * inside the sandbox root; every change is re-resolved and probed in the
 * backend before it is committed.
 */
#ifndef sandterm_SESSION_SESSION_STORE_HPP
#define sandterm_SESSION_SESSION_STORE_HPP

#include <sandterm/core/types.hpp>
#include <sandterm/exec/backend.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace sandterm {

class SiteRegistry;

struct Session {
    std::string session_id;
    UserContext user;
    std::string site_id;            // Empty until bound
    std::string cwd;                // Logical, absolute
    std::string active_invocation;  // Empty when idle
    int64_t created_at;

    Session() : created_at(0) {}
};

// New cwd or a client-safe error
struct CwdResult {
    bool success;
    std::string cwd;
    ExecError error;

    CwdResult() : success(false) {}

    static CwdResult ok(const std::string& cwd) {
        CwdResult r;
        r.success = true;
        r.cwd = cwd;
        return r;
    }

    static CwdResult fail(ErrorKind kind, const std::string& message, const std::string& hint = "") {
        CwdResult r;
        r.error = ExecError(kind, message, hint);
        return r;
    }

    static CwdResult fail(const ExecError& error) {
        CwdResult r;
        r.error = error;
        return r;
    }
};

// Resolve a cd target against cwd without touching any filesystem.
//   ""/"~"       sandbox root
//   "~/x"        root-relative
//   ".."         one segment up, clamped at the root
//   "/abs"       allowed only inside the root
//   "rel"        joined to cwd
// Result is normalized (no repeated or trailing separators). False when the
// target escapes the root.
bool resolve_cd_target(const std::string& root, const std::string& cwd,
                       const std::string& target, std::string& resolved);

class SessionStore {
public:
    SessionStore(const std::string& sandbox_root, SiteRegistry* sites);

    // False when the id is already in use
    bool create(const std::string& session_id, const UserContext& user);

    // Removes the session; returns the id of the invocation it had running, if any
    std::string destroy(const std::string& session_id);

    bool get(const std::string& session_id, Session& out) const;

    // Empty string for an unknown session
    std::string get_cwd(const std::string& session_id) const;

    // Bind a site and reset cwd to the site's folder
    CwdResult set_site_binding(const std::string& session_id, const std::string& site_id);

    // Resolve, probe in the backend, then commit. cwd is unchanged on failure.
    CwdResult change_dir(const std::string& session_id, const std::string& target,
                         ExecutionBackend& backend, const InfoSink& info);

    // Mark an invocation as running. False (with the running id) when busy.
    bool try_begin(const std::string& session_id, const std::string& invocation_id,
                   std::string& running);

    // Clear the running invocation if it is still `invocation_id`
    void finish(const std::string& session_id, const std::string& invocation_id);

    size_t size() const;

    const std::string& sandbox_root() const { return root_; }

private:
    std::string root_;
    SiteRegistry* sites_;

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
};

} // namespace sandterm

#endif // sandterm_SESSION_SESSION_STORE_HPP
