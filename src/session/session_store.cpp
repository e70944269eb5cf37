/*
 * sandterm C++ - Session State Store Implementation
 */
#include <sandterm/session/session_store.hpp>
#include <sandterm/session/site_registry.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

bool resolve_cd_target(const std::string& root, const std::string& cwd,
                       const std::string& target, std::string& resolved) {
    const std::string t = trim(target);
    std::string candidate;

    if (t.empty() || t == "~") {
        resolved = root;
        return true;
    }

    if (t == "..") {
        if (cwd == root || !path_within(cwd, root)) {
            resolved = root;
            return true;
        }
        size_t slash = cwd.rfind('/');
        candidate = slash == 0 ? "/" : cwd.substr(0, slash);
        resolved = path_within(candidate, root) ? candidate : root;
        return true;
    }

    if (starts_with(t, "~/")) {
        candidate = join_path(root, t.substr(2));
    } else if (t[0] == '/') {
        candidate = t;
    } else {
        candidate = join_path(cwd, t);
    }

    candidate = normalize_path(candidate);
    if (!path_within(candidate, root)) {
        return false;
    }
    resolved = candidate;
    return true;
}

SessionStore::SessionStore(const std::string& sandbox_root, SiteRegistry* sites)
    : root_(normalize_path(sandbox_root.empty() ? "/workspace" : sandbox_root))
    , sites_(sites)
{
}

bool SessionStore::create(const std::string& session_id, const UserContext& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session_id)) {
        return false;
    }

    Session s;
    s.session_id = session_id;
    s.user = user;
    s.cwd = root_;
    s.created_at = current_timestamp_ms();
    sessions_[session_id] = s;

    LOG_DEBUG("[Session] Created %s for user %s", session_id.c_str(), user.user_id.c_str());
    return true;
}

std::string SessionStore::destroy(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return "";
    }
    std::string active = it->second.active_invocation;
    sessions_.erase(it);

    LOG_DEBUG("[Session] Destroyed %s%s", session_id.c_str(),
              active.empty() ? "" : " (invocation still running)");
    return active;
}

bool SessionStore::get(const std::string& session_id, Session& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

std::string SessionStore::get_cwd(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? std::string() : it->second.cwd;
}

CwdResult SessionStore::set_site_binding(const std::string& session_id, const std::string& site_id) {
    Session session;
    if (!get(session_id, session)) {
        return CwdResult::fail(ErrorKind::VALIDATION, "Session not found");
    }
    if (!sites_) {
        return CwdResult::fail(ErrorKind::INFRASTRUCTURE, "Site registry is not available");
    }

    std::string folder;
    if (!sites_->lookup(site_id, session.user.user_id, folder)) {
        return CwdResult::fail(ErrorKind::VALIDATION, "Site not found");
    }

    std::string cwd = normalize_path(join_path(root_, folder));
    if (!path_within(cwd, root_) || cwd == root_) {
        return CwdResult::fail(ErrorKind::VALIDATION, "Site not found");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return CwdResult::fail(ErrorKind::VALIDATION, "Session not found");
    }
    it->second.site_id = site_id;
    it->second.cwd = cwd;
    LOG_DEBUG("[Session] %s bound to site %s (%s)", session_id.c_str(), site_id.c_str(), cwd.c_str());
    return CwdResult::ok(cwd);
}

CwdResult SessionStore::change_dir(const std::string& session_id, const std::string& target,
                                   ExecutionBackend& backend, const InfoSink& info) {
    Session session;
    if (!get(session_id, session)) {
        return CwdResult::fail(ErrorKind::VALIDATION, "Session not found");
    }

    std::string resolved;
    if (!resolve_cd_target(root_, session.cwd, target, resolved)) {
        LOG_DEBUG("[Session] cd \"%s\" escapes %s", target.c_str(), root_.c_str());
        return CwdResult::fail(ErrorKind::VALIDATION,
                               "Access denied: Can only navigate within " + root_);
    }

    bool exists = false;
    BackendResult probe = backend.probe_directory(session.user, resolved, info, exists);
    if (!probe.success) {
        return CwdResult::fail(probe.error);
    }
    if (!exists) {
        return CwdResult::fail(ErrorKind::VALIDATION, "Directory not found: " + trim(target));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return CwdResult::fail(ErrorKind::VALIDATION, "Session not found");
    }
    it->second.cwd = resolved;
    return CwdResult::ok(resolved);
}

bool SessionStore::try_begin(const std::string& session_id, const std::string& invocation_id,
                             std::string& running) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        running.clear();
        return false;
    }
    if (!it->second.active_invocation.empty()) {
        running = it->second.active_invocation;
        return false;
    }
    it->second.active_invocation = invocation_id;
    return true;
}

void SessionStore::finish(const std::string& session_id, const std::string& invocation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && it->second.active_invocation == invocation_id) {
        it->second.active_invocation.clear();
    }
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace sandterm
