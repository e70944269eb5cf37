/*
 * sandterm C++ - Identity Provider Implementation
 */
#include <sandterm/session/identity.hpp>
#include <sandterm/core/config.hpp>
#include <sandterm/core/sandbox.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

ConfigIdentityProvider::ConfigIdentityProvider(const Config& cfg) {
    Json tokens = cfg.get_json("identity.tokens");
    if (!tokens.is_object()) {
        LOG_WARN("[Identity] identity.tokens is empty; no client can connect");
        return;
    }

    for (auto it = tokens.begin(); it != tokens.end(); ++it) {
        const Json& entry = it.value();
        if (!entry.is_object() || !entry.contains("user_id") || !entry.contains("username") ||
            !entry["user_id"].is_string() || !entry["username"].is_string()) {
            LOG_WARN("[Identity] Skipping malformed identity entry");
            continue;
        }
        UserContext user(entry["user_id"].get<std::string>(), entry["username"].get<std::string>());
        if (!Sandbox::is_safe_username(user.username)) {
            LOG_WARN("[Identity] Skipping user %s: username is not usable as a folder name",
                     user.user_id.c_str());
            continue;
        }
        add(it.key(), user);
    }
    LOG_INFO("[Identity] %zu tokens loaded", users_.size());
}

void ConfigIdentityProvider::add(const std::string& token, const UserContext& user) {
    users_[sha256_hex(token)] = user;
}

bool ConfigIdentityProvider::resolve(const std::string& token, UserContext& user) {
    if (token.empty()) return false;
    auto it = users_.find(sha256_hex(token));
    if (it == users_.end()) {
        return false;
    }
    user = it->second;
    return true;
}

} // namespace sandterm
