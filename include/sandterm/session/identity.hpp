/*
 * sandterm C++ - Identity Provider
 *
 * Resolves the token a client presents in its hello frame to a user.
 * Authentication proper belongs to the hosting panel; ConfigIdentityProvider
 * reads a static token table ("identity.tokens") that the panel provisions.
 */
#ifndef sandterm_SESSION_IDENTITY_HPP
#define sandterm_SESSION_IDENTITY_HPP

#include <sandterm/core/types.hpp>
#include <map>
#include <string>

namespace sandterm {

class Config;

class IdentityProvider {
public:
    virtual ~IdentityProvider() {}

    virtual bool resolve(const std::string& token, UserContext& user) = 0;
};

class ConfigIdentityProvider : public IdentityProvider {
public:
    // identity.tokens: { "<token>": { "user_id": "...", "username": "..." } }
    explicit ConfigIdentityProvider(const Config& cfg);

    bool resolve(const std::string& token, UserContext& user);

    void add(const std::string& token, const UserContext& user);
    size_t size() const { return users_.size(); }

private:
    // Keyed by SHA-256 of the token
    std::map<std::string, UserContext> users_;
};

} // namespace sandterm

#endif // sandterm_SESSION_IDENTITY_HPP
