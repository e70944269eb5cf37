/*
 * sandterm C++ - Sandbox Layout and Landlock Jail
 *
 * Sandbox owns the host-side storage layout: one directory per username
 * under storage_root, mapped to the logical sandbox root ("/workspace")
 * that users see. It also rewrites outgoing messages so host paths never
 * reach a client.
 *
 * LandlockJail restricts a single child process (native backend) to its
 * user's storage directory plus read-only system directories. The ruleset
 * is built in the parent; the child only calls prctl + restrict_self,
 * both async-signal-safe, between fork() and exec().
 */
#ifndef sandterm_CORE_SANDBOX_HPP
#define sandterm_CORE_SANDBOX_HPP

#include <sandterm/core/types.hpp>
#include <string>
#include <vector>

namespace sandterm {

class Sandbox {
public:
    Sandbox(const std::string& storage_root, const std::string& logical_root);

    // Create storage_root. Must be called before any user directory is requested.
    bool init();

    const std::string& storage_root() const { return storage_root_; }
    const std::string& logical_root() const { return logical_root_; }

    // Usernames become directory names: [A-Za-z0-9._-], not "." or ".."
    static bool is_safe_username(const std::string& username);

    // storage_root/<username>, created on demand. Empty string on failure.
    std::string ensure_user_storage(const UserContext& user) const;

    // Map a logical path ("/workspace/site/src") onto a host directory that
    // plays the role of the logical root. Returns empty when the logical path
    // is outside the logical root.
    std::string to_host_path(const std::string& host_root, const std::string& logical_path) const;

    // Register another host root whose occurrences must be hidden from clients
    void add_redacted_root(const std::string& host_root);

    // Replace host roots in a client-bound message with the logical root
    std::string redact(const std::string& message) const;

private:
    std::string storage_root_;
    std::string logical_root_;
    std::vector<std::string> redacted_roots_;
};

class LandlockJail {
public:
    LandlockJail();
    ~LandlockJail();

    // Whether this kernel accepts Landlock rulesets
    static bool supported();

    void allow_rw(const std::string& path);
    void allow_ro(const std::string& path);

    // Allow the usual system directories read-only and /tmp read-write
    void allow_system_defaults();

    // Build the ruleset in the parent. False when Landlock is unavailable
    // or a read-write rule could not be added.
    bool prepare();

    bool prepared() const { return ruleset_fd_ >= 0; }

    // Called in the forked child only. Returns 0 on success, -1 on failure.
    int apply_in_child() const;

private:
    LandlockJail(const LandlockJail&);
    LandlockJail& operator=(const LandlockJail&);

    std::vector<std::string> rw_paths_;
    std::vector<std::string> ro_paths_;
    int ruleset_fd_;
};

} // namespace sandterm

#endif // sandterm_CORE_SANDBOX_HPP
