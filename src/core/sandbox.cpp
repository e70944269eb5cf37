/*
 * sandterm C++ - Sandbox Layout and Landlock Jail Implementation
 *
 * Landlock is unprivileged (no root/capabilities needed) and available
 * since Linux 5.13. When unsupported the native backend refuses to run
 * unless native.landlock is disabled in config.
 */
#include <sandterm/core/sandbox.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <sys/stat.h>
#include <sys/prctl.h>
#include <unistd.h>
#include <fcntl.h>

// ============================================================================
// Landlock syscall wrappers (not in glibc until very recently)
// ============================================================================

#ifdef __linux__

#include <linux/landlock.h>
#include <sys/syscall.h>

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

// All filesystem access rights (Landlock ABI v1)
#define SANDTERM_LANDLOCK_FS_ALL ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_WRITE_FILE       | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         | \
    LANDLOCK_ACCESS_FS_REMOVE_DIR       | \
    LANDLOCK_ACCESS_FS_REMOVE_FILE      | \
    LANDLOCK_ACCESS_FS_MAKE_CHAR        | \
    LANDLOCK_ACCESS_FS_MAKE_DIR         | \
    LANDLOCK_ACCESS_FS_MAKE_REG         | \
    LANDLOCK_ACCESS_FS_MAKE_SOCK        | \
    LANDLOCK_ACCESS_FS_MAKE_FIFO        | \
    LANDLOCK_ACCESS_FS_MAKE_BLOCK       | \
    LANDLOCK_ACCESS_FS_MAKE_SYM         \
)

#define SANDTERM_LANDLOCK_FS_RO ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         \
)

static inline int landlock_create_ruleset(
    const struct landlock_ruleset_attr* attr,
    size_t size, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

static inline int landlock_add_rule(
    int ruleset_fd, enum landlock_rule_type type,
    const void* attr, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags));
}

static inline int landlock_restrict_self(int ruleset_fd, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_restrict_self, ruleset_fd, flags));
}

#endif // __linux__

namespace sandterm {

// ============================================================================
// Sandbox Implementation
// ============================================================================

Sandbox::Sandbox(const std::string& storage_root, const std::string& logical_root)
    : storage_root_(storage_root)
    , logical_root_(normalize_path(logical_root.empty() ? "/workspace" : logical_root))
{
    while (storage_root_.size() > 1 && storage_root_.back() == '/') {
        storage_root_.pop_back();
    }
    redacted_roots_.push_back(storage_root_);
}

bool Sandbox::init() {
    if (storage_root_.empty()) {
        LOG_ERROR("[Sandbox] storage_root is not configured");
        return false;
    }
    if (!create_directories(storage_root_, 0755)) {
        LOG_ERROR("[Sandbox] Failed to create storage root: %s (%s)",
                  storage_root_.c_str(), strerror(errno));
        return false;
    }

    LOG_INFO("[Sandbox] Landlock supported: %s", LandlockJail::supported() ? "yes" : "no");
    LOG_INFO("[Sandbox] Storage root: %s", storage_root_.c_str());
    LOG_INFO("[Sandbox] Logical root: %s", logical_root_.c_str());
    return true;
}

bool Sandbox::is_safe_username(const std::string& username) {
    if (username.empty() || username == "." || username == "..") return false;
    if (username.size() > 64) return false;
    for (char c : username) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

std::string Sandbox::ensure_user_storage(const UserContext& user) const {
    if (!is_safe_username(user.username)) {
        LOG_ERROR("[Sandbox] Refusing unsafe username for user %s", user.user_id.c_str());
        return "";
    }

    std::string path = join_path(storage_root_, user.username);
    if (!create_directories(path, 0755)) {
        LOG_ERROR("[Sandbox] Failed to create user storage %s (%s)",
                  path.c_str(), strerror(errno));
        return "";
    }
    return path;
}

std::string Sandbox::to_host_path(const std::string& host_root, const std::string& logical_path) const {
    std::string normalized = normalize_path(logical_path);
    if (!path_within(normalized, logical_root_)) {
        return "";
    }
    std::string rest = normalized.substr(logical_root_.size());
    if (rest.empty()) return host_root;
    return join_path(host_root, rest);
}

void Sandbox::add_redacted_root(const std::string& host_root) {
    if (!host_root.empty() && host_root != "/") {
        redacted_roots_.push_back(host_root);
    }
}

std::string Sandbox::redact(const std::string& message) const {
    std::string out = message;
    for (const auto& root : redacted_roots_) {
        if (root.empty() || root == "/") continue;
        // storage_root/<user> -> logical root; bare storage_root too
        size_t pos = 0;
        while ((pos = out.find(root, pos)) != std::string::npos) {
            size_t end = pos + root.size();
            if (end < out.size() && out[end] == '/') {
                // Skip the username segment that follows the storage root
                size_t seg_end = out.find('/', end + 1);
                size_t space = out.find_first_of(" \t\n'\":", end + 1);
                if (seg_end == std::string::npos || (space != std::string::npos && space < seg_end)) {
                    seg_end = space == std::string::npos ? out.size() : space;
                }
                end = seg_end;
            }
            out.replace(pos, end - pos, logical_root_);
            pos += logical_root_.size();
        }
    }
    return out;
}

// ============================================================================
// LandlockJail Implementation
// ============================================================================

LandlockJail::LandlockJail() : ruleset_fd_(-1) {}

LandlockJail::~LandlockJail() {
    if (ruleset_fd_ >= 0) {
        close(ruleset_fd_);
    }
}

bool LandlockJail::supported() {
#ifdef __linux__
    struct landlock_ruleset_attr attr;
    memset(&attr, 0, sizeof(attr));
    attr.handled_access_fs = SANDTERM_LANDLOCK_FS_ALL;
    int fd = landlock_create_ruleset(&attr, sizeof(attr), 0);
    if (fd >= 0) {
        close(fd);
        return true;
    }
#endif
    return false;
}

void LandlockJail::allow_rw(const std::string& path) {
    rw_paths_.push_back(path);
}

void LandlockJail::allow_ro(const std::string& path) {
    ro_paths_.push_back(path);
}

void LandlockJail::allow_system_defaults() {
    const char* readonly_dirs[] = {
        "/usr", "/lib", "/lib64", "/bin", "/sbin",
        "/etc",       // DNS resolution, SSL certs, timezone
        "/dev",       // /dev/null, /dev/urandom
        "/proc",
        NULL
    };
    for (int i = 0; readonly_dirs[i] != NULL; ++i) {
        allow_ro(readonly_dirs[i]);
    }
    allow_rw("/tmp");
}

bool LandlockJail::prepare() {
#ifndef __linux__
    LOG_WARN("[Landlock] Only available on Linux");
    return false;
#else
    if (ruleset_fd_ >= 0) return true;

    struct landlock_ruleset_attr ruleset_attr;
    memset(&ruleset_attr, 0, sizeof(ruleset_attr));
    ruleset_attr.handled_access_fs = SANDTERM_LANDLOCK_FS_ALL;

    int ruleset_fd = landlock_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0);
    if (ruleset_fd < 0) {
        LOG_ERROR("[Landlock] Failed to create ruleset: %s", strerror(errno));
        return false;
    }

    auto add_rule = [&](const std::string& dir_path, __u64 access) -> bool {
        int dir_fd = open(dir_path.c_str(), O_PATH | O_CLOEXEC);
        if (dir_fd < 0) {
            return false;
        }

        struct landlock_path_beneath_attr path_attr;
        memset(&path_attr, 0, sizeof(path_attr));
        path_attr.allowed_access = access;
        path_attr.parent_fd = dir_fd;

        int ret = landlock_add_rule(ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &path_attr, 0);
        close(dir_fd);
        return ret == 0;
    };

    for (const auto& path : rw_paths_) {
        if (!add_rule(path, SANDTERM_LANDLOCK_FS_ALL)) {
            if (path == "/tmp") continue;
            LOG_ERROR("[Landlock] Cannot add R/W rule for '%s': %s", path.c_str(), strerror(errno));
            close(ruleset_fd);
            return false;
        }
    }
    for (const auto& path : ro_paths_) {
        // Missing system directories (e.g. /lib64) are not fatal
        add_rule(path, SANDTERM_LANDLOCK_FS_RO);
    }

    ruleset_fd_ = ruleset_fd;
    return true;
#endif
}

int LandlockJail::apply_in_child() const {
#ifdef __linux__
    if (ruleset_fd_ < 0) return -1;
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) return -1;
    if (landlock_restrict_self(ruleset_fd_, 0) < 0) return -1;
    return 0;
#else
    return -1;
#endif
}

} // namespace sandterm
