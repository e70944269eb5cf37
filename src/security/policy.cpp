/*
 * sandterm C++ - Command Policy Tables
 */
#include <sandterm/security/policy.hpp>
#include <sandterm/core/config.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

PolicyTables PolicyTables::defaults() {
    PolicyTables p;

    // Navigation & file reading
    p.allowlist["ls"] = CommandPolicy("Navigation", "List directory");
    p.allowlist["pwd"] = CommandPolicy("Navigation", "Print working directory");
    p.allowlist["cd"] = CommandPolicy("Navigation", "Change directory (persistent, sandboxed)");
    p.allowlist["cat"] = CommandPolicy("Navigation", "Display file content");
    p.allowlist["head"] = CommandPolicy("Navigation", "Display first lines");
    p.allowlist["tail"] = CommandPolicy("Navigation", "Display last lines");
    p.allowlist["grep"] = CommandPolicy("Navigation", "Search pattern in files");
    p.allowlist["find"] = CommandPolicy("Navigation", "Find files");

    // Archives
    p.allowlist["zip"] = CommandPolicy("Archives", "Create zip archive");
    p.allowlist["unzip"] = CommandPolicy("Archives", "Extract zip archive");
    p.allowlist["tar"] = CommandPolicy("Archives", "Archive utility");

    // PHP
    p.allowlist["php"] = CommandPolicy("PHP", "PHP interpreter");
    p.allowlist["composer"] = CommandPolicy("PHP", "PHP package manager");

    // Node.js
    p.allowlist["node"] = CommandPolicy("Node.js", "Node.js runtime");
    p.allowlist["npm"] = CommandPolicy("Node.js", "Node package manager");
    p.allowlist["npx"] = CommandPolicy("Node.js", "Node package executor");
    p.allowlist["yarn"] = CommandPolicy("Node.js", "Yarn package manager");
    p.allowlist["pnpm"] = CommandPolicy("Node.js", "PNPM package manager");

    // Git
    p.allowlist["git"] = CommandPolicy("Git", "Version control", true);

    // Utility
    p.allowlist["echo"] = CommandPolicy("Utility", "Print text");
    p.allowlist["clear"] = CommandPolicy("Utility", "Clear terminal");
    p.allowlist["whoami"] = CommandPolicy("Utility", "Show current user");
    p.allowlist["date"] = CommandPolicy("Utility", "Show date/time");
    p.allowlist["which"] = CommandPolicy("Utility", "Locate command");
    p.allowlist["mkdir"] = CommandPolicy("Utility", "Create directory");
    p.allowlist["touch"] = CommandPolicy("Utility", "Create empty file");
    p.allowlist["cp"] = CommandPolicy("Utility", "Copy files");
    p.allowlist["mv"] = CommandPolicy("Utility", "Move/rename files");

    const char* git_subcommands[] = {
        "status", "log", "pull", "fetch", "checkout",
        "branch", "diff", "add", "commit", "stash",
        "push", "clone", "init", "remote", "merge",
        "rebase", "reset", "show", "tag", "config",
        NULL
    };
    for (int i = 0; git_subcommands[i] != NULL; ++i) {
        p.allowed_git_subcommands.insert(git_subcommands[i]);
    }

    // Checked by presence anywhere in the raw string
    const char* operators[] = {
        ";", "&&", "||", "|", ">", ">>", "<", "2>", "2>>", "&>", "`", "$(", "${", "&",
        NULL
    };
    for (int i = 0; operators[i] != NULL; ++i) {
        p.blocked_operators.push_back(operators[i]);
    }

    const char* blocked[] = {
        // Destructive
        "rm", "rmdir", "del", "erase", "shred", "dd",
        // Privilege escalation
        "sudo", "su", "runas", "login", "logout", "passwd", "chown", "chmod",
        // System / service
        "systemctl", "service", "reboot", "shutdown", "poweroff", "halt", "init",
        // Container / VM
        "docker", "docker-compose", "kubectl", "podman", "containerd",
        "vagrant", "virtualbox", "vmware",
        // Network tools
        "nmap", "nc", "netcat", "ncat", "telnet", "tcpdump", "wireshark",
        // Resource abuse
        "yes", "stress", "stress-ng", "fork",
        // Background / daemon
        "nohup", "screen", "tmux", "bg", "fg", "disown", "at", "cron", "crontab",
        // Filesystem
        "mount", "umount", "fdisk", "mkfs", "parted", "lsblk",
        // Download & execute
        "wget", "curl",
        // Shell bypass
        "bash", "sh", "zsh", "fish", "csh", "ksh", "eval", "exec",
        "powershell", "pwsh", "cmd",
        NULL
    };
    for (int i = 0; blocked[i] != NULL; ++i) {
        p.absolute_blocklist.insert(blocked[i]);
    }

    const char* paths[] = {
        "../", "..\\",
        "/etc/passwd", "/etc/shadow",
        "/root", "/proc", "/sys", "/dev", "/boot",
        "C:\\Windows", "C:\\Program", "C:\\Users\\Administrator",
        NULL
    };
    for (int i = 0; paths[i] != NULL; ++i) {
        p.blocked_path_patterns.push_back(paths[i]);
    }

    return p;
}

void PolicyTables::tighten(const Config& cfg) {
    for (const auto& cmd : cfg.get_string_list("policy.extra_blocked_commands")) {
        std::string name = to_lower(trim(cmd));
        if (name.empty()) continue;
        absolute_blocklist.insert(name);
        LOG_DEBUG("[Policy] Extra blocked command: %s", name.c_str());
    }

    for (const auto& pattern : cfg.get_string_list("policy.extra_blocked_paths")) {
        if (pattern.empty()) continue;
        blocked_path_patterns.push_back(pattern);
        LOG_DEBUG("[Policy] Extra blocked path pattern: %s", pattern.c_str());
    }

    int64_t limit = cfg.get_int("terminal.max_command_length", static_cast<int64_t>(max_command_length));
    if (limit > 0 && static_cast<size_t>(limit) < max_command_length) {
        max_command_length = static_cast<size_t>(limit);
    } else if (static_cast<size_t>(limit) > max_command_length) {
        LOG_WARN("[Policy] terminal.max_command_length=%lld ignored (ceiling is %zu)",
                 static_cast<long long>(limit), max_command_length);
    }

    LOG_INFO("[Policy] %zu allowed commands, %zu blocked commands, %zu blocked path patterns",
             allowlist.size(), absolute_blocklist.size(), blocked_path_patterns.size());
}

} // namespace sandterm
