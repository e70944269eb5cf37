/*
 * sandterm C++ - Command Policy Tables
 *
 * Process-wide, loaded once at startup and read-only afterwards:
 *   allowlist            primary command -> metadata (deny by default)
 *   absolute_blocklist   never permitted, wins over the allowlist
 *   blocked_operators    chaining / redirection / substitution tokens
 *   blocked_path_patterns substrings matched case-insensitively
 *   allowed_git_subcommands
 */
#ifndef sandterm_SECURITY_POLICY_HPP
#define sandterm_SECURITY_POLICY_HPP

#include <string>
#include <vector>
#include <map>
#include <set>

namespace sandterm {

class Config;

struct CommandPolicy {
    std::string group;              // Shown by the "help" builtin
    std::string description;
    bool validate_subcommand;       // Only git today

    CommandPolicy() : validate_subcommand(false) {}
    CommandPolicy(const std::string& g, const std::string& d, bool sub = false)
        : group(g), description(d), validate_subcommand(sub) {}
};

struct PolicyTables {
    std::map<std::string, CommandPolicy> allowlist;
    std::set<std::string> absolute_blocklist;
    std::vector<std::string> blocked_operators;
    std::vector<std::string> blocked_path_patterns;
    std::set<std::string> allowed_git_subcommands;
    size_t max_command_length;

    PolicyTables() : max_command_length(1000) {}

    // The canonical policy
    static PolicyTables defaults();

    // Apply deny-only overrides from config:
    //   policy.extra_blocked_commands, policy.extra_blocked_paths,
    //   terminal.max_command_length (may only shrink)
    void tighten(const Config& cfg);
};

} // namespace sandterm

#endif // sandterm_SECURITY_POLICY_HPP
