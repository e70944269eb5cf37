/*
 * sandterm C++ - Command Validator
 *
 * Decides allow/deny for a raw user-typed command string. Pure function of
 * the input and the policy tables: no I/O, no state.
 *
 * Rules, first match wins:
 *   1. empty / too long
 *   2. any blocked operator anywhere in the string
 *   3. primary command in the absolute blocklist
 *   4. primary command missing from the allowlist
 *   5. subcommand check (git)
 *   6. blocked path substrings, dangerous patterns
 */
#ifndef sandterm_SECURITY_COMMAND_VALIDATOR_HPP
#define sandterm_SECURITY_COMMAND_VALIDATOR_HPP

#include <sandterm/security/policy.hpp>
#include <string>
#include <vector>
#include <regex>

namespace sandterm {

enum class RejectRule {
    NONE,
    EMPTY,
    TOO_LONG,
    OPERATOR,
    BLOCKED_COMMAND,
    NOT_ALLOWED,
    SUBCOMMAND,
    BLOCKED_PATH,
    DANGEROUS_PATTERN
};

struct ValidationResult {
    bool allowed;
    RejectRule rule;
    std::string reason;     // Client-facing rejection text
    std::string primary;    // Lowercased first token (empty for EMPTY)

    ValidationResult() : allowed(false), rule(RejectRule::NONE) {}

    static ValidationResult allow(const std::string& primary) {
        ValidationResult r;
        r.allowed = true;
        r.primary = primary;
        return r;
    }

    static ValidationResult reject(RejectRule rule, const std::string& reason,
                                   const std::string& primary = "") {
        ValidationResult r;
        r.allowed = false;
        r.rule = rule;
        r.reason = reason;
        r.primary = primary;
        return r;
    }
};

class CommandValidator {
public:
    explicit CommandValidator(const PolicyTables& policy);

    ValidationResult validate(const std::string& raw) const;

    const PolicyTables& policy() const { return policy_; }

private:
    PolicyTables policy_;
    std::vector<std::regex> dangerous_patterns_;
};

} // namespace sandterm

#endif // sandterm_SECURITY_COMMAND_VALIDATOR_HPP
