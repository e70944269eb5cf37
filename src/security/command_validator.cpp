/*
 * sandterm C++ - Command Validator Implementation
 */
#include <sandterm/security/command_validator.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

CommandValidator::CommandValidator(const PolicyTables& policy)
    : policy_(policy)
{
    // $VAR expansion, raw control characters, \xNN escapes, :(){ fork bombs
    dangerous_patterns_.push_back(std::regex("\\$[A-Za-z0-9_]+"));
    dangerous_patterns_.push_back(std::regex("[\\x01-\\x1F\\x7F]"));
    dangerous_patterns_.push_back(std::regex("\\\\x[0-9a-fA-F]{2}"));
    dangerous_patterns_.push_back(std::regex(":+\\(\\)\\s*\\{"));
}

ValidationResult CommandValidator::validate(const std::string& raw) const {
    const std::string command = trim(raw);

    if (command.empty()) {
        return ValidationResult::reject(RejectRule::EMPTY, "Invalid command: empty command");
    }
    if (command.size() > policy_.max_command_length) {
        return ValidationResult::reject(RejectRule::TOO_LONG,
            "Command too long (max " + std::to_string(policy_.max_command_length) + " chars)");
    }
    for (const auto& op : policy_.blocked_operators) {
        if (command.find(op) != std::string::npos) {
            LOG_DEBUG("[Validator] Blocked operator \"%s\"", op.c_str());
            return ValidationResult::reject(RejectRule::OPERATOR,
                "Operator not allowed: \"" + op + "\" - command chaining and redirection are disabled");
        }
    }

    const std::vector<std::string> parts = split_whitespace(command);
    const std::string primary = to_lower(parts[0]);

    if (policy_.absolute_blocklist.count(primary)) {
        LOG_DEBUG("[Validator] Blocked command \"%s\"", primary.c_str());
        return ValidationResult::reject(RejectRule::BLOCKED_COMMAND,
            "Command \"" + primary + "\" is blocked for system security", primary);
    }

    auto entry = policy_.allowlist.find(primary);
    if (entry == policy_.allowlist.end()) {
        return ValidationResult::reject(RejectRule::NOT_ALLOWED,
            "Command \"" + primary + "\" is not in the allowed list. Type \"help\" to see available commands.",
            primary);
    }

    if (entry->second.validate_subcommand && parts.size() > 1) {
        const std::string sub = to_lower(parts[1]);
        if (!policy_.allowed_git_subcommands.count(sub)) {
            std::vector<std::string> names(policy_.allowed_git_subcommands.begin(),
                                           policy_.allowed_git_subcommands.end());
            return ValidationResult::reject(RejectRule::SUBCOMMAND,
                "Subcommand \"" + primary + " " + sub + "\" is not allowed. Use: " + join(names, ", "),
                primary);
        }
    }

    const std::string lowered = to_lower(command);
    for (const auto& pattern : policy_.blocked_path_patterns) {
        if (lowered.find(to_lower(pattern)) != std::string::npos) {
            LOG_DEBUG("[Validator] Path escape \"%s\"", pattern.c_str());
            return ValidationResult::reject(RejectRule::BLOCKED_PATH,
                "Access to path \"" + pattern + "\" is not allowed - stay inside your project folder",
                primary);
        }
    }

    // NUL cannot be matched by std::regex reliably
    bool dangerous = command.find('\0') != std::string::npos;
    for (size_t i = 0; !dangerous && i < dangerous_patterns_.size(); ++i) {
        dangerous = std::regex_search(command, dangerous_patterns_[i]);
    }
    if (dangerous) {
        return ValidationResult::reject(RejectRule::DANGEROUS_PATTERN,
            "Command contains a dangerous pattern", primary);
    }

    return ValidationResult::allow(primary);
}

} // namespace sandterm
