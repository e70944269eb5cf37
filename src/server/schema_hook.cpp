/*
 * sandterm C++ - Schema Change Hook Implementation
 */
#include <sandterm/server/schema_hook.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

static const char* const SCHEMA_COMMANDS[] = {
    // Laravel
    "php artisan migrate",
    "php artisan db:seed",
    "php artisan db:wipe",
    "php artisan schema:dump",
    // MySQL client
    "mysql ",
    "mysql -",
    // Composer (autoloaded migrations)
    "composer dump-autoload",
    // Node.js ORMs
    "npx prisma migrate",
    "npx prisma db push",
    "npm run migrate",
    "npx typeorm migration:run",
    "npx sequelize-cli db:migrate",
    "npx knex migrate:latest",
    NULL
};

bool detect_schema_change(const std::string& command, std::string& operation) {
    const std::string lower = to_lower(trim(command));
    if (lower.empty()) return false;

    bool matched = false;
    for (int i = 0; SCHEMA_COMMANDS[i] != NULL; ++i) {
        if (lower.find(SCHEMA_COMMANDS[i]) != std::string::npos) {
            matched = true;
            break;
        }
    }
    // Bare "mysql" has no trailing separator to match
    if (!matched && lower == "mysql") matched = true;
    if (!matched) return false;

    if (lower.find("migrate:fresh") != std::string::npos || lower.find("db:wipe") != std::string::npos) {
        operation = "wipe";
    } else if (lower.find("migrate:rollback") != std::string::npos ||
               lower.find("migrate:reset") != std::string::npos) {
        operation = "rollback";
    } else if (lower.find("migrat") != std::string::npos) {
        operation = "migrate";
    } else if (lower.find("seed") != std::string::npos) {
        operation = "seed";
    } else if (lower.find("mysql") != std::string::npos) {
        operation = "query";
    } else {
        operation = "unknown";
    }
    return true;
}

void LoggingSchemaChangeHook::on_schema_change(const SchemaChangeEvent& event) {
    LOG_INFO("[Schema] %s by user %s (site %s): %s", event.operation.c_str(),
             event.user.user_id.c_str(), event.site_id.empty() ? "-" : event.site_id.c_str(),
             event.command.c_str());
}

} // namespace sandterm
