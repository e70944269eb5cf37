/*
 * sandterm C++ - Schema Change Hook
 *
 * After a command exits 0, its text is matched against known migration /
 * seeding / database client commands. A match is reported to the client as
 * database_changed and handed to the registered hook, which forwards it to
 * whatever refreshes database views in the panel.
 */
#ifndef sandterm_SERVER_SCHEMA_HOOK_HPP
#define sandterm_SERVER_SCHEMA_HOOK_HPP

#include <sandterm/core/types.hpp>
#include <string>

namespace sandterm {

// True when `command` may modify a database schema. `operation` is one of
// wipe, rollback, migrate, seed, query, unknown.
bool detect_schema_change(const std::string& command, std::string& operation);

struct SchemaChangeEvent {
    UserContext user;
    std::string site_id;
    std::string command;
    std::string operation;
};

class SchemaChangeHook {
public:
    virtual ~SchemaChangeHook() {}

    virtual void on_schema_change(const SchemaChangeEvent& event) = 0;
};

class LoggingSchemaChangeHook : public SchemaChangeHook {
public:
    void on_schema_change(const SchemaChangeEvent& event);
};

} // namespace sandterm

#endif // sandterm_SERVER_SCHEMA_HOOK_HPP
