/*
 * sandterm C++ - Audit Store
 *
 * Append-only record of execution attempts. Rows are never updated.
 */
#ifndef sandterm_AUDIT_AUDIT_STORE_HPP
#define sandterm_AUDIT_AUDIT_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace sandterm {

class Database;

struct AuditRecord {
    std::string invocation_id;
    std::string user_id;
    std::string site_id;
    std::string command;        // Raw text as typed
    std::string backend;
    std::string status;         // outcome_name(): success, failure, timeout, canceled, rejected
    std::string error;          // Empty on success
    int exit_code;              // -1 when the process never exited normally
    int64_t executed_at;        // Unix ms

    AuditRecord() : exit_code(-1), executed_at(0) {}
};

class AuditSink {
public:
    virtual ~AuditSink() {}

    virtual bool append(const AuditRecord& record) = 0;
};

class SqliteAuditStore : public AuditSink {
public:
    explicit SqliteAuditStore(Database& db);

    bool ensure_schema();

    bool append(const AuditRecord& record);

    // Newest first; empty user_id lists every user
    std::vector<AuditRecord> recent(const std::string& user_id, int limit);

    int64_t count();

private:
    Database& db_;
};

} // namespace sandterm

#endif // sandterm_AUDIT_AUDIT_STORE_HPP
