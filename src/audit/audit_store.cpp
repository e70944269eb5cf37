/*
 * sandterm C++ - Audit Store Implementation
 */
#include <sandterm/audit/audit_store.hpp>
#include <sandterm/storage/database.hpp>
#include <sandterm/core/logger.hpp>

namespace sandterm {

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

SqliteAuditStore::SqliteAuditStore(Database& db) : db_(db) {}

bool SqliteAuditStore::ensure_schema() {
    bool ok = db_.exec_sql(
        "CREATE TABLE IF NOT EXISTS terminal_audit ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  invocation_id TEXT DEFAULT '',"
        "  user_id TEXT NOT NULL,"
        "  site_id TEXT DEFAULT '',"
        "  command TEXT NOT NULL,"
        "  backend TEXT DEFAULT '',"
        "  status TEXT NOT NULL,"
        "  error TEXT DEFAULT '',"
        "  exit_code INTEGER DEFAULT -1,"
        "  executed_at INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;

    db_.exec_sql("CREATE INDEX IF NOT EXISTS idx_audit_user ON terminal_audit(user_id, executed_at)");
    db_.exec_sql("CREATE INDEX IF NOT EXISTS idx_audit_status ON terminal_audit(status)");

    // Append-only, enforced by the database
    db_.exec_sql(
        "CREATE TRIGGER IF NOT EXISTS terminal_audit_no_update BEFORE UPDATE ON terminal_audit "
        "BEGIN SELECT RAISE(ABORT, 'terminal_audit is append-only'); END"
    );
    db_.exec_sql(
        "CREATE TRIGGER IF NOT EXISTS terminal_audit_no_delete BEFORE DELETE ON terminal_audit "
        "BEGIN SELECT RAISE(ABORT, 'terminal_audit is append-only'); END"
    );

    LOG_DEBUG("[Audit] Schema ready");
    return true;
}

bool SqliteAuditStore::append(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(db_.mutex());
    sqlite3* db = db_.handle();
    if (!db) return false;

    const char* sql =
        "INSERT INTO terminal_audit "
        "(invocation_id, user_id, site_id, command, backend, status, error, exit_code, executed_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Audit] append prepare failed: %s", sqlite3_errmsg(db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, record.invocation_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.site_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, record.command.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, record.backend.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, record.status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, record.error.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 8, record.exit_code);
    sqlite3_bind_int64(stmt, 9, record.executed_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("[Audit] append step failed: %s", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

std::vector<AuditRecord> SqliteAuditStore::recent(const std::string& user_id, int limit) {
    std::vector<AuditRecord> results;
    std::lock_guard<std::mutex> lock(db_.mutex());
    sqlite3* db = db_.handle();
    if (!db) return results;

    std::string sql =
        "SELECT invocation_id, user_id, site_id, command, backend, status, error, exit_code, executed_at "
        "FROM terminal_audit ";
    if (!user_id.empty()) {
        sql += "WHERE user_id = ? ";
    }
    sql += "ORDER BY id DESC LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Audit] recent prepare failed: %s", sqlite3_errmsg(db));
        return results;
    }

    int idx = 1;
    if (!user_id.empty()) {
        sqlite3_bind_text(stmt, idx++, user_id.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(stmt, idx, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AuditRecord r;
        r.invocation_id = column_text(stmt, 0);
        r.user_id = column_text(stmt, 1);
        r.site_id = column_text(stmt, 2);
        r.command = column_text(stmt, 3);
        r.backend = column_text(stmt, 4);
        r.status = column_text(stmt, 5);
        r.error = column_text(stmt, 6);
        r.exit_code = sqlite3_column_int(stmt, 7);
        r.executed_at = sqlite3_column_int64(stmt, 8);
        results.push_back(r);
    }
    sqlite3_finalize(stmt);
    return results;
}

int64_t SqliteAuditStore::count() {
    std::lock_guard<std::mutex> lock(db_.mutex());
    sqlite3* db = db_.handle();
    if (!db) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM terminal_audit", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("[Audit] count prepare failed: %s", sqlite3_errmsg(db));
        return 0;
    }
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}

} // namespace sandterm
