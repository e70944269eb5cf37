/*
 * sandterm C++ - SQLite Database Implementation
 */
#include <sandterm/storage/database.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

Database::Database() : db_(nullptr) {}

Database::~Database() {
    close();
}

bool Database::open(const std::string& db_path) {
    if (db_) {
        close();
    }

    // ":memory:" has no directory
    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        LOG_ERROR("[Database] Failed to create parent directory for '%s'", db_path.c_str());
        return false;
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Database] Failed to open database '%s': %s",
                  db_path.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL lets the site lookups read while the audit writer appends
    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=NORMAL");
    exec_sql("PRAGMA busy_timeout=5000");

    path_ = db_path;
    LOG_INFO("[Database] Opened: %s", db_path.c_str());
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::exec_sql(const std::string& sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        LOG_ERROR("[Database] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }

    return true;
}

} // namespace sandterm
