/*
 * sandterm C++ - Site Registry Implementation
 */
#include <sandterm/session/site_registry.hpp>
#include <sandterm/storage/database.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

namespace sandterm {

bool is_safe_folder_name(const std::string& name) {
    if (name.empty() || name == "." || name == ".." || name.size() > 255) return false;
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0' || static_cast<unsigned char>(c) < 0x20) {
            return false;
        }
    }
    return true;
}

SqliteSiteRegistry::SqliteSiteRegistry(Database& db) : db_(db) {}

bool SqliteSiteRegistry::ensure_schema() {
    bool ok = db_.exec_sql(
        "CREATE TABLE IF NOT EXISTS sites ("
        "  id TEXT PRIMARY KEY,"
        "  user_id TEXT NOT NULL,"
        "  name TEXT NOT NULL"
        ")"
    );
    if (!ok) return false;
    db_.exec_sql("CREATE INDEX IF NOT EXISTS idx_sites_user ON sites(user_id)");
    return true;
}

bool SqliteSiteRegistry::lookup(const std::string& site_id, const std::string& user_id,
                                std::string& folder) {
    std::lock_guard<std::mutex> lock(db_.mutex());
    sqlite3* db = db_.handle();
    if (!db) return false;

    const char* sql = "SELECT name FROM sites WHERE id = ? AND user_id = ?";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Sites] lookup prepare failed: %s", sqlite3_errmsg(db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, site_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, user_id.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        std::string name = text ? reinterpret_cast<const char*>(text) : "";
        if (is_safe_folder_name(name)) {
            folder = name;
            found = true;
        } else {
            LOG_WARN("[Sites] Site %s has an unusable folder name", site_id.c_str());
        }
    } else if (rc != SQLITE_DONE) {
        LOG_ERROR("[Sites] lookup step failed: %s", sqlite3_errmsg(db));
    }
    sqlite3_finalize(stmt);
    return found;
}

bool SqliteSiteRegistry::upsert_site(const std::string& site_id, const std::string& user_id,
                                     const std::string& name) {
    if (!is_safe_folder_name(name)) {
        LOG_ERROR("[Sites] Refusing folder name for site %s", site_id.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(db_.mutex());
    sqlite3* db = db_.handle();
    if (!db) return false;

    const char* sql = "INSERT OR REPLACE INTO sites (id, user_id, name) VALUES (?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Sites] upsert prepare failed: %s", sqlite3_errmsg(db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, site_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, name.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("[Sites] upsert step failed: %s", sqlite3_errmsg(db));
        return false;
    }
    LOG_DEBUG("[Sites] Site %s -> %s (user %s)", site_id.c_str(), name.c_str(), user_id.c_str());
    return true;
}

} // namespace sandterm
