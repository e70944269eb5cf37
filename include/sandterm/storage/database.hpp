/*
 * sandterm C++ - SQLite Database
 *
 * Owns the sqlite3 handle shared by the audit store and the site registry.
 * Each store creates its own tables through ensure_schema().
 */
#ifndef sandterm_STORAGE_DATABASE_HPP
#define sandterm_STORAGE_DATABASE_HPP

#include <mutex>
#include <string>
#include <sqlite3.h>

namespace sandterm {

class Database {
public:
    Database();
    ~Database();

    // Opens (creating parent directories) and applies WAL pragmas
    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool exec_sql(const std::string& sql);

    // Statements must be prepared, stepped and finalized while holding mutex()
    sqlite3* handle() { return db_; }
    std::mutex& mutex() { return mutex_; }

    const std::string& path() const { return path_; }

private:
    Database(const Database&);
    Database& operator=(const Database&);

    sqlite3* db_;
    std::string path_;
    std::mutex mutex_;
};

} // namespace sandterm

#endif // sandterm_STORAGE_DATABASE_HPP
