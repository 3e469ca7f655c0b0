#pragma once
#include <string>
#include <cstdint>
#include <sqlite3.h>

namespace queuectl {

// One SQLite connection. Opening creates the file, switches it to WAL and
// makes sure the jobs/config schema exists.
class Database {
public:
    explicit Database(const std::string& db_path, int busy_timeout_ms = 10000);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    void exec(const char* sql);
    int changes() const { return sqlite3_changes(db_); }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    void init_schema();
};

class Statement {
public:
    Statement(Database& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int idx, const std::string& value);
    void bind_int64(int idx, int64_t value);
    void bind_null(int idx);

    // true while a row is available, false once done
    bool step();

    int64_t column_int64(int col) const;
    std::string column_text(int col) const;
    bool column_is_null(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE takes the write lock up front, so two transactions never
// both read the same pending row and then race to update it.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

// Maps an sqlite result code onto StoreBusyError / StoreConstraintError / StoreError.
[[noreturn]] void throw_sqlite_error(sqlite3* db, int rc, const std::string& what);

} // namespace queuectl
