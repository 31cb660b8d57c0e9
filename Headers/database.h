#pragma once
#include <sqlite3.h>
#include <memory>
#include <stdexcept>
#include <string>

// Owning handle for prepared statements
using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

class Database {
public:
    // Constructor that opens (or creates) the database and applies connection pragmas
    explicit Database(const std::string& filename);

    // Disable copy semantics
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Enable move semantics
    Database(Database&&) = default;
    Database& operator=(Database&&) = default;

    // Implicit conversion to sqlite3* for compatibility with SQLite C API
    operator sqlite3* () const { return db_.get(); }

    // Explicit getter for the raw sqlite3* pointer
    sqlite3* get() const { return db_.get(); }

    // Check whether the database connection is valid
    bool is_valid() const { return db_ != nullptr; }

    // Execute one or more statements without result rows
    void execute(const std::string& sql) const;

    // Prepare a statement, throws on failure
    StatementPtr prepare(const std::string& sql) const;

    // Step a statement that returns no rows, throws unless it reports SQLITE_DONE
    void stepDone(sqlite3_stmt* stmt) const;

    // Row id of the most recent successful INSERT
    sqlite3_int64 lastInsertId() const;

    // Number of rows modified by the most recent statement
    int changes() const;

    // Last error message reported by SQLite
    std::string errorMessage() const;

    const std::string& path() const { return path_; }

private:
    struct Deleter {
        void operator()(sqlite3* db) const {
            if (db) sqlite3_close(db);
        }
    };

    std::unique_ptr<sqlite3, Deleter> db_;
    std::string path_;
};
