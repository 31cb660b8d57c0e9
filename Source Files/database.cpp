#include <filesystem>

#include "database.h"

Database::Database(const std::string& filename) : path_(filename) {
    // Create the parent directory for file-backed databases
    if (filename != ":memory:" && !filename.empty()) {
        const std::filesystem::path parent = std::filesystem::path(filename).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("Failed to create database directory " + parent.string() + ": " + ec.message());
            }
        }
    }

    sqlite3* db_raw = nullptr;
    const int result = sqlite3_open(filename.c_str(), &db_raw);

    if (result != SQLITE_OK) {
        const std::string error_msg = db_raw ? sqlite3_errmsg(db_raw) : "unknown error";
        if (db_raw) sqlite3_close(db_raw);
        throw std::runtime_error("Failed to open database: " + error_msg);
    }

    db_.reset(db_raw);

    execute("PRAGMA foreign_keys = ON;");
    execute("PRAGMA journal_mode = WAL;");
}

void Database::execute(const std::string& sql) const {
    char* error = nullptr;
    if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        const std::string message = error ? error : errorMessage();
        sqlite3_free(error);
        throw std::runtime_error("SQLite exec failed: " + message);
    }
}

StatementPtr Database::prepare(const std::string& sql) const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("SQLite prepare failed: " + errorMessage());
    }
    return StatementPtr(stmt, sqlite3_finalize);
}

void Database::stepDone(sqlite3_stmt* stmt) const {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error("SQLite step failed: " + errorMessage());
    }
}

sqlite3_int64 Database::lastInsertId() const {
    return sqlite3_last_insert_rowid(db_.get());
}

int Database::changes() const {
    return sqlite3_changes(db_.get());
}

std::string Database::errorMessage() const {
    return db_ ? sqlite3_errmsg(db_.get()) : "database is not open";
}
