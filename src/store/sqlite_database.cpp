#include "billguard/store/sqlite_database.hpp"

#include <stdexcept>
#include <utility>

namespace billguard::sqlite {

// ─────────────────────────────────────────────────────────────────────────────
// Statement
// ─────────────────────────────────────────────────────────────────────────────

void Statement::bind_text(int index, std::string_view value) {
    sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind_optional_text(int index, const std::optional<std::string>& value) {
    if (value) {
        bind_text(index, *value);
    } else {
        sqlite3_bind_null(stmt_, index);
    }
}

void Statement::bind_int64(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

void Statement::bind_optional_int64(int index, const std::optional<std::int64_t>& value) {
    if (value) {
        bind_int64(index, *value);
    } else {
        sqlite3_bind_null(stmt_, index);
    }
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> Statement::column_optional_text(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(col);
}

std::int64_t Statement::column_int64(int col) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

std::optional<std::int64_t> Statement::column_optional_int64(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_int64(col);
}

// ─────────────────────────────────────────────────────────────────────────────
// Database
// ─────────────────────────────────────────────────────────────────────────────

Database::Database(std::string path) : path_(std::move(path)) {
    const int rc = sqlite3_open_v2(
        path_.c_str(), &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr);

    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open " + path_ + ": " + msg);
    }

    if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot set busy timeout: " + msg);
    }

    for (const char* pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA synchronous=NORMAL;",
                               "PRAGMA foreign_keys=ON;"}) {
        auto result = exec(pragma);
        if (!result) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error("Cannot configure " + path_ + ": " + result.error().message);
        }
    }
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

StoreResult<void> Database::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        auto error = translate(rc);
        if (err) {
            error.message = err;
            sqlite3_free(err);
        }
        return tl::unexpected(std::move(error));
    }
    return {};
}

StoreResult<Statement> Database::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return tl::unexpected(translate(rc));
    }
    return Statement(db_, stmt);
}

StoreError Database::translate(int rc) const {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return StoreError::busy(std::move(msg));
        case SQLITE_CONSTRAINT:
            return StoreError::constraint_violation(std::move(msg));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
            return StoreError::io_error(std::move(msg));
        default:
            return StoreError::internal(std::move(msg));
    }
}

bool is_unique_violation(sqlite3* db, int rc) noexcept {
    if ((rc & 0xFF) != SQLITE_CONSTRAINT) {
        return false;
    }
    const int extended = sqlite3_extended_errcode(db);
    return extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY;
}

}  // namespace billguard::sqlite
