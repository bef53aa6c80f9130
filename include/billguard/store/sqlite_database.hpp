#pragma once

#include "billguard/store/store_error.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace billguard::sqlite {

// ─────────────────────────────────────────────────────────────────────────────
// Statement: RAII over sqlite3_stmt*
// ─────────────────────────────────────────────────────────────────────────────

class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}

    Statement(Statement&& other) noexcept
        : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

    Statement& operator=(Statement&&) = delete;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    void bind_text(int index, std::string_view value);
    void bind_optional_text(int index, const std::optional<std::string>& value);
    void bind_int64(int index, std::int64_t value);
    void bind_optional_int64(int index, const std::optional<std::int64_t>& value);

    /// SQLITE_ROW, SQLITE_DONE or an error code
    [[nodiscard]] int step() noexcept { return sqlite3_step(stmt_); }

    [[nodiscard]] std::string column_text(int col) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int col) const;
    [[nodiscard]] std::int64_t column_int64(int col) const;
    [[nodiscard]] std::optional<std::int64_t> column_optional_int64(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Database: RAII over sqlite3*
// ─────────────────────────────────────────────────────────────────────────────
// Opened with WAL journaling and a busy timeout so concurrent writers from
// other processes wait for the lock instead of failing immediately.

class Database {
public:
    static constexpr int kBusyTimeoutMs = 5000;

    /// Throws std::runtime_error if the file cannot be opened or configured
    explicit Database(std::string path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] sqlite3* handle() const noexcept { return db_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /// Run one or more statements without results (pragmas, DDL, BEGIN/COMMIT)
    [[nodiscard]] StoreResult<void> exec(const std::string& sql);

    [[nodiscard]] StoreResult<Statement> prepare(std::string_view sql);

    /// Map a sqlite3 result code onto the store error taxonomy
    [[nodiscard]] StoreError translate(int rc) const;

private:
    sqlite3* db_{nullptr};
    std::string path_;
};

/// True for SQLITE_CONSTRAINT_UNIQUE / SQLITE_CONSTRAINT_PRIMARYKEY
[[nodiscard]] bool is_unique_violation(sqlite3* db, int rc) noexcept;

}  // namespace billguard::sqlite
