// =============================================================================
// numgen - SQLite Database Wrapper
// =============================================================================
// Thin RAII wrappers around sqlite3* and sqlite3_stmt*.
//
// SqliteDatabase opens the connection in its constructor and throws a
// NumgenException (kLookupFailed) if that fails; everything after opening
// reports failures through Result.
// =============================================================================

#ifndef NUMGEN_LOOKUP_SQLITE_DATABASE_H
#define NUMGEN_LOOKUP_SQLITE_DATABASE_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <sqlite3.h>

#include "numgen/common/error.h"

namespace numgen::lookup {

/// @brief Milliseconds to wait on a locked database before failing.
inline constexpr int kBusyTimeoutMs = 5000;

enum class OpenMode : std::uint8_t {
    kReadOnly,
    kReadWriteCreate,
};

/// @brief Owning prepared statement.
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    /// @brief Bind a text parameter (1-based index); the value is copied.
    [[nodiscard]] VoidResult bindText(int index, std::string_view value);

    [[nodiscard]] VoidResult bindInt(int index, std::int64_t value);

    /// @brief Advance the statement.
    /// @return true if a row is available, false when done.
    [[nodiscard]] Result<bool> step();

    /// @brief Reset for re-execution and clear bindings.
    [[nodiscard]] VoidResult reset();

    [[nodiscard]] std::string columnText(int column) const;
    [[nodiscard]] std::int64_t columnInt(int column) const;

    [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    [[nodiscard]] VoidResult check(int rc, const char* what) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

class SqliteDatabase {
public:
    /// @brief Open a database.
    /// @throws NumgenException (kLookupFailed) if the database cannot be opened.
    SqliteDatabase(const std::filesystem::path& path, OpenMode mode);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    [[nodiscard]] sqlite3* handle() const noexcept { return db_; }

    /// @brief Execute one or more SQL statements without results.
    [[nodiscard]] VoidResult exec(const std::string& sql);

    /// @brief Prepare a statement.
    [[nodiscard]] Result<Statement> prepare(const std::string& sql);

    /// @brief Check whether a table exists.
    [[nodiscard]] Result<bool> tableExists(std::string_view table);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
};

}  // namespace numgen::lookup

#endif  // NUMGEN_LOOKUP_SQLITE_DATABASE_H
