// =============================================================================
// numgen - SQLite Database Wrapper Implementation
// =============================================================================

#include "numgen/lookup/sqlite_database.h"

#include <utility>

#include <fmt/format.h>

#include "numgen/common/logger.h"

namespace numgen::lookup {

// =============================================================================
// Statement
// =============================================================================

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

VoidResult Statement::check(int rc, const char* what) const {
    if (rc != SQLITE_OK) {
        return makeVoidError(ErrorCode::kLookupFailed,
                             fmt::format("sqlite {}: {}", what, sqlite3_errmsg(db_)));
    }
    return makeVoidSuccess();
}

VoidResult Statement::bindText(int index, std::string_view value) {
    return check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT),
                 "bind");
}

VoidResult Statement::bindInt(int index, std::int64_t value) {
    return check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), "bind");
}

Result<bool> Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return makeError<bool>(ErrorCode::kLookupFailed,
                           fmt::format("sqlite step: {}", sqlite3_errmsg(db_)));
}

VoidResult Statement::reset() {
    sqlite3_clear_bindings(stmt_);
    return check(sqlite3_reset(stmt_), "reset");
}

std::string Statement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    return text != nullptr ? reinterpret_cast<const char*>(text) : "";
}

std::int64_t Statement::columnInt(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

// =============================================================================
// SqliteDatabase
// =============================================================================

SqliteDatabase::SqliteDatabase(const std::filesystem::path& path, OpenMode mode) : path_(path) {
    const int flags = mode == OpenMode::kReadOnly
                          ? SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX
                          : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

    const int rc = sqlite3_open_v2(path_.string().c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ != nullptr ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_ != nullptr) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        throw NumgenException(ErrorCode::kLookupFailed,
                              fmt::format("cannot open database {}: {}", path_.string(), msg),
                              path_);
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    if (mode == OpenMode::kReadWriteCreate) {
        if (auto configured = exec("PRAGMA synchronous=NORMAL; PRAGMA temp_store=MEMORY;");
            !configured) {
            NUMGEN_LOG_WARNING("Database pragmas not applied: {}", configured.error().message());
        }
    }
    NUMGEN_LOG_DEBUG("Opened database {}", path_.string());
}

SqliteDatabase::~SqliteDatabase() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

VoidResult SqliteDatabase::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err != nullptr ? err : "sqlite exec failed";
        sqlite3_free(err);
        return makeVoidError(ErrorCode::kLookupFailed, std::move(msg));
    }
    return makeVoidSuccess();
}

Result<Statement> SqliteDatabase::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
        return makeError<Statement>(ErrorCode::kLookupFailed,
                                    fmt::format("sqlite prepare: {}", sqlite3_errmsg(db_)));
    }
    return Statement(db_, stmt);
}

Result<bool> SqliteDatabase::tableExists(std::string_view table) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
    if (!stmt) {
        return makeError<bool>(stmt.error());
    }
    if (auto bound = stmt->bindText(1, table); !bound) {
        return makeError<bool>(bound.error());
    }
    return stmt->step();
}


}  // namespace numgen::lookup
