// =============================================================================
// numgen - SQLite Segment Lookup Implementation
// =============================================================================

#include "numgen/lookup/segment_lookup.h"

#include <cstdint>
#include <utility>

#include <fmt/format.h>

#include "numgen/common/logger.h"
#include "numgen/common/types.h"
#include "numgen/lookup/sqlite_database.h"

namespace numgen::lookup {

namespace {

Result<std::vector<std::string>> collectColumn(Statement& stmt) {
    std::vector<std::string> values;
    while (true) {
        auto row = stmt.step();
        if (!row) {
            return makeError<std::vector<std::string>>(row.error());
        }
        if (!*row) {
            break;
        }
        values.push_back(stmt.columnText(0));
    }
    return values;
}

}  // namespace

Result<std::unique_ptr<SqliteSegmentLookup>> SqliteSegmentLookup::open(
    const std::filesystem::path& databasePath) {
    using LookupPtr = std::unique_ptr<SqliteSegmentLookup>;

    std::unique_ptr<SqliteDatabase> db;
    try {
        db = std::make_unique<SqliteDatabase>(databasePath, OpenMode::kReadOnly);
    } catch (const NumgenException& ex) {
        return makeError<LookupPtr>(Error(ex));
    }

    auto exists = db->tableExists(kSegmentTable);
    if (!exists) {
        return makeError<LookupPtr>(exists.error());
    }
    if (!*exists) {
        return makeError<LookupPtr>(
            ErrorCode::kLookupFailed,
            fmt::format("database {} has no {} table; run 'numgen import' first",
                        databasePath.string(), kSegmentTable));
    }
    return LookupPtr(new SqliteSegmentLookup(std::move(db)));
}

SqliteSegmentLookup::SqliteSegmentLookup(std::unique_ptr<SqliteDatabase> db)
    : db_(std::move(db)) {}

SqliteSegmentLookup::~SqliteSegmentLookup() = default;

Result<std::vector<SegmentRecord>> SqliteSegmentLookup::findSegments(
    std::string_view prefix, std::string_view province, std::string_view city,
    std::span<const OperatorCode> operators) {
    using Records = std::vector<SegmentRecord>;

    std::string sql = fmt::format(
        "SELECT prefix, suffix, province, city, operator FROM {} "
        "WHERE prefix = ? AND province = ? AND city = ?",
        kSegmentTable);
    if (!operators.empty()) {
        sql += " AND operator IN (";
        for (std::size_t i = 0; i < operators.size(); ++i) {
            sql += i == 0 ? "?" : ",?";
        }
        sql += ")";
    }
    sql += " ORDER BY suffix;";

    auto stmt = db_->prepare(sql);
    if (!stmt) {
        return makeError<Records>(stmt.error());
    }

    int index = 1;
    for (std::string_view value : {prefix, province, city}) {
        if (auto bound = stmt->bindText(index++, value); !bound) {
            return makeError<Records>(bound.error());
        }
    }
    for (OperatorCode code : operators) {
        if (auto bound = stmt->bindInt(index++, code); !bound) {
            return makeError<Records>(bound.error());
        }
    }

    Records records;
    std::uint64_t ignored = 0;
    while (true) {
        auto row = stmt->step();
        if (!row) {
            return makeError<Records>(row.error());
        }
        if (!*row) {
            break;
        }
        const std::int64_t operatorCode = stmt->columnInt(4);
        SegmentRecord record;
        record.prefix = stmt->columnText(0);
        record.suffix = stmt->columnText(1);
        record.province = stmt->columnText(2);
        record.city = stmt->columnText(3);
        // Rows written by other tools may not hold a usable segment
        if (operatorCode < kMinOperatorCode || operatorCode > kMaxOperatorCode ||
            !isDigitString(record.prefix, kPrefixDigits) ||
            !isDigitString(record.suffix, kRegionCodeDigits)) {
            ++ignored;
            continue;
        }
        record.operatorCode = static_cast<OperatorCode>(operatorCode);
        records.push_back(std::move(record));
    }
    if (ignored > 0) {
        NUMGEN_LOG_WARNING("Ignored {} malformed segment row(s) for {}/{}/{}", ignored, prefix,
                           province, city);
    }

    NUMGEN_LOG_DEBUG("Lookup {}/{}/{} matched {} segment(s)", prefix, province, city,
                     records.size());
    return records;
}

Result<std::vector<std::string>> SqliteSegmentLookup::listProvinces() {
    auto stmt = db_->prepare(
        fmt::format("SELECT DISTINCT province FROM {} ORDER BY province;", kSegmentTable));
    if (!stmt) {
        return makeError<std::vector<std::string>>(stmt.error());
    }
    return collectColumn(*stmt);
}

Result<std::vector<std::string>> SqliteSegmentLookup::listCities(std::string_view province) {
    auto stmt = db_->prepare(fmt::format(
        "SELECT DISTINCT city FROM {} WHERE province = ? ORDER BY city;", kSegmentTable));
    if (!stmt) {
        return makeError<std::vector<std::string>>(stmt.error());
    }
    if (auto bound = stmt->bindText(1, province); !bound) {
        return makeError<std::vector<std::string>>(bound.error());
    }
    return collectColumn(*stmt);
}

}  // namespace numgen::lookup
