// =============================================================================
// numgen - Segment Importer Implementation
// =============================================================================

#include "numgen/lookup/segment_importer.h"

#include <array>
#include <charconv>
#include <fstream>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "numgen/common/logger.h"
#include "numgen/common/types.h"
#include "numgen/lookup/segment_lookup.h"
#include "numgen/lookup/sqlite_database.h"
#include "numgen/lookup/text_encoding.h"

namespace numgen::lookup {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// @brief Rolls back an open transaction unless it was committed.
class TransactionGuard {
public:
    explicit TransactionGuard(SqliteDatabase& db) : db_(db) {}

    ~TransactionGuard() {
        if (active_) {
            if (auto rolledBack = db_.exec("ROLLBACK;"); !rolledBack) {
                NUMGEN_LOG_ERROR("Rollback failed: {}", rolledBack.error().message());
            }
        }
    }

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] VoidResult begin() {
        auto begun = db_.exec("BEGIN TRANSACTION;");
        active_ = begun.has_value();
        return begun;
    }

    [[nodiscard]] VoidResult commit() {
        auto committed = db_.exec("COMMIT;");
        if (committed) {
            active_ = false;
        }
        return committed;
    }

private:
    SqliteDatabase& db_;
    bool active_ = false;
};

struct CsvRow {
    std::array<std::string, 4> text;
    std::int64_t operatorCode = 0;
};

std::string_view trimView(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<CsvRow> parseRow(std::string_view line) {
    auto fields = splitCsvLine(line);
    if (!fields || fields->size() != kSegmentCsvColumns) {
        return std::nullopt;
    }
    CsvRow row;
    for (std::size_t i = 0; i < row.text.size(); ++i) {
        row.text[i] = std::string(trimView((*fields)[i]));
    }
    const std::string_view op = trimView((*fields)[4]);
    const auto [ptr, ec] = std::from_chars(op.data(), op.data() + op.size(), row.operatorCode);
    if (ec != std::errc{} || ptr != op.data() + op.size()) {
        return std::nullopt;
    }

    // Segments the generator could not expand are rejected here, not at request time
    if (!isDigitString(row.text[0], kPrefixDigits) ||
        !isDigitString(row.text[1], kRegionCodeDigits)) {
        return std::nullopt;
    }
    if (row.text[2].empty() || row.text[3].empty()) {
        return std::nullopt;
    }
    if (row.operatorCode < kMinOperatorCode || row.operatorCode > kMaxOperatorCode) {
        return std::nullopt;
    }
    return row;
}

/// @brief Read the leading bytes of @p csv and rewind it.
Result<TextEncoding> detectFileEncoding(std::ifstream& csv, const std::filesystem::path& path) {
    std::string sample(kEncodingSampleBytes, '\0');
    csv.read(sample.data(), static_cast<std::streamsize>(sample.size()));
    if (csv.bad()) {
        return makeError<TextEncoding>(ErrorCode::kSourceUnreadable,
                                       "read failed on CSV file: " + path.string());
    }
    sample.resize(static_cast<std::size_t>(csv.gcount()));
    const bool complete = csv.eof();

    csv.clear();
    csv.seekg(0);
    if (!csv) {
        return makeError<TextEncoding>(ErrorCode::kSourceUnreadable,
                                       "cannot rewind CSV file: " + path.string());
    }

    auto encoding = detectEncoding(sample, complete);
    if (!encoding) {
        return makeError<TextEncoding>(
            ErrorCode::kSourceUnreadable,
            fmt::format("{}: {}", path.string(), encoding.error().message()));
    }
    return encoding;
}

VoidResult createSchema(SqliteDatabase& db) {
    return db.exec(fmt::format(
        "CREATE TABLE IF NOT EXISTS {0} ("
        "  prefix TEXT NOT NULL,"
        "  suffix TEXT NOT NULL,"
        "  province TEXT NOT NULL,"
        "  city TEXT NOT NULL,"
        "  operator INTEGER NOT NULL);"
        "CREATE INDEX IF NOT EXISTS idx_prefix ON {0}(prefix);"
        "CREATE INDEX IF NOT EXISTS idx_province_city ON {0}(province, city);"
        "CREATE INDEX IF NOT EXISTS idx_operator ON {0}(operator);"
        "CREATE INDEX IF NOT EXISTS idx_prefix_province_city_operator "
        "ON {0}(prefix, province, city, operator);",
        kSegmentTable));
}

Result<std::uint64_t> countRows(SqliteDatabase& db) {
    auto exists = db.tableExists(kSegmentTable);
    if (!exists) {
        return makeError<std::uint64_t>(exists.error());
    }
    if (!*exists) {
        return std::uint64_t{0};
    }
    auto stmt = db.prepare(fmt::format("SELECT COUNT(*) FROM {};", kSegmentTable));
    if (!stmt) {
        return makeError<std::uint64_t>(stmt.error());
    }
    auto row = stmt->step();
    if (!row) {
        return makeError<std::uint64_t>(row.error());
    }
    return *row ? static_cast<std::uint64_t>(stmt->columnInt(0)) : 0;
}

VoidResult insertBatch(Statement& insert, const std::vector<CsvRow>& batch) {
    for (const auto& row : batch) {
        for (int i = 0; i < 4; ++i) {
            if (auto bound = insert.bindText(i + 1, row.text[static_cast<std::size_t>(i)]);
                !bound) {
                return bound;
            }
        }
        if (auto bound = insert.bindInt(5, row.operatorCode); !bound) {
            return bound;
        }
        if (auto stepped = insert.step(); !stepped) {
            return makeVoidError(stepped.error().code(), stepped.error().message());
        }
        if (auto reset = insert.reset(); !reset) {
            return reset;
        }
    }
    return makeVoidSuccess();
}

}  // namespace

std::optional<std::vector<std::string>> splitCsvLine(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (inQuotes) {
        return std::nullopt;
    }
    fields.push_back(std::move(current));
    return fields;
}

SegmentImporter::SegmentImporter(std::filesystem::path databasePath)
    : databasePath_(std::move(databasePath)) {}

Result<std::uint64_t> SegmentImporter::rowCount() const {
    std::error_code ec;
    if (!std::filesystem::exists(databasePath_, ec)) {
        return std::uint64_t{0};
    }
    try {
        SqliteDatabase db(databasePath_, OpenMode::kReadOnly);
        return countRows(db);
    } catch (const NumgenException& ex) {
        return makeError<std::uint64_t>(Error(ex));
    }
}

Result<ImportReport> SegmentImporter::importCsv(const std::filesystem::path& csvPath,
                                                const ImportOptions& options) const {
    std::ifstream csv(csvPath, std::ios::binary);
    if (!csv.is_open()) {
        return makeError<ImportReport>(ErrorCode::kSourceUnreadable,
                                       "cannot open CSV file: " + csvPath.string());
    }

    std::error_code ec;
    if (databasePath_.has_parent_path()) {
        std::filesystem::create_directories(databasePath_.parent_path(), ec);
        if (ec) {
            return makeError<ImportReport>(
                ErrorCode::kLookupFailed,
                IOError::formatWithSystemError("cannot create database directory", ec));
        }
    }

    std::unique_ptr<SqliteDatabase> db;
    try {
        db = std::make_unique<SqliteDatabase>(databasePath_, OpenMode::kReadWriteCreate);
    } catch (const NumgenException& ex) {
        return makeError<ImportReport>(Error(ex));
    }

    ImportReport report;

    auto existing = countRows(*db);
    if (!existing) {
        return makeError<ImportReport>(existing.error());
    }
    if (*existing > 0 && !options.force) {
        NUMGEN_LOG_INFO("Segment table already holds {} row(s); use --force to re-import",
                        *existing);
        report.alreadyPopulated = true;
        report.totalRows = *existing;
        return report;
    }

    auto encoding = detectFileEncoding(csv, csvPath);
    if (!encoding) {
        return makeError<ImportReport>(encoding.error());
    }
    report.encoding = *encoding;

    std::optional<Gb18030Decoder> decoder;
    if (*encoding == TextEncoding::kGb18030) {
        try {
            decoder.emplace();
        } catch (const NumgenException& ex) {
            return makeError<ImportReport>(Error(ex));
        }
        NUMGEN_LOG_INFO("CSV {} is GB18030/GBK encoded; converting to UTF-8", csvPath.string());
    }

    if (auto schema = createSchema(*db); !schema) {
        return makeError<ImportReport>(schema.error());
    }

    TransactionGuard tx(*db);
    if (auto begun = tx.begin(); !begun) {
        return makeError<ImportReport>(begun.error());
    }

    if (options.force && *existing > 0) {
        if (auto cleared = db->exec(fmt::format("DELETE FROM {};", kSegmentTable)); !cleared) {
            return makeError<ImportReport>(cleared.error());
        }
        NUMGEN_LOG_INFO("Cleared {} existing row(s)", *existing);
    }

    auto insert = db->prepare(fmt::format(
        "INSERT INTO {} (prefix, suffix, province, city, operator) VALUES (?, ?, ?, ?, ?);",
        kSegmentTable));
    if (!insert) {
        return makeError<ImportReport>(insert.error());
    }

    const std::size_t batchRows = options.batchRows > 0 ? options.batchRows : kImportBatchRows;
    std::vector<CsvRow> batch;
    batch.reserve(batchRows);

    std::string line;
    bool header = true;
    std::uint64_t lineNumber = 0;
    while (std::getline(csv, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (decoder) {
            auto decoded = decoder->decode(line);
            if (!decoded) {
                if (!header) {
                    ++report.skipped;
                }
                NUMGEN_LOG_DEBUG("Skipping undecodable CSV line {}: {}", lineNumber,
                                 decoded.error().message());
                header = false;
                continue;
            }
            line = std::move(*decoded);
        } else if (!isValidUtf8(line)) {
            if (!header) {
                ++report.skipped;
            }
            NUMGEN_LOG_DEBUG("Skipping CSV line {} with invalid UTF-8", lineNumber);
            header = false;
            continue;
        }
        if (header) {
            if (line.starts_with(kUtf8Bom)) {
                line.erase(0, kUtf8Bom.size());
            }
            NUMGEN_LOG_DEBUG("CSV header: {}", line);
            header = false;
            continue;
        }
        if (line.empty()) {
            continue;
        }

        auto row = parseRow(line);
        if (!row) {
            ++report.skipped;
            NUMGEN_LOG_DEBUG("Skipping malformed or out-of-range CSV line {}", lineNumber);
            continue;
        }
        batch.push_back(std::move(*row));

        if (batch.size() >= batchRows) {
            if (auto inserted = insertBatch(*insert, batch); !inserted) {
                return makeError<ImportReport>(inserted.error());
            }
            report.imported += batch.size();
            batch.clear();
            NUMGEN_LOG_DEBUG("Imported {} row(s)", report.imported);
        }
    }
    if (csv.bad()) {
        return makeError<ImportReport>(ErrorCode::kSourceUnreadable,
                                       "read failed on CSV file: " + csvPath.string());
    }
    if (header) {
        return makeError<ImportReport>(ErrorCode::kSourceUnreadable,
                                       "CSV file is empty: " + csvPath.string());
    }

    if (!batch.empty()) {
        if (auto inserted = insertBatch(*insert, batch); !inserted) {
            return makeError<ImportReport>(inserted.error());
        }
        report.imported += batch.size();
    }

    if (auto committed = tx.commit(); !committed) {
        return makeError<ImportReport>(committed.error());
    }

    auto total = countRows(*db);
    if (!total) {
        return makeError<ImportReport>(total.error());
    }
    report.totalRows = *total;

    NUMGEN_LOG_INFO("Import finished: {} imported, {} skipped, {} total", report.imported,
                    report.skipped, report.totalRows);
    return report;
}

}  // namespace numgen::lookup
