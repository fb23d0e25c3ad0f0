// =============================================================================
// numgen - Segment Importer
// =============================================================================
// Loads the segment table from a CSV file into SQLite.
//
// CSV format:
//   prefix,suffix,province,city,operator      <- header row, skipped
//   130,0000,Beijing,Beijing,1
//
// - The file is read as UTF-8, or converted from GB18030/GBK when its leading
//   bytes are not valid UTF-8; anything else is kSourceUnreadable
// - A byte order mark is stripped
// - Fields may be double-quoted ("" escapes a quote inside a quoted field)
// - Rows are skipped and counted when they do not have exactly five fields,
//   when prefix or suffix are not 3 and 4 digits, when a region is empty,
//   when the operator is not an integer from 1 to 5, or when the line cannot
//   be decoded
// - Rows are inserted in batches inside one transaction; any failure rolls
//   the whole import back
// =============================================================================

#ifndef NUMGEN_LOOKUP_SEGMENT_IMPORTER_H
#define NUMGEN_LOOKUP_SEGMENT_IMPORTER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "numgen/common/error.h"
#include "numgen/lookup/text_encoding.h"

namespace numgen::lookup {

/// @brief Rows inserted per batch.
inline constexpr std::size_t kImportBatchRows = 1000;

/// @brief Fields per CSV row.
inline constexpr std::size_t kSegmentCsvColumns = 5;

struct ImportOptions {
    /// @brief Clear existing rows before importing.
    bool force = false;

    /// @brief Rows per insert batch.
    std::size_t batchRows = kImportBatchRows;
};

struct ImportReport {
    std::uint64_t imported = 0;
    std::uint64_t skipped = 0;

    /// @brief Rows in the table after the import.
    std::uint64_t totalRows = 0;

    /// @brief True when the table already held rows and force was not set.
    bool alreadyPopulated = false;

    /// @brief Encoding the CSV was read in.
    TextEncoding encoding = TextEncoding::kUtf8;
};

/// @brief Split one CSV line into fields.
/// @return The fields, or std::nullopt for an unterminated quoted field.
[[nodiscard]] std::optional<std::vector<std::string>> splitCsvLine(std::string_view line);

class SegmentImporter {
public:
    explicit SegmentImporter(std::filesystem::path databasePath);

    /// @brief Import a CSV file.
    /// @return The report, kSourceUnreadable if the CSV cannot be read, or
    ///         kLookupFailed on any database failure.
    [[nodiscard]] Result<ImportReport> importCsv(const std::filesystem::path& csvPath,
                                                 const ImportOptions& options = {}) const;

    /// @brief Rows currently in the segment table (0 if it does not exist).
    [[nodiscard]] Result<std::uint64_t> rowCount() const;

private:
    std::filesystem::path databasePath_;
};

}  // namespace numgen::lookup

#endif  // NUMGEN_LOOKUP_SEGMENT_IMPORTER_H
