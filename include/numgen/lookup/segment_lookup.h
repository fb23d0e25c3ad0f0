// =============================================================================
// numgen - Segment Lookup
// =============================================================================
// Resolves a filter's (prefix, province, city, operators) into the segments
// it matches, and lists the provinces and cities known to the segment table.
//
// SegmentLookup is the seam between the generation engine and wherever the
// segment table lives. SqliteSegmentLookup reads the phone_location table:
//
//   phone_location(prefix TEXT, suffix TEXT, province TEXT, city TEXT,
//                  operator INTEGER)
// =============================================================================

#ifndef NUMGEN_LOOKUP_SEGMENT_LOOKUP_H
#define NUMGEN_LOOKUP_SEGMENT_LOOKUP_H

#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "numgen/common/error.h"
#include "numgen/common/types.h"

namespace numgen::lookup {

class SqliteDatabase;

/// @brief Name of the segment table.
inline constexpr std::string_view kSegmentTable = "phone_location";

class SegmentLookup {
public:
    virtual ~SegmentLookup() = default;

    /// @brief Find the segments matching a filter.
    /// @param operators Operator codes to match; empty means any operator.
    [[nodiscard]] virtual Result<std::vector<SegmentRecord>> findSegments(
        std::string_view prefix, std::string_view province, std::string_view city,
        std::span<const OperatorCode> operators) = 0;

    /// @brief Distinct provinces, ascending.
    [[nodiscard]] virtual Result<std::vector<std::string>> listProvinces() = 0;

    /// @brief Distinct cities of a province, ascending.
    [[nodiscard]] virtual Result<std::vector<std::string>> listCities(
        std::string_view province) = 0;

protected:
    SegmentLookup() = default;
    SegmentLookup(const SegmentLookup&) = default;
    SegmentLookup& operator=(const SegmentLookup&) = default;
};

class SqliteSegmentLookup final : public SegmentLookup {
public:
    /// @brief Open a segment database read-only.
    /// @return The lookup, or kLookupFailed if the database cannot be opened
    ///         or holds no segment table.
    [[nodiscard]] static Result<std::unique_ptr<SqliteSegmentLookup>> open(
        const std::filesystem::path& databasePath);

    ~SqliteSegmentLookup() override;

    [[nodiscard]] Result<std::vector<SegmentRecord>> findSegments(
        std::string_view prefix, std::string_view province, std::string_view city,
        std::span<const OperatorCode> operators) override;

    [[nodiscard]] Result<std::vector<std::string>> listProvinces() override;

    [[nodiscard]] Result<std::vector<std::string>> listCities(std::string_view province) override;

private:
    explicit SqliteSegmentLookup(std::unique_ptr<SqliteDatabase> db);

    std::unique_ptr<SqliteDatabase> db_;
};

}  // namespace numgen::lookup

#endif  // NUMGEN_LOOKUP_SEGMENT_LOOKUP_H
