// =============================================================================
// numgen - Segment Import and Lookup Tests
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "numgen/lookup/segment_importer.h"
#include "numgen/lookup/segment_lookup.h"
#include "numgen/lookup/sqlite_database.h"
#include "numgen/lookup/text_encoding.h"
#include "test_utils.h"

namespace numgen::lookup::test {

using numgen::test::TempDirGuard;
using numgen::test::writeFile;

namespace {

constexpr const char* kSampleCsv =
    "prefix,suffix,province,city,operator\n"
    "138,0013,Guangdong,Shenzhen,1\n"
    "138,0014,Guangdong,Shenzhen,2\n"
    "138,0015,Guangdong,Shenzhen,1\n"
    "138,0013,Guangdong,Shenzhen,3\n"
    "138,0020,Guangdong,Guangzhou,1\n"
    "139,0001,Guangdong,Shenzhen,1\n"
    "130,0000,Beijing,Beijing,2\n";

}  // namespace

// =============================================================================
// CSV Splitting
// =============================================================================

TEST(SplitCsvLineTest, PlainFields) {
    auto fields = splitCsvLine("138,0013,Guangdong,Shenzhen,1");
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ(*fields, (std::vector<std::string>{"138", "0013", "Guangdong", "Shenzhen", "1"}));
}

TEST(SplitCsvLineTest, QuotedFields) {
    auto fields = splitCsvLine(R"(138,"0013","Hong Kong, SAR","say ""hi""",1)");
    ASSERT_TRUE(fields.has_value());
    ASSERT_EQ(fields->size(), 5u);
    EXPECT_EQ((*fields)[2], "Hong Kong, SAR");
    EXPECT_EQ((*fields)[3], "say \"hi\"");
}

TEST(SplitCsvLineTest, EmptyFieldsAreKept) {
    auto fields = splitCsvLine("a,,b,");
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ(*fields, (std::vector<std::string>{"a", "", "b", ""}));
}

TEST(SplitCsvLineTest, UnterminatedQuoteFails) {
    EXPECT_FALSE(splitCsvLine(R"(138,"0013,x)").has_value());
}

// =============================================================================
// Import
// =============================================================================

class SegmentDatabaseTest : public ::testing::Test {
protected:
    [[nodiscard]] std::filesystem::path csv(const std::string& content,
                                            const std::string& name = "segments.csv") const {
        const auto path = dir_ / name;
        writeFile(path, content);
        return path;
    }

    [[nodiscard]] std::filesystem::path databasePath() const { return dir_ / "db" / "segments.db"; }

    void importSample() {
        SegmentImporter importer(databasePath());
        auto report = importer.importCsv(csv(kSampleCsv));
        ASSERT_TRUE(report.has_value()) << report.error().message();
    }

    TempDirGuard dir_{"numgen_lookup"};
};

TEST_F(SegmentDatabaseTest, ImportCreatesTable) {
    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv(kSampleCsv));
    ASSERT_TRUE(report.has_value()) << report.error().message();

    EXPECT_EQ(report->imported, 7u);
    EXPECT_EQ(report->skipped, 0u);
    EXPECT_EQ(report->totalRows, 7u);
    EXPECT_FALSE(report->alreadyPopulated);

    auto rows = importer.rowCount();
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(*rows, 7u);
}

TEST_F(SegmentDatabaseTest, ImportHandlesBomCrlfAndBadRows) {
    const std::string content =
        "\xEF\xBB\xBFprefix,suffix,province,city,operator\r\n"
        "138,0013,Guangdong,Shenzhen,1\r\n"
        "138,0014,Guangdong\r\n"
        "138,0015,Guangdong,Shenzhen,mobile\r\n"
        "\"138\",\"0016\",\"Guangdong\",\"Shenzhen\",\"2\"\r\n"
        "\r\n";

    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv(content));
    ASSERT_TRUE(report.has_value()) << report.error().message();

    EXPECT_EQ(report->imported, 2u);
    EXPECT_EQ(report->skipped, 2u);
    EXPECT_EQ(report->totalRows, 2u);
}

TEST_F(SegmentDatabaseTest, ImportSkipsRowsOutsideKeySpace) {
    const std::string content =
        "prefix,suffix,province,city,operator\n"
        "138,0013,Guangdong,Shenzhen,1\n"
        "138,13,Guangdong,Shenzhen,1\n"
        "13,0013,Guangdong,Shenzhen,1\n"
        "138,00a3,Guangdong,Shenzhen,1\n"
        "138,0014,Guangdong,Shenzhen,0\n"
        "138,0015,Guangdong,Shenzhen,6\n"
        "138,0016,Guangdong,Shenzhen,257\n"
        "138,0017,Guangdong,,1\n"
        "138,0018,Guangdong,Shenzhen,5\n";

    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv(content));
    ASSERT_TRUE(report.has_value()) << report.error().message();
    EXPECT_EQ(report->imported, 2u);
    EXPECT_EQ(report->skipped, 7u);

    auto lookup = SqliteSegmentLookup::open(databasePath());
    ASSERT_TRUE(lookup.has_value());
    auto segments = (*lookup)->findSegments("138", "Guangdong", "Shenzhen", {});
    ASSERT_TRUE(segments.has_value());
    ASSERT_EQ(segments->size(), 2u);
    EXPECT_EQ((*segments)[0].suffix, "0013");
    EXPECT_EQ((*segments)[1].suffix, "0018");
    EXPECT_EQ((*segments)[1].operatorCode, 5);
}

TEST_F(SegmentDatabaseTest, ImportConvertsGbkRegionNames) {
    // "广东" / "广州" in GBK
    const std::string content =
        "prefix,suffix,province,city,operator\r\n"
        "138,0013,\xB9\xE3\xB6\xAB,\xB9\xE3\xD6\xDD,1\r\n"
        "138,0014,\xB9\xE3\xB6\xAB,\xB9\xE3\xD6\xDD,2\r\n";
    const std::string guangdong = "\xE5\xB9\xBF\xE4\xB8\x9C";
    const std::string guangzhou = "\xE5\xB9\xBF\xE5\xB7\x9E";

    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv(content));
    ASSERT_TRUE(report.has_value()) << report.error().message();
    EXPECT_EQ(report->encoding, TextEncoding::kGb18030);
    EXPECT_EQ(report->imported, 2u);
    EXPECT_EQ(report->skipped, 0u);

    auto lookup = SqliteSegmentLookup::open(databasePath());
    ASSERT_TRUE(lookup.has_value());

    auto provinces = (*lookup)->listProvinces();
    ASSERT_TRUE(provinces.has_value());
    EXPECT_EQ(*provinces, (std::vector<std::string>{guangdong}));

    auto segments = (*lookup)->findSegments("138", guangdong, guangzhou, {});
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(segments->size(), 2u);
}

TEST_F(SegmentDatabaseTest, ImportKeepsUtf8RegionNames) {
    const std::string content =
        "prefix,suffix,province,city,operator\n"
        "138,0013,\xE5\xB9\xBF\xE4\xB8\x9C,Shenzhen,1\n";

    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv(content));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->encoding, TextEncoding::kUtf8);
    EXPECT_EQ(report->imported, 1u);

    auto lookup = SqliteSegmentLookup::open(databasePath());
    ASSERT_TRUE(lookup.has_value());
    auto segments = (*lookup)->findSegments("138", "\xE5\xB9\xBF\xE4\xB8\x9C", "Shenzhen", {});
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(segments->size(), 1u);
}

TEST_F(SegmentDatabaseTest, UndecodableCsvIsUnreadable) {
    const std::string content =
        "prefix,suffix,province,city,operator\n"
        "138,0013,\xFF\xFE\xFF,Shenzhen,1\n";

    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv(content));
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kSourceUnreadable);

    auto rows = importer.rowCount();
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(*rows, 0u);
}

TEST_F(SegmentDatabaseTest, SmallBatchesImportEverything) {
    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv(kSampleCsv), ImportOptions{.force = false, .batchRows = 2});
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->imported, 7u);
    EXPECT_EQ(report->totalRows, 7u);
}

TEST_F(SegmentDatabaseTest, PopulatedTableIsKeptWithoutForce) {
    importSample();

    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv("prefix,suffix,province,city,operator\n"
                                         "150,0001,Zhejiang,Hangzhou,1\n",
                                         "other.csv"));
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->alreadyPopulated);
    EXPECT_EQ(report->imported, 0u);
    EXPECT_EQ(report->totalRows, 7u);
}

TEST_F(SegmentDatabaseTest, ForceReplacesRows) {
    importSample();

    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv("prefix,suffix,province,city,operator\n"
                                         "150,0001,Zhejiang,Hangzhou,1\n",
                                         "other.csv"),
                                     ImportOptions{.force = true, .batchRows = kImportBatchRows});
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->alreadyPopulated);
    EXPECT_EQ(report->imported, 1u);
    EXPECT_EQ(report->totalRows, 1u);
}

TEST_F(SegmentDatabaseTest, MissingCsvIsUnreadable) {
    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(dir_ / "absent.csv");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kSourceUnreadable);
}

TEST_F(SegmentDatabaseTest, EmptyCsvIsUnreadable) {
    SegmentImporter importer(databasePath());
    auto report = importer.importCsv(csv(""));
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kSourceUnreadable);
}

TEST_F(SegmentDatabaseTest, RowCountOfMissingDatabaseIsZero) {
    SegmentImporter importer(databasePath());
    auto rows = importer.rowCount();
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(*rows, 0u);
}

// =============================================================================
// Lookup
// =============================================================================

TEST_F(SegmentDatabaseTest, FindSegmentsByRegion) {
    importSample();
    auto lookup = SqliteSegmentLookup::open(databasePath());
    ASSERT_TRUE(lookup.has_value()) << lookup.error().message();

    auto segments = (*lookup)->findSegments("138", "Guangdong", "Shenzhen", {});
    ASSERT_TRUE(segments.has_value());
    ASSERT_EQ(segments->size(), 4u);
    for (const auto& segment : *segments) {
        EXPECT_EQ(segment.prefix, "138");
        EXPECT_EQ(segment.city, "Shenzhen");
    }
    EXPECT_EQ(segments->front().suffix, "0013");
    EXPECT_EQ(segments->back().suffix, "0015");
}

TEST_F(SegmentDatabaseTest, FindSegmentsByOperator) {
    importSample();
    auto lookup = SqliteSegmentLookup::open(databasePath());
    ASSERT_TRUE(lookup.has_value());

    const std::vector<OperatorCode> operators = {2, 3};
    auto segments = (*lookup)->findSegments("138", "Guangdong", "Shenzhen", operators);
    ASSERT_TRUE(segments.has_value());
    ASSERT_EQ(segments->size(), 2u);
    EXPECT_EQ((*segments)[0].suffix, "0013");
    EXPECT_EQ((*segments)[0].operatorCode, 3);
    EXPECT_EQ((*segments)[1].suffix, "0014");
    EXPECT_EQ((*segments)[1].operatorCode, 2);
}

TEST_F(SegmentDatabaseTest, LookupIgnoresMalformedStoredRows) {
    importSample();
    {
        SqliteDatabase db(databasePath(), OpenMode::kReadWriteCreate);
        ASSERT_TRUE(db.exec("INSERT INTO phone_location VALUES "
                            "('138', '0016', 'Guangdong', 'Shenzhen', 257),"
                            "('138', '17', 'Guangdong', 'Shenzhen', 1);")
                        .has_value());
    }

    auto lookup = SqliteSegmentLookup::open(databasePath());
    ASSERT_TRUE(lookup.has_value());

    auto segments = (*lookup)->findSegments("138", "Guangdong", "Shenzhen", {});
    ASSERT_TRUE(segments.has_value());
    ASSERT_EQ(segments->size(), 4u);
    for (const auto& segment : *segments) {
        EXPECT_NE(segment.suffix, "0016");
        EXPECT_NE(segment.suffix, "17");
        EXPECT_GE(segment.operatorCode, kMinOperatorCode);
        EXPECT_LE(segment.operatorCode, kMaxOperatorCode);
    }

    const std::vector<OperatorCode> first = {1};
    auto byOperator = (*lookup)->findSegments("138", "Guangdong", "Shenzhen", first);
    ASSERT_TRUE(byOperator.has_value());
    EXPECT_EQ(byOperator->size(), 2u);
}

TEST_F(SegmentDatabaseTest, UnknownRegionMatchesNothing) {
    importSample();
    auto lookup = SqliteSegmentLookup::open(databasePath());
    ASSERT_TRUE(lookup.has_value());

    auto segments = (*lookup)->findSegments("138", "Guangdong", "Nowhere", {});
    ASSERT_TRUE(segments.has_value());
    EXPECT_TRUE(segments->empty());
}

TEST_F(SegmentDatabaseTest, ListsProvincesAndCities) {
    importSample();
    auto lookup = SqliteSegmentLookup::open(databasePath());
    ASSERT_TRUE(lookup.has_value());

    auto provinces = (*lookup)->listProvinces();
    ASSERT_TRUE(provinces.has_value());
    EXPECT_EQ(*provinces, (std::vector<std::string>{"Beijing", "Guangdong"}));

    auto cities = (*lookup)->listCities("Guangdong");
    ASSERT_TRUE(cities.has_value());
    EXPECT_EQ(*cities, (std::vector<std::string>{"Guangzhou", "Shenzhen"}));

    auto none = (*lookup)->listCities("Atlantis");
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none->empty());
}

TEST_F(SegmentDatabaseTest, OpenWithoutTableFails) {
    std::filesystem::create_directories(databasePath().parent_path());
    {
        SqliteDatabase db(databasePath(), OpenMode::kReadWriteCreate);
        ASSERT_TRUE(db.exec("CREATE TABLE unrelated (x INTEGER);").has_value());
    }

    auto lookup = SqliteSegmentLookup::open(databasePath());
    ASSERT_FALSE(lookup.has_value());
    EXPECT_EQ(lookup.error().code(), ErrorCode::kLookupFailed);
}

TEST_F(SegmentDatabaseTest, OpenMissingDatabaseFails) {
    auto lookup = SqliteSegmentLookup::open(dir_ / "absent.db");
    ASSERT_FALSE(lookup.has_value());
    EXPECT_EQ(lookup.error().code(), ErrorCode::kLookupFailed);
}

}  // namespace numgen::lookup::test
