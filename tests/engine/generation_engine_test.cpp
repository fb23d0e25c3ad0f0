// =============================================================================
// numgen - Generation Engine Tests
// =============================================================================
// End-to-end requests against an in-memory segment table and a temporary
// artifact store.
// =============================================================================

#include "numgen/engine/generation_engine.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "numgen/artifact/artifact_partitioner.h"
#include "numgen/artifact/artifact_store.h"
#include "test_utils.h"

namespace numgen::engine::test {

using numgen::test::makeSegment;
using numgen::test::readFile;
using numgen::test::TempDirGuard;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

/// @brief Segment table held in memory.
class FakeSegmentLookup final : public lookup::SegmentLookup {
public:
    explicit FakeSegmentLookup(std::vector<SegmentRecord> segments)
        : segments_(std::move(segments)) {}

    Result<std::vector<SegmentRecord>> findSegments(
        std::string_view prefix, std::string_view province, std::string_view city,
        std::span<const OperatorCode> operators) override {
        ++queries;
        if (failing) {
            return makeError<std::vector<SegmentRecord>>(ErrorCode::kIOError, "database is locked");
        }
        std::vector<SegmentRecord> matched;
        std::copy_if(segments_.begin(), segments_.end(), std::back_inserter(matched),
                     [&](const SegmentRecord& s) {
                         const bool operatorMatches =
                             operators.empty() || std::find(operators.begin(), operators.end(),
                                                            s.operatorCode) != operators.end();
                         return s.prefix == prefix && s.province == province && s.city == city &&
                                operatorMatches;
                     });
        return matched;
    }

    Result<std::vector<std::string>> listProvinces() override {
        return std::vector<std::string>{};
    }

    Result<std::vector<std::string>> listCities(std::string_view) override {
        return std::vector<std::string>{};
    }

    bool failing = false;
    int queries = 0;

private:
    std::vector<SegmentRecord> segments_;
};

std::vector<SegmentRecord> fullSegments(std::size_t count) {
    std::vector<SegmentRecord> segments;
    for (std::size_t i = 0; i < count; ++i) {
        std::string suffix = std::to_string(1000 + i);
        segments.push_back(makeSegment("138", suffix));
    }
    return segments;
}

gen::RawFilter shenzhen(std::string prefix = "138") {
    gen::RawFilter raw;
    raw.prefix = std::move(prefix);
    raw.province = "Guangdong";
    raw.city = "Shenzhen";
    return raw;
}

std::vector<std::string> regularFilesIn(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            names.push_back(entry.path().filename().string());
        }
    }
    return names;
}

std::size_t filesIn(const std::filesystem::path& dir) {
    if (!std::filesystem::exists(dir)) {
        return 0;
    }
    return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                                  std::filesystem::directory_iterator()));
}

}  // namespace

class GenerationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.storeDir = dir_ / "downloads";
        config_.threads = 2;
    }

    TempDirGuard dir_{"numgen_engine"};
    Config config_;
};

// =============================================================================
// Rejections
// =============================================================================

TEST_F(GenerationEngineTest, InvalidFilterIsRejectedBeforeLookup) {
    FakeSegmentLookup lookup(fullSegments(1));
    GenerationEngine engine(config_, lookup);

    auto result = engine.run(shenzhen("13"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidFilter);
    EXPECT_EQ(lookup.queries, 0);
}

TEST_F(GenerationEngineTest, LookupFailureIsReported) {
    FakeSegmentLookup lookup(fullSegments(1));
    lookup.failing = true;
    GenerationEngine engine(config_, lookup);

    auto result = engine.run(shenzhen());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kLookupFailed);
}

TEST_F(GenerationEngineTest, OverCapacityWritesNothing) {
    config_.maxCount = 15'000;
    FakeSegmentLookup lookup(fullSegments(2));
    GenerationEngine engine(config_, lookup);

    auto result = engine.run(shenzhen());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kOverCapacity);
    EXPECT_EQ(filesIn(config_.storeDir), 0u);
}

TEST_F(GenerationEngineTest, CancelledRequestFails) {
    FakeSegmentLookup lookup(fullSegments(3));
    GenerationEngine engine(config_, lookup);

    CancellationToken token;
    token.cancel();
    auto result = engine.run(shenzhen(), &token);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
}

// =============================================================================
// Results
// =============================================================================

TEST_F(GenerationEngineTest, NoMatchingSegmentsIsEmptyResult) {
    FakeSegmentLookup lookup(fullSegments(1));
    GenerationEngine engine(config_, lookup);

    auto result = engine.run(shenzhen("139"));
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_TRUE(result->noMatches());
    EXPECT_EQ(result->count, 0u);
    EXPECT_TRUE(result->files.empty());
    EXPECT_FALSE(std::filesystem::exists(config_.storeDir));
}

TEST_F(GenerationEngineTest, OperatorFilterCanExcludeEverything) {
    FakeSegmentLookup lookup(fullSegments(1));
    GenerationEngine engine(config_, lookup);

    gen::RawFilter raw = shenzhen();
    raw.operators = {3};
    auto result = engine.run(raw);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->noMatches());
}

TEST_F(GenerationEngineTest, SmallRequestYieldsSingleFile) {
    FakeSegmentLookup lookup({makeSegment("138", "0013"), makeSegment("138", "0014")});
    GenerationEngine engine(config_, lookup);

    gen::RawFilter raw = shenzhen();
    raw.suffix4 = "0001";
    auto result = engine.run(raw);
    ASSERT_TRUE(result.has_value()) << result.error().message();

    EXPECT_EQ(result->count, 2u);
    EXPECT_FALSE(result->partitioned);
    ASSERT_EQ(result->files.size(), 1u);

    const auto& file = result->files.front();
    EXPECT_EQ(file.name, result->artifactName);
    EXPECT_TRUE(file.name.starts_with("138_Guangdong_Shenzhen_0001_"));
    EXPECT_TRUE(file.name.ends_with(".txt"));
    EXPECT_EQ(file.sizeBytes, 24u);
    EXPECT_EQ(file.humanSize, "24.00 B");
    EXPECT_EQ(file.relativeDownloadPath, "/download/" + file.name);

    EXPECT_EQ(readFile(config_.storeDir / file.name), "13800130001\n13800140001\n");
    EXPECT_EQ(result->stats.segments, 2u);
}

TEST_F(GenerationEngineTest, DuplicateSegmentsAreGeneratedOnce) {
    FakeSegmentLookup lookup({makeSegment("138", "0013", "Guangdong", "Shenzhen", 1),
                              makeSegment("138", "0013", "Guangdong", "Shenzhen", 2)});
    GenerationEngine engine(config_, lookup);

    gen::RawFilter raw = shenzhen();
    raw.suffix3 = "123";
    auto result = engine.run(raw);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->count, 10u);
    EXPECT_EQ(result->stats.duplicateSegments, 1u);
}

TEST_F(GenerationEngineTest, OversizedArtifactIsPartitioned) {
    config_.partitionSizeLimitMB = 1;
    // 10 full blocks: 100000 identifiers, 1200000 bytes
    FakeSegmentLookup lookup(fullSegments(10));
    GenerationEngine engine(config_, lookup);

    auto result = engine.run(shenzhen());
    ASSERT_TRUE(result.has_value()) << result.error().message();

    EXPECT_EQ(result->count, 100'000u);
    EXPECT_TRUE(result->partitioned);
    ASSERT_EQ(result->files.size(), 2u);

    std::string joined;
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < result->files.size(); ++i) {
        const auto& file = result->files[i];
        EXPECT_EQ(file.name, artifact::makePartitionName(static_cast<std::uint32_t>(i + 1),
                                                         result->artifactName));
        EXPECT_EQ(file.relativeDownloadPath, "/download/" + file.name);
        joined += readFile(config_.storeDir / file.name);
        total += file.sizeBytes;
    }
    EXPECT_EQ(total, 1'200'000u);
    EXPECT_LT(result->files.front().sizeBytes, config_.partitionSizeLimitBytes() + kArtifactLineBytes);
    EXPECT_EQ(joined, readFile(config_.storeDir / result->artifactName));
}

TEST_F(GenerationEngineTest, PartitionFailureRemovesPartialPartitions) {
    config_.partitionSizeLimitMB = 1;
    FakeSegmentLookup lookup(fullSegments(10));
    GenerationEngine engine(config_, lookup);

    // Occupy the second partition name for every artifact name the request can get
    std::filesystem::create_directories(config_.storeDir);
    FilterSpec filter = numgen::test::makeFilter("138");
    const auto start = std::chrono::system_clock::now();
    for (int offset = -2; offset <= 120; ++offset) {
        const std::string name =
            artifact::makeArtifactName(filter, start + std::chrono::seconds(offset));
        std::filesystem::create_directories(config_.storeDir /
                                            artifact::makePartitionName(2, name));
    }

    auto result = engine.run(shenzhen());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDestinationUnwritable);

    const auto files = regularFilesIn(config_.storeDir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_TRUE(files.front().starts_with("138_Guangdong_Shenzhen_"));
    EXPECT_EQ(std::filesystem::file_size(config_.storeDir / files.front()), 1'200'000u);
}

TEST_F(GenerationEngineTest, RepeatedRequestsDoNotOverwrite) {
    FakeSegmentLookup lookup({makeSegment("138", "0013")});
    GenerationEngine engine(config_, lookup);

    gen::RawFilter raw = shenzhen();
    raw.suffix4 = "0001";
    auto first = engine.run(raw);
    auto second = engine.run(raw);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_NE(first->artifactName, second->artifactName);
    EXPECT_TRUE(std::filesystem::exists(config_.storeDir / first->artifactName));
    EXPECT_TRUE(std::filesystem::exists(config_.storeDir / second->artifactName));
}

}  // namespace numgen::engine::test
