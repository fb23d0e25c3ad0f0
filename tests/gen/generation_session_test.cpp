// =============================================================================
// numgen - Generation Session Tests
// =============================================================================

#include "numgen/gen/generation_session.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "test_utils.h"

namespace numgen::gen::test {

using numgen::test::makeFilter;
using numgen::test::makeSegment;

// =============================================================================
// Unit Tests
// =============================================================================

TEST(GenerationSessionTest, NoSegmentsYieldsEmptySet) {
    GenerationSession session;
    auto result = session.generate(makeFilter("138"), {});

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
    EXPECT_EQ(session.stats().segments, 0u);
}

TEST(GenerationSessionTest, FullExpansionOfTwoSegments) {
    const std::vector<SegmentRecord> segments = {makeSegment("138", "0013"),
                                                 makeSegment("138", "0014")};
    GenerationSession session;
    auto result = session.generate(makeFilter("138"), segments);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 20'000u);
    EXPECT_EQ(result->at(0), "13800130000");
    EXPECT_EQ(result->at(9'999), "13800139999");
    EXPECT_EQ(result->at(10'000), "13800140000");
    EXPECT_EQ(result->at(19'999), "13800149999");
}

TEST(GenerationSessionTest, SegmentsSharingRegionCodeAreDeduplicated) {
    // Same block served by two operators
    const std::vector<SegmentRecord> segments = {
        makeSegment("138", "0013", "Guangdong", "Shenzhen", 1),
        makeSegment("138", "0013", "Guangdong", "Shenzhen", 2)};
    GenerationSession session;
    auto result = session.generate(makeFilter("138"), segments);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 10'000u);
    EXPECT_EQ(session.stats().uniqueBlocks, 1u);
    EXPECT_EQ(session.stats().duplicateSegments, 1u);
}

TEST(GenerationSessionTest, OutputIsAscendingRegardlessOfInputOrder) {
    const std::vector<SegmentRecord> segments = {makeSegment("138", "0099"),
                                                 makeSegment("138", "0001"),
                                                 makeSegment("138", "0050")};
    FilterSpec filter = makeFilter("138");
    filter.exactSuffix3 = "123";

    GenerationSession session;
    auto result = session.generate(filter, segments);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 30u);
    EXPECT_TRUE(std::is_sorted(result->begin(), result->end()));
    EXPECT_EQ(result->at(0), "13800010123");
    EXPECT_EQ(result->at(29), "13800999123");
}

TEST(GenerationSessionTest, Exact4YieldsOnePerBlock) {
    const std::vector<SegmentRecord> segments = {makeSegment("138", "0013"),
                                                 makeSegment("138", "0014"),
                                                 makeSegment("138", "0015")};
    FilterSpec filter = makeFilter("138");
    filter.exactSuffix4 = "8888";

    GenerationSession session;
    auto result = session.generate(filter, segments);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 3u);
    EXPECT_TRUE(result->contains(std::string_view("13800138888")));
    EXPECT_TRUE(result->contains(std::string_view("13800148888")));
    EXPECT_TRUE(result->contains(std::string_view("13800158888")));
}

TEST(GenerationSessionTest, OverCapacityFailsBeforeExpansion) {
    const std::vector<SegmentRecord> segments = {makeSegment("138", "0013"),
                                                 makeSegment("138", "0014")};
    GenerationSession session;
    auto result = session.generate(makeFilter("138", 19'999), segments);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kOverCapacity);
    EXPECT_EQ(session.stats().identifiers, 0u);
}

TEST(GenerationSessionTest, CapacityIsInclusive) {
    const std::vector<SegmentRecord> segments = {makeSegment("138", "0013"),
                                                 makeSegment("138", "0014")};
    GenerationSession session;
    auto result = session.generate(makeFilter("138", 20'000), segments);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 20'000u);
}

TEST(GenerationSessionTest, DuplicatesDoNotCountTowardCapacity) {
    const std::vector<SegmentRecord> segments = {
        makeSegment("138", "0013", "Guangdong", "Shenzhen", 1),
        makeSegment("138", "0013", "Guangdong", "Shenzhen", 3)};
    GenerationSession session;
    auto result = session.generate(makeFilter("138", 10'000), segments);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 10'000u);
}

TEST(GenerationSessionTest, CancelledTokenStopsGeneration) {
    CancellationToken token;
    token.cancel();

    const std::vector<SegmentRecord> segments = {makeSegment("138", "0013")};
    GenerationSession session(SessionOptions{.threads = 0, .cancellation = &token});
    auto result = session.generate(makeFilter("138"), segments);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
}

TEST(GenerationSessionTest, MalformedSegmentIsRejected) {
    const std::vector<SegmentRecord> segments = {makeSegment("138", "13")};
    GenerationSession session;
    auto result = session.generate(makeFilter("138"), segments);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(GenerationSessionTest, ExplicitThreadCountGivesSameResult) {
    std::vector<SegmentRecord> segments;
    for (int i = 0; i < 16; ++i) {
        segments.push_back(makeSegment("150", "10" + std::to_string(10 + i)));
    }

    GenerationSession automatic;
    GenerationSession twoThreads(SessionOptions{.threads = 2, .cancellation = nullptr});
    auto a = automatic.generate(makeFilter("150"), segments);
    auto b = twoThreads.generate(makeFilter("150"), segments);

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(a->size(), 160'000u);
    EXPECT_TRUE(std::equal(a->begin(), a->end(), b->begin(), b->end()));
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(GenerationSessionProperty, SizeIsDistinctBlocksTimesCardinality, ()) {
    const auto suffixes = *rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 10'000));
    const auto exact3 = *rc::gen::inRange(0, 1'000);

    std::vector<SegmentRecord> segments;
    std::set<int> distinct;
    for (int suffix : suffixes) {
        std::string code = std::to_string(suffix);
        code.insert(0, 4 - code.size(), '0');
        segments.push_back(makeSegment("177", code));
        distinct.insert(suffix);
    }

    FilterSpec filter = makeFilter("177");
    std::string exact = std::to_string(exact3);
    exact.insert(0, 3 - exact.size(), '0');
    filter.exactSuffix3 = exact;

    GenerationSession session;
    auto result = session.generate(filter, segments);
    RC_ASSERT(result.has_value());
    RC_ASSERT(result->size() == distinct.size() * kExact3Cardinality);

    // Ascending and unique
    RC_ASSERT(std::adjacent_find(result->begin(), result->end(),
                                 [](IdentifierKey a, IdentifierKey b) { return a >= b; }) ==
              result->end());

    for (std::size_t i = 0; i < result->size(); ++i) {
        const Identifier id = result->at(i);
        RC_ASSERT(id.starts_with("177"));
        RC_ASSERT(id.substr(8) == exact);
    }
}

RC_GTEST_PROP(GenerationSessionProperty, CapacityCheckIsExact, ()) {
    const auto blocks = *rc::gen::inRange(1, 20);
    const auto maxCount = *rc::gen::inRange<std::uint64_t>(1, 200);

    std::vector<SegmentRecord> segments;
    for (int i = 0; i < blocks; ++i) {
        segments.push_back(makeSegment("186", "20" + std::to_string(10 + i)));
    }
    FilterSpec filter = makeFilter("186", maxCount);
    filter.exactSuffix3 = "000";

    GenerationSession session;
    auto result = session.generate(filter, segments);

    const std::uint64_t cardinality = static_cast<std::uint64_t>(blocks) * kExact3Cardinality;
    if (cardinality > maxCount) {
        RC_ASSERT(!result.has_value());
        RC_ASSERT(result.error().code() == ErrorCode::kOverCapacity);
    } else {
        RC_ASSERT(result.has_value());
        RC_ASSERT(result->size() == cardinality);
    }
}

}  // namespace numgen::gen::test
