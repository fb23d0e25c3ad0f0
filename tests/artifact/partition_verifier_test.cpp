// =============================================================================
// numgen - Partition Verifier Tests
// =============================================================================

#include "numgen/artifact/partition_verifier.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "numgen/artifact/artifact_partitioner.h"
#include "numgen/artifact/artifact_writer.h"
#include "test_utils.h"

namespace numgen::artifact::test {

using numgen::test::readFile;
using numgen::test::TempDirGuard;
using numgen::test::writeFile;

class PartitionVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<IdentifierKey> keys;
        for (std::size_t i = 0; i < 500; ++i) {
            keys.push_back(18600000000ULL + i * 7);
        }
        ArtifactWriter writer(dir_.path());
        auto written = writer.write(gen::IdentifierSet::freeze(std::move(keys)), "verify.txt");
        ASSERT_TRUE(written.has_value());
        artifact_ = *written;

        auto parts = ArtifactPartitioner().partition(artifact_, 1000);
        ASSERT_TRUE(parts.has_value());
        ASSERT_GT(parts->size(), 1u);
        partitions_ = *parts;
    }

    TempDirGuard dir_{"numgen_verify"};
    Artifact artifact_;
    std::vector<Partition> partitions_;
};

TEST_F(PartitionVerifierTest, IntactPartitionsVerify) {
    auto report = verifyPartitions(artifact_, partitions_);
    ASSERT_TRUE(report.has_value()) << report.error().message();

    EXPECT_FALSE(report->passThrough);
    EXPECT_EQ(report->partitionCount, partitions_.size());
    EXPECT_EQ(report->artifactDigest, report->partitionsDigest);
    EXPECT_EQ(report->artifactBytes, 500 * kArtifactLineBytes);
    EXPECT_EQ(report->partitionBytes, report->artifactBytes);
    EXPECT_EQ(report->artifactLines, 500u);
    EXPECT_EQ(report->partitionLines, 500u);
}

TEST_F(PartitionVerifierTest, PassThroughVerifies) {
    auto whole = ArtifactPartitioner().partition(artifact_, artifact_.sizeBytes);
    ASSERT_TRUE(whole.has_value());

    auto report = verifyPartitions(artifact_, *whole);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->passThrough);
    EXPECT_EQ(report->artifactLines, 500u);
}

TEST_F(PartitionVerifierTest, DetectsAlteredContent) {
    // Same size, different digit
    std::string content = readFile(partitions_[1].path);
    content[0] = content[0] == '9' ? '8' : '9';
    writeFile(partitions_[1].path, content);

    auto report = verifyPartitions(artifact_, partitions_);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kVerificationFailed);
}

TEST_F(PartitionVerifierTest, DetectsMissingPartition) {
    std::vector<Partition> incomplete(partitions_.begin(), partitions_.end() - 1);

    auto report = verifyPartitions(artifact_, incomplete);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kVerificationFailed);
}

TEST_F(PartitionVerifierTest, DetectsOutOfOrderPartitions) {
    std::vector<Partition> swapped = partitions_;
    std::swap(swapped[0], swapped[1]);

    auto report = verifyPartitions(artifact_, swapped);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kVerificationFailed);
}

TEST_F(PartitionVerifierTest, DeletedPartitionHasExpired) {
    std::filesystem::remove(partitions_.back().path);

    auto report = verifyPartitions(artifact_, partitions_);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kArtifactExpired);
}

}  // namespace numgen::artifact::test
