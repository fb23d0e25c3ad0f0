// =============================================================================
// numgen - CSV Text Encoding Tests
// =============================================================================

#include "numgen/lookup/text_encoding.h"

#include <gtest/gtest.h>

#include <string>

namespace numgen::lookup::test {

namespace {

// "广东省" in GBK and UTF-8
const std::string kGbkProvince = "\xB9\xE3\xB6\xAB\xCA\xA1";
const std::string kUtf8Province = "\xE5\xB9\xBF\xE4\xB8\x9C\xE7\x9C\x81";

}  // namespace

// =============================================================================
// UTF-8 Validation
// =============================================================================

TEST(Utf8ValidationTest, AcceptsAsciiAndMultibyte) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("138,0013,Guangdong,Shenzhen,1"));
    EXPECT_TRUE(isValidUtf8(kUtf8Province));
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x93\x9E"));
}

TEST(Utf8ValidationTest, RejectsMalformedSequences) {
    EXPECT_FALSE(isValidUtf8(kGbkProvince));
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));
    EXPECT_FALSE(isValidUtf8("\xE0\x80\xAF"));
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80"));
    EXPECT_FALSE(isValidUtf8("\xE5\xB9"));
    EXPECT_FALSE(isValidUtf8("\x80"));
}

// =============================================================================
// Detection
// =============================================================================

TEST(EncodingDetectionTest, Utf8Sample) {
    auto encoding = detectEncoding("prefix,suffix\n138,0013," + kUtf8Province + "\n", true);
    ASSERT_TRUE(encoding.has_value());
    EXPECT_EQ(*encoding, TextEncoding::kUtf8);
}

TEST(EncodingDetectionTest, GbkSample) {
    auto encoding = detectEncoding("prefix,suffix\n138,0013," + kGbkProvince + "\n", true);
    ASSERT_TRUE(encoding.has_value());
    EXPECT_EQ(*encoding, TextEncoding::kGb18030);
    EXPECT_EQ(encodingName(*encoding), "GB18030");
}

TEST(EncodingDetectionTest, PartialSampleIgnoresCutCharacter) {
    // The sample ends inside a UTF-8 character of an unfinished line
    const std::string sample = "a," + kUtf8Province + "\nb,\xE5\xB9";
    auto encoding = detectEncoding(sample, false);
    ASSERT_TRUE(encoding.has_value());
    EXPECT_EQ(*encoding, TextEncoding::kUtf8);
}

TEST(EncodingDetectionTest, UnknownBytesAreUnreadable) {
    auto encoding = detectEncoding("a,\xFF\xFF\n", true);
    ASSERT_FALSE(encoding.has_value());
    EXPECT_EQ(encoding.error().code(), ErrorCode::kSourceUnreadable);
}

// =============================================================================
// GB18030 Decoding
// =============================================================================

TEST(Gb18030DecoderTest, ConvertsToUtf8) {
    Gb18030Decoder decoder;
    auto decoded = decoder.decode("138,0013," + kGbkProvince + ",1");
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message();
    EXPECT_EQ(*decoded, "138,0013," + kUtf8Province + ",1");
}

TEST(Gb18030DecoderTest, ReusableAfterFailure) {
    Gb18030Decoder decoder;
    auto truncated = decoder.decode("\xB9\xE3\xB6");
    ASSERT_FALSE(truncated.has_value());
    EXPECT_EQ(truncated.error().code(), ErrorCode::kSourceUnreadable);

    auto next = decoder.decode(kGbkProvince);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, kUtf8Province);
}

TEST(Gb18030DecoderTest, LongInputGrowsOutput) {
    std::string gbk;
    std::string utf8;
    for (int i = 0; i < 5000; ++i) {
        gbk += kGbkProvince;
        utf8 += kUtf8Province;
    }
    Gb18030Decoder decoder;
    auto decoded = decoder.decode(gbk);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, utf8);
}

}  // namespace numgen::lookup::test
