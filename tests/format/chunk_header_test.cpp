// =============================================================================
// dnac - Chunk Header Tests
// =============================================================================
// Unit and property tests for the fixed 26-byte chunk header layout.
// =============================================================================

#include "dnac/format/chunk_header.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <array>
#include <string>

namespace dnac::format::test {

namespace {

ChunkHeader sampleHeader() {
    ChunkHeader header;
    header.encrypted = true;
    header.level = ErrorCorrectionLevel::kAdvanced;
    header.index = 2;
    header.totalChunks = 5;
    header.originalLength = 0x0102030405ULL;
    header.checksum = 0xDEADBEEFCAFEF00DULL;
    return header;
}

Bytes toBytes(const std::array<std::uint8_t, ChunkHeader::kSize>& raw) {
    return Bytes(raw.begin(), raw.end());
}

}  // namespace

TEST(ChunkHeaderTest, LayoutIsBigEndian) {
    const auto raw = encodeHeader(sampleHeader());

    EXPECT_EQ(raw[0], kChunkFormatVersion);
    EXPECT_EQ(raw[1], 0x03);  // encrypted | advanced << 1
    EXPECT_EQ(raw[2], 0x00);
    EXPECT_EQ(raw[5], 0x02);  // index
    EXPECT_EQ(raw[9], 0x05);  // total
    EXPECT_EQ(raw[13], 0x01);
    EXPECT_EQ(raw[17], 0x05);  // length low byte
    EXPECT_EQ(raw[18], 0xDE);  // checksum high byte
    EXPECT_EQ(raw[25], 0x0D);
}

TEST(ChunkHeaderTest, DecodeRoundTrip) {
    const ChunkHeader header = sampleHeader();
    auto decoded = decodeHeader(toBytes(encodeHeader(header)));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, header);
    EXPECT_TRUE(decoded->isValid());
}

TEST(ChunkHeaderTest, TrailingDataIgnored) {
    Bytes bytes = toBytes(encodeHeader(sampleHeader()));
    bytes.push_back(0xAB);
    auto decoded = decodeHeader(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->index, 2u);
}

TEST(ChunkHeaderTest, RejectsShortInput) {
    Bytes bytes = toBytes(encodeHeader(sampleHeader()));
    bytes.pop_back();
    auto decoded = decodeHeader(bytes);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kValidationError);
}

TEST(ChunkHeaderTest, RejectsUnknownVersion) {
    Bytes bytes = toBytes(encodeHeader(sampleHeader()));
    bytes[0] = 2;
    auto decoded = decodeHeader(bytes);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_NE(decoded.error().message().find("version"), std::string::npos);
}

TEST(ChunkHeaderTest, RejectsReservedFlags) {
    Bytes bytes = toBytes(encodeHeader(sampleHeader()));
    bytes[1] |= 0x10;
    EXPECT_FALSE(decodeHeader(bytes).has_value());
}

TEST(ChunkHeaderTest, RejectsUnknownLevel) {
    Bytes bytes = toBytes(encodeHeader(sampleHeader()));
    bytes[1] = 0x04;  // level bits = 2
    auto decoded = decodeHeader(bytes);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kValidationError);
}

TEST(ChunkHeaderTest, RejectsIndexOutOfRange) {
    ChunkHeader header = sampleHeader();
    header.index = 5;
    auto decoded = decodeHeader(toBytes(encodeHeader(header)));
    ASSERT_FALSE(decoded.has_value());
    ASSERT_TRUE(decoded.error().context().has_value());
    ASSERT_TRUE(decoded.error().context()->chunkIndex.has_value());
    EXPECT_EQ(*decoded.error().context()->chunkIndex, 5u);

    header.index = 0;
    header.totalChunks = 0;
    EXPECT_FALSE(decodeHeader(toBytes(encodeHeader(header))).has_value());
}

TEST(ChunkHeaderTest, FlagHelpers) {
    const std::uint8_t bits = encodeFlags(false, ErrorCorrectionLevel::kAdvanced);
    EXPECT_FALSE(isEncrypted(bits));
    EXPECT_EQ(levelBits(bits), 1);
    EXPECT_TRUE(isEncrypted(encodeFlags(true, ErrorCorrectionLevel::kBasic)));
}

TEST(ChunkHeaderTest, ChecksumDependsOnContent) {
    const Bytes a = {1, 2, 3};
    const Bytes b = {1, 2, 4};
    EXPECT_EQ(computeChecksum(a), computeChecksum(a));
    EXPECT_NE(computeChecksum(a), computeChecksum(b));
}

RC_GTEST_PROP(ChunkHeaderProperty, EncodeDecodeIdentity, ()) {
    ChunkHeader header;
    header.totalChunks = *rc::gen::inRange<std::uint32_t>(1, 100000);
    header.index = *rc::gen::inRange<std::uint32_t>(0, header.totalChunks);
    header.encrypted = *rc::gen::arbitrary<bool>();
    header.level = *rc::gen::element(ErrorCorrectionLevel::kBasic, ErrorCorrectionLevel::kAdvanced);
    header.originalLength = *rc::gen::arbitrary<std::uint64_t>();
    header.checksum = *rc::gen::arbitrary<std::uint64_t>();

    auto decoded = decodeHeader(toBytes(encodeHeader(header)));
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == header);
}

}  // namespace dnac::format::test
