// =============================================================================
// dnac - Symbol Codec Tests
// =============================================================================
// Unit and property tests for the byte <-> nucleotide mapping.
// =============================================================================

#include "dnac/codec/symbol_codec.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace dnac::codec::test {

TEST(SymbolCodecTest, KnownMappings) {
    const Bytes bytes = {0x00, 0xFF, 0x1B, 0xE4};
    EXPECT_EQ(bytesToSymbols(bytes), "AAAAGGGGATCGGCTA");
}

TEST(SymbolCodecTest, EmptyInput) {
    EXPECT_TRUE(bytesToSymbols(Bytes{}).empty());

    auto decoded = symbolsToBytes("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(SymbolCodecTest, LowerCaseAccepted) {
    auto decoded = symbolsToBytes("atcg");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 1u);
    EXPECT_EQ((*decoded)[0], 0x1B);
}

TEST(SymbolCodecTest, InvalidSymbolReportsOffset) {
    auto decoded = symbolsToBytes("ATCGATNG");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kValidationError);
    ASSERT_TRUE(decoded.error().context().has_value());
    ASSERT_TRUE(decoded.error().context()->byteOffset.has_value());
    EXPECT_EQ(*decoded.error().context()->byteOffset, 6u);
    EXPECT_NE(decoded.error().message().find("'N'"), std::string::npos);
}

TEST(SymbolCodecTest, LengthNotMultipleOfFour) {
    auto decoded = symbolsToBytes("ATCGA");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kValidationError);
}

TEST(SymbolCodecTest, ValidSymbols) {
    for (char c : kSymbolAlphabet) {
        EXPECT_TRUE(isValidSymbol(c));
    }
    EXPECT_FALSE(isValidSymbol('N'));
    EXPECT_FALSE(isValidSymbol('U'));
    EXPECT_FALSE(isValidSymbol(' '));
}

TEST(SymbolCodecTest, MixedCaseDecodesLikeUpperCase) {
    auto mixed = symbolsToBytes("atCGgcTa");
    auto upper = symbolsToBytes("ATCGGCTA");
    ASSERT_TRUE(mixed.has_value());
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*mixed, *upper);
    EXPECT_TRUE(isValidSymbol('g'));
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(SymbolCodecProperty, RoundTrip, (const std::vector<std::uint8_t>& bytes)) {
    const std::string symbols = bytesToSymbols(bytes);
    RC_ASSERT(symbols.size() == bytes.size() * kSymbolsPerByte);
    RC_ASSERT(std::all_of(symbols.begin(), symbols.end(), isValidSymbol));

    auto decoded = symbolsToBytes(symbols);
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == bytes);
}

RC_GTEST_PROP(SymbolCodecProperty, SingleSymbolChangeAffectsOneByte,
              (const std::vector<std::uint8_t>& bytes)) {
    RC_PRE(!bytes.empty());
    std::string symbols = bytesToSymbols(bytes);
    const auto position = *rc::gen::inRange<std::size_t>(0, symbols.size());
    const std::uint8_t code = symbolCode(symbols[position]);
    symbols[position] = kSymbolAlphabet[(code + 1) % kSymbolAlphabet.size()];

    auto decoded = symbolsToBytes(symbols);
    RC_ASSERT(decoded.has_value());
    std::size_t differing = 0;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        differing += (*decoded)[i] != bytes[i] ? 1 : 0;
    }
    RC_ASSERT(differing == 1u);
    RC_ASSERT((*decoded)[position / kSymbolsPerByte] != bytes[position / kSymbolsPerByte]);
}

}  // namespace dnac::codec::test
