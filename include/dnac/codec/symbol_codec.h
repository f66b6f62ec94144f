// =============================================================================
// dnac - Symbol Codec
// =============================================================================
// Bijective mapping between bytes and nucleotide symbols.
//
// Each byte is split into four 2-bit groups, most significant first, and each
// group selects one symbol:
//
//   00 -> A    01 -> T    10 -> C    11 -> G
//
// so the byte 0b00011011 becomes "ATCG". Decoding accepts lower case input
// and rejects anything outside the alphabet.
// =============================================================================

#ifndef DNAC_CODEC_SYMBOL_CODEC_H
#define DNAC_CODEC_SYMBOL_CODEC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "dnac/common/error.h"
#include "dnac/common/types.h"

namespace dnac::codec {

/// @brief Symbol for each 2-bit value.
inline constexpr std::array<char, 4> kSymbolAlphabet = {'A', 'T', 'C', 'G'};

/// @brief Marker for characters outside the alphabet.
inline constexpr std::uint8_t kInvalidSymbolCode = 0xFF;

/// @brief Map a character (either case) to its 2-bit value.
/// @return kInvalidSymbolCode for characters outside the alphabet.
[[nodiscard]] constexpr std::uint8_t symbolCode(char c) noexcept {
    switch (c) {
        case 'A':
        case 'a':
            return 0;
        case 'T':
        case 't':
            return 1;
        case 'C':
        case 'c':
            return 2;
        case 'G':
        case 'g':
            return 3;
        default:
            return kInvalidSymbolCode;
    }
}

[[nodiscard]] constexpr bool isValidSymbol(char c) noexcept {
    return symbolCode(c) != kInvalidSymbolCode;
}

/// @brief Map bytes to symbols; the result has exactly 4 * bytes.size() symbols.
[[nodiscard]] std::string bytesToSymbols(ByteSpan bytes);

/// @brief Map symbols back to bytes.
/// @return ValidationError naming the first bad offset when the length is not
///         a multiple of 4 or a character is outside the alphabet.
[[nodiscard]] Result<Bytes> symbolsToBytes(std::string_view symbols);

}  // namespace dnac::codec

#endif  // DNAC_CODEC_SYMBOL_CODEC_H
