// =============================================================================
// dnac - Symbol Codec Implementation
// =============================================================================

#include "dnac/codec/symbol_codec.h"

#include <cctype>

#include <fmt/format.h>

namespace dnac::codec {

namespace {

/// @brief Four-symbol expansion of every byte value.
constexpr auto kByteToSymbols = [] {
    std::array<std::array<char, 4>, 256> table{};
    for (std::size_t value = 0; value < 256; ++value) {
        for (std::size_t i = 0; i < kSymbolsPerByte; ++i) {
            const std::size_t shift = (kSymbolsPerByte - 1 - i) * kBitsPerSymbol;
            table[value][i] = kSymbolAlphabet[(value >> shift) & 0x3];
        }
    }
    return table;
}();

static_assert(kByteToSymbols[0x1B][0] == 'A' && kByteToSymbols[0x1B][1] == 'T' &&
              kByteToSymbols[0x1B][2] == 'C' && kByteToSymbols[0x1B][3] == 'G');

}  // namespace

std::string bytesToSymbols(ByteSpan bytes) {
    std::string symbols;
    symbols.resize(bytes.size() * kSymbolsPerByte);

    char* out = symbols.data();
    for (std::uint8_t value : bytes) {
        const auto& group = kByteToSymbols[value];
        out[0] = group[0];
        out[1] = group[1];
        out[2] = group[2];
        out[3] = group[3];
        out += kSymbolsPerByte;
    }
    return symbols;
}

Result<Bytes> symbolsToBytes(std::string_view symbols) {
    if (symbols.size() % kSymbolsPerByte != 0) {
        return makeError<Bytes>(
            ErrorCode::kValidationError,
            fmt::format("sequence length {} is not a multiple of {}", symbols.size(),
                        kSymbolsPerByte),
            ErrorContext{}.withOffset(symbols.size()));
    }

    Bytes bytes(symbols.size() / kSymbolsPerByte);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        std::uint8_t value = 0;
        for (std::size_t j = 0; j < kSymbolsPerByte; ++j) {
            const std::size_t offset = i * kSymbolsPerByte + j;
            const std::uint8_t code = symbolCode(symbols[offset]);
            if (code == kInvalidSymbolCode) {
                const auto c = static_cast<unsigned char>(symbols[offset]);
                return makeError<Bytes>(
                    ErrorCode::kValidationError,
                    std::isprint(c) != 0
                        ? fmt::format("invalid symbol '{}' at offset {}", symbols[offset], offset)
                        : fmt::format("invalid symbol 0x{:02x} at offset {}", c, offset),
                    ErrorContext{}.withOffset(offset));
            }
            value = static_cast<std::uint8_t>((value << kBitsPerSymbol) | code);
        }
        bytes[i] = value;
    }
    return bytes;
}

}  // namespace dnac::codec
