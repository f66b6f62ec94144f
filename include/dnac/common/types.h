// =============================================================================
// dnac - Common Type Definitions
// =============================================================================
// Core type definitions for the dnac library.
//
// This module defines:
// - Bytes, ByteSpan: owning and non-owning byte buffers
// - ChunkIndex, Checksum: type aliases for header fields
// - ErrorCorrectionLevel: Enum for redundancy levels
// - KdfParams: Password key-derivation cost
// - Geometry constants shared by the chunker and the codecs
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef DNAC_COMMON_TYPES_H
#define DNAC_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "dnac/common/error.h"

namespace dnac {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Owning byte buffer.
using Bytes = std::vector<std::uint8_t>;

/// @brief Non-owning view over bytes.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief Zero-based chunk position within an encoded set.
using ChunkIndex = std::uint32_t;

/// @brief Type alias for checksum values (xxHash64).
using Checksum = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Number of bits carried by one nucleotide symbol.
inline constexpr std::size_t kBitsPerSymbol = 2;

/// @brief Number of nucleotide symbols per byte.
inline constexpr std::size_t kSymbolsPerByte = 4;

/// @brief Default sequence length in symbols.
inline constexpr std::uint32_t kDefaultBaseLength = 200;

/// @brief Maximum sequence length: one 255-byte Reed-Solomon codeword.
inline constexpr std::uint32_t kMaxBaseLength = 1020;

/// @brief Maximum worker threads used when auto-detecting.
inline constexpr std::size_t kMaxAutoThreads = 32;

// =============================================================================
// Error Correction Level
// =============================================================================

/// @brief Redundancy level applied to every chunk.
/// @note Stored in the chunk header flags (bits 1-2).
enum class ErrorCorrectionLevel : std::uint8_t {
    /// @brief 8 parity bytes per chunk, corrects up to 4 corrupted bytes.
    kBasic = 0,

    /// @brief 16 parity bytes per chunk, corrects up to 8 corrupted bytes.
    kAdvanced = 1
};

/// @brief Number of Reed-Solomon parity bytes appended at a level.
[[nodiscard]] constexpr std::size_t paritySymbols(ErrorCorrectionLevel level) noexcept {
    return level == ErrorCorrectionLevel::kAdvanced ? 16 : 8;
}

/// @brief Maximum number of corrupted bytes per chunk that a level repairs.
[[nodiscard]] constexpr std::size_t correctionBound(ErrorCorrectionLevel level) noexcept {
    return paritySymbols(level) / 2;
}

/// @brief The other level (used when probing an undeclared level).
[[nodiscard]] constexpr ErrorCorrectionLevel otherLevel(ErrorCorrectionLevel level) noexcept {
    return level == ErrorCorrectionLevel::kAdvanced ? ErrorCorrectionLevel::kBasic
                                                     : ErrorCorrectionLevel::kAdvanced;
}

[[nodiscard]] constexpr std::string_view levelToString(ErrorCorrectionLevel level) noexcept {
    switch (level) {
        case ErrorCorrectionLevel::kBasic:
            return "basic";
        case ErrorCorrectionLevel::kAdvanced:
            return "advanced";
    }
    return "unknown";
}

/// @brief Parse a level name.
/// @note "robust" is accepted as an alias of "advanced".
[[nodiscard]] inline Result<ErrorCorrectionLevel> parseErrorCorrectionLevel(
    std::string_view name) {
    if (name == "basic") {
        return ErrorCorrectionLevel::kBasic;
    }
    if (name == "advanced" || name == "robust") {
        return ErrorCorrectionLevel::kAdvanced;
    }
    return makeError<ErrorCorrectionLevel>(
        ErrorCode::kConfigurationError,
        "unknown error-correction level '" + std::string(name) + "'");
}

// =============================================================================
// Key Derivation Parameters
// =============================================================================

/// @brief PBKDF2 cost parameters recorded in every envelope.
struct KdfParams {
    static constexpr std::uint32_t kDefaultIterations = 100'000;
    static constexpr std::uint32_t kMinIterations = 1'000;
    static constexpr std::uint32_t kMaxIterations = 10'000'000;

    std::uint32_t iterations = kDefaultIterations;

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return iterations >= kMinIterations && iterations <= kMaxIterations;
    }
};

// =============================================================================
// Static Assertions
// =============================================================================

static_assert(sizeof(ErrorCorrectionLevel) == 1, "ErrorCorrectionLevel must be 1 byte");
static_assert(sizeof(ChunkIndex) == 4, "ChunkIndex must be 4 bytes");
static_assert(sizeof(Checksum) == 8, "Checksum must be 8 bytes");
static_assert(kMaxBaseLength / kSymbolsPerByte == 255, "a chunk must fit one RS codeword");
static_assert(correctionBound(ErrorCorrectionLevel::kBasic) == 4);
static_assert(correctionBound(ErrorCorrectionLevel::kAdvanced) == 8);

}  // namespace dnac

#endif  // DNAC_COMMON_TYPES_H
