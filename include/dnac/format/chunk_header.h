// =============================================================================
// dnac - Chunk Header Format
// =============================================================================
// Fixed-size header prepended to every chunk before error-correction coding.
// All multi-byte fields are big-endian.
//
// Layout (26 bytes):
// +--------+-------+------------------------------------------------+
// | offset | size  | field                                          |
// +--------+-------+------------------------------------------------+
// |    0   |   1   | format version                                 |
// |    1   |   1   | flags (see flags namespace)                    |
// |    2   |   4   | chunk index                                    |
// |    6   |   4   | total chunk count                              |
// |   10   |   8   | original length of the chunked stream          |
// |   18   |   8   | XXH64 (seed 0) of this chunk's data bytes      |
// +--------+-------+------------------------------------------------+
//
// The protected chunk is header || data || parity, so the header itself is
// covered by Reed-Solomon as well.
// =============================================================================

#ifndef DNAC_FORMAT_CHUNK_HEADER_H
#define DNAC_FORMAT_CHUNK_HEADER_H

#include <array>
#include <cstddef>
#include <cstdint>

#include "dnac/common/error.h"
#include "dnac/common/types.h"

namespace dnac::format {

/// @brief Current chunk header version.
inline constexpr std::uint8_t kChunkFormatVersion = 1;

/// @brief Chunk header flag bits.
namespace flags {

/// @brief Bit 0: chunk stream is an encryption envelope.
inline constexpr std::uint8_t kEncrypted = 1U << 0;

/// @brief Bits 1-2: error-correction level.
inline constexpr std::uint8_t kLevelMask = 0x3U << 1;
inline constexpr std::uint8_t kLevelShift = 1;

/// @brief Bits 3-7: reserved, must be 0.
inline constexpr std::uint8_t kReservedMask = 0xF8;

}  // namespace flags

[[nodiscard]] constexpr std::uint8_t encodeFlags(bool encrypted,
                                                 ErrorCorrectionLevel level) noexcept {
    return static_cast<std::uint8_t>((encrypted ? flags::kEncrypted : 0) |
                                     (static_cast<std::uint8_t>(level) << flags::kLevelShift));
}

[[nodiscard]] constexpr bool isEncrypted(std::uint8_t flagBits) noexcept {
    return (flagBits & flags::kEncrypted) != 0;
}

/// @brief Raw level bits of a flag byte (not yet validated).
[[nodiscard]] constexpr std::uint8_t levelBits(std::uint8_t flagBits) noexcept {
    return static_cast<std::uint8_t>((flagBits & flags::kLevelMask) >> flags::kLevelShift);
}

/// @brief Decoded chunk header.
struct ChunkHeader {
    static constexpr std::size_t kSize = 26;

    std::uint8_t version = kChunkFormatVersion;

    bool encrypted = false;

    ErrorCorrectionLevel level = ErrorCorrectionLevel::kBasic;

    /// @brief Zero-based position of this chunk.
    ChunkIndex index = 0;

    /// @brief Number of chunks in the set.
    std::uint32_t totalChunks = 0;

    /// @brief Length of the chunked stream in bytes.
    std::uint64_t originalLength = 0;

    /// @brief XXH64 of this chunk's data bytes.
    Checksum checksum = 0;

    [[nodiscard]] bool isValid() const noexcept {
        return version == kChunkFormatVersion && totalChunks > 0 && index < totalChunks;
    }

    bool operator==(const ChunkHeader&) const = default;
};

/// @brief Serialize a header.
[[nodiscard]] std::array<std::uint8_t, ChunkHeader::kSize> encodeHeader(const ChunkHeader& header);

/// @brief Parse and validate the first kSize bytes of a buffer.
/// @return ValidationError on short input, unknown version, reserved or
///         unknown level bits, zero total, or index >= total.
[[nodiscard]] Result<ChunkHeader> decodeHeader(ByteSpan bytes);

/// @brief XXH64 (seed 0) of a byte range.
[[nodiscard]] Checksum computeChecksum(ByteSpan data) noexcept;

}  // namespace dnac::format

#endif  // DNAC_FORMAT_CHUNK_HEADER_H
