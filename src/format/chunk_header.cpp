// =============================================================================
// dnac - Chunk Header Format Implementation
// =============================================================================

#include "dnac/format/chunk_header.h"

#include <fmt/format.h>
#include <xxhash.h>

namespace dnac::format {

namespace {

template <typename T>
void storeBigEndian(std::uint8_t* out, T value) noexcept {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<std::uint8_t>(value >> (8 * (sizeof(T) - 1 - i)));
    }
}

template <typename T>
T loadBigEndian(const std::uint8_t* in) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | in[i]);
    }
    return value;
}

constexpr std::size_t kVersionOffset = 0;
constexpr std::size_t kFlagsOffset = 1;
constexpr std::size_t kIndexOffset = 2;
constexpr std::size_t kTotalOffset = 6;
constexpr std::size_t kLengthOffset = 10;
constexpr std::size_t kChecksumOffset = 18;

static_assert(kChecksumOffset + sizeof(Checksum) == ChunkHeader::kSize);

}  // namespace

std::array<std::uint8_t, ChunkHeader::kSize> encodeHeader(const ChunkHeader& header) {
    std::array<std::uint8_t, ChunkHeader::kSize> out{};
    out[kVersionOffset] = header.version;
    out[kFlagsOffset] = encodeFlags(header.encrypted, header.level);
    storeBigEndian<std::uint32_t>(out.data() + kIndexOffset, header.index);
    storeBigEndian<std::uint32_t>(out.data() + kTotalOffset, header.totalChunks);
    storeBigEndian<std::uint64_t>(out.data() + kLengthOffset, header.originalLength);
    storeBigEndian<std::uint64_t>(out.data() + kChecksumOffset, header.checksum);
    return out;
}

Result<ChunkHeader> decodeHeader(ByteSpan bytes) {
    if (bytes.size() < ChunkHeader::kSize) {
        return makeError<ChunkHeader>(
            ErrorCode::kValidationError,
            fmt::format("chunk of {} bytes is shorter than its {}-byte header", bytes.size(),
                        ChunkHeader::kSize));
    }

    ChunkHeader header;
    header.version = bytes[kVersionOffset];
    if (header.version != kChunkFormatVersion) {
        return makeError<ChunkHeader>(
            ErrorCode::kValidationError,
            fmt::format("unsupported chunk format version {}", header.version));
    }

    const std::uint8_t flagBits = bytes[kFlagsOffset];
    if ((flagBits & flags::kReservedMask) != 0) {
        return makeError<ChunkHeader>(
            ErrorCode::kValidationError,
            fmt::format("reserved header flag bits set (0x{:02x})", flagBits));
    }
    const std::uint8_t level = levelBits(flagBits);
    if (level > static_cast<std::uint8_t>(ErrorCorrectionLevel::kAdvanced)) {
        return makeError<ChunkHeader>(ErrorCode::kValidationError,
                                      fmt::format("unknown error-correction level {}", level));
    }
    header.encrypted = isEncrypted(flagBits);
    header.level = static_cast<ErrorCorrectionLevel>(level);

    header.index = loadBigEndian<std::uint32_t>(bytes.data() + kIndexOffset);
    header.totalChunks = loadBigEndian<std::uint32_t>(bytes.data() + kTotalOffset);
    header.originalLength = loadBigEndian<std::uint64_t>(bytes.data() + kLengthOffset);
    header.checksum = loadBigEndian<std::uint64_t>(bytes.data() + kChecksumOffset);

    if (header.totalChunks == 0) {
        return makeError<ChunkHeader>(ErrorCode::kValidationError,
                                      "header declares a total of zero chunks");
    }
    if (header.index >= header.totalChunks) {
        return makeError<ChunkHeader>(
            ErrorCode::kValidationError,
            fmt::format("chunk index {} is not below the total {}", header.index,
                        header.totalChunks),
            ErrorContext{}.withChunk(header.index));
    }
    return header;
}

Checksum computeChecksum(ByteSpan data) noexcept {
    return XXH64(data.data(), data.size(), 0);
}

}  // namespace dnac::format
