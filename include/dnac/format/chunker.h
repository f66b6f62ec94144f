// =============================================================================
// dnac - Chunker / Reassembler
// =============================================================================
// Splits a byte stream into fixed-size chunks and merges validated chunks
// back into the stream.
//
// Chunk geometry: a protected chunk is header || data || parity and maps to
// four symbols per byte, so a full chunk carries
//
//   capacity = baseLength / 4 - ChunkHeader::kSize - parity(level)
//
// data bytes and becomes a sequence of exactly baseLength symbols. Only the
// last chunk may be shorter; it is never padded.
// =============================================================================

#ifndef DNAC_FORMAT_CHUNKER_H
#define DNAC_FORMAT_CHUNKER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "dnac/common/error.h"
#include "dnac/common/types.h"
#include "dnac/format/chunk_header.h"

namespace dnac::format {

/// @brief Upper bound on individually listed missing indices in a report.
inline constexpr std::size_t kMaxReportedMissingChunks = 64;

/// @brief Data bytes per full chunk for a base length and level.
/// @return ConfigurationError when baseLength is not a positive multiple of 4,
///         exceeds kMaxBaseLength, or leaves no room for a payload byte.
[[nodiscard]] Result<std::size_t> chunkCapacity(std::uint32_t baseLength,
                                                ErrorCorrectionLevel level);

/// @brief Number of chunks a stream of streamLength bytes splits into.
[[nodiscard]] constexpr std::size_t chunkCount(std::size_t streamLength,
                                               std::size_t chunkSize) noexcept {
    if (streamLength == 0) {
        return 1;
    }
    return (streamLength + chunkSize - 1) / chunkSize;
}

/// @brief Split a stream into contiguous slices of chunkSize bytes.
/// @note An empty stream yields a single empty slice.
[[nodiscard]] std::vector<ByteSpan> splitPayload(ByteSpan stream, std::size_t chunkSize);

/// @brief A chunk that passed error correction, header and checksum checks.
struct DecodedChunk {
    /// @brief Position of the source sequence in the caller's input.
    std::size_t sequencePosition = 0;

    ChunkHeader header;

    Bytes data;
};

/// @brief Merge validated chunks into the original stream.
/// @note Collects every inconsistency before failing: chunks disagreeing with
///       the majority on total, length, encrypted flag or level
///       (ValidationError), duplicate indices (ValidationError) and missing
///       indices (MissingChunkError). Faults are ordered by chunk index.
[[nodiscard]] Result<Bytes> reassemble(std::vector<DecodedChunk> chunks);

}  // namespace dnac::format

#endif  // DNAC_FORMAT_CHUNKER_H
