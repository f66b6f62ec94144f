// =============================================================================
// dnac - Chunker / Reassembler Implementation
// =============================================================================

#include "dnac/format/chunker.h"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <tuple>

#include <fmt/format.h>

#include "dnac/common/logger.h"

namespace dnac::format {

namespace {

/// @brief Fields every chunk of one set must agree on.
struct SetSignature {
    std::uint32_t totalChunks = 0;
    std::uint64_t originalLength = 0;
    bool encrypted = false;
    ErrorCorrectionLevel level = ErrorCorrectionLevel::kBasic;

    auto operator<=>(const SetSignature&) const = default;
};

SetSignature signatureOf(const ChunkHeader& header) {
    return SetSignature{header.totalChunks, header.originalLength, header.encrypted, header.level};
}

std::string describe(const SetSignature& sig) {
    return fmt::format("total {}, length {}, {}, level {}", sig.totalChunks, sig.originalLength,
                       sig.encrypted ? "encrypted" : "plain", levelToString(sig.level));
}

/// @brief Signature shared by most chunks; ties go to the earliest input.
SetSignature majoritySignature(const std::vector<DecodedChunk>& chunks) {
    std::map<SetSignature, std::size_t> votes;
    std::vector<SetSignature> firstSeen;
    for (const auto& chunk : chunks) {
        const SetSignature sig = signatureOf(chunk.header);
        if (votes[sig]++ == 0) {
            firstSeen.push_back(sig);
        }
    }

    SetSignature best = firstSeen.front();
    for (const auto& sig : firstSeen) {
        if (votes[sig] > votes[best]) {
            best = sig;
        }
    }
    return best;
}

class MissingReporter {
public:
    explicit MissingReporter(std::vector<ChunkFault>& faults) : faults_(faults) {}

    void addRange(std::uint64_t from, std::uint64_t to) {
        for (std::uint64_t index = from; index < to; ++index) {
            if (listed_ == kMaxReportedMissingChunks) {
                unlisted_ += to - index;
                if (!firstUnlisted_.has_value()) {
                    firstUnlisted_ = static_cast<ChunkIndex>(index);
                }
                return;
            }
            ChunkFault fault;
            fault.code = ErrorCode::kMissingChunk;
            fault.chunkIndex = static_cast<ChunkIndex>(index);
            fault.message = fmt::format("chunk {} is missing", index);
            faults_.push_back(std::move(fault));
            ++listed_;
        }
    }

    void finish() {
        if (unlisted_ == 0) {
            return;
        }
        ChunkFault fault;
        fault.code = ErrorCode::kMissingChunk;
        fault.chunkIndex = firstUnlisted_;
        fault.message = fmt::format("{} further chunks are missing", unlisted_);
        faults_.push_back(std::move(fault));
    }

private:
    std::vector<ChunkFault>& faults_;
    std::size_t listed_ = 0;
    std::uint64_t unlisted_ = 0;
    std::optional<ChunkIndex> firstUnlisted_;
};

}  // namespace

Result<std::size_t> chunkCapacity(std::uint32_t baseLength, ErrorCorrectionLevel level) {
    if (baseLength == 0 || baseLength % kSymbolsPerByte != 0) {
        return makeError<std::size_t>(
            ErrorCode::kConfigurationError,
            fmt::format("base length {} is not a positive multiple of {}", baseLength,
                        kSymbolsPerByte));
    }
    if (baseLength > kMaxBaseLength) {
        return makeError<std::size_t>(
            ErrorCode::kConfigurationError,
            fmt::format("base length {} exceeds the maximum of {}", baseLength, kMaxBaseLength));
    }

    const std::size_t overhead = ChunkHeader::kSize + paritySymbols(level);
    const std::size_t codewordBytes = baseLength / kSymbolsPerByte;
    if (codewordBytes <= overhead) {
        return makeError<std::size_t>(
            ErrorCode::kConfigurationError,
            fmt::format("base length {} leaves no room for data at level {} (minimum {})",
                        baseLength, levelToString(level),
                        (overhead + 1) * kSymbolsPerByte));
    }
    return codewordBytes - overhead;
}

std::vector<ByteSpan> splitPayload(ByteSpan stream, std::size_t chunkSize) {
    std::vector<ByteSpan> slices;
    if (stream.empty() || chunkSize == 0) {
        slices.push_back(stream.first(0));
        return slices;
    }

    slices.reserve(chunkCount(stream.size(), chunkSize));
    for (std::size_t offset = 0; offset < stream.size(); offset += chunkSize) {
        slices.push_back(stream.subspan(offset, std::min(chunkSize, stream.size() - offset)));
    }
    return slices;
}

Result<Bytes> reassemble(std::vector<DecodedChunk> chunks) {
    if (chunks.empty()) {
        return makeError<Bytes>(ErrorCode::kValidationError, "no chunks to reassemble");
    }

    const SetSignature reference = majoritySignature(chunks);
    std::vector<ChunkFault> faults;

    std::vector<const DecodedChunk*> accepted;
    accepted.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        const SetSignature sig = signatureOf(chunk.header);
        if (sig == reference) {
            accepted.push_back(&chunk);
            continue;
        }
        ChunkFault fault;
        fault.code = ErrorCode::kValidationError;
        fault.sequencePosition = chunk.sequencePosition;
        fault.chunkIndex = chunk.header.index;
        fault.message = fmt::format("header ({}) disagrees with the set ({})", describe(sig),
                                    describe(reference));
        faults.push_back(std::move(fault));
    }

    std::sort(accepted.begin(), accepted.end(), [](const auto* a, const auto* b) {
        return std::tie(a->header.index, a->sequencePosition) <
               std::tie(b->header.index, b->sequencePosition);
    });

    std::vector<const DecodedChunk*> ordered;
    ordered.reserve(accepted.size());
    for (const auto* chunk : accepted) {
        if (!ordered.empty() && ordered.back()->header.index == chunk->header.index) {
            ChunkFault fault;
            fault.code = ErrorCode::kValidationError;
            fault.sequencePosition = chunk->sequencePosition;
            fault.chunkIndex = chunk->header.index;
            fault.message = fmt::format("duplicate chunk index {} (first seen at sequence {})",
                                        chunk->header.index, ordered.back()->sequencePosition);
            faults.push_back(std::move(fault));
            continue;
        }
        ordered.push_back(chunk);
    }

    MissingReporter missing(faults);
    std::uint64_t expected = 0;
    for (const auto* chunk : ordered) {
        missing.addRange(expected, chunk->header.index);
        expected = static_cast<std::uint64_t>(chunk->header.index) + 1;
    }
    missing.addRange(expected, reference.totalChunks);
    missing.finish();

    // Chunk 0 fixes the chunk size: every later chunk but the last holds the
    // same number of bytes and the last holds the remainder exactly
    if (!ordered.empty() && ordered.front()->header.index == 0) {
        const std::uint64_t chunkSize = ordered.front()->data.size();
        const std::uint64_t lastIndex = reference.totalChunks - 1;
        const std::uint64_t leading = lastIndex * chunkSize;
        for (const auto* chunk : ordered) {
            const std::uint64_t size = chunk->data.size();
            const bool fits = chunk->header.index == lastIndex
                                  ? leading + size == reference.originalLength
                                  : size == chunkSize;
            if (fits) {
                continue;
            }
            ChunkFault fault;
            fault.code = ErrorCode::kValidationError;
            fault.sequencePosition = chunk->sequencePosition;
            fault.chunkIndex = chunk->header.index;
            fault.message = fmt::format(
                "chunk holds {} bytes but chunk 0 sets a size of {} for a {}-byte stream",
                chunk->data.size(), chunkSize, reference.originalLength);
            faults.push_back(std::move(fault));
        }
    }

    if (!faults.empty()) {
        std::stable_sort(faults.begin(), faults.end(), [](const auto& a, const auto& b) {
            return a.chunkIndex.value_or(0) < b.chunkIndex.value_or(0);
        });
        DNAC_LOG_DEBUG("reassembly found {} faults across {} chunks", faults.size(),
                       chunks.size());
        return makeError<Bytes>(Error{std::move(faults)});
    }

    // Every index is present and sized, so the chunks add up to the stream
    Bytes stream;
    stream.reserve(static_cast<std::size_t>(reference.originalLength));
    for (const auto* chunk : ordered) {
        stream.insert(stream.end(), chunk->data.begin(), chunk->data.end());
    }
    return stream;
}

}  // namespace dnac::format
