// =============================================================================
// dnac - Codec Pipeline Implementation
// =============================================================================

#include "dnac/pipeline/codec_pipeline.h"

#include <algorithm>
#include <array>
#include <limits>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "dnac/codec/reed_solomon.h"
#include "dnac/codec/symbol_codec.h"
#include "dnac/common/logger.h"
#include "dnac/crypto/envelope.h"
#include "dnac/format/chunk_header.h"
#include "dnac/format/chunker.h"

namespace dnac::pipeline {

namespace {

/// @brief Run body(i) for every i in [0, count) on an arena of the given size.
template <typename Body>
void parallelFor(std::size_t threads, std::size_t count, Body&& body) {
    tbb::task_arena arena(static_cast<int>(threads));
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, count),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i < range.end(); ++i) {
                                  body(i);
                              }
                          });
    });
}

/// @brief Reports stage transitions and the terminal state of a call.
class StageTracker {
public:
    explicit StageTracker(const StageObserver& observer) : observer_(observer) {}

    void enter(PipelineStage stage) const {
        if (observer_) {
            observer_(stage);
        }
    }

    /// @brief Report kFailed and pass the error through.
    template <typename T>
    Result<T> fail(Error error) const {
        enter(PipelineStage::kFailed);
        return std::unexpected(std::move(error));
    }

private:
    const StageObserver& observer_;
};

}  // namespace

// =============================================================================
// Stage Names
// =============================================================================

std::string_view pipelineStageToString(PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::kValidatingInput:
            return "validating-input";
        case PipelineStage::kEncrypting:
            return "encrypting";
        case PipelineStage::kChunking:
            return "chunking";
        case PipelineStage::kProtecting:
            return "protecting";
        case PipelineStage::kSymbolMapping:
            return "symbol-mapping";
        case PipelineStage::kSymbolDecoding:
            return "symbol-decoding";
        case PipelineStage::kPerChunkValidating:
            return "per-chunk-validating";
        case PipelineStage::kReassembling:
            return "reassembling";
        case PipelineStage::kDecrypting:
            return "decrypting";
        case PipelineStage::kDone:
            return "done";
        case PipelineStage::kFailed:
            return "failed";
    }
    return "unknown";
}

// =============================================================================
// Options
// =============================================================================

std::size_t recommendedThreadCount() noexcept {
    const std::size_t hardware = std::thread::hardware_concurrency();
    return std::clamp<std::size_t>(hardware, 1, kMaxAutoThreads);
}

VoidResult EncodeOptions::validate() const {
    if (auto capacity = format::chunkCapacity(baseLength, level); !capacity) {
        return std::unexpected(capacity.error());
    }
    if (password.has_value()) {
        if (password->empty()) {
            return makeVoidError(ErrorCode::kConfigurationError, "password must not be empty");
        }
        if (!kdf.isValid()) {
            return makeVoidError(
                ErrorCode::kConfigurationError,
                fmt::format("KDF iteration count {} is outside {}..{}", kdf.iterations,
                            KdfParams::kMinIterations, KdfParams::kMaxIterations));
        }
    }
    return makeVoidSuccess();
}

std::size_t EncodeOptions::effectiveThreads() const noexcept {
    return numThreads > 0 ? numThreads : recommendedThreadCount();
}

VoidResult DecodeOptions::validate() const {
    if (password.has_value() && password->empty()) {
        return makeVoidError(ErrorCode::kConfigurationError, "password must not be empty");
    }
    return makeVoidSuccess();
}

std::size_t DecodeOptions::effectiveThreads() const noexcept {
    return numThreads > 0 ? numThreads : recommendedThreadCount();
}

// =============================================================================
// EncoderImpl
// =============================================================================

class EncoderImpl {
public:
    explicit EncoderImpl(EncodeOptions options) : options_(std::move(options)) {}

    Result<EncodeResult> encode(ByteSpan payload) const {
        StageTracker stages(observer_);

        stages.enter(PipelineStage::kValidatingInput);
        if (auto valid = options_.validate(); !valid) {
            return stages.fail<EncodeResult>(valid.error());
        }
        const std::size_t chunkSize = *format::chunkCapacity(options_.baseLength, options_.level);

        Bytes envelope;
        ByteSpan stream = payload;
        if (options_.password.has_value()) {
            stages.enter(PipelineStage::kEncrypting);
            auto sealed = crypto::seal(payload, *options_.password, options_.kdf);
            if (!sealed) {
                return stages.fail<EncodeResult>(sealed.error());
            }
            envelope = std::move(*sealed);
            stream = envelope;
        }

        stages.enter(PipelineStage::kChunking);
        const std::vector<ByteSpan> slices = format::splitPayload(stream, chunkSize);
        if (slices.size() > std::numeric_limits<std::uint32_t>::max()) {
            return stages.fail<EncodeResult>(
                Error{ErrorCode::kConfigurationError,
                      fmt::format("payload needs {} chunks, more than a header can index",
                                  slices.size())});
        }
        const auto total = static_cast<std::uint32_t>(slices.size());
        DNAC_LOG_DEBUG("encoding {} bytes as {} chunks of up to {} bytes (base length {}, {})",
                       stream.size(), total, chunkSize, options_.baseLength,
                       levelToString(options_.level));

        const std::size_t threads = options_.effectiveThreads();

        stages.enter(PipelineStage::kProtecting);
        std::vector<Bytes> codewords(total);
        std::vector<std::optional<Error>> errors(total);
        parallelFor(threads, total, [&](std::size_t i) {
            format::ChunkHeader header;
            header.encrypted = options_.password.has_value();
            header.level = options_.level;
            header.index = static_cast<ChunkIndex>(i);
            header.totalChunks = total;
            header.originalLength = stream.size();
            header.checksum = format::computeChecksum(slices[i]);

            const auto headerBytes = format::encodeHeader(header);
            Bytes block;
            block.reserve(headerBytes.size() + slices[i].size());
            block.insert(block.end(), headerBytes.begin(), headerBytes.end());
            block.insert(block.end(), slices[i].begin(), slices[i].end());

            auto protectedBlock = codec::protect(block, options_.level);
            if (!protectedBlock) {
                errors[i] = protectedBlock.error();
                return;
            }
            codewords[i] = std::move(*protectedBlock);
        });
        for (auto& error : errors) {
            if (error.has_value()) {
                return stages.fail<EncodeResult>(std::move(*error));
            }
        }

        stages.enter(PipelineStage::kSymbolMapping);
        EncodeResult result;
        result.sequences.resize(total);
        parallelFor(threads, total,
                    [&](std::size_t i) { result.sequences[i] = codec::bytesToSymbols(codewords[i]); });

        result.metadata.originalSize = payload.size();
        result.metadata.encodedSize = stream.size();
        result.metadata.sequenceCount = total;
        result.metadata.baseLength = options_.baseLength;
        result.metadata.chunkSize = chunkSize;
        result.metadata.level = options_.level;
        result.metadata.isEncrypted = options_.password.has_value();

        if (options_.checkConstraints) {
            result.constraints = codec::analyzeSequences(result.sequences);
        }

        stages.enter(PipelineStage::kDone);
        return result;
    }

    EncodeOptions options_;
    StageObserver observer_;
};

// =============================================================================
// DecoderImpl
// =============================================================================

namespace {

/// @brief Outcome of decoding one input sequence.
struct ChunkOutcome {
    std::optional<format::DecodedChunk> chunk;
    std::optional<ChunkFault> fault;
    std::size_t correctedCount = 0;
    ErrorCorrectionLevel level = ErrorCorrectionLevel::kBasic;
};

/// @brief How far one level attempt got; later failures are more informative.
enum class AttemptProgress : std::uint8_t {
    kCodewordRejected = 0,
    kHeaderRejected = 1,
    kLevelMismatch = 2
};

ChunkFault makeFault(std::size_t position, const Error& error) {
    ChunkFault fault;
    fault.code = error.code();
    fault.sequencePosition = position;
    if (error.context().has_value()) {
        fault.chunkIndex = error.context()->chunkIndex;
    }
    fault.message = error.message();
    return fault;
}

ChunkOutcome decodeSequence(std::size_t position, std::string_view sequence,
                            ErrorCorrectionLevel declared) {
    ChunkOutcome outcome;

    auto codeword = codec::symbolsToBytes(sequence);
    if (!codeword) {
        outcome.fault = makeFault(position, codeword.error());
        return outcome;
    }

    std::optional<Error> bestError;
    AttemptProgress bestProgress = AttemptProgress::kCodewordRejected;
    auto remember = [&](AttemptProgress progress, Error error) {
        if (!bestError.has_value() || progress > bestProgress) {
            bestError = std::move(error);
            bestProgress = progress;
        }
    };

    // The declared level is tried first; a header that records a different
    // level than the one used to decode it is not trusted.
    const std::array<ErrorCorrectionLevel, 2> candidates = {declared, otherLevel(declared)};
    for (ErrorCorrectionLevel level : candidates) {
        auto recovered = codec::recover(*codeword, level);
        if (!recovered) {
            remember(AttemptProgress::kCodewordRejected, recovered.error());
            continue;
        }

        // A repaired word whose header is unusable was miscorrected
        const ErrorCode headerCode = recovered->correctedCount > 0
                                         ? ErrorCode::kUncorrectableError
                                         : ErrorCode::kValidationError;

        auto header = format::decodeHeader(recovered->data);
        if (!header) {
            remember(AttemptProgress::kHeaderRejected,
                     Error{headerCode, header.error().message(),
                           header.error().context().value_or(ErrorContext{})});
            continue;
        }
        if (header->level != level) {
            remember(AttemptProgress::kLevelMismatch,
                     Error{headerCode,
                           fmt::format("header records level {} but decodes only at level {}",
                                       levelToString(header->level), levelToString(level)),
                           ErrorContext{}.withChunk(header->index)});
            continue;
        }

        if (level != declared) {
            DNAC_LOG_DEBUG("sequence {} was encoded at level {}, not the declared {}", position,
                           levelToString(level), levelToString(declared));
        }

        format::DecodedChunk chunk;
        chunk.sequencePosition = position;
        chunk.header = *header;
        chunk.data.assign(recovered->data.begin() + format::ChunkHeader::kSize,
                          recovered->data.end());

        const Checksum actual = format::computeChecksum(chunk.data);
        if (actual != header->checksum) {
            ChunkFault fault;
            fault.code = ErrorCode::kChecksumMismatch;
            fault.sequencePosition = position;
            fault.chunkIndex = header->index;
            fault.message = ChecksumMismatchError::formatChecksumMismatch(header->checksum, actual);
            outcome.fault = std::move(fault);
            return outcome;
        }

        if (recovered->correctedCount > 0) {
            DNAC_LOG_DEBUG("chunk {} (sequence {}): corrected {} bytes", header->index, position,
                           recovered->correctedCount);
        }
        outcome.correctedCount = recovered->correctedCount;
        outcome.level = level;
        outcome.chunk = std::move(chunk);
        return outcome;
    }

    outcome.fault = makeFault(position, *bestError);
    return outcome;
}

}  // namespace

class DecoderImpl {
public:
    explicit DecoderImpl(DecodeOptions options) : options_(std::move(options)) {}

    Result<DecodeResult> decode(std::span<const std::string> sequences) const {
        StageTracker stages(observer_);

        stages.enter(PipelineStage::kValidatingInput);
        if (auto valid = options_.validate(); !valid) {
            return stages.fail<DecodeResult>(valid.error());
        }
        if (sequences.empty()) {
            return stages.fail<DecodeResult>(
                Error{ErrorCode::kValidationError, "no sequences supplied"});
        }

        stages.enter(PipelineStage::kSymbolDecoding);
        std::vector<ChunkOutcome> outcomes(sequences.size());
        parallelFor(options_.effectiveThreads(), sequences.size(), [&](std::size_t i) {
            outcomes[i] = decodeSequence(i, sequences[i], options_.declaredLevel);
        });

        stages.enter(PipelineStage::kPerChunkValidating);
        DecodeStats stats;
        stats.sequenceCount = sequences.size();
        std::vector<ChunkFault> faults;
        std::vector<format::DecodedChunk> chunks;
        chunks.reserve(outcomes.size());
        for (auto& outcome : outcomes) {
            if (outcome.fault.has_value()) {
                faults.push_back(std::move(*outcome.fault));
                continue;
            }
            stats.correctedBytes += outcome.correctedCount;
            stats.correctedChunks += outcome.correctedCount > 0 ? 1 : 0;
            chunks.push_back(std::move(*outcome.chunk));
        }

        stages.enter(PipelineStage::kReassembling);
        if (!chunks.empty()) {
            stats.chunkCount = chunks.front().header.totalChunks;
            stats.level = chunks.front().header.level;
            stats.isEncrypted = chunks.front().header.encrypted;
        }

        Result<Bytes> stream = chunks.empty()
                                   ? makeError<Bytes>(ErrorCode::kValidationError,
                                                      "no sequence could be decoded")
                                   : format::reassemble(std::move(chunks));

        if (!faults.empty()) {
            // Reassembly faults of the surviving chunks follow the per-chunk ones
            if (!stream && !stream.error().faults().empty()) {
                const auto& more = stream.error().faults();
                faults.insert(faults.end(), more.begin(), more.end());
            }
            Error report{std::move(faults)};
            DNAC_LOG_WARNING("decode failed with {} chunk faults: {}", report.faults().size(),
                             report.message());
            return stages.fail<DecodeResult>(std::move(report));
        }
        if (!stream) {
            DNAC_LOG_WARNING("decode failed: {}", stream.error().message());
            return stages.fail<DecodeResult>(stream.error());
        }

        DecodeResult result;
        if (stats.isEncrypted) {
            stages.enter(PipelineStage::kDecrypting);
            if (!options_.password.has_value()) {
                return stages.fail<DecodeResult>(
                    Error{ErrorCode::kAuthenticationError,
                          "payload is encrypted but no password was supplied"});
            }
            auto opened = crypto::open(*stream, *options_.password);
            if (!opened) {
                return stages.fail<DecodeResult>(opened.error());
            }
            result.payload = std::move(*opened);
        } else {
            if (options_.password.has_value()) {
                DNAC_LOG_WARNING("payload is not encrypted; ignoring the supplied password");
            }
            result.payload = std::move(*stream);
        }

        if (stats.correctedChunks > 0) {
            DNAC_LOG_INFO("repaired {} bytes in {} of {} chunks", stats.correctedBytes,
                          stats.correctedChunks, stats.chunkCount);
        }
        result.stats = stats;
        stages.enter(PipelineStage::kDone);
        return result;
    }

    DecodeOptions options_;
    StageObserver observer_;
};

// =============================================================================
// Encoder / Decoder
// =============================================================================

Encoder::Encoder(EncodeOptions options)
    : impl_(std::make_unique<EncoderImpl>(std::move(options))) {}

Encoder::~Encoder() = default;
Encoder::Encoder(Encoder&&) noexcept = default;
Encoder& Encoder::operator=(Encoder&&) noexcept = default;

Result<EncodeResult> Encoder::encode(ByteSpan payload) const {
    return impl_->encode(payload);
}

void Encoder::setObserver(StageObserver observer) {
    impl_->observer_ = std::move(observer);
}

const EncodeOptions& Encoder::options() const noexcept {
    return impl_->options_;
}

Decoder::Decoder(DecodeOptions options)
    : impl_(std::make_unique<DecoderImpl>(std::move(options))) {}

Decoder::~Decoder() = default;
Decoder::Decoder(Decoder&&) noexcept = default;
Decoder& Decoder::operator=(Decoder&&) noexcept = default;

Result<DecodeResult> Decoder::decode(std::span<const std::string> sequences) const {
    return impl_->decode(sequences);
}

void Decoder::setObserver(StageObserver observer) {
    impl_->observer_ = std::move(observer);
}

const DecodeOptions& Decoder::options() const noexcept {
    return impl_->options_;
}

// =============================================================================
// Free Functions
// =============================================================================

Result<EncodeResult> encode(ByteSpan payload, const EncodeOptions& options) {
    return Encoder(options).encode(payload);
}

Result<DecodeResult> decode(std::span<const std::string> sequences, const DecodeOptions& options) {
    return Decoder(options).decode(sequences);
}

HealthStatus health() {
    return HealthStatus{"healthy", std::string(kLibraryVersion)};
}

}  // namespace dnac::pipeline
