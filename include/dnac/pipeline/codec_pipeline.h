// =============================================================================
// dnac - Codec Pipeline
// =============================================================================
// Composes the codec stages into the encode and decode operations.
//
// Encode:
//   payload -> [seal] -> split -> header + checksum -> Reed-Solomon -> symbols
//
// Decode:
//   symbols -> bytes -> Reed-Solomon -> header -> checksum      (per sequence)
//           -> reassemble by index -> [open]                    (whole set)
//
// Per-chunk work runs in parallel on a TBB arena; results are joined by
// position so the outcome never depends on scheduling. Decode collects every
// per-chunk and reassembly fault before failing, so one call reports all
// broken chunks at once.
// =============================================================================

#ifndef DNAC_PIPELINE_CODEC_PIPELINE_H
#define DNAC_PIPELINE_CODEC_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "dnac/codec/constraint_checker.h"
#include "dnac/common/error.h"
#include "dnac/common/types.h"

namespace dnac::pipeline {

// =============================================================================
// Constants
// =============================================================================

/// @brief Library version reported by the health probe.
inline constexpr std::string_view kLibraryVersion = "1.0.0";

// =============================================================================
// Pipeline Stages
// =============================================================================

/// @brief Stage transitions reported to a StageObserver.
enum class PipelineStage : std::uint8_t {
    kValidatingInput,
    kEncrypting,
    kChunking,
    kProtecting,
    kSymbolMapping,
    kSymbolDecoding,
    kPerChunkValidating,
    kReassembling,
    kDecrypting,
    kDone,
    kFailed
};

[[nodiscard]] std::string_view pipelineStageToString(PipelineStage stage) noexcept;

/// @brief Receives every stage transition of a call, on the calling thread.
using StageObserver = std::function<void(PipelineStage stage)>;

// =============================================================================
// Options
// =============================================================================

/// @brief Per-call encode configuration.
struct EncodeOptions {
    /// @brief Encrypt the payload under this password when set.
    std::optional<std::string> password;

    /// @brief Symbols per full sequence.
    std::uint32_t baseLength = kDefaultBaseLength;

    ErrorCorrectionLevel level = ErrorCorrectionLevel::kBasic;

    /// @brief Key-derivation cost (only used with a password).
    KdfParams kdf;

    /// @brief Worker threads (0 = auto-detect).
    std::size_t numThreads = 0;

    /// @brief Attach a synthesis constraint report to the result.
    bool checkConstraints = false;

    /// @brief Check base length, level and KDF settings.
    /// @return ConfigurationError describing the first invalid setting.
    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] std::size_t effectiveThreads() const noexcept;
};

/// @brief Per-call decode configuration.
struct DecodeOptions {
    /// @brief Password for encrypted sets; ignored for plain sets.
    std::optional<std::string> password;

    /// @brief Level the caller believes was used. Advisory: chunk headers win.
    ErrorCorrectionLevel declaredLevel = ErrorCorrectionLevel::kBasic;

    /// @brief Worker threads (0 = auto-detect).
    std::size_t numThreads = 0;

    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] std::size_t effectiveThreads() const noexcept;
};

// =============================================================================
// Results
// =============================================================================

/// @brief Aggregate description of an encoded set.
/// @note Informational only; decode relies on the per-chunk headers.
struct EncodeMetadata {
    std::uint64_t originalSize = 0;

    /// @brief Bytes actually chunked (the envelope size when encrypted).
    std::uint64_t encodedSize = 0;

    std::size_t sequenceCount = 0;
    std::uint32_t baseLength = kDefaultBaseLength;

    /// @brief Data bytes per full chunk.
    std::size_t chunkSize = 0;

    ErrorCorrectionLevel level = ErrorCorrectionLevel::kBasic;
    bool isEncrypted = false;
};

struct EncodeResult {
    /// @brief One sequence per chunk, in chunk index order.
    std::vector<std::string> sequences;

    EncodeMetadata metadata;

    /// @brief Present when EncodeOptions::checkConstraints was set.
    std::optional<codec::ConstraintReport> constraints;
};

struct DecodeStats {
    std::size_t sequenceCount = 0;
    std::size_t chunkCount = 0;

    /// @brief Bytes repaired by error correction, over all chunks.
    std::size_t correctedBytes = 0;

    /// @brief Chunks that needed at least one repair.
    std::size_t correctedChunks = 0;

    /// @brief Level recorded in the chunk headers.
    ErrorCorrectionLevel level = ErrorCorrectionLevel::kBasic;

    bool isEncrypted = false;
};

struct DecodeResult {
    Bytes payload;
    DecodeStats stats;
};

/// @brief Liveness probe result.
struct HealthStatus {
    std::string status;
    std::string version;
};

// =============================================================================
// Encoder
// =============================================================================

class EncoderImpl;
class DecoderImpl;

/// @brief Turns a payload into a set of symbol sequences.
///
/// Usage:
/// @code
/// EncodeOptions options;
/// options.level = ErrorCorrectionLevel::kAdvanced;
/// Encoder encoder(options);
/// auto result = encoder.encode(payload);
/// if (result) {
///     for (const auto& seq : result->sequences) { ... }
/// }
/// @endcode
class Encoder {
public:
    explicit Encoder(EncodeOptions options = {});
    ~Encoder();

    Encoder(const Encoder&) = delete;
    Encoder& operator=(const Encoder&) = delete;
    Encoder(Encoder&&) noexcept;
    Encoder& operator=(Encoder&&) noexcept;

    /// @brief Encode a payload.
    /// @return ConfigurationError before any chunk is produced when the
    ///         options are invalid; InternalError on crypto backend failure.
    [[nodiscard]] Result<EncodeResult> encode(ByteSpan payload) const;

    void setObserver(StageObserver observer);

    [[nodiscard]] const EncodeOptions& options() const noexcept;

private:
    std::unique_ptr<EncoderImpl> impl_;
};

// =============================================================================
// Decoder
// =============================================================================

/// @brief Recovers a payload from a set of symbol sequences in any order.
class Decoder {
public:
    explicit Decoder(DecodeOptions options = {});
    ~Decoder();

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;
    Decoder(Decoder&&) noexcept;
    Decoder& operator=(Decoder&&) noexcept;

    /// @brief Decode a set of sequences.
    /// @return On failure, an Error whose faults() lists every broken chunk
    ///         (per-chunk faults by input position, then reassembly faults by
    ///         chunk index). Envelope failures are reported on their own.
    [[nodiscard]] Result<DecodeResult> decode(std::span<const std::string> sequences) const;

    void setObserver(StageObserver observer);

    [[nodiscard]] const DecodeOptions& options() const noexcept;

private:
    std::unique_ptr<DecoderImpl> impl_;
};

// =============================================================================
// Free Functions
// =============================================================================

[[nodiscard]] Result<EncodeResult> encode(ByteSpan payload, const EncodeOptions& options = {});

[[nodiscard]] Result<DecodeResult> decode(std::span<const std::string> sequences,
                                          const DecodeOptions& options = {});

/// @brief Liveness probe; performs no codec work.
[[nodiscard]] HealthStatus health();

/// @brief Thread count used when numThreads is 0.
[[nodiscard]] std::size_t recommendedThreadCount() noexcept;

}  // namespace dnac::pipeline

#endif  // DNAC_PIPELINE_CODEC_PIPELINE_H
