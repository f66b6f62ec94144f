// =============================================================================
// dnac - Reed-Solomon Error Correction
// =============================================================================
// Systematic Reed-Solomon coder over GF(2^8), backed by libcorrect.
//
// Field: primitive polynomial x^8 + x^4 + x^3 + x^2 + 1 (0x11D), generator
// alpha = 2. The generator polynomial has the consecutive roots
// alpha^0 .. alpha^(parity-1). Codewords are the message followed by the
// parity bytes and may be shortened to any length up to 255 bytes.
//
// With p parity bytes the decoder corrects up to floor(p / 2) corrupted bytes
// anywhere in the codeword (message or parity). Anything beyond that bound is
// either reported as uncorrectable or, rarely, decoded to a different valid
// codeword; callers detect the latter with an independent checksum.
// =============================================================================

#ifndef DNAC_CODEC_REED_SOLOMON_H
#define DNAC_CODEC_REED_SOLOMON_H

#include <cstddef>
#include <cstdint>
#include <memory>

#include "dnac/common/error.h"
#include "dnac/common/types.h"

namespace dnac::codec {

/// @brief Maximum codeword length in bytes.
inline constexpr std::size_t kMaxCodewordLength = 255;

/// @brief Message recovered from a codeword.
struct RecoveredBlock {
    /// @brief Message bytes with parity removed.
    Bytes data;

    /// @brief Number of bytes the decoder repaired.
    std::size_t correctedCount = 0;
};

class ReedSolomonImpl;

/// @brief Reed-Solomon encoder/decoder for a fixed parity length.
/// @note The underlying coder keeps scratch buffers, so an instance must not
///       be used from two threads at once. codecForLevel() hands every thread
///       its own instance.
class ReedSolomonCodec {
public:
    /// @brief Create a coder appending paritySymbols bytes per codeword.
    /// @throws ConfigurationError when paritySymbols is 0, odd, or >= 255.
    /// @throws InternalError when the coder cannot be allocated.
    explicit ReedSolomonCodec(std::size_t paritySymbols);
    ~ReedSolomonCodec();

    // Non-copyable, movable
    ReedSolomonCodec(const ReedSolomonCodec&) = delete;
    ReedSolomonCodec& operator=(const ReedSolomonCodec&) = delete;
    ReedSolomonCodec(ReedSolomonCodec&&) noexcept;
    ReedSolomonCodec& operator=(ReedSolomonCodec&&) noexcept;

    [[nodiscard]] std::size_t paritySymbols() const noexcept { return parity_; }

    [[nodiscard]] std::size_t correctionBound() const noexcept { return parity_ / 2; }

    /// @brief Longest message that fits one codeword.
    [[nodiscard]] std::size_t maxMessageLength() const noexcept {
        return kMaxCodewordLength - parity_;
    }

    /// @brief Append parity to a message.
    /// @return ConfigurationError when the message does not fit one codeword.
    [[nodiscard]] Result<Bytes> encode(ByteSpan message) const;

    /// @brief Correct a codeword and strip its parity.
    /// @return ValidationError for a codeword of impossible length,
    ///         UncorrectableError when the corruption exceeds the bound.
    [[nodiscard]] Result<RecoveredBlock> decode(ByteSpan codeword) const;

    /// @brief True when the parity of the codeword matches its message.
    [[nodiscard]] bool isCodeword(ByteSpan codeword) const;

private:
    std::size_t parity_;
    std::unique_ptr<ReedSolomonImpl> impl_;
};

/// @brief Coder for a level, private to the calling thread.
[[nodiscard]] const ReedSolomonCodec& codecForLevel(ErrorCorrectionLevel level);

/// @brief Append the parity of a level to a message.
[[nodiscard]] Result<Bytes> protect(ByteSpan message, ErrorCorrectionLevel level);

/// @brief Correct and strip a codeword protected at a level.
[[nodiscard]] Result<RecoveredBlock> recover(ByteSpan codeword, ErrorCorrectionLevel level);

}  // namespace dnac::codec

#endif  // DNAC_CODEC_REED_SOLOMON_H
