// =============================================================================
// dnac - Encryption Envelope
// =============================================================================
// Password-based authenticated encryption of a whole payload.
//
// Key derivation: PBKDF2-HMAC-SHA256, 32-byte key, fresh 16-byte salt.
// Cipher: AES-256-GCM, fresh 12-byte nonce, 16-byte tag.
//
// Envelope layout (all fields big-endian):
// +--------+------+----------------------------+
// | offset | size | field                      |
// +--------+------+----------------------------+
// |    0   |   1  | envelope version           |
// |    1   |   4  | PBKDF2 iteration count     |
// |    5   |  16  | salt                       |
// |   21   |  12  | nonce                      |
// |   33   |  16  | GCM tag                    |
// |   49   |   n  | ciphertext                 |
// +--------+------+----------------------------+
//
// Bytes 0..32 are authenticated as associated data, so the recorded KDF cost
// cannot be altered without failing the tag check.
// =============================================================================

#ifndef DNAC_CRYPTO_ENVELOPE_H
#define DNAC_CRYPTO_ENVELOPE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "dnac/common/error.h"
#include "dnac/common/types.h"

namespace dnac::crypto {

inline constexpr std::uint8_t kEnvelopeVersion = 1;
inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kSaltSize = 16;
inline constexpr std::size_t kNonceSize = 12;
inline constexpr std::size_t kTagSize = 16;

inline constexpr std::size_t kAssociatedDataSize = 1 + 4 + kSaltSize + kNonceSize;
inline constexpr std::size_t kEnvelopeOverhead = kAssociatedDataSize + kTagSize;

static_assert(kAssociatedDataSize == 33);
static_assert(kEnvelopeOverhead == 49);

/// @brief Encrypt a payload under a password.
/// @return ConfigurationError for an empty password or out-of-range KDF cost,
///         InternalError if the crypto backend fails.
[[nodiscard]] Result<Bytes> seal(ByteSpan plaintext, std::string_view password,
                                 const KdfParams& kdf = {});

/// @brief Decrypt and authenticate an envelope.
/// @return ValidationError for a truncated envelope, unknown version or
///         out-of-range KDF cost; AuthenticationError for an empty password
///         or tag mismatch; InternalError if the crypto backend fails.
[[nodiscard]] Result<Bytes> open(ByteSpan envelope, std::string_view password);

}  // namespace dnac::crypto

#endif  // DNAC_CRYPTO_ENVELOPE_H
