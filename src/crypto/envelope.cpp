// =============================================================================
// dnac - Encryption Envelope Implementation
// =============================================================================

#include "dnac/crypto/envelope.h"

#include <algorithm>
#include <array>
#include <limits>
#include <memory>

#include <fmt/format.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "dnac/common/logger.h"

namespace dnac::crypto {

namespace {

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

constexpr std::size_t kIterationsOffset = 1;
constexpr std::size_t kSaltOffset = 5;
constexpr std::size_t kNonceOffset = kSaltOffset + kSaltSize;
constexpr std::size_t kTagOffset = kNonceOffset + kNonceSize;
constexpr std::size_t kCiphertextOffset = kTagOffset + kTagSize;

static_assert(kTagOffset == kAssociatedDataSize);
static_assert(kCiphertextOffset == kEnvelopeOverhead);

/// @brief Derived key that is wiped when it leaves scope.
class DerivedKey {
public:
    DerivedKey() = default;
    ~DerivedKey() { OPENSSL_cleanse(bytes_.data(), bytes_.size()); }

    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;

    [[nodiscard]] unsigned char* data() noexcept { return bytes_.data(); }
    [[nodiscard]] const unsigned char* data() const noexcept { return bytes_.data(); }
    [[nodiscard]] static constexpr std::size_t size() noexcept { return kKeySize; }

private:
    std::array<unsigned char, kKeySize> bytes_{};
};

VoidResult deriveKey(std::string_view password, ByteSpan salt, std::uint32_t iterations,
                     DerivedKey& key) {
    if (password.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return makeVoidError(ErrorCode::kConfigurationError, "password is too long");
    }
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt.data(),
                          static_cast<int>(salt.size()), static_cast<int>(iterations),
                          EVP_sha256(), static_cast<int>(key.size()), key.data()) != 1) {
        return makeVoidError(ErrorCode::kInternalError, "PBKDF2 key derivation failed");
    }
    return makeVoidSuccess();
}

void storeU32(std::uint8_t* out, std::uint32_t value) noexcept {
    out[0] = static_cast<std::uint8_t>(value >> 24);
    out[1] = static_cast<std::uint8_t>(value >> 16);
    out[2] = static_cast<std::uint8_t>(value >> 8);
    out[3] = static_cast<std::uint8_t>(value);
}

std::uint32_t loadU32(const std::uint8_t* in) noexcept {
    return (static_cast<std::uint32_t>(in[0]) << 24) | (static_cast<std::uint32_t>(in[1]) << 16) |
           (static_cast<std::uint32_t>(in[2]) << 8) | static_cast<std::uint32_t>(in[3]);
}

Result<Bytes> internalError(const char* what) {
    return makeError<Bytes>(ErrorCode::kInternalError, fmt::format("AES-GCM: {} failed", what));
}

}  // namespace

Result<Bytes> seal(ByteSpan plaintext, std::string_view password, const KdfParams& kdf) {
    if (password.empty()) {
        return makeError<Bytes>(ErrorCode::kConfigurationError, "password must not be empty");
    }
    if (!kdf.isValid()) {
        return makeError<Bytes>(
            ErrorCode::kConfigurationError,
            fmt::format("KDF iteration count {} is outside {}..{}", kdf.iterations,
                        KdfParams::kMinIterations, KdfParams::kMaxIterations));
    }
    if (plaintext.size() >
        static_cast<std::size_t>(std::numeric_limits<int>::max()) - kEnvelopeOverhead) {
        return makeError<Bytes>(ErrorCode::kConfigurationError, "payload too large to encrypt");
    }

    Bytes envelope(kEnvelopeOverhead + plaintext.size(), 0);
    envelope[0] = kEnvelopeVersion;
    storeU32(envelope.data() + kIterationsOffset, kdf.iterations);
    if (RAND_bytes(envelope.data() + kSaltOffset, static_cast<int>(kSaltSize + kNonceSize)) != 1) {
        return internalError("random salt/nonce generation");
    }

    DerivedKey key;
    if (auto derived = deriveKey(password, ByteSpan(envelope).subspan(kSaltOffset, kSaltSize),
                                 kdf.iterations, key);
        !derived) {
        return makeError<Bytes>(derived.error());
    }
    DNAC_LOG_DEBUG("derived envelope key with {} PBKDF2 iterations", kdf.iterations);

    EvpCipherCtxPtr ctx{EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};
    if (!ctx) {
        return internalError("EVP_CIPHER_CTX_new");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return internalError("EVP_EncryptInit_ex");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1) {
        return internalError("set ivlen");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                           envelope.data() + kNonceOffset) != 1) {
        return internalError("set key/nonce");
    }

    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, envelope.data(),
                          static_cast<int>(kAssociatedDataSize)) != 1) {
        return internalError("add aad");
    }

    int written = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), envelope.data() + kCiphertextOffset, &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return internalError("encrypt update");
        }
        written = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), envelope.data() + kCiphertextOffset + written, &len) != 1) {
        return internalError("encrypt final");
    }
    written += len;
    if (static_cast<std::size_t>(written) != plaintext.size()) {
        return internalError("ciphertext length check");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(kTagSize),
                            envelope.data() + kTagOffset) != 1) {
        return internalError("get tag");
    }
    return envelope;
}

Result<Bytes> open(ByteSpan envelope, std::string_view password) {
    if (password.empty()) {
        return makeError<Bytes>(ErrorCode::kAuthenticationError,
                                "payload is encrypted but no password was supplied");
    }
    if (envelope.size() < kEnvelopeOverhead) {
        return makeError<Bytes>(
            ErrorCode::kValidationError,
            fmt::format("envelope of {} bytes is shorter than its {}-byte preamble",
                        envelope.size(), kEnvelopeOverhead));
    }
    if (envelope[0] != kEnvelopeVersion) {
        return makeError<Bytes>(ErrorCode::kValidationError,
                                fmt::format("unsupported envelope version {}", envelope[0]));
    }
    if (envelope.size() - kEnvelopeOverhead >
        static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return makeError<Bytes>(ErrorCode::kValidationError, "envelope too large to decrypt");
    }

    KdfParams kdf;
    kdf.iterations = loadU32(envelope.data() + kIterationsOffset);
    if (!kdf.isValid()) {
        return makeError<Bytes>(
            ErrorCode::kValidationError,
            fmt::format("envelope KDF iteration count {} is outside {}..{}", kdf.iterations,
                        KdfParams::kMinIterations, KdfParams::kMaxIterations));
    }

    DerivedKey key;
    if (auto derived =
            deriveKey(password, envelope.subspan(kSaltOffset, kSaltSize), kdf.iterations, key);
        !derived) {
        return makeError<Bytes>(derived.error());
    }

    EvpCipherCtxPtr ctx{EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};
    if (!ctx) {
        return internalError("EVP_CIPHER_CTX_new");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return internalError("EVP_DecryptInit_ex");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1) {
        return internalError("set ivlen");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                           envelope.data() + kNonceOffset) != 1) {
        return internalError("set key/nonce");
    }

    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, envelope.data(),
                          static_cast<int>(kAssociatedDataSize)) != 1) {
        return internalError("add aad");
    }

    const ByteSpan ciphertext = envelope.subspan(kCiphertextOffset);
    // Slack of one block so the final call always has a valid output pointer
    Bytes plaintext(ciphertext.size() + kTagSize);
    int written = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1) {
            return internalError("decrypt update");
        }
        written = len;
    }

    // EVP_CTRL_AEAD_SET_TAG takes a non-const buffer
    std::array<std::uint8_t, kTagSize> tag{};
    std::copy_n(envelope.data() + kTagOffset, kTagSize, tag.begin());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(kTagSize),
                            tag.data()) != 1) {
        return internalError("set tag");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return makeError<Bytes>(ErrorCode::kAuthenticationError,
                                "authentication failed: wrong password or tampered data");
    }
    written += len;
    plaintext.resize(static_cast<std::size_t>(written));
    return plaintext;
}

}  // namespace dnac::crypto
