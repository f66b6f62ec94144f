// =============================================================================
// dnac - Reed-Solomon Error Correction Implementation
// =============================================================================
// libcorrect does the field arithmetic and the decoding chain. Around it this
// file enforces the codeword size limits and counts repairs by re-encoding the
// decoded message and comparing it with the received word. A decode that lands
// farther away than the correction bound is rejected.
// =============================================================================

#include "dnac/codec/reed_solomon.h"

#include <algorithm>
#include <optional>
#include <string_view>

#include <fmt/format.h>

extern "C" {
#include <correct.h>
}

namespace dnac::codec {

namespace {

/// @brief First consecutive root alpha^0, consecutive roots one apart.
constexpr std::uint8_t kFirstConsecutiveRoot = 0;
constexpr std::uint8_t kRootGap = 1;

struct CorrectDeleter {
    void operator()(correct_reed_solomon* rs) const noexcept {
        if (rs != nullptr) {
            correct_reed_solomon_destroy(rs);
        }
    }
};

using CorrectHandle = std::unique_ptr<correct_reed_solomon, CorrectDeleter>;

std::size_t hammingDistance(ByteSpan a, ByteSpan b) noexcept {
    std::size_t distance = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) {
            ++distance;
        }
    }
    return distance;
}

}  // namespace

// =============================================================================
// ReedSolomonImpl
// =============================================================================

class ReedSolomonImpl {
public:
    explicit ReedSolomonImpl(std::size_t parity)
        : parity_(parity),
          rs_(correct_reed_solomon_create(correct_rs_primitive_polynomial_8_4_3_2_0,
                                          kFirstConsecutiveRoot, kRootGap, parity)) {
        if (!rs_) {
            throw InternalError(
                fmt::format("failed to create a Reed-Solomon coder with {} parity bytes", parity));
        }
    }

    /// @brief Message followed by parity. The message must fit one codeword.
    std::optional<Bytes> encode(ByteSpan message) {
        Bytes codeword(message.size() + parity_, 0);
        if (message.empty()) {
            // The zero message has all-zero parity
            return codeword;
        }
        const auto written = correct_reed_solomon_encode(rs_.get(), message.data(),
                                                         message.size(), codeword.data());
        if (written < 0 || static_cast<std::size_t>(written) != codeword.size()) {
            return std::nullopt;
        }
        return codeword;
    }

    /// @brief Decoded message, or nullopt when libcorrect gives up.
    std::optional<Bytes> decode(ByteSpan codeword) {
        const std::size_t messageLength = codeword.size() - parity_;
        if (messageLength == 0) {
            return Bytes{};
        }
        Bytes message(messageLength, 0);
        const auto decoded = correct_reed_solomon_decode(rs_.get(), codeword.data(),
                                                         codeword.size(), message.data());
        if (decoded < 0 || static_cast<std::size_t>(decoded) != messageLength) {
            return std::nullopt;
        }
        return message;
    }

private:
    std::size_t parity_;
    CorrectHandle rs_;
};

// =============================================================================
// ReedSolomonCodec
// =============================================================================

ReedSolomonCodec::ReedSolomonCodec(std::size_t paritySymbols) : parity_(paritySymbols) {
    if (parity_ == 0 || parity_ % 2 != 0 || parity_ >= kMaxCodewordLength) {
        throw ConfigurationError(
            fmt::format("invalid Reed-Solomon parity length {}", paritySymbols));
    }
    impl_ = std::make_unique<ReedSolomonImpl>(parity_);
}

ReedSolomonCodec::~ReedSolomonCodec() = default;
ReedSolomonCodec::ReedSolomonCodec(ReedSolomonCodec&&) noexcept = default;
ReedSolomonCodec& ReedSolomonCodec::operator=(ReedSolomonCodec&&) noexcept = default;

Result<Bytes> ReedSolomonCodec::encode(ByteSpan message) const {
    if (message.size() > maxMessageLength()) {
        return makeError<Bytes>(
            ErrorCode::kConfigurationError,
            fmt::format("message of {} bytes exceeds the {}-byte codeword limit",
                        message.size(), maxMessageLength()));
    }

    auto codeword = impl_->encode(message);
    if (!codeword) {
        return makeError<Bytes>(ErrorCode::kInternalError,
                                fmt::format("Reed-Solomon encoding of {} bytes failed",
                                            message.size()));
    }
    return std::move(*codeword);
}

bool ReedSolomonCodec::isCodeword(ByteSpan codeword) const {
    if (codeword.size() < parity_ || codeword.size() > kMaxCodewordLength) {
        return false;
    }
    auto expected = impl_->encode(codeword.first(codeword.size() - parity_));
    return expected && std::equal(expected->begin(), expected->end(), codeword.begin());
}

Result<RecoveredBlock> ReedSolomonCodec::decode(ByteSpan codeword) const {
    const std::size_t n = codeword.size();
    if (n < parity_ || n > kMaxCodewordLength) {
        return makeError<RecoveredBlock>(
            ErrorCode::kValidationError,
            fmt::format("codeword length {} is outside {}..{}", n, parity_, kMaxCodewordLength));
    }

    auto uncorrectable = [this](std::string_view reason) {
        return makeError<RecoveredBlock>(
            ErrorCode::kUncorrectableError,
            fmt::format("corruption exceeds the correction bound of {} bytes ({})",
                        correctionBound(), reason));
    };

    RecoveredBlock block;
    if (isCodeword(codeword)) {
        block.data.assign(codeword.begin(), codeword.end() - static_cast<std::ptrdiff_t>(parity_));
        return block;
    }

    auto message = impl_->decode(codeword);
    if (!message) {
        return uncorrectable("decoder failure");
    }

    // Re-encode to count repairs across message and parity
    auto repaired = impl_->encode(*message);
    if (!repaired) {
        return uncorrectable("re-encoding failed");
    }
    const std::size_t distance = hammingDistance(*repaired, codeword);
    if (distance > correctionBound()) {
        return uncorrectable(fmt::format("nearest codeword is {} bytes away", distance));
    }

    block.correctedCount = distance;
    block.data = std::move(*message);
    return block;
}

// =============================================================================
// Level Facade
// =============================================================================

const ReedSolomonCodec& codecForLevel(ErrorCorrectionLevel level) {
    thread_local const ReedSolomonCodec basic(paritySymbols(ErrorCorrectionLevel::kBasic));
    thread_local const ReedSolomonCodec advanced(paritySymbols(ErrorCorrectionLevel::kAdvanced));
    return level == ErrorCorrectionLevel::kAdvanced ? advanced : basic;
}

Result<Bytes> protect(ByteSpan message, ErrorCorrectionLevel level) {
    return codecForLevel(level).encode(message);
}

Result<RecoveredBlock> recover(ByteSpan codeword, ErrorCorrectionLevel level) {
    return codecForLevel(level).decode(codeword);
}

}  // namespace dnac::codec
