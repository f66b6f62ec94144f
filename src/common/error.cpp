// =============================================================================
// dnac - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "dnac/common/error.h"

#include <algorithm>
#include <sstream>

#include <fmt/format.h>

namespace dnac {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (sequencePosition.has_value()) {
        separate();
        oss << "sequence: " << *sequencePosition;
    }

    if (chunkIndex.has_value()) {
        separate();
        oss << "chunk: " << *chunkIndex;
    }

    if (byteOffset.has_value()) {
        separate();
        oss << "offset: " << *byteOffset;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// ChunkFault Implementation
// =============================================================================

std::string ChunkFault::format() const {
    std::string where;
    if (sequencePosition.has_value()) {
        where = fmt::format("sequence {}", *sequencePosition);
    }
    if (chunkIndex.has_value()) {
        if (!where.empty()) {
            where += ", ";
        }
        where += fmt::format("chunk {}", *chunkIndex);
    }
    if (where.empty()) {
        return fmt::format("[{}] {}", errorCodeToString(code), message);
    }
    return fmt::format("[{}] {}: {}", errorCodeToString(code), where, message);
}

// =============================================================================
// DnacException Implementation
// =============================================================================

void DnacException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// ChecksumMismatchError Implementation
// =============================================================================

std::string ChecksumMismatchError::formatChecksumMismatch(std::uint64_t expected,
                                                          std::uint64_t actual) {
    return fmt::format("checksum mismatch: expected 0x{:016x}, got 0x{:016x}", expected, actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

Error::Error(std::vector<ChunkFault> faults)
    : code_(ErrorCode::kValidationError), faults_(std::move(faults)) {
    if (faults_.empty()) {
        message_ = "decode failed";
        return;
    }
    code_ = faults_.front().code;
    if (faults_.size() == 1) {
        message_ = faults_.front().format();
    } else {
        message_ = fmt::format("{} chunk faults, first: {}", faults_.size(),
                               faults_.front().format());
    }
}

std::string Error::describe() const {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;
    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }
    if (faults_.size() > 1) {
        for (const auto& fault : faults_) {
            oss << "\n  " << fault.format();
        }
    }
    return oss.str();
}

void Error::throwException() const {
    if (!faults_.empty()) {
        throw DecodeFailure(code_, message_, faults_);
    }

    ErrorContext context = context_.value_or(ErrorContext{});
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_, context);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kConfigurationError:
            throw ConfigurationError(message_, context);
        case ErrorCode::kValidationError:
            throw ValidationError(message_, context);
        case ErrorCode::kUncorrectableError:
            throw UncorrectableError(message_, context);
        case ErrorCode::kChecksumMismatch:
            throw ChecksumMismatchError(message_, context);
        case ErrorCode::kMissingChunk:
            throw MissingChunkError(message_, context);
        case ErrorCode::kAuthenticationError:
            throw AuthenticationError(message_, context);
        case ErrorCode::kSuccess:
        case ErrorCode::kInternalError:
            break;
    }
    throw InternalError(message_, context);
}

}  // namespace dnac
