// =============================================================================
// dnac - Error Handling Framework
// =============================================================================
// Error handling for the dnac codec library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - DnacException hierarchy for structured error handling
// - ChunkFault records for per-chunk decode diagnostics
// - Result<T, E> type for functional error handling (using std::expected)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (CLI only)
// - 3: Configuration error (base length, level, KDF parameters)
// - 4: Validation error (alphabet, header, duplicate index, totals)
// - 5: Uncorrectable chunk
// - 6: Checksum mismatch after correction
// - 7: Missing chunk
// - 8: Authentication failure
// - 9: Internal error (crypto backend, allocation)
// =============================================================================

#ifndef DNAC_COMMON_ERROR_H
#define DNAC_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace dnac {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Only raised by the command-line layer; the codec never touches files.
    kIOError = 2,

    /// @brief Invalid base length / error-correction level / KDF parameter combination.
    kConfigurationError = 3,

    /// @brief Malformed alphabet, inconsistent header, duplicate index or mismatched totals.
    kValidationError = 4,

    /// @brief Redundancy insufficient to fix the corruption in a chunk.
    kUncorrectableError = 5,

    /// @brief Post-correction checksum still fails.
    kChecksumMismatch = 6,

    /// @brief A chunk index is missing from the set.
    kMissingChunk = 7,

    /// @brief Wrong password or tampered ciphertext.
    kAuthenticationError = 8,

    /// @brief Failure inside a backend library.
    kInternalError = 9
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kConfigurationError:
            return "configuration error";
        case ErrorCode::kValidationError:
            return "validation error";
        case ErrorCode::kUncorrectableError:
            return "uncorrectable chunk";
        case ErrorCode::kChecksumMismatch:
            return "checksum mismatch";
        case ErrorCode::kMissingChunk:
            return "missing chunk";
        case ErrorCode::kAuthenticationError:
            return "authentication failure";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code is scoped to a single chunk.
/// @note Chunk-scoped errors are collected during decode; the others abort the call.
[[nodiscard]] constexpr bool isChunkScoped(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kValidationError:
        case ErrorCode::kUncorrectableError:
        case ErrorCode::kChecksumMismatch:
        case ErrorCode::kMissingChunk:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Locates a failure inside a decode call (which chunk, which input sequence).
struct ErrorContext {
    /// @brief Chunk index read from (or expected in) the chunk header.
    std::optional<std::uint32_t> chunkIndex;

    /// @brief Position of the sequence in the caller's input collection.
    std::optional<std::size_t> sequencePosition;

    /// @brief Byte or symbol offset where the error was detected.
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Set the chunk index.
    /// @return Reference to this for method chaining.
    ErrorContext& withChunk(std::uint32_t index) {
        chunkIndex = index;
        return *this;
    }

    /// @brief Set the input sequence position.
    /// @return Reference to this for method chaining.
    ErrorContext& withSequence(std::size_t position) {
        sequencePosition = position;
        return *this;
    }

    /// @brief Set the byte offset.
    /// @return Reference to this for method chaining.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Chunk Fault
// =============================================================================

/// @brief One problem found while decoding a set of sequences.
/// @note Per-chunk faults carry the input position; reassembly faults carry
///       the chunk index they concern (e.g. the missing index).
struct ChunkFault {
    /// @brief Error category.
    ErrorCode code = ErrorCode::kValidationError;

    /// @brief Position of the offending sequence in the input (if known).
    std::optional<std::size_t> sequencePosition;

    /// @brief Chunk index concerned (if known).
    std::optional<std::uint32_t> chunkIndex;

    /// @brief Description of the fault.
    std::string message;

    /// @brief Format the fault as a single line.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all dnac errors.
class DnacException : public std::exception {
public:
    /// @brief Construct with error code and message.
    DnacException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    DnacException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~DnacException() override = default;

    DnacException(const DnacException&) = default;
    DnacException(DnacException&&) noexcept = default;
    DnacException& operator=(const DnacException&) = default;
    DnacException& operator=(DnacException&&) noexcept = default;

    /// @brief Get the formatted error message.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
/// @note Thrown for invalid command-line arguments and unreadable password files.
class UsageError : public DnacException {
public:
    /// @brief Construct with message.
    /// @param message Descriptive error message.
    explicit UsageError(std::string message)
        : DnacException(ErrorCode::kUsageError, std::move(message)) {}

    /// @brief Construct with message and context.
    /// @param message Descriptive error message.
    /// @param context Additional error context.
    UsageError(std::string message, ErrorContext context)
        : DnacException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for invalid encode/decode settings (exit code 3).
/// @note Thrown for a bad base length, level or KDF cost, before any chunk exists.
class ConfigurationError : public DnacException {
public:
    /// @brief Construct with message.
    /// @param message Descriptive error message.
    explicit ConfigurationError(std::string message)
        : DnacException(ErrorCode::kConfigurationError, std::move(message)) {}

    /// @brief Construct with message and context.
    /// @param message Descriptive error message.
    /// @param context Additional error context.
    ConfigurationError(std::string message, ErrorContext context)
        : DnacException(ErrorCode::kConfigurationError, std::move(message), std::move(context)) {}
};

/// @brief Exception for malformed or inconsistent input (exit code 4).
class ValidationError : public DnacException {
public:
    explicit ValidationError(std::string message)
        : DnacException(ErrorCode::kValidationError, std::move(message)) {}

    ValidationError(std::string message, ErrorContext context)
        : DnacException(ErrorCode::kValidationError, std::move(message), std::move(context)) {}
};

/// @brief Exception for chunk corruption beyond the correction bound (exit code 5).
class UncorrectableError : public DnacException {
public:
    explicit UncorrectableError(std::string message)
        : DnacException(ErrorCode::kUncorrectableError, std::move(message)) {}

    UncorrectableError(std::string message, ErrorContext context)
        : DnacException(ErrorCode::kUncorrectableError, std::move(message), std::move(context)) {}
};

/// @brief Exception for an index gap in the chunk set (exit code 7).
class MissingChunkError : public DnacException {
public:
    explicit MissingChunkError(std::string message)
        : DnacException(ErrorCode::kMissingChunk, std::move(message)) {}

    MissingChunkError(std::string message, ErrorContext context)
        : DnacException(ErrorCode::kMissingChunk, std::move(message), std::move(context)) {}
};

/// @brief Exception for a wrong password or tampered ciphertext (exit code 8).
class AuthenticationError : public DnacException {
public:
    explicit AuthenticationError(std::string message)
        : DnacException(ErrorCode::kAuthenticationError, std::move(message)) {}

    AuthenticationError(std::string message, ErrorContext context)
        : DnacException(ErrorCode::kAuthenticationError, std::move(message), std::move(context)) {}
};

/// @brief Exception for crypto backend or allocator failures (exit code 9).
class InternalError : public DnacException {
public:
    explicit InternalError(std::string message)
        : DnacException(ErrorCode::kInternalError, std::move(message)) {}

    InternalError(std::string message, ErrorContext context)
        : DnacException(ErrorCode::kInternalError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown by the command-line layer only.
class IOError : public DnacException {
public:
    explicit IOError(std::string message)
        : DnacException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : DnacException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for post-correction checksum failures (exit code 6).
class ChecksumMismatchError : public DnacException {
public:
    explicit ChecksumMismatchError(std::string message)
        : DnacException(ErrorCode::kChecksumMismatch, std::move(message)) {}

    ChecksumMismatchError(std::string message, ErrorContext context)
        : DnacException(ErrorCode::kChecksumMismatch, std::move(message), std::move(context)) {}

    /// @brief Construct with expected and actual checksum values.
    ChecksumMismatchError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : DnacException(ErrorCode::kChecksumMismatch,
                        formatChecksumMismatch(expected, actual),
                        std::move(context)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }
    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

    /// @brief Build the canonical mismatch message.
    static std::string formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual);

private:
    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

/// @brief Consolidated decode failure carrying every chunk fault found.
/// @note code() is the code of the first fault in report order.
class DecodeFailure : public DnacException {
public:
    DecodeFailure(ErrorCode code, std::string message, std::vector<ChunkFault> faults)
        : DnacException(code, std::move(message)), faults_(std::move(faults)) {}

    /// @brief All faults, per-chunk faults first (by input position), then
    ///        reassembly faults (by chunk index).
    [[nodiscard]] const std::vector<ChunkFault>& faults() const noexcept { return faults_; }

private:
    std::vector<ChunkFault> faults_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode, message and chunk faults.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct a chunk-scoped error.
    Error(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// @brief Construct a consolidated report from a non-empty fault list.
    explicit Error(std::vector<ChunkFault> faults);

    /// @brief Construct from a DnacException.
    explicit Error(const DnacException& ex)
        : code_(ex.code()), message_(ex.message()), context_(ex.context()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Per-chunk faults collected during decode (empty for call-level errors).
    [[nodiscard]] const std::vector<ChunkFault>& faults() const noexcept { return faults_; }

    /// @brief Human readable description including every fault.
    [[nodiscard]] std::string describe() const;

    /// @brief Throw the exception type matching the code.
    /// @note Multi-fault reports throw DecodeFailure.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::vector<ChunkFault> faults_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create a chunk-scoped error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message, ErrorContext context) {
    return std::unexpected(Error{code, std::move(message), std::move(context)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws DnacException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<
    std::conditional_t<std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const DecodeFailure& ex) {
        return std::unexpected(Error{ex.faults()});
    } catch (const DnacException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::bad_alloc& ex) {
        return std::unexpected(Error{ErrorCode::kInternalError, ex.what()});
    }
}

}  // namespace dnac

#endif  // DNAC_COMMON_ERROR_H
