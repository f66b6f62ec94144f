// =============================================================================
// dnac - Verify Command
// =============================================================================
// Command handler that runs a full decode without writing output and reports
// every fault found in a sequence file.
// =============================================================================

#ifndef DNAC_COMMANDS_VERIFY_COMMAND_H
#define DNAC_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "dnac/common/error.h"
#include "dnac/common/types.h"

namespace dnac::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    /// @brief Check name.
    std::string checkName;

    bool passed = false;

    /// @brief Error category (kSuccess when passed).
    ErrorCode code = ErrorCode::kSuccess;

    /// @brief Error message (if failed).
    std::string errorMessage;

    /// @brief Additional details.
    std::string details;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;

    /// @brief Individual results in report order.
    std::vector<VerificationResult> results;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    /// @brief Exit code of the first failed check, or 0.
    [[nodiscard]] int exitCode() const noexcept {
        for (const auto& result : results) {
            if (!result.passed) {
                return toExitCode(result.code);
            }
        }
        return 0;
    }

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for the verify command.
struct VerifyOptions {
    /// @brief Input sequence file path.
    std::filesystem::path inputPath;

    /// @brief Password for encrypted sets (authentication is part of the check).
    std::optional<std::string> password;

    ErrorCorrectionLevel declaredLevel = ErrorCorrectionLevel::kBasic;

    int threads = 0;

    /// @brief Print every check as it completes.
    bool verbose = false;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for verifying a sequence file.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);
    ~VerifyCommand();

    // Non-copyable, movable
    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;
    VerifyCommand(VerifyCommand&&) noexcept;
    VerifyCommand& operator=(VerifyCommand&&) noexcept;

    /// @brief Execute the verify command.
    /// @return 0 when the set decodes cleanly, else the first fault's exit code.
    [[nodiscard]] int execute();

    /// @brief Verify an in-memory set of sequences.
    void verifySequences(const std::vector<std::string>& sequences);

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    void record(VerificationResult result);

    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
};

}  // namespace dnac::commands

#endif  // DNAC_COMMANDS_VERIFY_COMMAND_H
