// =============================================================================
// dnac - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <iostream>

#include <fmt/format.h>

#include "dnac/common/logger.h"
#include "dnac/pipeline/codec_pipeline.h"
#include "sequence_file.h"

namespace dnac::commands {

namespace {

std::string faultCheckName(const ChunkFault& fault) {
    if (fault.chunkIndex) {
        return fmt::format("Chunk {}", *fault.chunkIndex);
    }
    if (fault.sequencePosition) {
        return fmt::format("Sequence {}", *fault.sequencePosition + 1);
    }
    return "Decode";
}

}  // namespace

// =============================================================================
// VerifyCommand Implementation
// =============================================================================

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

VerifyCommand::~VerifyCommand() = default;

VerifyCommand::VerifyCommand(VerifyCommand&&) noexcept = default;
VerifyCommand& VerifyCommand::operator=(VerifyCommand&&) noexcept = default;

int VerifyCommand::execute() {
    try {
        if (options_.verbose) {
            std::cout << "Verifying: " << options_.inputPath.string() << std::endl;
            std::cout << std::endl;
        }

        verifySequences(readSequenceFile(options_.inputPath));
        printSummary();
        return summary_.exitCode();

    } catch (const DnacException& e) {
        DNAC_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        DNAC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

void VerifyCommand::verifySequences(const std::vector<std::string>& sequences) {
    VerificationResult input;
    input.checkName = "Sequence File";
    input.passed = !sequences.empty();
    if (input.passed) {
        input.details = fmt::format("{} sequences", sequences.size());
    } else {
        input.code = ErrorCode::kValidationError;
        input.errorMessage = "no sequences found";
    }
    record(std::move(input));
    if (sequences.empty()) {
        return;
    }

    pipeline::DecodeOptions opts;
    opts.password = options_.password;
    opts.declaredLevel = options_.declaredLevel;
    opts.numThreads = options_.threads > 0 ? static_cast<std::size_t>(options_.threads) : 0;

    auto result = pipeline::decode(sequences, opts);
    if (!result) {
        const Error& error = result.error();
        if (error.faults().empty()) {
            VerificationResult failure;
            failure.checkName = "Decode";
            failure.code = error.code();
            failure.errorMessage = error.message();
            record(std::move(failure));
            return;
        }
        for (const auto& fault : error.faults()) {
            VerificationResult failure;
            failure.checkName = faultCheckName(fault);
            failure.code = fault.code;
            failure.errorMessage = fault.format();
            record(std::move(failure));
        }
        return;
    }

    const auto& stats = result->stats;
    VerificationResult decoded;
    decoded.checkName = "Decode";
    decoded.passed = true;
    decoded.details = fmt::format("{} chunks, {} bytes, level {}{}", stats.chunkCount,
                                  result->payload.size(), levelToString(stats.level),
                                  stats.isEncrypted ? ", authenticated" : "");
    record(std::move(decoded));

    VerificationResult repairs;
    repairs.checkName = "Error Correction";
    repairs.passed = true;
    repairs.details = stats.correctedChunks == 0
                          ? std::string("no repairs needed")
                          : fmt::format("{} bytes repaired in {} chunks", stats.correctedBytes,
                                        stats.correctedChunks);
    record(std::move(repairs));
}

void VerifyCommand::record(VerificationResult result) {
    if (options_.verbose) {
        std::cout << "[" << (result.passed ? "PASS" : "FAIL") << "] " << result.checkName;
        if (!result.passed) {
            std::cout << ": " << result.errorMessage;
        } else if (!result.details.empty()) {
            std::cout << " (" << result.details << ")";
        }
        std::cout << std::endl;
    }
    summary_.addResult(std::move(result));
}

void VerifyCommand::printSummary() const {
    std::cout << std::endl;
    std::cout << "=== Verification Summary ===" << std::endl;
    std::cout << "File:    " << options_.inputPath.string() << std::endl;
    std::cout << "Checks:  " << summary_.passedChecks << "/" << summary_.totalChecks << " passed"
              << std::endl;

    if (summary_.passed()) {
        std::cout << "Status:  OK" << std::endl;
    } else {
        std::cout << "Status:  FAILED" << std::endl;
        std::cout << std::endl;
        std::cout << "Failed checks:" << std::endl;
        for (const auto& result : summary_.results) {
            if (!result.passed) {
                std::cout << "  [FAIL] " << result.checkName << ": " << result.errorMessage
                          << std::endl;
            }
        }
    }

    std::cout << "=============================" << std::endl;
}

}  // namespace dnac::commands
