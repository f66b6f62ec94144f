// =============================================================================
// dnac - Encode Command
// =============================================================================
// Command handler that turns a binary file into a sequence file.
// =============================================================================

#ifndef DNAC_COMMANDS_ENCODE_COMMAND_H
#define DNAC_COMMANDS_ENCODE_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include "dnac/common/error.h"
#include "dnac/common/types.h"
#include "dnac/pipeline/codec_pipeline.h"

namespace dnac::commands {

// =============================================================================
// Encode Options
// =============================================================================

/// @brief Configuration options for the encode command.
struct EncodeCommandOptions {
    /// @brief Input payload path.
    std::filesystem::path inputPath;

    /// @brief Output sequence file path.
    std::filesystem::path outputPath;

    /// @brief Encryption password (unset = no encryption).
    std::optional<std::string> password;

    std::uint32_t baseLength = kDefaultBaseLength;
    ErrorCorrectionLevel level = ErrorCorrectionLevel::kBasic;
    std::uint32_t kdfIterations = KdfParams::kDefaultIterations;

    /// @brief Write '>seq_<n>' header lines.
    bool fasta = false;

    /// @brief Optional JSON metadata output path.
    std::optional<std::filesystem::path> metadataPath;

    /// @brief Attach and print a synthesis constraint report.
    bool checkConstraints = false;

    /// @brief Number of threads (0 = auto).
    int threads = 0;

    bool forceOverwrite = false;

    /// @brief Print a summary to stdout.
    bool showSummary = true;
};

/// @brief Write encode metadata as a JSON object.
void writeMetadataJson(std::ostream& out, const pipeline::EncodeMetadata& metadata);

// =============================================================================
// EncodeCommand Class
// =============================================================================

/// @brief Command handler for encoding a file into sequences.
class EncodeCommand {
public:
    explicit EncodeCommand(EncodeCommandOptions options);
    ~EncodeCommand();

    // Non-copyable, movable
    EncodeCommand(const EncodeCommand&) = delete;
    EncodeCommand& operator=(const EncodeCommand&) = delete;
    EncodeCommand(EncodeCommand&&) noexcept;
    EncodeCommand& operator=(EncodeCommand&&) noexcept;

    /// @brief Execute the encode command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const EncodeCommandOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] pipeline::EncodeOptions buildPipelineOptions() const;

    void writeMetadata(const pipeline::EncodeMetadata& metadata) const;

    void printSummary(const pipeline::EncodeResult& result) const;

    EncodeCommandOptions options_;
};

}  // namespace dnac::commands

#endif  // DNAC_COMMANDS_ENCODE_COMMAND_H
