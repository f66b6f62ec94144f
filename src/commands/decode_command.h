// =============================================================================
// dnac - Decode Command
// =============================================================================
// Command handler that recovers a binary file from a sequence file.
// =============================================================================

#ifndef DNAC_COMMANDS_DECODE_COMMAND_H
#define DNAC_COMMANDS_DECODE_COMMAND_H

#include <filesystem>
#include <optional>
#include <string>

#include "dnac/common/error.h"
#include "dnac/common/types.h"
#include "dnac/pipeline/codec_pipeline.h"

namespace dnac::commands {

/// @brief Configuration options for the decode command.
struct DecodeCommandOptions {
    /// @brief Input sequence file path.
    std::filesystem::path inputPath;

    /// @brief Output payload path.
    std::filesystem::path outputPath;

    std::optional<std::string> password;

    /// @brief Level the caller believes was used (advisory).
    ErrorCorrectionLevel declaredLevel = ErrorCorrectionLevel::kBasic;

    /// @brief Number of threads (0 = auto).
    int threads = 0;

    bool forceOverwrite = false;

    bool showSummary = true;
};

/// @brief Command handler for decoding sequences back into a file.
class DecodeCommand {
public:
    explicit DecodeCommand(DecodeCommandOptions options);
    ~DecodeCommand();

    DecodeCommand(const DecodeCommand&) = delete;
    DecodeCommand& operator=(const DecodeCommand&) = delete;
    DecodeCommand(DecodeCommand&&) noexcept;
    DecodeCommand& operator=(DecodeCommand&&) noexcept;

    /// @brief Execute the decode command.
    /// @return Exit code of the first fault, or 0 on success.
    [[nodiscard]] int execute();

    [[nodiscard]] const DecodeCommandOptions& options() const noexcept { return options_; }

private:
    void printSummary(const pipeline::DecodeResult& result) const;

    DecodeCommandOptions options_;
};

}  // namespace dnac::commands

#endif  // DNAC_COMMANDS_DECODE_COMMAND_H
