// =============================================================================
// dnac - Check Command
// =============================================================================
// Command handler that reports how a sequence file fares against synthesis
// constraints (GC content and homopolymer runs).
// =============================================================================

#ifndef DNAC_COMMANDS_CHECK_COMMAND_H
#define DNAC_COMMANDS_CHECK_COMMAND_H

#include <filesystem>
#include <iosfwd>

#include "dnac/codec/constraint_checker.h"
#include "dnac/common/error.h"

namespace dnac::commands {

/// @brief Configuration options for the check command.
struct CheckOptions {
    /// @brief Input sequence file path.
    std::filesystem::path inputPath;

    codec::ConstraintLimits limits;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief List every violating sequence.
    bool detailed = false;

    /// @brief Exit with a validation error when any sequence violates a limit.
    bool strict = false;
};

/// @brief Command handler for the constraint report.
class CheckCommand {
public:
    explicit CheckCommand(CheckOptions options);
    ~CheckCommand();

    CheckCommand(const CheckCommand&) = delete;
    CheckCommand& operator=(const CheckCommand&) = delete;
    CheckCommand(CheckCommand&&) noexcept;
    CheckCommand& operator=(CheckCommand&&) noexcept;

    /// @brief Execute the check command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const CheckOptions& options() const noexcept { return options_; }

    void printTextReport(std::ostream& out, const codec::ConstraintReport& report) const;

    void printJsonReport(std::ostream& out, const codec::ConstraintReport& report) const;

private:
    CheckOptions options_;
};

}  // namespace dnac::commands

#endif  // DNAC_COMMANDS_CHECK_COMMAND_H
