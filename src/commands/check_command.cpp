// =============================================================================
// dnac - Check Command Implementation
// =============================================================================

#include "check_command.h"

#include <iostream>
#include <ostream>

#include <fmt/format.h>

#include "dnac/common/logger.h"
#include "sequence_file.h"

namespace dnac::commands {

CheckCommand::CheckCommand(CheckOptions options) : options_(std::move(options)) {}

CheckCommand::~CheckCommand() = default;

CheckCommand::CheckCommand(CheckCommand&&) noexcept = default;
CheckCommand& CheckCommand::operator=(CheckCommand&&) noexcept = default;

int CheckCommand::execute() {
    try {
        const auto sequences = readSequenceFile(options_.inputPath);
        const auto report = codec::analyzeSequences(sequences, options_.limits);

        if (options_.jsonOutput) {
            printJsonReport(std::cout, report);
        } else {
            printTextReport(std::cout, report);
        }

        if (options_.strict && report.violatingSequences > 0) {
            return toExitCode(ErrorCode::kValidationError);
        }
        return 0;

    } catch (const DnacException& e) {
        DNAC_LOG_ERROR("Check command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        DNAC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

void CheckCommand::printTextReport(std::ostream& out,
                                   const codec::ConstraintReport& report) const {
    out << "=== Synthesis Constraints ===" << '\n';
    out << "File:          " << options_.inputPath.string() << '\n';
    out << "Sequences:     " << report.sequences.size() << '\n';
    out << fmt::format("GC target:     {:.2f} +/- {:.2f}\n", report.limits.targetGcContent,
                       report.limits.gcTolerance);
    out << "Max run:       " << report.limits.maxHomopolymerLength << '\n';
    out << fmt::format("Mean GC:       {:.3f}\n", report.meanGcContent);
    out << "GC violations: " << report.gcViolations << '\n';
    out << "Run violations:" << ' ' << report.homopolymerViolations << '\n';
    out << "Violating:     " << report.violatingSequences << '\n';

    if (options_.detailed && report.violatingSequences > 0) {
        out << '\n' << "--- Violating Sequences ---" << '\n';
        for (std::size_t i = 0; i < report.sequences.size(); ++i) {
            const auto& entry = report.sequences[i];
            if (entry.satisfied()) {
                continue;
            }
            out << fmt::format("  seq_{}: GC {:.3f}{}, longest run {}{}\n", i + 1,
                               entry.gcContent, entry.gcViolation ? " (!)" : "",
                               entry.longestHomopolymer,
                               entry.homopolymerViolation ? " (!)" : "");
        }
    }
    out << "=============================" << std::endl;
}

void CheckCommand::printJsonReport(std::ostream& out,
                                   const codec::ConstraintReport& report) const {
    out << "{\n";
    out << fmt::format("  \"sequences\": {},\n", report.sequences.size());
    out << fmt::format("  \"gc_target\": {},\n", report.limits.targetGcContent);
    out << fmt::format("  \"gc_tolerance\": {},\n", report.limits.gcTolerance);
    out << fmt::format("  \"max_homopolymer\": {},\n", report.limits.maxHomopolymerLength);
    out << fmt::format("  \"mean_gc_content\": {:.6f},\n", report.meanGcContent);
    out << fmt::format("  \"gc_violations\": {},\n", report.gcViolations);
    out << fmt::format("  \"homopolymer_violations\": {},\n", report.homopolymerViolations);
    out << fmt::format("  \"violating_sequences\": {}", report.violatingSequences);

    if (options_.detailed) {
        out << ",\n  \"details\": [";
        for (std::size_t i = 0; i < report.sequences.size(); ++i) {
            const auto& entry = report.sequences[i];
            out << (i == 0 ? "\n" : ",\n");
            out << fmt::format("    {{\"gc_content\": {:.6f}, \"longest_homopolymer\": {}, "
                               "\"gc_violation\": {}, \"homopolymer_violation\": {}}}",
                               entry.gcContent, entry.longestHomopolymer, entry.gcViolation,
                               entry.homopolymerViolation);
        }
        out << (report.sequences.empty() ? "]" : "\n  ]");
    }
    out << "\n}" << std::endl;
}

}  // namespace dnac::commands
