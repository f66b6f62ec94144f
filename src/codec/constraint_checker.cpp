// =============================================================================
// dnac - Synthesis Constraint Checker Implementation
// =============================================================================

#include "dnac/codec/constraint_checker.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "dnac/common/logger.h"

namespace dnac::codec {

SequenceConstraints analyzeSequence(std::string_view sequence, const ConstraintLimits& limits) {
    SequenceConstraints result;
    if (sequence.empty()) {
        return result;
    }

    std::size_t gcCount = 0;
    std::size_t run = 0;
    char previous = '\0';
    for (char raw : sequence) {
        const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
        if (c == 'G' || c == 'C') {
            ++gcCount;
        }
        run = (c == previous) ? run + 1 : 1;
        previous = c;
        result.longestHomopolymer = std::max(result.longestHomopolymer, run);
    }

    result.gcContent = static_cast<double>(gcCount) / static_cast<double>(sequence.size());
    result.gcViolation = std::fabs(result.gcContent - limits.targetGcContent) > limits.gcTolerance;
    result.homopolymerViolation = result.longestHomopolymer > limits.maxHomopolymerLength;
    return result;
}

ConstraintReport analyzeSequences(std::span<const std::string> sequences,
                                  const ConstraintLimits& limits) {
    ConstraintReport report;
    report.limits = limits;
    report.sequences.reserve(sequences.size());

    double gcSum = 0.0;
    for (const auto& sequence : sequences) {
        const SequenceConstraints result = analyzeSequence(sequence, limits);
        gcSum += result.gcContent;
        report.gcViolations += result.gcViolation ? 1 : 0;
        report.homopolymerViolations += result.homopolymerViolation ? 1 : 0;
        report.violatingSequences += result.satisfied() ? 0 : 1;
        report.sequences.push_back(result);
    }

    if (!sequences.empty()) {
        report.meanGcContent = gcSum / static_cast<double>(sequences.size());
    }

    DNAC_LOG_INFO("constraint check: {} of {} sequences violate limits ({} GC, {} homopolymer)",
                  report.violatingSequences, sequences.size(), report.gcViolations,
                  report.homopolymerViolations);
    return report;
}

}  // namespace dnac::codec
