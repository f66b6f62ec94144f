// =============================================================================
// dnac - Synthesis Constraint Checker
// =============================================================================
// Report-only analysis of encoded sequences against common DNA synthesis
// limits: GC content close to a target and bounded homopolymer runs.
// The checker never alters a sequence.
// =============================================================================

#ifndef DNAC_CODEC_CONSTRAINT_CHECKER_H
#define DNAC_CODEC_CONSTRAINT_CHECKER_H

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dnac::codec {

/// @brief Acceptance limits for one sequence.
struct ConstraintLimits {
    /// @brief Desired fraction of G and C symbols.
    double targetGcContent = 0.5;

    /// @brief Allowed absolute deviation from the target.
    double gcTolerance = 0.1;

    /// @brief Longest allowed run of one repeated symbol.
    std::size_t maxHomopolymerLength = 3;
};

/// @brief Analysis of a single sequence.
struct SequenceConstraints {
    double gcContent = 0.0;
    std::size_t longestHomopolymer = 0;
    bool gcViolation = false;
    bool homopolymerViolation = false;

    [[nodiscard]] bool satisfied() const noexcept { return !gcViolation && !homopolymerViolation; }
};

/// @brief Analysis of an encoded set.
struct ConstraintReport {
    ConstraintLimits limits;

    /// @brief One entry per input sequence, in input order.
    std::vector<SequenceConstraints> sequences;

    /// @brief Number of sequences with at least one violation.
    std::size_t violatingSequences = 0;

    std::size_t gcViolations = 0;
    std::size_t homopolymerViolations = 0;

    /// @brief Mean GC content over all sequences.
    double meanGcContent = 0.0;
};

[[nodiscard]] SequenceConstraints analyzeSequence(std::string_view sequence,
                                                  const ConstraintLimits& limits = {});

[[nodiscard]] ConstraintReport analyzeSequences(std::span<const std::string> sequences,
                                                const ConstraintLimits& limits = {});

}  // namespace dnac::codec

#endif  // DNAC_CODEC_CONSTRAINT_CHECKER_H
