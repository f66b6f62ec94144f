// =============================================================================
// dnac - Encode Command Implementation
// =============================================================================

#include "encode_command.h"

#include <fstream>
#include <iostream>
#include <ostream>

#include <fmt/format.h>

#include "dnac/common/logger.h"
#include "sequence_file.h"

namespace dnac::commands {

void writeMetadataJson(std::ostream& out, const pipeline::EncodeMetadata& metadata) {
    out << "{\n";
    out << fmt::format("  \"original_size\": {},\n", metadata.originalSize);
    out << fmt::format("  \"encoded_size\": {},\n", metadata.encodedSize);
    out << fmt::format("  \"sequence_count\": {},\n", metadata.sequenceCount);
    out << fmt::format("  \"base_length\": {},\n", metadata.baseLength);
    out << fmt::format("  \"chunk_size\": {},\n", metadata.chunkSize);
    out << fmt::format("  \"error_correction\": \"{}\",\n", levelToString(metadata.level));
    out << fmt::format("  \"is_encrypted\": {}\n", metadata.isEncrypted ? "true" : "false");
    out << "}\n";
}

// =============================================================================
// EncodeCommand Implementation
// =============================================================================

EncodeCommand::EncodeCommand(EncodeCommandOptions options) : options_(std::move(options)) {}

EncodeCommand::~EncodeCommand() = default;

EncodeCommand::EncodeCommand(EncodeCommand&&) noexcept = default;
EncodeCommand& EncodeCommand::operator=(EncodeCommand&&) noexcept = default;

int EncodeCommand::execute() {
    try {
        ensureWritable(options_.outputPath, options_.forceOverwrite);
        if (options_.metadataPath) {
            ensureWritable(*options_.metadataPath, options_.forceOverwrite);
        }

        const Bytes payload = readBinaryFile(options_.inputPath);
        DNAC_LOG_INFO("encoding {} ({} bytes)", options_.inputPath.string(), payload.size());

        pipeline::Encoder encoder(buildPipelineOptions());
        encoder.setObserver([](pipeline::PipelineStage stage) {
            DNAC_LOG_DEBUG("encode stage: {}", pipeline::pipelineStageToString(stage));
        });

        auto result = encoder.encode(payload);
        if (!result) {
            DNAC_LOG_ERROR("Encoding failed: {}", result.error().describe());
            return result.error().exitCode();
        }

        writeSequenceFile(options_.outputPath, result->sequences, options_.fasta);
        if (options_.metadataPath) {
            writeMetadata(result->metadata);
        }
        if (options_.showSummary) {
            printSummary(*result);
        }
        return 0;

    } catch (const DnacException& e) {
        DNAC_LOG_ERROR("Encoding failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        DNAC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

pipeline::EncodeOptions EncodeCommand::buildPipelineOptions() const {
    pipeline::EncodeOptions opts;
    opts.password = options_.password;
    opts.baseLength = options_.baseLength;
    opts.level = options_.level;
    opts.kdf.iterations = options_.kdfIterations;
    opts.numThreads = options_.threads > 0 ? static_cast<std::size_t>(options_.threads) : 0;
    opts.checkConstraints = options_.checkConstraints;
    return opts;
}

void EncodeCommand::writeMetadata(const pipeline::EncodeMetadata& metadata) const {
    std::ofstream file(*options_.metadataPath, std::ios::trunc);
    if (!file) {
        throw IOError("Failed to create metadata file: " + options_.metadataPath->string());
    }
    writeMetadataJson(file, metadata);
    file.flush();
    if (!file) {
        throw IOError("Failed to write metadata file: " + options_.metadataPath->string());
    }
}

void EncodeCommand::printSummary(const pipeline::EncodeResult& result) const {
    const auto& meta = result.metadata;
    std::cout << "Encoded " << meta.originalSize << " bytes into " << meta.sequenceCount
              << " sequences of up to " << meta.baseLength << " bases" << std::endl;
    std::cout << "  Error correction: " << levelToString(meta.level) << std::endl;
    std::cout << "  Encrypted:        " << (meta.isEncrypted ? "yes" : "no") << std::endl;
    std::cout << "  Output:           " << options_.outputPath.string() << std::endl;

    if (result.constraints) {
        const auto& report = *result.constraints;
        std::cout << fmt::format("  Constraints:      {} of {} sequences outside limits "
                                 "(mean GC {:.3f})",
                                 report.violatingSequences, report.sequences.size(),
                                 report.meanGcContent)
                  << std::endl;
    }
}

}  // namespace dnac::commands
