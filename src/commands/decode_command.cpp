// =============================================================================
// dnac - Decode Command Implementation
// =============================================================================

#include "decode_command.h"

#include <iostream>

#include "dnac/common/logger.h"
#include "sequence_file.h"

namespace dnac::commands {

DecodeCommand::DecodeCommand(DecodeCommandOptions options) : options_(std::move(options)) {}

DecodeCommand::~DecodeCommand() = default;

DecodeCommand::DecodeCommand(DecodeCommand&&) noexcept = default;
DecodeCommand& DecodeCommand::operator=(DecodeCommand&&) noexcept = default;

int DecodeCommand::execute() {
    try {
        ensureWritable(options_.outputPath, options_.forceOverwrite);

        const auto sequences = readSequenceFile(options_.inputPath);
        DNAC_LOG_INFO("decoding {} sequences from {}", sequences.size(),
                      options_.inputPath.string());

        pipeline::DecodeOptions opts;
        opts.password = options_.password;
        opts.declaredLevel = options_.declaredLevel;
        opts.numThreads = options_.threads > 0 ? static_cast<std::size_t>(options_.threads) : 0;

        pipeline::Decoder decoder(std::move(opts));
        decoder.setObserver([](pipeline::PipelineStage stage) {
            DNAC_LOG_DEBUG("decode stage: {}", pipeline::pipelineStageToString(stage));
        });

        auto result = decoder.decode(sequences);
        if (!result) {
            const Error& error = result.error();
            DNAC_LOG_ERROR("Decoding failed: {}", error.message());
            for (const auto& fault : error.faults()) {
                DNAC_LOG_ERROR("  {}", fault.format());
            }
            return error.exitCode();
        }

        writeBinaryFile(options_.outputPath, result->payload);
        if (options_.showSummary) {
            printSummary(*result);
        }
        return 0;

    } catch (const DnacException& e) {
        DNAC_LOG_ERROR("Decoding failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        DNAC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

void DecodeCommand::printSummary(const pipeline::DecodeResult& result) const {
    const auto& stats = result.stats;
    std::cout << "Decoded " << result.payload.size() << " bytes from " << stats.chunkCount
              << " chunks" << std::endl;
    std::cout << "  Error correction: " << levelToString(stats.level) << std::endl;
    std::cout << "  Encrypted:        " << (stats.isEncrypted ? "yes" : "no") << std::endl;
    if (stats.correctedChunks > 0) {
        std::cout << "  Repaired:         " << stats.correctedBytes << " bytes in "
                  << stats.correctedChunks << " chunks" << std::endl;
    }
    std::cout << "  Output:           " << options_.outputPath.string() << std::endl;
}

}  // namespace dnac::commands
