// =============================================================================
// dnac - DNA Storage Codec
// =============================================================================
// Main entry point for the dnac command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: encode, decode, verify, check, health
// - Global options: threads, verbose, quiet, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dnac/common/error.h"
#include "dnac/common/logger.h"
#include "dnac/common/types.h"
#include "dnac/pipeline/codec_pipeline.h"

// Command implementations
#include "commands/check_command.h"
#include "commands/decode_command.h"
#include "commands/encode_command.h"
#include "commands/sequence_file.h"
#include "commands/verify_command.h"

// Forward declarations for command handlers
namespace dnac::commands {
int runEncode(CLI::App* app);
int runDecode(CLI::App* app);
int runVerify(CLI::App* app);
int runCheck(CLI::App* app);
int runHealth(CLI::App* app);
}  // namespace dnac::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kDescription =
    "dnac: DNA storage codec\n"
    "Encodes arbitrary files into error-corrected A/T/C/G sequences and back,\n"
    "with optional password-based encryption.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;    // 0 = auto-detect
    int verbosity = 0;  // 0 = warnings, 1 = info, 2 = debug, 3 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Encode Command Options
// =============================================================================

struct CliEncodeOptions {
    std::string input;
    std::string output;
    std::string password;
    std::string passwordFile;
    std::uint32_t baseLength = dnac::kDefaultBaseLength;
    std::string ecc = "basic";
    std::uint32_t kdfIterations = dnac::KdfParams::kDefaultIterations;
    bool fasta = false;
    std::string metadata;
    bool checkConstraints = false;
    bool force = false;
};

CliEncodeOptions gEncodeOpts;

// =============================================================================
// Decode Command Options
// =============================================================================

struct CliDecodeOptions {
    std::string input;
    std::string output;
    std::string password;
    std::string passwordFile;
    std::string ecc = "basic";
    bool force = false;
};

CliDecodeOptions gDecodeOpts;

// =============================================================================
// Verify Command Options
// =============================================================================

struct CliVerifyOptions {
    std::string input;
    std::string password;
    std::string passwordFile;
    std::string ecc = "basic";
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Check Command Options
// =============================================================================

struct CliCheckOptions {
    std::string input;
    double gcTarget = 0.5;
    double gcTolerance = 0.1;
    std::size_t maxHomopolymer = 3;
    bool json = false;
    bool detailed = false;
    bool strict = false;
};

CliCheckOptions gCheckOpts;

// =============================================================================
// Helpers
// =============================================================================

const std::vector<std::string> kEccChoices{"basic", "advanced", "robust"};

void addPasswordOptions(CLI::App* cmd, std::string& password, std::string& passwordFile) {
    auto* pw = cmd->add_option("-p,--password", password, "Encryption password");
    auto* pwFile = cmd->add_option("--password-file", passwordFile,
                                   "Read the password from the first line of a file")
                       ->check(CLI::ExistingFile);
    pw->excludes(pwFile);
}

/// @brief Resolve --password / --password-file into an optional password.
[[nodiscard]] std::optional<std::string> resolvePassword(const std::string& password,
                                                         const std::string& passwordFile) {
    if (!passwordFile.empty()) {
        return dnac::commands::readPasswordFile(passwordFile);
    }
    if (!password.empty()) {
        return password;
    }
    return std::nullopt;
}

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupEncodeCommand(CLI::App& app) {
    auto* encode = app.add_subcommand("encode", "Encode a file into DNA sequences");
    encode->alias("e");

    encode->add_option("-i,--input", gEncodeOpts.input, "Input file")
        ->required()
        ->check(CLI::ExistingFile);

    encode->add_option("-o,--output", gEncodeOpts.output, "Output sequence file")->required();

    addPasswordOptions(encode, gEncodeOpts.password, gEncodeOpts.passwordFile);

    encode->add_option("-b,--base-length", gEncodeOpts.baseLength,
                       "Bases per sequence (multiple of 4)")
        ->default_val(dnac::kDefaultBaseLength)
        ->check(CLI::Range(std::uint32_t{4}, dnac::kMaxBaseLength));

    encode->add_option("--ecc", gEncodeOpts.ecc, "Error correction: basic, advanced")
        ->default_val("basic")
        ->check(CLI::IsMember(kEccChoices));

    encode->add_option("--kdf-iterations", gEncodeOpts.kdfIterations,
                       "PBKDF2 iterations for encrypted output")
        ->default_val(dnac::KdfParams::kDefaultIterations)
        ->check(CLI::Range(dnac::KdfParams::kMinIterations, dnac::KdfParams::kMaxIterations));

    encode->add_flag("--fasta", gEncodeOpts.fasta, "Write FASTA headers (>seq_N)");

    encode->add_option("--metadata", gEncodeOpts.metadata, "Write encode metadata as JSON");

    encode->add_flag("--check-constraints", gEncodeOpts.checkConstraints,
                     "Report GC content and homopolymer violations");

    encode->add_flag("-f,--force", gEncodeOpts.force, "Overwrite existing output files");
}

void setupDecodeCommand(CLI::App& app) {
    auto* decode = app.add_subcommand("decode", "Decode DNA sequences back into a file");
    decode->alias("d");

    decode->add_option("-i,--input", gDecodeOpts.input, "Input sequence file")
        ->required()
        ->check(CLI::ExistingFile);

    decode->add_option("-o,--output", gDecodeOpts.output, "Output file")->required();

    addPasswordOptions(decode, gDecodeOpts.password, gDecodeOpts.passwordFile);

    decode->add_option("--ecc", gDecodeOpts.ecc,
                       "Expected error correction (chunk headers take precedence)")
        ->default_val("basic")
        ->check(CLI::IsMember(kEccChoices));

    decode->add_flag("-f,--force", gDecodeOpts.force, "Overwrite existing output file");
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Check that a sequence file decodes cleanly");
    verify->alias("v");

    verify->add_option("-i,--input", gVerifyOpts.input, "Input sequence file")
        ->required()
        ->check(CLI::ExistingFile);

    addPasswordOptions(verify, gVerifyOpts.password, gVerifyOpts.passwordFile);

    verify->add_option("--ecc", gVerifyOpts.ecc,
                       "Expected error correction (chunk headers take precedence)")
        ->default_val("basic")
        ->check(CLI::IsMember(kEccChoices));

    verify->add_flag("--verbose", gVerifyOpts.verbose, "Print every check");
}

void setupCheckCommand(CLI::App& app) {
    auto* check = app.add_subcommand("check", "Report synthesis constraint violations");

    check->add_option("-i,--input", gCheckOpts.input, "Input sequence file")
        ->required()
        ->check(CLI::ExistingFile);

    check->add_option("--gc-target", gCheckOpts.gcTarget, "Target GC fraction")
        ->default_val(0.5)
        ->check(CLI::Range(0.0, 1.0));

    check->add_option("--gc-tolerance", gCheckOpts.gcTolerance, "Allowed GC deviation")
        ->default_val(0.1)
        ->check(CLI::Range(0.0, 1.0));

    check->add_option("--max-homopolymer", gCheckOpts.maxHomopolymer,
                      "Longest allowed single-base run")
        ->default_val(3)
        ->check(CLI::PositiveNumber);

    check->add_flag("--json", gCheckOpts.json, "Output as JSON");

    check->add_flag("--detailed", gCheckOpts.detailed, "List each violating sequence");

    check->add_flag("--strict", gCheckOpts.strict, "Fail when any sequence violates a limit");
}

void setupHealthCommand(CLI::App& app) {
    app.add_subcommand("health", "Print the liveness probe");
}

[[nodiscard]] dnac::ErrorCorrectionLevel parseLevelOrThrow(const std::string& name) {
    return dnac::unwrapOrThrow(dnac::parseErrorCorrectionLevel(name));
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", std::string(dnac::pipeline::kLibraryVersion));

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity,
                 "Increase verbosity (-v info, -vv debug, -vvv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    // Setup subcommands
    setupEncodeCommand(app);
    setupDecodeCommand(app);
    setupVerifyCommand(app);
    setupCheckCommand(app);
    setupHealthCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        dnac::log::Config config;
        config.logFile = gOptions.logFile;
        config.level = dnac::log::levelFromVerbosity(gOptions.verbosity, gOptions.quiet);
        dnac::log::init(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return dnac::toExitCode(dnac::ErrorCode::kIOError);
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("encode")) {
            exitCode = dnac::commands::runEncode(app.get_subcommand("encode"));
        } else if (app.got_subcommand("decode")) {
            exitCode = dnac::commands::runDecode(app.get_subcommand("decode"));
        } else if (app.got_subcommand("verify")) {
            exitCode = dnac::commands::runVerify(app.get_subcommand("verify"));
        } else if (app.got_subcommand("check")) {
            exitCode = dnac::commands::runCheck(app.get_subcommand("check"));
        } else if (app.got_subcommand("health")) {
            exitCode = dnac::commands::runHealth(app.get_subcommand("health"));
        }
    } catch (const dnac::DnacException& ex) {
        DNAC_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        DNAC_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = dnac::toExitCode(dnac::ErrorCode::kInternalError);
    }

    dnac::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace dnac::commands {

int runEncode([[maybe_unused]] CLI::App* app) {
    try {
        EncodeCommandOptions opts;
        opts.inputPath = gEncodeOpts.input;
        opts.outputPath = gEncodeOpts.output;
        opts.password = resolvePassword(gEncodeOpts.password, gEncodeOpts.passwordFile);
        opts.baseLength = gEncodeOpts.baseLength;
        opts.level = parseLevelOrThrow(gEncodeOpts.ecc);
        opts.kdfIterations = gEncodeOpts.kdfIterations;
        opts.fasta = gEncodeOpts.fasta;
        if (!gEncodeOpts.metadata.empty()) {
            opts.metadataPath = gEncodeOpts.metadata;
        }
        opts.checkConstraints = gEncodeOpts.checkConstraints;
        opts.threads = gOptions.threads;
        opts.forceOverwrite = gEncodeOpts.force;
        opts.showSummary = !gOptions.quiet;

        auto cmd = std::make_unique<EncodeCommand>(std::move(opts));
        return cmd->execute();
    } catch (const DnacException& e) {
        DNAC_LOG_ERROR("Encoding failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        DNAC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

int runDecode([[maybe_unused]] CLI::App* app) {
    try {
        DecodeCommandOptions opts;
        opts.inputPath = gDecodeOpts.input;
        opts.outputPath = gDecodeOpts.output;
        opts.password = resolvePassword(gDecodeOpts.password, gDecodeOpts.passwordFile);
        opts.declaredLevel = parseLevelOrThrow(gDecodeOpts.ecc);
        opts.threads = gOptions.threads;
        opts.forceOverwrite = gDecodeOpts.force;
        opts.showSummary = !gOptions.quiet;

        auto cmd = std::make_unique<DecodeCommand>(std::move(opts));
        return cmd->execute();
    } catch (const DnacException& e) {
        DNAC_LOG_ERROR("Decoding failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        DNAC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

int runVerify([[maybe_unused]] CLI::App* app) {
    try {
        VerifyOptions opts;
        opts.inputPath = gVerifyOpts.input;
        opts.password = resolvePassword(gVerifyOpts.password, gVerifyOpts.passwordFile);
        opts.declaredLevel = parseLevelOrThrow(gVerifyOpts.ecc);
        opts.threads = gOptions.threads;
        opts.verbose = gVerifyOpts.verbose;

        auto cmd = std::make_unique<VerifyCommand>(std::move(opts));
        return cmd->execute();
    } catch (const DnacException& e) {
        DNAC_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        DNAC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

int runCheck([[maybe_unused]] CLI::App* app) {
    try {
        CheckOptions opts;
        opts.inputPath = gCheckOpts.input;
        opts.limits.targetGcContent = gCheckOpts.gcTarget;
        opts.limits.gcTolerance = gCheckOpts.gcTolerance;
        opts.limits.maxHomopolymerLength = gCheckOpts.maxHomopolymer;
        opts.jsonOutput = gCheckOpts.json;
        opts.detailed = gCheckOpts.detailed;
        opts.strict = gCheckOpts.strict;

        auto cmd = std::make_unique<CheckCommand>(std::move(opts));
        return cmd->execute();
    } catch (const DnacException& e) {
        DNAC_LOG_ERROR("Check command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        DNAC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

int runHealth([[maybe_unused]] CLI::App* app) {
    const auto status = pipeline::health();
    std::cout << "{\"status\": \"" << status.status << "\", \"version\": \"" << status.version
              << "\"}" << std::endl;
    return 0;
}

}  // namespace dnac::commands
