// =============================================================================
// dnac - Sequence File I/O Implementation
// =============================================================================

#include "sequence_file.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <string_view>
#include <system_error>

#include "dnac/common/logger.h"

namespace dnac::commands {

namespace {

std::string_view trim(std::string_view line) noexcept {
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) {
        line.remove_prefix(1);
    }
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.remove_suffix(1);
    }
    return line;
}

}  // namespace

std::vector<std::string> parseSequences(std::istream& in) {
    std::vector<std::string> sequences;
    std::string line;
    while (std::getline(in, line)) {
        const std::string_view content = trim(line);
        if (content.empty() || content.front() == '>') {
            continue;
        }
        sequences.emplace_back(content);
    }
    return sequences;
}

std::vector<std::string> readSequenceFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Failed to open sequence file: " + path.string());
    }
    auto sequences = parseSequences(file);
    if (file.bad()) {
        throw IOError("Failed to read sequence file: " + path.string());
    }
    DNAC_LOG_DEBUG("read {} sequences from {}", sequences.size(), path.string());
    return sequences;
}

void writeSequences(std::ostream& out, std::span<const std::string> sequences, bool fasta) {
    for (std::size_t i = 0; i < sequences.size(); ++i) {
        if (fasta) {
            out << ">seq_" << (i + 1) << '\n';
        }
        out << sequences[i] << '\n';
    }
}

void writeSequenceFile(const std::filesystem::path& path, std::span<const std::string> sequences,
                       bool fasta) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw IOError("Failed to create output file: " + path.string());
    }
    writeSequences(file, sequences, fasta);
    file.flush();
    if (!file) {
        throw IOError("Failed to write output file: " + path.string());
    }
}

Bytes readBinaryFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Failed to open input file: " + path.string());
    }
    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError("Failed to read input file: " + path.string());
    }
    return data;
}

void writeBinaryFile(const std::filesystem::path& path, ByteSpan data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError("Failed to create output file: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        throw IOError("Failed to write output file: " + path.string());
    }
}

std::string readPasswordFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Failed to open password file: " + path.string());
    }
    std::string line;
    std::getline(file, line);
    if (file.bad()) {
        throw IOError("Failed to read password file: " + path.string());
    }
    // Strip the line terminator only; leading and inner spaces are significant
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.empty()) {
        throw UsageError("Password file is empty: " + path.string());
    }
    return line;
}

void ensureWritable(const std::filesystem::path& path, bool force) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec) && !force) {
        throw IOError("Output file exists (use -f to overwrite): " + path.string());
    }
}

}  // namespace dnac::commands
