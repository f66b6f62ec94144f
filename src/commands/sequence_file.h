// =============================================================================
// dnac - Sequence File I/O
// =============================================================================
// File helpers shared by the command handlers. The codec library never touches
// the file system; everything path-related lives here.
//
// Sequence files hold one sequence per line. Blank lines and FASTA header
// lines (starting with '>') are skipped when reading.
// =============================================================================

#ifndef DNAC_COMMANDS_SEQUENCE_FILE_H
#define DNAC_COMMANDS_SEQUENCE_FILE_H

#include <filesystem>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>

#include "dnac/common/types.h"

namespace dnac::commands {

/// @brief Parse sequences from a stream.
[[nodiscard]] std::vector<std::string> parseSequences(std::istream& in);

/// @brief Read all sequences from a file.
/// @throws IOError if the file cannot be read.
[[nodiscard]] std::vector<std::string> readSequenceFile(const std::filesystem::path& path);

/// @brief Write sequences, one per line, optionally with '>seq_<n>' headers.
void writeSequences(std::ostream& out, std::span<const std::string> sequences, bool fasta);

/// @throws IOError if the file cannot be written.
void writeSequenceFile(const std::filesystem::path& path, std::span<const std::string> sequences,
                       bool fasta);

/// @throws IOError if the file cannot be read.
[[nodiscard]] Bytes readBinaryFile(const std::filesystem::path& path);

/// @throws IOError if the file cannot be written.
void writeBinaryFile(const std::filesystem::path& path, ByteSpan data);

/// @brief Read a password from the first line of a file.
/// @throws IOError if the file cannot be read; UsageError if it is empty.
[[nodiscard]] std::string readPasswordFile(const std::filesystem::path& path);

/// @brief Refuse to replace an existing file unless forced.
/// @throws IOError if the path exists and force is false.
void ensureWritable(const std::filesystem::path& path, bool force);

}  // namespace dnac::commands

#endif  // DNAC_COMMANDS_SEQUENCE_FILE_H
