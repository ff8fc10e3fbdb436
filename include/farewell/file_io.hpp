// ============================================================================
// Farewell - File I/O
// ============================================================================
// Bounded whole-file reads (claim packages, sent messages, proofs, secrets)
// and whole-file writes for the documents the claimer produces.
// ============================================================================

#ifndef FAREWELL_FILE_IO_HPP
#define FAREWELL_FILE_IO_HPP

#include "types.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace farewell {

/// Read a whole file as text (at most constants::MAX_FILE_SIZE bytes)
/// @return The content, or FileNotFound / FileTooLarge / FileReadError
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path& path);

/// Write text to a file, replacing it. Missing parent directories are created.
/// @return Nothing, or FileWriteError
[[nodiscard]] VoidResult write_text_file(const std::filesystem::path& path, std::string_view content);

} // namespace farewell

#endif // FAREWELL_FILE_IO_HPP
