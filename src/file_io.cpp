// ============================================================================
// Farewell - File I/O Implementation
// ============================================================================

#include "farewell/file_io.hpp"

#include <format>
#include <fstream>

namespace farewell {

Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return fail(ErrorCode::FileNotFound, path.string());
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return fail(ErrorCode::FileReadError, std::format("{}: {}", path.string(), ec.message()));
    }
    if (file_size > constants::MAX_FILE_SIZE) {
        return fail(ErrorCode::FileTooLarge,
                    std::format("{} (max {} bytes)", path.string(), constants::MAX_FILE_SIZE));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return fail(ErrorCode::FileReadError, path.string());
    }

    std::string content(static_cast<std::size_t>(file_size), '\0');
    file.read(content.data(), static_cast<std::streamsize>(file_size));
    if (!file) {
        return fail(ErrorCode::FileReadError, path.string());
    }

    return content;
}

VoidResult write_text_file(const std::filesystem::path& path, std::string_view content) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return fail(ErrorCode::FileWriteError,
                        std::format("{}: {}", path.parent_path().string(), ec.message()));
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return fail(ErrorCode::FileWriteError, path.string());
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        return fail(ErrorCode::FileWriteError, path.string());
    }

    return {};
}

} // namespace farewell
