#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace depgraph {

/// The file that was being read when an error occurred
struct e_read_file_path {
    std::filesystem::path value;
};

/// The file that was being written when an error occurred
struct e_write_file_path {
    std::filesystem::path value;
};

/// Read the entire content of a file. Throws std::system_error on failure.
[[nodiscard]] std::string read_file(const std::filesystem::path& path);

/// Create or truncate a file and write the given content. Throws std::system_error on failure.
void write_file(const std::filesystem::path& path, std::string_view content);

/// Flush the file or directory at `path` to stable storage. Throws std::system_error on failure.
void sync_to_disk(const std::filesystem::path& path);

/**
 * @brief Replace the content of the given file atomically.
 *
 * The content is first written to a sibling temporary file and synced to disk, then renamed over
 * the destination, and the directory is synced. Readers observe either the old content or the
 * new content, never a partial write, even across a power loss. The temporary file is removed if
 * any step fails.
 */
void write_file_atomic(const std::filesystem::path& path, std::string_view content);

}  // namespace depgraph
