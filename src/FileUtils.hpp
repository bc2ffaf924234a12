#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace FileUtils {

// Normalize extensions (trim whitespace, enforce dot prefix, lower-case).
std::string normalizeExtension(std::string extension);

// Create directory when missing; every level created mirrors the mode and owner of the
// matching level above referenceFile. Returns false (after logging) when creation fails.
bool ensureDirectory(const std::filesystem::path& directory, const std::filesystem::path& referenceFile,
                     spdlog::logger& logger);

// Move source into destinationDirectory keeping permissions, owner and timestamps.
// Throws std::filesystem::filesystem_error on failure.
void moveFile(const std::filesystem::path& source, const std::filesystem::path& destinationDirectory);

// Size of a regular file, or 0 when it is gone.
std::uintmax_t fileSizeOrZero(const std::filesystem::path& path);

// "1.50 GB" style rendering with 1024-based units.
std::string formatBytes(std::uintmax_t bytes);

// Read a newline-delimited list of paths; blank lines and '#' comments are skipped.
// A missing file yields an empty list.
std::vector<std::string> readPathList(const std::filesystem::path& listFile, spdlog::logger& logger);

// Overwrite target with one path per line.
void writePathList(const std::filesystem::path& target, const std::vector<std::string>& paths);

} // namespace FileUtils

#endif
