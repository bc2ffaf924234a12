#include "FileUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {
std::error_code lastError() {
    return std::error_code(errno, std::generic_category());
}

// Apply the source's ownership, mode and timestamps to a freshly copied target.
void copyMetadata(const struct stat& sourceStat, const std::filesystem::path& target) {
    if (::lchown(target.c_str(), sourceStat.st_uid, sourceStat.st_gid) != 0) {
        throw std::filesystem::filesystem_error("Failed to restore owner", target, lastError());
    }

    if (::chmod(target.c_str(), sourceStat.st_mode & 07777) != 0) {
        throw std::filesystem::filesystem_error("Failed to restore permissions", target, lastError());
    }

    const struct timespec times[2] = {sourceStat.st_atim, sourceStat.st_mtim};
    if (::utimensat(AT_FDCWD, target.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        throw std::filesystem::filesystem_error("Failed to restore timestamps", target, lastError());
    }
}

std::string trim(const std::string& value) {
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch);
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch);
    }).base();
    return first < last ? std::string(first, last) : std::string{};
}
}

namespace FileUtils {

std::string normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty()) {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

bool ensureDirectory(const std::filesystem::path& directory, const std::filesystem::path& referenceFile,
                     spdlog::logger& logger) {
    std::error_code ec;
    if (std::filesystem::is_directory(directory, ec)) {
        return true;
    }

    // Deepest first, so each level pairs with the reference level at the same depth.
    std::vector<std::filesystem::path> missing;
    for (std::filesystem::path current = directory; !current.empty(); current = current.parent_path()) {
        ec.clear();
        if (std::filesystem::exists(current, ec) || current == current.parent_path()) {
            break;
        }
        missing.push_back(current);
    }

    ec.clear();
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        logger.error("Failed to create destination directory `{}`: {}", directory.string(), ec.message());
        return false;
    }

    std::filesystem::path reference = referenceFile.parent_path();
    for (const auto& created : missing) {
        struct stat referenceStat {};
        if (reference.empty() || ::stat(reference.c_str(), &referenceStat) != 0 || !S_ISDIR(referenceStat.st_mode)) {
            logger.debug("No reference directory for `{}`, keeping default permissions", created.string());
            break;
        }

        if (::chmod(created.c_str(), referenceStat.st_mode & 07777) != 0) {
            logger.warn("Unable to copy permissions from `{}` to `{}`: {}", reference.string(), created.string(),
                        lastError().message());
        }
        if (::chown(created.c_str(), referenceStat.st_uid, referenceStat.st_gid) != 0) {
            logger.warn("Unable to copy owner from `{}` to `{}`: {}", reference.string(), created.string(),
                        lastError().message());
        }
        logger.debug("Created `{}` mirroring `{}`", created.string(), reference.string());
        reference = reference.parent_path();
    }

    return true;
}

void moveFile(const std::filesystem::path& source, const std::filesystem::path& destinationDirectory) {
    const auto targetPath = destinationDirectory / source.filename();

    struct stat sourceStat {};
    if (::lstat(source.c_str(), &sourceStat) != 0) {
        throw std::filesystem::filesystem_error("Cannot stat source", source, lastError());
    }

    // Same filesystem: rename keeps every attribute by itself.
    std::error_code renameErr;
    std::filesystem::rename(source, targetPath, renameErr);
    if (!renameErr) {
        return;
    }

    if (renameErr != std::errc::cross_device_link) {
        throw std::filesystem::filesystem_error("Failed to move", source, targetPath, renameErr);
    }

    std::error_code copyErr;
    std::filesystem::copy_file(source, targetPath, std::filesystem::copy_options::overwrite_existing, copyErr);
    if (copyErr) {
        std::error_code cleanupErr;
        std::filesystem::remove(targetPath, cleanupErr);
        throw std::filesystem::filesystem_error("Failed to copy", source, targetPath, copyErr);
    }

    try {
        copyMetadata(sourceStat, targetPath);
    } catch (const std::filesystem::filesystem_error&) {
        std::error_code cleanupErr;
        std::filesystem::remove(targetPath, cleanupErr);
        throw;
    }

    std::error_code removeErr;
    std::filesystem::remove(source, removeErr);
    if (removeErr) {
        throw std::filesystem::filesystem_error("Failed to remove original file after copy", source, removeErr);
    }
}

std::uintmax_t fileSizeOrZero(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

std::string formatBytes(std::uintmax_t bytes) {
    static const std::array<const char*, 4> units{"KB", "MB", "GB", "TB"};

    double size = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < units.size()) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << size << ' ' << units[unit];
    return out.str();
}

std::vector<std::string> readPathList(const std::filesystem::path& listFile, spdlog::logger& logger) {
    std::vector<std::string> paths;
    std::ifstream input(listFile);
    if (!input) {
        logger.warn("Candidate list `{}` is not readable, treating it as empty", listFile.string());
        return paths;
    }

    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        paths.push_back(std::move(line));
    }

    logger.debug("Read {} path(s) from `{}`", paths.size(), listFile.string());
    return paths;
}

void writePathList(const std::filesystem::path& target, const std::vector<std::string>& paths) {
    std::ofstream output(target, std::ios::trunc);
    if (!output) {
        throw std::filesystem::filesystem_error("Cannot open for writing", target,
                                                std::make_error_code(std::errc::io_error));
    }

    for (const auto& path : paths) {
        output << path << '\n';
    }

    if (!output.flush()) {
        throw std::filesystem::filesystem_error("Failed to write", target, std::make_error_code(std::errc::io_error));
    }
}

} // namespace FileUtils
