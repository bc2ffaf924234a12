#include "CapacityGuard.hpp"

#include "FileUtils.hpp"

std::uintmax_t CapacityGuard::availableSpace(const std::filesystem::path& root) {
    // Throws std::filesystem::filesystem_error when the root is unreachable.
    return std::filesystem::space(root).available;
}

CapacityGuard::CapacityGuard(TierLayout layout, std::shared_ptr<spdlog::logger> logger, FreeSpaceProbe probe)
    : m_layout(std::move(layout)), m_logger(std::move(logger)), m_probe(std::move(probe)) {}

CapacityReport CapacityGuard::checkAndSize(const std::vector<std::string>& files, Tier destination) const {
    CapacityReport report;

    for (const auto& file : files) {
        std::uintmax_t size = 0;
        if (m_layout.contains(file)) {
            size = FileUtils::fileSizeOrZero(m_layout.sourcePathFor(file, destination));
        }
        if (size == 0) {
            size = FileUtils::fileSizeOrZero(file);
        }
        if (size == 0) {
            m_logger->debug("Not counting `{}`: no longer present", file);
        }
        report.totalBytes += size;
    }

    if (report.empty()) {
        return report;
    }

    report.freeBytes = m_probe(m_layout.rootOf(destination));
    m_logger->info("Total size of media files to be moved to {}: {}", toString(destination),
                   FileUtils::formatBytes(report.totalBytes));
    m_logger->info("Free space on the {}: {}", toString(destination), FileUtils::formatBytes(report.freeBytes));
    return report;
}

void CapacityGuard::enforce(const CapacityReport& report, Tier destination, const OperatingMode& mode) const {
    if (report.fits()) {
        return;
    }

    const std::string message = "Not enough space on " + toString(destination) + " drive (" +
                                FileUtils::formatBytes(report.totalBytes) + " needed, " +
                                FileUtils::formatBytes(report.freeBytes) + " free).";
    if (!mode.dryRun) {
        throw InsufficientSpaceError(message);
    }
    m_logger->error("{}", message);
}
