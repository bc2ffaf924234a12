#include "PlacementDecider.hpp"

#include "FileUtils.hpp"

#include <stdexcept>
#include <system_error>

namespace {
bool isRegularFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}
}

PlacementDecider::PlacementDecider(TierLayout layout, std::filesystem::path exclusionListPath, OperatingMode mode,
                                   std::shared_ptr<spdlog::logger> logger)
    : m_layout(std::move(layout)),
      m_exclusionListPath(std::move(exclusionListPath)),
      m_mode(mode),
      m_logger(std::move(logger)) {}

std::vector<std::string> PlacementDecider::decide(const std::vector<std::string>& files, Tier destination,
                                                  const std::vector<std::string>& alreadyDestinedForCache,
                                                  const std::unordered_set<std::string>& skip) {
    if (destination != Tier::Cache && destination != Tier::Array) {
        throw std::logic_error("Unknown destination tier " + std::to_string(static_cast<int>(destination)));
    }

    m_logger->info("Filtering media files for {}...", toString(destination));

    std::vector<std::string> toMove;
    if (files.empty()) {
        return toMove;
    }

    const std::unordered_set<std::string> destinedForCache(alreadyDestinedForCache.begin(), alreadyDestinedForCache.end());
    std::unordered_set<std::string> processed;
    std::vector<std::string> cachePathsToExclude;

    for (const auto& file : files) {
        if (skip.count(file) != 0) {
            m_logger->info("Skipping `{}`: in use", file);
            continue;
        }
        if (!processed.insert(file).second) {
            continue;
        }
        if (!m_layout.contains(file)) {
            m_logger->warn("Skipping `{}`: not under `{}`", file, m_layout.realSource());
            continue;
        }

        cachePathsToExclude.push_back(m_layout.cachePathFor(file).string());

        const bool move = destination == Tier::Array ? shouldMoveToArray(file, destinedForCache) : shouldMoveToCache(file);
        if (move) {
            m_logger->info("Adding file to {}: {}", toString(destination), file);
            toMove.push_back(file);
        }
    }

    if (m_mode.storageManagerExclusionSupported) {
        writeExclusionList(cachePathsToExclude);
    }

    return toMove;
}

bool PlacementDecider::shouldMoveToArray(const std::string& file, const std::unordered_set<std::string>& destinedForCache) {
    // Another list wants this file on the cache; leave it there.
    if (destinedForCache.count(file) != 0) {
        m_logger->debug("Keeping `{}` on cache: also wanted on cache", file);
        return false;
    }

    const auto arrayCopy = m_layout.arrayPathFor(file);
    if (!isRegularFile(arrayCopy)) {
        return true;
    }

    const auto cacheCopy = m_layout.cachePathFor(file);
    if (isRegularFile(cacheCopy)) {
        removeRedundantCopy(cacheCopy, Tier::Cache);
    }
    return false;
}

bool PlacementDecider::shouldMoveToCache(const std::string& file) {
    const auto cacheCopy = m_layout.cachePathFor(file);
    const bool onCache = isRegularFile(cacheCopy);

    if (onCache) {
        const auto arrayCopy = m_layout.arrayPathFor(file);
        if (isRegularFile(arrayCopy)) {
            removeRedundantCopy(arrayCopy, Tier::Array);
        }
    }
    return !onCache;
}

void PlacementDecider::removeRedundantCopy(const std::filesystem::path& copy, Tier tier) {
    if (m_mode.dryRun) {
        m_logger->info("Would remove {} version of file: {}", toString(tier), copy.string());
        return;
    }

    std::error_code ec;
    std::filesystem::remove(copy, ec);
    if (ec) {
        m_logger->error("Failed to remove {} version of file `{}`: {}", toString(tier), copy.string(), ec.message());
        return;
    }
    m_logger->info("Removed {} version of file: {}", toString(tier), copy.string());
}

void PlacementDecider::writeExclusionList(const std::vector<std::string>& cachePaths) const {
    if (m_mode.dryRun) {
        m_logger->info("Would write {} path(s) to mover exclusion list `{}`", cachePaths.size(),
                       m_exclusionListPath.string());
        return;
    }

    try {
        FileUtils::writePathList(m_exclusionListPath, cachePaths);
        m_logger->debug("Wrote {} path(s) to mover exclusion list `{}`", cachePaths.size(), m_exclusionListPath.string());
    } catch (const std::filesystem::filesystem_error& e) {
        m_logger->error("Unable to update mover exclusion list: {}", e.what());
    }
}
