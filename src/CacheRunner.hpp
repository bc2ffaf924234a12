#ifndef CACHE_RUNNER_HPP
#define CACHE_RUNNER_HPP

#include "CapacityGuard.hpp"
#include "CompanionResolver.hpp"
#include "ConfigParser.hpp"
#include "Logging.hpp"
#include "MediaSetCache.hpp"
#include "PathTranslator.hpp"
#include "PlacementDecider.hpp"
#include "TierLayout.hpp"
#include "TieredMover.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

// Raised before any mutation when the configured roots are unusable.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Raised before any mutation when playback is in progress and the run must not proceed.
class ActiveSessionError : public std::runtime_error {
public:
    explicit ActiveSessionError(const std::string& message) : std::runtime_error(message) {}
};

struct RunOptions {
    bool dryRun = false;
    // Ignore cached watchlist/watched sets and read the candidate lists again.
    bool skipCache = false;
};

// "1 hour, 2 minutes, 5 seconds"
std::string formatDuration(std::chrono::seconds elapsed);

// One full pass: gather candidates, then settle the array batch before the cache batch.
class CacheRunner {
public:
    CacheRunner(Settings settings, RunOptions options, std::shared_ptr<spdlog::logger> logger);

    // Returns the number of failed moves. Throws ConfigError, ActiveSessionError or
    // InsufficientSpaceError when the run has to stop.
    std::size_t run();

    const RunSummary& summary() const { return m_summary; }
    RunSummary& summary() { return m_summary; }
    const std::vector<std::string>& mediaToCache() const { return m_mediaToCache; }
    const std::vector<std::string>& mediaToArray() const { return m_mediaToArray; }

private:
    void checkPaths() const;
    void logDryRunSettings() const;
    void collectActiveFiles();
    // Translate logical paths and add their subtitles.
    std::vector<std::string> resolve(const std::vector<std::string>& logicalPaths) const;
    // Use the cached set while fresh, otherwise read the list again and refresh the cache.
    std::vector<std::string> loadCategory(const std::string& label, const std::string& listFile,
                                          const MediaSetCache& cache, int expiryHours) const;
    std::size_t checkFreeSpaceAndMove(const std::vector<std::string>& files, Tier destination);

    Settings m_settings;
    RunOptions m_options;
    OperatingMode m_mode;
    std::shared_ptr<spdlog::logger> m_logger;
    TierLayout m_layout;
    PathTranslator m_translator;
    CompanionResolver m_resolver;
    PlacementDecider m_decider;
    CapacityGuard m_guard;
    TieredMover m_mover;
    RunSummary m_summary;

    std::unordered_set<std::string> m_filesToSkip;
    std::vector<std::string> m_mediaToCache;
    std::vector<std::string> m_mediaToArray;
};

#endif
