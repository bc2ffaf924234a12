#include "CacheRunner.hpp"

#include "FileUtils.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace {
void appendUnit(std::string& out, long long value, const char* unit) {
    if (value <= 0) {
        return;
    }
    if (!out.empty()) {
        out += ", ";
    }
    out += std::to_string(value) + " " + unit + (value > 1 ? "s" : "");
}

std::string joinForLog(const std::vector<LibraryRule>& rules) {
    std::string out;
    for (const auto& rule : rules) {
        if (!out.empty()) {
            out += ", ";
        }
        out += rule.match + " -> " + rule.replacement;
    }
    return out;
}
}

std::string formatDuration(std::chrono::seconds elapsed) {
    long long remaining = elapsed.count();
    const long long days = remaining / 86400;
    remaining %= 86400;
    const long long hours = remaining / 3600;
    remaining %= 3600;
    const long long minutes = remaining / 60;
    const long long seconds = remaining % 60;

    std::string out;
    appendUnit(out, days, "day");
    appendUnit(out, hours, "hour");
    appendUnit(out, minutes, "minute");
    appendUnit(out, seconds, "second");
    return out.empty() ? "0 seconds" : out;
}

CacheRunner::CacheRunner(Settings settings, RunOptions options, std::shared_ptr<spdlog::logger> logger)
    : m_settings(std::move(settings)),
      m_options(options),
      m_mode{options.dryRun, m_settings.storageManagerExclusion},
      m_logger(std::move(logger)),
      m_layout(m_settings.realSource, m_settings.cacheDir, m_settings.arraySource),
      m_translator(m_settings.plexSource, m_settings.realSource, m_settings.libraryRules, m_logger),
      m_resolver(m_logger, m_settings.subtitleExtensions),
      m_decider(m_layout, m_settings.moverExcludeFile, m_mode, m_logger),
      m_guard(m_layout, m_logger),
      m_mover(m_layout, m_mode, m_logger) {}

std::size_t CacheRunner::run() {
    checkPaths();

    if (m_options.dryRun) {
        logDryRunSettings();
    }

    collectActiveFiles();

    const auto onDeck = m_settings.sources.onDeck.empty()
                            ? std::vector<std::string>{}
                            : FileUtils::readPathList(m_settings.sources.onDeck, *m_logger);
    m_mediaToCache = resolve(onDeck);

    if (m_settings.watchlistToggle) {
        const MediaSetCache watchlistCache(m_settings.watchlistCacheFile(), m_logger);
        const auto watchlist = loadCategory("watchlist", m_settings.sources.watchlist, watchlistCache,
                                            m_settings.watchlistCacheExpiryHours);
        m_mediaToCache.insert(m_mediaToCache.end(), watchlist.begin(), watchlist.end());
    }

    if (m_settings.watchedMove) {
        const MediaSetCache watchedCache(m_settings.watchedCacheFile(), m_logger);
        m_mediaToArray = loadCategory("watched", m_settings.sources.watched, watchedCache,
                                      m_settings.watchedCacheExpiryHours);
    }

    // Array first, so space freed on the cache is available to the cache batch.
    std::size_t errors = 0;
    if (m_settings.watchedMove) {
        errors += checkFreeSpaceAndMove(m_mediaToArray, Tier::Array);
    }
    errors += checkFreeSpaceAndMove(m_mediaToCache, Tier::Cache);
    return errors;
}

void CacheRunner::checkPaths() const {
    for (const auto& root : {m_settings.realSource, m_settings.cacheDir, m_settings.arraySource}) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            throw ConfigError("Path `" + root + "` is not accessible: " + (ec ? ec.message() : "not a directory"));
        }
    }
}

void CacheRunner::logDryRunSettings() const {
    std::cout << "Dry run is active, NO FILE WILL BE MOVED." << std::endl;
    m_logger->warn("Dry run is active, NO FILE WILL BE MOVED.");
    m_logger->info("Real source: {}", m_settings.realSource);
    m_logger->info("Array source: {}", m_settings.arraySource);
    m_logger->info("Cache dir: {}", m_settings.cacheDir);
    m_logger->info("Plex source: {}", m_settings.plexSource);
    m_logger->info("Library folders: {}", joinForLog(m_settings.libraryRules));
}

void CacheRunner::collectActiveFiles() {
    m_filesToSkip.clear();
    if (m_settings.sources.activeSessions.empty()) {
        return;
    }

    const auto sessions = FileUtils::readPathList(m_settings.sources.activeSessions, *m_logger);
    if (!sessions.empty() && m_settings.exitIfActiveSession) {
        m_logger->warn("There is an active session. Exiting...");
        throw ActiveSessionError("There is an active session. Exiting...");
    }

    const auto active = m_translator.translate(sessions);
    for (const auto& file : active) {
        std::cout << "Active session detected, skipping: " << file << std::endl;
        m_logger->warn("Active session detected, skipping: {}", file);
        m_filesToSkip.insert(file);
    }
    if (m_filesToSkip.empty()) {
        m_logger->info("No active sessions found. Proceeding...");
    }
}

std::vector<std::string> CacheRunner::resolve(const std::vector<std::string>& logicalPaths) const {
    return m_resolver.resolveSubtitles(m_translator.translate(logicalPaths), m_filesToSkip);
}

std::vector<std::string> CacheRunner::loadCategory(const std::string& label, const std::string& listFile,
                                                   const MediaSetCache& cache, int expiryHours) const {
    const MediaSet cached = cache.load();
    const bool useCache = listFile.empty() ||
                          (!m_options.skipCache && !m_options.dryRun &&
                           MediaSetCache::isFresh(cached, std::chrono::hours(expiryHours)));
    if (useCache) {
        m_logger->info("Loading {} media from cache...", label);
        return std::vector<std::string>(cached.media.begin(), cached.media.end());
    }

    m_logger->info("Fetching {} media...", label);
    auto resolved = resolve(FileUtils::readPathList(listFile, *m_logger));
    if (m_options.dryRun) {
        return resolved;
    }

    try {
        cache.save(resolved);
    } catch (const std::runtime_error& e) {
        m_logger->error("An error occurred while saving the {} cache: {}", label, e.what());
    }
    return resolved;
}

std::size_t CacheRunner::checkFreeSpaceAndMove(const std::vector<std::string>& files, Tier destination) {
    const std::string tierName = toString(destination);
    const auto decided = m_decider.decide(files, destination, m_mediaToCache, m_filesToSkip);

    const CapacityReport report = m_guard.checkAndSize(decided, destination);
    if (report.empty()) {
        std::cout << "Nothing to move to " << tierName << std::endl;
        m_logger->info("Nothing to move to {}", tierName);
        m_summary.setNothingMoved();
        return 0;
    }

    std::cout << "Total size of media files to be moved to " << tierName << ": "
              << FileUtils::formatBytes(report.totalBytes) << std::endl;
    std::cout << "Free space on the " << tierName << ": " << FileUtils::formatBytes(report.freeBytes) << std::endl;
    m_guard.enforce(report, destination, m_mode);

    m_summary.addMoved("Total size of media files moved to " + tierName + ": " + FileUtils::formatBytes(report.totalBytes));
    std::cout << "Moving media to " << tierName << "..." << std::endl;
    const std::size_t errors =
        m_mover.move(decided, destination, m_settings.maxConcurrentMovesCache, m_settings.maxConcurrentMovesArray);
    if (errors > 0) {
        m_summary.add(std::to_string(errors) + " file(s) failed to move to " + tierName + ".");
    }
    return errors;
}
