#ifndef MEDIA_SET_CACHE_HPP
#define MEDIA_SET_CACHE_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

// Paths remembered for one candidate category and when they were fetched.
struct MediaSet {
    std::set<std::string> media;
    std::chrono::system_clock::time_point lastUpdated{};
    bool loaded = false;
};

// JSON file holding a MediaSet, so slow candidate queries can be skipped while fresh.
class MediaSetCache {
public:
    MediaSetCache(std::filesystem::path file, std::shared_ptr<spdlog::logger> logger);

    const std::filesystem::path& file() const { return m_file; }

    // Missing or malformed files load as an empty, never-updated set.
    MediaSet load() const;
    // Overwrites the file with media stamped at now. Throws std::runtime_error on I/O failure.
    void save(const std::vector<std::string>& media,
              std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    static bool isFresh(const MediaSet& set, std::chrono::hours expiry,
                        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    std::filesystem::path m_file;
    std::shared_ptr<spdlog::logger> m_logger;
};

#endif
