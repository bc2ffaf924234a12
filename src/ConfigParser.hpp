#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include "PathTranslator.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// Newline-delimited candidate lists, one per category, produced by the media server side.
struct CandidateSources {
    std::string onDeck;
    std::string watchlist;
    std::string watched;
    std::string activeSessions;
};

struct Settings {
    std::string plexSource;
    std::string realSource;
    std::string cacheDir;
    std::string arraySource;
    std::vector<LibraryRule> libraryRules;
    std::vector<std::string> subtitleExtensions;

    std::size_t maxConcurrentMovesCache = 5;
    std::size_t maxConcurrentMovesArray = 2;

    bool storageManagerExclusion = false;
    std::string stateFolder;
    std::string moverExcludeFile;

    // Stop before touching anything while media is being played.
    bool exitIfActiveSession = false;

    bool watchlistToggle = true;
    bool watchedMove = false;
    int watchlistCacheExpiryHours = 6;
    int watchedCacheExpiryHours = 48;
    CandidateSources sources;

    std::string logsFolder;
    std::string logLevel = "info";
    std::size_t maxLogFiles = 5;

    std::string watchlistCacheFile() const;
    std::string watchedCacheFile() const;
};

// Parses the settings JSON file and exposes the validated settings.
class ConfigParser {
public:
    // Read-only access to the loaded settings.
    const Settings& getSettings() const;
    // Load configuration from disk; returns false on I/O or validation errors.
    bool load(const std::string& filePath);

    // "path/to/dir" -> "/path/to/dir/"
    static std::string addTrailingSlashes(std::string value);
    // "/movies/" -> "movies"
    static std::string removeAllSlashes(std::string value);

private:
    // Collect placeholder tokens (built-in and user-defined) for later substitution.
    void loadPlaceholders(const nlohmann::json& data);
    // Replace placeholder tokens in strings, logging warnings for unresolved entries.
    std::string applyPlaceholders(const std::string& value) const;
    // Read the ordered library rules, accepting the legacy parallel-list form.
    bool parseLibraryRules(const nlohmann::json& data);
    bool parseSources(const nlohmann::json& data);
    // Fetch an optional string path with placeholders applied.
    std::string optionalPath(const nlohmann::json& data, const char* key, const std::string& fallback) const;

    Settings m_settings;
    std::unordered_map<std::string, std::string> m_placeholders;
};

#endif
