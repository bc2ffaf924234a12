#include "ConfigParser.hpp"

#include "CompanionResolver.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
constexpr char kWatchlistCacheName[] = "cachekeeper_watchlist_cache.json";
constexpr char kWatchedCacheName[] = "cachekeeper_watched_cache.json";
constexpr char kMoverExcludeName[] = "cachekeeper_mover_exclude.txt";

// Read an optional key into target, rejecting values of the wrong type.
template <typename T>
bool readOptional(const json& data, const char* key, T& target) {
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }

    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        std::cerr << "Invalid value for `" << key << "`: " << e.what() << std::endl;
        return false;
    }
    return true;
}
}

std::string Settings::watchlistCacheFile() const {
    return (std::filesystem::path(stateFolder) / kWatchlistCacheName).string();
}

std::string Settings::watchedCacheFile() const {
    return (std::filesystem::path(stateFolder) / kWatchedCacheName).string();
}

const Settings& ConfigParser::getSettings() const {
    return m_settings;
}

bool ConfigParser::load(const std::string& filePath) {
    const std::filesystem::path settingsPath(filePath);

    std::ifstream jsonFile(settingsPath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << settingsPath << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Configuration file must contain a JSON object." << std::endl;
        return false;
    }

    loadPlaceholders(data);
    m_settings = Settings{};

    try {
        m_settings.plexSource = addTrailingSlashes(applyPlaceholders(data.at("plex_source").get<std::string>()));
        m_settings.realSource = addTrailingSlashes(applyPlaceholders(data.at("real_source").get<std::string>()));
        m_settings.cacheDir = addTrailingSlashes(applyPlaceholders(data.at("cache_dir").get<std::string>()));
    } catch (const json::exception& e) {
        std::cerr << "Missing or invalid source paths: " << e.what() << std::endl;
        return false;
    }

    const std::string arraySource = optionalPath(data, "array_source", {});
    m_settings.arraySource = arraySource.empty() ? m_settings.realSource : addTrailingSlashes(arraySource);

    if (!parseLibraryRules(data)) {
        return false;
    }

    m_settings.subtitleExtensions = CompanionResolver::defaultExtensions();
    if (!readOptional(data, "subtitle_extensions", m_settings.subtitleExtensions)) {
        return false;
    }

    int cacheMoves = static_cast<int>(m_settings.maxConcurrentMovesCache);
    int arrayMoves = static_cast<int>(m_settings.maxConcurrentMovesArray);
    if (!readOptional(data, "max_concurrent_moves_cache", cacheMoves) ||
        !readOptional(data, "max_concurrent_moves_array", arrayMoves)) {
        return false;
    }
    if (cacheMoves < 1 || arrayMoves < 1) {
        std::cerr << "`max_concurrent_moves_cache` and `max_concurrent_moves_array` must be at least 1." << std::endl;
        return false;
    }
    m_settings.maxConcurrentMovesCache = static_cast<std::size_t>(cacheMoves);
    m_settings.maxConcurrentMovesArray = static_cast<std::size_t>(arrayMoves);

    if (!readOptional(data, "storage_manager_exclusion", m_settings.storageManagerExclusion) ||
        !readOptional(data, "watchlist_toggle", m_settings.watchlistToggle) ||
        !readOptional(data, "watched_move", m_settings.watchedMove) ||
        !readOptional(data, "exit_if_active_session", m_settings.exitIfActiveSession) ||
        !readOptional(data, "watchlist_cache_expiry", m_settings.watchlistCacheExpiryHours) ||
        !readOptional(data, "watched_cache_expiry", m_settings.watchedCacheExpiryHours) ||
        !readOptional(data, "log_level", m_settings.logLevel)) {
        return false;
    }

    int maxLogFiles = static_cast<int>(m_settings.maxLogFiles);
    if (!readOptional(data, "max_log_files", maxLogFiles)) {
        return false;
    }
    if (maxLogFiles < 1) {
        std::cerr << "`max_log_files` must be at least 1." << std::endl;
        return false;
    }
    m_settings.maxLogFiles = static_cast<std::size_t>(maxLogFiles);

    // State files live beside the settings file unless told otherwise.
    const std::string settingsDir = settingsPath.has_parent_path() ? settingsPath.parent_path().string() : std::string(".");
    try {
        m_settings.stateFolder = optionalPath(data, "state_folder", settingsDir);
        m_settings.moverExcludeFile = optionalPath(
            data, "mover_exclude_file", (std::filesystem::path(m_settings.stateFolder) / kMoverExcludeName).string());
        m_settings.logsFolder = optionalPath(data, "logs_folder", {});
    } catch (const json::exception& e) {
        std::cerr << "Invalid path setting: " << e.what() << std::endl;
        return false;
    }

    if (!parseSources(data)) {
        return false;
    }

    std::cout << "Loaded settings from " << settingsPath << " (" << m_settings.libraryRules.size()
              << " library folder(s))" << std::endl;
    return true;
}

bool ConfigParser::parseLibraryRules(const json& data) {
    m_settings.libraryRules.clear();

    if (auto it = data.find("library_folders"); it != data.end()) {
        if (!it->is_array()) {
            std::cerr << "Invalid configuration: `library_folders` must be an array." << std::endl;
            return false;
        }

        for (const auto& ruleJson : *it) {
            if (!ruleJson.is_object()) {
                std::cerr << "Invalid entry in `library_folders`: expected an object." << std::endl;
                return false;
            }

            auto plexIt = ruleJson.find("plex");
            auto nasIt = ruleJson.find("nas");
            if (plexIt == ruleJson.end() || !plexIt->is_string() || nasIt == ruleJson.end() || !nasIt->is_string()) {
                std::cerr << "Invalid entry in `library_folders`: `plex` and `nas` must be strings." << std::endl;
                return false;
            }

            LibraryRule rule{removeAllSlashes(applyPlaceholders(plexIt->get<std::string>())),
                             removeAllSlashes(applyPlaceholders(nasIt->get<std::string>()))};
            if (rule.match.empty()) {
                std::cerr << "Invalid entry in `library_folders`: `plex` cannot be empty." << std::endl;
                return false;
            }
            m_settings.libraryRules.push_back(std::move(rule));
        }
        return true;
    }

    const bool hasLegacyPlex = data.contains("plex_library_folders");
    const bool hasLegacyNas = data.contains("nas_library_folders");
    if (!hasLegacyPlex && !hasLegacyNas) {
        return true;
    }

    std::cerr << "The configuration uses the legacy `plex_library_folders`/`nas_library_folders` lists; "
                 "please migrate to `library_folders` when convenient."
              << std::endl;

    std::vector<std::string> plexFolders;
    std::vector<std::string> nasFolders;
    if (!readOptional(data, "plex_library_folders", plexFolders) || !readOptional(data, "nas_library_folders", nasFolders)) {
        return false;
    }

    for (auto& folder : plexFolders) {
        folder = removeAllSlashes(applyPlaceholders(folder));
    }
    for (auto& folder : nasFolders) {
        folder = removeAllSlashes(applyPlaceholders(folder));
    }

    try {
        m_settings.libraryRules = PathTranslator::pairFragments(plexFolders, nasFolders);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid library folders: " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool ConfigParser::parseSources(const json& data) {
    auto it = data.find("sources");
    if (it == data.end()) {
        return true;
    }

    if (!it->is_object()) {
        std::cerr << "Invalid configuration: `sources` must be an object." << std::endl;
        return false;
    }

    try {
        m_settings.sources.onDeck = optionalPath(*it, "ondeck", {});
        m_settings.sources.watchlist = optionalPath(*it, "watchlist", {});
        m_settings.sources.watched = optionalPath(*it, "watched", {});
        m_settings.sources.activeSessions = optionalPath(*it, "active_sessions", {});
    } catch (const json::exception& e) {
        std::cerr << "Invalid candidate source: " << e.what() << std::endl;
        return false;
    }
    return true;
}

std::string ConfigParser::optionalPath(const json& data, const char* key, const std::string& fallback) const {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return fallback;
    }
    return applyPlaceholders(it->get<std::string>());
}

std::string ConfigParser::addTrailingSlashes(std::string value) {
    if (value.empty() || value.front() != '/') {
        value.insert(value.begin(), '/');
    }
    if (value.back() != '/') {
        value.push_back('/');
    }
    return value;
}

std::string ConfigParser::removeAllSlashes(std::string value) {
    value.erase(std::remove_if(value.begin(), value.end(), [](char ch) {
        return ch == '/' || ch == '\\';
    }), value.end());
    return value;
}

void ConfigParser::loadPlaceholders(const json& data) {
    m_placeholders.clear();

    // Support both the short `user` token and the `placeholders` map.
    auto addPlaceholder = [this](const std::string& key, const json& value) {
        if (!value.is_string()) {
            std::cerr << "Placeholder `" << key << "` must be a string." << std::endl;
            return;
        }
        m_placeholders[key] = value.get<std::string>();
    };

    if (auto userIt = data.find("user"); userIt != data.end()) {
        addPlaceholder("user", *userIt);
    }

    if (auto placeholdersIt = data.find("placeholders"); placeholdersIt != data.end()) {
        if (!placeholdersIt->is_object()) {
            std::cerr << "`placeholders` must be an object of key/value strings." << std::endl;
        } else {
            for (auto it = placeholdersIt->begin(); it != placeholdersIt->end(); ++it) {
                addPlaceholder(it.key(), it.value());
            }
        }
    }
}

std::string ConfigParser::applyPlaceholders(const std::string& value) const {
    std::string result = value;
    for (const auto& [key, replacement] : m_placeholders) {
        const std::string token = "{{" + key + "}}";
        std::size_t pos = 0;
        while ((pos = result.find(token, pos)) != std::string::npos) {
            result.replace(pos, token.size(), replacement);
            pos += replacement.size();
        }
    }

    if (result.find("{{") != std::string::npos) {
        std::cerr << "Warning: unresolved placeholder detected in value `" << result << "`." << std::endl;
    }

    return result;
}
