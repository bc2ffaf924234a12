#include "MediaSetCache.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

MediaSetCache::MediaSetCache(std::filesystem::path file, std::shared_ptr<spdlog::logger> logger)
    : m_file(std::move(file)), m_logger(std::move(logger)) {}

MediaSet MediaSetCache::load() const {
    MediaSet result;

    std::ifstream input(m_file);
    if (!input) {
        m_logger->debug("No cached media at `{}`", m_file.string());
        return result;
    }

    json data;
    try {
        input >> data;
        for (const auto& entry : data.at("media")) {
            result.media.insert(entry.get<std::string>());
        }
        const auto seconds = data.at("timestamp").get<std::int64_t>();
        result.lastUpdated = std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
        result.loaded = true;
    } catch (const json::exception& e) {
        m_logger->warn("Ignoring unreadable media cache `{}`: {}", m_file.string(), e.what());
        return MediaSet{};
    }

    return result;
}

void MediaSetCache::save(const std::vector<std::string>& media, std::chrono::system_clock::time_point now) const {
    json data;
    data["media"] = media;
    data["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    std::ofstream output(m_file, std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Cannot write media cache `" + m_file.string() + "`");
    }
    output << data.dump(4);
    if (!output.flush()) {
        throw std::runtime_error("Failed to write media cache `" + m_file.string() + "`");
    }
    m_logger->debug("Saved {} media path(s) to `{}`", media.size(), m_file.string());
}

bool MediaSetCache::isFresh(const MediaSet& set, std::chrono::hours expiry, std::chrono::system_clock::time_point now) {
    return set.loaded && now - set.lastUpdated < expiry;
}
