#include "Logging.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr std::size_t kMaxLogFileBytes = 20 * 1024 * 1024;
constexpr char kLoggerName[] = "cachekeeper";
constexpr char kNothingMoved[] = "There were no files to move to any destination.";
}

std::shared_ptr<spdlog::logger> makeLogger(const LogSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!settings.logsFolder.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(settings.logsFolder, ec);
        if (ec) {
            throw spdlog::spdlog_ex("`" + settings.logsFolder + "` not writable: " + ec.message());
        }
        const auto logFile = std::filesystem::path(settings.logsFolder) / "cachekeeper.log";
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile.string(), kMaxLogFileBytes,
                                                                               settings.maxLogFiles));
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S - %l - %v");

    const auto level = spdlog::level::from_str(settings.level.empty() ? "info" : settings.level);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && settings.level != "off") {
        std::cerr << "Invalid log_level: " << settings.level << ". Using default level: INFO" << std::endl;
        logger->set_level(spdlog::level::info);
    } else {
        logger->set_level(level);
    }
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> makeNullLogger() {
    return std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

void RunSummary::add(const std::string& message) {
    m_messages.push_back(message);
}

void RunSummary::addMoved(const std::string& message) {
    m_messages.erase(std::remove(m_messages.begin(), m_messages.end(), kNothingMoved), m_messages.end());
    m_messages.push_back(message);
    m_filesMoved = true;
}

void RunSummary::setNothingMoved() {
    if (!m_filesMoved && std::find(m_messages.begin(), m_messages.end(), kNothingMoved) == m_messages.end()) {
        m_messages.push_back(kNothingMoved);
    }
}

void RunSummary::log(spdlog::logger& logger) const {
    if (m_messages.empty()) {
        return;
    }

    std::string joined;
    for (const auto& message : m_messages) {
        if (!joined.empty()) {
            joined += "  ";
        }
        joined += message;
    }
    logger.warn("Summary: {}", joined);
}
