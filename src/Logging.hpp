#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

struct LogSettings {
    std::string logsFolder;
    std::string level = "info";
    std::size_t maxLogFiles = 5;
};

// Console logger, plus a size-rotated file when a logs folder is configured.
// Throws spdlog::spdlog_ex when the log file cannot be opened.
std::shared_ptr<spdlog::logger> makeLogger(const LogSettings& settings);

// Logger that discards everything; used where no output is wanted.
std::shared_ptr<spdlog::logger> makeNullLogger();

// Lines reported together at the end of a run.
class RunSummary {
public:
    void add(const std::string& message);
    // Add a line about moved files; replaces the nothing-moved line.
    void addMoved(const std::string& message);
    // Records that nothing was moved; ignored once a move was recorded.
    void setNothingMoved();
    bool empty() const { return m_messages.empty(); }
    const std::vector<std::string>& messages() const { return m_messages; }
    void log(spdlog::logger& logger) const;

private:
    std::vector<std::string> m_messages;
    bool m_filesMoved = false;
};

#endif
