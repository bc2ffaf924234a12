#include "PathTranslator.hpp"

#include <stdexcept>

namespace {
// Replace the first occurrence of token only.
bool replaceFirst(std::string& value, const std::string& token, const std::string& replacement) {
    if (token.empty()) {
        return false;
    }

    const std::size_t pos = value.find(token);
    if (pos == std::string::npos) {
        return false;
    }

    value.replace(pos, token.size(), replacement);
    return true;
}
}

PathTranslator::PathTranslator(std::string logicalSource, std::string physicalSource, std::vector<LibraryRule> rules,
                               std::shared_ptr<spdlog::logger> logger)
    : m_logicalSource(std::move(logicalSource)),
      m_physicalSource(std::move(physicalSource)),
      m_rules(std::move(rules)),
      m_logger(std::move(logger)) {}

std::vector<LibraryRule> PathTranslator::pairFragments(const std::vector<std::string>& logicalFragments,
                                                       const std::vector<std::string>& physicalFragments) {
    if (logicalFragments.size() != physicalFragments.size()) {
        throw std::invalid_argument("Library folder lists differ in length (" + std::to_string(logicalFragments.size()) +
                                    " media server folders, " + std::to_string(physicalFragments.size()) +
                                    " physical folders)");
    }

    std::vector<LibraryRule> rules;
    rules.reserve(logicalFragments.size());
    for (std::size_t i = 0; i < logicalFragments.size(); ++i) {
        rules.push_back({logicalFragments[i], physicalFragments[i]});
    }
    return rules;
}

std::vector<std::string> PathTranslator::translate(const std::vector<std::string>& paths) const {
    std::vector<std::string> translated;
    if (paths.empty()) {
        return translated;
    }

    m_logger->info("Editing file paths...");
    translated.reserve(paths.size());
    for (const auto& path : paths) {
        if (path.compare(0, m_logicalSource.size(), m_logicalSource) != 0) {
            m_logger->debug("Ignoring `{}`: not under `{}`", path, m_logicalSource);
            continue;
        }

        m_logger->info("Original path: {}", path);
        translated.push_back(translateOne(path));
        m_logger->info("Edited path: {}", translated.back());
    }

    return translated;
}

std::string PathTranslator::translateOne(const std::string& path) const {
    std::string result = path;
    replaceFirst(result, m_logicalSource, m_physicalSource);

    for (const auto& rule : m_rules) {
        if (replaceFirst(result, rule.match, rule.replacement)) {
            break;
        }
    }
    return result;
}
