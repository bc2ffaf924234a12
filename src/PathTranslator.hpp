#ifndef PATH_TRANSLATOR_HPP
#define PATH_TRANSLATOR_HPP

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

// A library folder as the media server names it, and the folder it lives in on disk.
struct LibraryRule {
    std::string match;
    std::string replacement;
};

// Rewrites media-server paths into physical paths under the real source.
class PathTranslator {
public:
    PathTranslator(std::string logicalSource, std::string physicalSource, std::vector<LibraryRule> rules,
                   std::shared_ptr<spdlog::logger> logger);

    // Pair two positional fragment lists into rules; throws std::invalid_argument on a length mismatch.
    static std::vector<LibraryRule> pairFragments(const std::vector<std::string>& logicalFragments,
                                                  const std::vector<std::string>& physicalFragments);

    // Drop paths outside the logical source and translate the rest, keeping their order.
    std::vector<std::string> translate(const std::vector<std::string>& paths) const;
    // Translate one path already known to start with the logical source.
    std::string translateOne(const std::string& path) const;

private:
    std::string m_logicalSource;
    std::string m_physicalSource;
    std::vector<LibraryRule> m_rules;
    std::shared_ptr<spdlog::logger> m_logger;
};

#endif
