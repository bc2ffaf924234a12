#ifndef COMPANION_RESOLVER_HPP
#define COMPANION_RESOLVER_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

// Finds sidecar subtitle files that sit next to media files and share their base name.
class CompanionResolver {
public:
    static const std::vector<std::string>& defaultExtensions();

    explicit CompanionResolver(std::shared_ptr<spdlog::logger> logger,
                               std::vector<std::string> subtitleExtensions = defaultExtensions());

    const std::vector<std::string>& subtitleExtensions() const { return m_subtitleExtensions; }

    // Return mediaPaths followed by every companion discovered for them.
    std::vector<std::string> resolveSubtitles(const std::vector<std::string>& mediaPaths,
                                              const std::unordered_set<std::string>& exclude = {}) const;

private:
    std::vector<std::string> findCompanions(const std::filesystem::path& mediaPath) const;
    bool isSubtitleExtension(const std::string& extension) const;

    std::shared_ptr<spdlog::logger> m_logger;
    std::vector<std::string> m_subtitleExtensions;
};

#endif
