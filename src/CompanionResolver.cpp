#include "CompanionResolver.hpp"

#include "FileUtils.hpp"

#include <algorithm>
#include <system_error>

const std::vector<std::string>& CompanionResolver::defaultExtensions() {
    static const std::vector<std::string> extensions{".srt", ".vtt", ".sbv", ".sub", ".idx"};
    return extensions;
}

CompanionResolver::CompanionResolver(std::shared_ptr<spdlog::logger> logger, std::vector<std::string> subtitleExtensions)
    : m_logger(std::move(logger)) {
    for (auto& extension : subtitleExtensions) {
        std::string normalized = FileUtils::normalizeExtension(std::move(extension));
        if (!normalized.empty()) {
            m_subtitleExtensions.push_back(std::move(normalized));
        }
    }
}

std::vector<std::string> CompanionResolver::resolveSubtitles(const std::vector<std::string>& mediaPaths,
                                                             const std::unordered_set<std::string>& exclude) const {
    m_logger->info("Fetching subtitles...");

    std::vector<std::string> result = mediaPaths;
    std::unordered_set<std::string> seen(mediaPaths.begin(), mediaPaths.end());
    std::unordered_set<std::string> processed;

    for (const auto& media : mediaPaths) {
        if (exclude.count(media) != 0 || !processed.insert(media).second) {
            continue;
        }

        for (auto& companion : findCompanions(std::filesystem::path(media))) {
            if (!seen.insert(companion).second) {
                continue;
            }
            m_logger->info("Subtitle found: {}", companion);
            result.push_back(std::move(companion));
        }
    }

    return result;
}

std::vector<std::string> CompanionResolver::findCompanions(const std::filesystem::path& mediaPath) const {
    std::vector<std::string> companions;
    const std::filesystem::path directory = mediaPath.parent_path();
    const std::string stem = mediaPath.stem().string();
    const std::string mediaName = mediaPath.filename().string();

    std::error_code ec;
    std::filesystem::directory_iterator iter(directory, ec);
    if (ec) {
        m_logger->error("Cannot access directory `{}`: {}", directory.string(), ec.message());
        return companions;
    }

    try {
        for (const auto& entry : iter) {
            std::error_code entryErr;
            if (!entry.is_regular_file(entryErr) || entryErr) {
                continue;
            }

            const std::string name = entry.path().filename().string();
            if (name == mediaName || name.compare(0, stem.size(), stem) != 0) {
                continue;
            }

            if (isSubtitleExtension(entry.path().extension().string())) {
                companions.push_back(entry.path().string());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        m_logger->error("Error while listing `{}`: {}", directory.string(), e.what());
    }

    // Directory order is unspecified; keep output stable across runs.
    std::sort(companions.begin(), companions.end());
    return companions;
}

bool CompanionResolver::isSubtitleExtension(const std::string& extension) const {
    const std::string normalized = FileUtils::normalizeExtension(extension);
    return std::find(m_subtitleExtensions.begin(), m_subtitleExtensions.end(), normalized) != m_subtitleExtensions.end();
}
