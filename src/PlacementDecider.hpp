#ifndef PLACEMENT_DECIDER_HPP
#define PLACEMENT_DECIDER_HPP

#include "TierLayout.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

// Filters a candidate list down to the files that really have to move to a tier.
// Redundant copies found on both tiers are removed while deciding, so after one pass
// no decided file is left on both tiers.
class PlacementDecider {
public:
    PlacementDecider(TierLayout layout, std::filesystem::path exclusionListPath, OperatingMode mode,
                     std::shared_ptr<spdlog::logger> logger);

    // Returns the subset of files to move to destination. Also rewrites the mover
    // exclusion list with the cache path of every processed file when the storage
    // manager supports it. Throws std::logic_error for an unknown tier.
    std::vector<std::string> decide(const std::vector<std::string>& files, Tier destination,
                                    const std::vector<std::string>& alreadyDestinedForCache = {},
                                    const std::unordered_set<std::string>& skip = {});

private:
    bool shouldMoveToArray(const std::string& file, const std::unordered_set<std::string>& destinedForCache);
    bool shouldMoveToCache(const std::string& file);
    // Delete a copy made redundant by the one on the other tier.
    void removeRedundantCopy(const std::filesystem::path& copy, Tier tier);
    void writeExclusionList(const std::vector<std::string>& cachePaths) const;

    TierLayout m_layout;
    std::filesystem::path m_exclusionListPath;
    OperatingMode m_mode;
    std::shared_ptr<spdlog::logger> m_logger;
};

#endif
