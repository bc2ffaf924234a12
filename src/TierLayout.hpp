#ifndef TIER_LAYOUT_HPP
#define TIER_LAYOUT_HPP

#include <filesystem>
#include <string>

// Storage tier a file is placed on.
enum class Tier {
    Cache,
    Array
};

// Where a file currently lives, computed by looking at both physical copies.
enum class TierHint {
    Cache,
    Array,
    Both,
    Unknown
};

std::string toString(Tier tier);

// Flags that change how much the engine is allowed to touch the filesystem.
struct OperatingMode {
    bool dryRun = false;
    bool storageManagerExclusionSupported = false;
};

// Physical roots of the two tiers and the mapping from an identity path to each copy.
// Identity paths live under realSource; on split-volume layouts arraySource is the
// array-only view of the same tree (e.g. /mnt/user/ vs /mnt/user0/).
class TierLayout {
public:
    TierLayout(std::string realSource, std::string cacheDir, std::string arraySource = {});

    const std::string& realSource() const { return m_realSource; }
    const std::string& cacheDir() const { return m_cacheDir; }
    const std::string& arraySource() const { return m_arraySource; }

    // True when the path is rooted under realSource and can be mapped to both tiers.
    bool contains(const std::string& identityPath) const;
    std::filesystem::path cachePathFor(const std::string& identityPath) const;
    std::filesystem::path arrayPathFor(const std::string& identityPath) const;
    // Copy a batch bound for destination is read from.
    std::filesystem::path sourcePathFor(const std::string& identityPath, Tier destination) const;
    std::filesystem::path destinationPathFor(const std::string& identityPath, Tier destination) const;
    // Root whose free space bounds a batch bound for destination.
    std::filesystem::path rootOf(Tier tier) const;
    TierHint locate(const std::string& identityPath) const;

private:
    std::string relativePart(const std::string& identityPath) const;

    std::string m_realSource;
    std::string m_cacheDir;
    std::string m_arraySource;
};

#endif
