#ifndef CAPACITY_GUARD_HPP
#define CAPACITY_GUARD_HPP

#include "TierLayout.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

// Thrown when a batch does not fit on its destination tier.
class InsufficientSpaceError : public std::runtime_error {
public:
    explicit InsufficientSpaceError(const std::string& message) : std::runtime_error(message) {}
};

struct CapacityReport {
    std::uintmax_t totalBytes = 0;
    std::uintmax_t freeBytes = 0;

    bool empty() const { return totalBytes == 0; }
    bool fits() const { return totalBytes <= freeBytes; }
};

// Sizes a move batch and checks it against the free space of the destination tier.
class CapacityGuard {
public:
    // Returns the bytes available to unprivileged writers under a root.
    using FreeSpaceProbe = std::function<std::uintmax_t(const std::filesystem::path&)>;

    static std::uintmax_t availableSpace(const std::filesystem::path& root);

    CapacityGuard(TierLayout layout, std::shared_ptr<spdlog::logger> logger, FreeSpaceProbe probe = availableSpace);

    // Files that vanished since the decision are counted as zero bytes.
    CapacityReport checkAndSize(const std::vector<std::string>& files, Tier destination) const;

    // Throws InsufficientSpaceError when the batch does not fit, unless running dry.
    void enforce(const CapacityReport& report, Tier destination, const OperatingMode& mode) const;

private:
    TierLayout m_layout;
    std::shared_ptr<spdlog::logger> m_logger;
    FreeSpaceProbe m_probe;
};

#endif
