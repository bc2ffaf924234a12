#ifndef TIERED_MOVER_HPP
#define TIERED_MOVER_HPP

#include "TierLayout.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

// One file to relocate: the copy to read and the directory it should end up in.
struct MoveOperation {
    std::filesystem::path source;
    std::filesystem::path destinationDirectory;
};

// Relocates decided files between the tiers on a bounded worker pool per destination.
class TieredMover {
public:
    // Performs one move; reports failure by throwing.
    using Transfer = std::function<void(const std::filesystem::path&, const std::filesystem::path&)>;

    TieredMover(TierLayout layout, OperatingMode mode, std::shared_ptr<spdlog::logger> logger, Transfer transfer = {});

    // Plan and run the moves for files; returns how many moves failed.
    std::size_t move(const std::vector<std::string>& files, Tier destination, std::size_t cacheConcurrency,
                     std::size_t arrayConcurrency);

    // Ensure destination directories and keep only moves whose source is in place.
    // Files whose destination directory cannot be created are counted in directoryFailures.
    std::vector<MoveOperation> plan(const std::vector<std::string>& files, Tier destination,
                                    std::size_t* directoryFailures = nullptr) const;
    // Run operations on workerCount threads; dry runs only log them.
    std::size_t execute(const std::vector<MoveOperation>& operations, std::size_t workerCount) const;

private:
    int runOperation(const MoveOperation& operation) const;

    TierLayout m_layout;
    OperatingMode m_mode;
    std::shared_ptr<spdlog::logger> m_logger;
    Transfer m_transfer;
};

#endif
