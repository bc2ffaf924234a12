#include "TieredMover.hpp"

#include "FileUtils.hpp"
#include "WorkerPool.hpp"

#include <future>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace {
bool isRegularFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}
}

TieredMover::TieredMover(TierLayout layout, OperatingMode mode, std::shared_ptr<spdlog::logger> logger, Transfer transfer)
    : m_layout(std::move(layout)), m_mode(mode), m_logger(std::move(logger)), m_transfer(std::move(transfer)) {
    if (!m_transfer) {
        m_transfer = FileUtils::moveFile;
    }
}

std::size_t TieredMover::move(const std::vector<std::string>& files, Tier destination, std::size_t cacheConcurrency,
                              std::size_t arrayConcurrency) {
    m_logger->info("Moving media files to {}...", toString(destination));

    std::size_t directoryFailures = 0;
    const auto operations = plan(files, destination, &directoryFailures);
    const std::size_t workers = destination == Tier::Cache ? cacheConcurrency : arrayConcurrency;
    const std::size_t errors = execute(operations, workers) + directoryFailures;
    if (m_mode.dryRun) {
        return errors;
    }

    std::cout << "Finished moving files with " << errors << " errors." << std::endl;
    m_logger->info("Finished moving files with {} errors.", errors);
    return errors;
}

std::vector<MoveOperation> TieredMover::plan(const std::vector<std::string>& files, Tier destination,
                                             std::size_t* directoryFailures) const {
    if (destination != Tier::Cache && destination != Tier::Array) {
        throw std::logic_error("Unknown destination tier " + std::to_string(static_cast<int>(destination)));
    }

    std::vector<MoveOperation> operations;
    std::unordered_set<std::string> processed;
    std::size_t failed = 0;

    for (const auto& file : files) {
        if (!processed.insert(file).second) {
            continue;
        }
        if (!m_layout.contains(file)) {
            m_logger->warn("Cannot move `{}`: not under `{}`", file, m_layout.realSource());
            continue;
        }

        const auto cacheCopy = m_layout.cachePathFor(file);
        const auto arrayCopy = m_layout.arrayPathFor(file);

        // Directory goes in first even when the move is skipped, so both trees keep the same shape.
        if (destination == Tier::Array) {
            if (!m_mode.dryRun && !FileUtils::ensureDirectory(arrayCopy.parent_path(), cacheCopy, *m_logger)) {
                ++failed;
                continue;
            }
            if (!isRegularFile(cacheCopy)) {
                m_logger->debug("Nothing to move for `{}`: no cache copy", file);
                continue;
            }
            operations.push_back({cacheCopy, arrayCopy.parent_path()});
        } else {
            if (!m_mode.dryRun && !FileUtils::ensureDirectory(cacheCopy.parent_path(), arrayCopy, *m_logger)) {
                ++failed;
                continue;
            }
            if (isRegularFile(cacheCopy)) {
                m_logger->debug("Nothing to move for `{}`: already on cache", file);
                continue;
            }
            if (!isRegularFile(arrayCopy)) {
                m_logger->warn("Cannot move `{}` to cache: array copy `{}` is missing", file, arrayCopy.string());
                continue;
            }
            operations.push_back({arrayCopy, cacheCopy.parent_path()});
        }
    }

    if (directoryFailures != nullptr) {
        *directoryFailures = failed;
    }
    return operations;
}

std::size_t TieredMover::execute(const std::vector<MoveOperation>& operations, std::size_t workerCount) const {
    if (m_mode.dryRun) {
        for (const auto& operation : operations) {
            std::cout << "Would move `" << operation.source.string() << "` -> `"
                      << operation.destinationDirectory.string() << "`" << std::endl;
            m_logger->info("Would move `{}` -> `{}`", operation.source.string(), operation.destinationDirectory.string());
        }
        return 0;
    }

    std::size_t errors = 0;
    if (!operations.empty()) {
        WorkerPool pool(workerCount);
        std::vector<std::future<int>> results;
        results.reserve(operations.size());
        for (const auto& operation : operations) {
            results.push_back(pool.submit([this, &operation] { return runOperation(operation); }));
        }
        for (auto& result : results) {
            errors += static_cast<std::size_t>(result.get());
        }
    }

    return errors;
}

int TieredMover::runOperation(const MoveOperation& operation) const {
    try {
        m_transfer(operation.source, operation.destinationDirectory);
        m_logger->info("Moved `{}` -> `{}` with original permissions and owner.", operation.source.string(),
                       operation.destinationDirectory.string());
        return 0;
    } catch (const std::exception& e) {
        m_logger->error("Error moving file `{}`: {}", operation.source.string(), e.what());
        return 1;
    }
}
