#include <gtest/gtest.h>

#include "CapacityGuard.hpp"
#include "TestTree.hpp"

namespace {
constexpr std::uintmax_t kGiB = 1024ull * 1024ull * 1024ull;
}

class CapacityGuardTest : public TestTree {
protected:
    std::filesystem::path probedRoot;

    CapacityGuard makeGuard(std::uintmax_t freeBytes) {
        return CapacityGuard(layout(), logger, [this, freeBytes](const std::filesystem::path& root) {
            probedRoot = root;
            return freeBytes;
        });
    }
};

TEST_F(CapacityGuardTest, OversizedBatchIsRejected) {
    auto guard = makeGuard(3 * kGiB);
    const CapacityReport report{5 * kGiB, 3 * kGiB};

    EXPECT_FALSE(report.fits());
    EXPECT_THROW(guard.enforce(report, Tier::Cache, OperatingMode{}), InsufficientSpaceError);
}

TEST_F(CapacityGuardTest, BatchThatFitsProceeds) {
    auto guard = makeGuard(3 * kGiB);
    const CapacityReport report{2 * kGiB, 3 * kGiB};

    EXPECT_TRUE(report.fits());
    EXPECT_NO_THROW(guard.enforce(report, Tier::Cache, OperatingMode{}));
}

TEST_F(CapacityGuardTest, DryRunOnlyWarns) {
    auto guard = makeGuard(3 * kGiB);
    OperatingMode mode;
    mode.dryRun = true;

    EXPECT_NO_THROW(guard.enforce(CapacityReport{5 * kGiB, 3 * kGiB}, Tier::Array, mode));
}

TEST_F(CapacityGuardTest, SizesSourceCopiesAndProbesDestinationRoot) {
    writeFile(onArray("movies/a.mkv"), std::string(1000, 'a'));
    writeFile(onArray("movies/a.srt"), std::string(24, 's'));

    auto guard = makeGuard(4096);
    const auto report = guard.checkAndSize({onArray("movies/a.mkv"), onArray("movies/a.srt")}, Tier::Cache);

    EXPECT_EQ(report.totalBytes, 1024u);
    EXPECT_EQ(report.freeBytes, 4096u);
    EXPECT_EQ(probedRoot, std::filesystem::path(cacheRoot));
    EXPECT_TRUE(report.fits());
}

TEST_F(CapacityGuardTest, ArrayBatchIsSizedFromTheCache) {
    writeFile(onCache("tv/b.mkv"), std::string(300, 'b'));

    auto guard = makeGuard(100);
    const auto report = guard.checkAndSize({onArray("tv/b.mkv")}, Tier::Array);

    EXPECT_EQ(report.totalBytes, 300u);
    EXPECT_EQ(probedRoot, std::filesystem::path(arrayRoot));
    EXPECT_FALSE(report.fits());
}

TEST_F(CapacityGuardTest, VanishedFilesCountAsNothing) {
    auto guard = makeGuard(100);
    const auto report = guard.checkAndSize({onArray("gone.mkv")}, Tier::Cache);

    EXPECT_TRUE(report.empty());
    EXPECT_TRUE(probedRoot.empty());
}

TEST_F(CapacityGuardTest, SplitVolumeSizesPhysicalCopies) {
    writeFile(onArray("movies/a.mkv"), std::string(1000, 'a'));
    writeFile(onCache("tv/b.mkv"), std::string(300, 'b'));

    CapacityGuard guard(splitLayout(), logger, [this](const std::filesystem::path& root) {
        probedRoot = root;
        return std::uintmax_t{2000};
    });

    const auto toCache = guard.checkAndSize({onUnion("movies/a.mkv")}, Tier::Cache);
    EXPECT_EQ(toCache.totalBytes, 1000u);
    EXPECT_EQ(probedRoot, std::filesystem::path(cacheRoot));

    const auto toArray = guard.checkAndSize({onUnion("tv/b.mkv")}, Tier::Array);
    EXPECT_EQ(toArray.totalBytes, 300u);
    EXPECT_EQ(probedRoot, std::filesystem::path(arrayRoot));
}
