#include <gtest/gtest.h>

#include <stdexcept>

#include "FileUtils.hpp"
#include "PlacementDecider.hpp"
#include "TestTree.hpp"

class PlacementDeciderTest : public TestTree {
protected:
    std::filesystem::path exclusionList() const { return root / "mover_exclude.txt"; }

    PlacementDecider makeDecider(OperatingMode mode = {}) const {
        return PlacementDecider(layout(), exclusionList(), mode, logger);
    }
};

TEST_F(PlacementDeciderTest, ArrayOnlyFileGoesToCache) {
    writeFile(onArray("movies/a.mkv"));

    auto decider = makeDecider();
    const auto result = decider.decide({onArray("movies/a.mkv")}, Tier::Cache);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], onArray("movies/a.mkv"));
}

TEST_F(PlacementDeciderTest, CachedFileIsNotMovedToCacheAgain) {
    writeFile(onCache("movies/a.mkv"));

    auto decider = makeDecider();
    EXPECT_TRUE(decider.decide({onArray("movies/a.mkv")}, Tier::Cache).empty());
    EXPECT_TRUE(exists(onCache("movies/a.mkv")));
}

TEST_F(PlacementDeciderTest, BothCopiesForCacheRemovesArrayCopy) {
    writeFile(onArray("movies/a.mkv"));
    writeFile(onCache("movies/a.mkv"));

    auto decider = makeDecider();
    EXPECT_TRUE(decider.decide({onArray("movies/a.mkv")}, Tier::Cache).empty());

    EXPECT_TRUE(exists(onCache("movies/a.mkv")));
    EXPECT_FALSE(exists(onArray("movies/a.mkv")));
}

TEST_F(PlacementDeciderTest, BothCopiesForArrayRemovesCacheCopy) {
    writeFile(onArray("movies/a.mkv"));
    writeFile(onCache("movies/a.mkv"));

    auto decider = makeDecider();
    EXPECT_TRUE(decider.decide({onArray("movies/a.mkv")}, Tier::Array).empty());

    EXPECT_TRUE(exists(onArray("movies/a.mkv")));
    EXPECT_FALSE(exists(onCache("movies/a.mkv")));
}

TEST_F(PlacementDeciderTest, CacheOnlyFileGoesToArray) {
    writeFile(onCache("tv/b.mkv"));

    auto decider = makeDecider();
    const auto result = decider.decide({onArray("tv/b.mkv")}, Tier::Array);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], onArray("tv/b.mkv"));
}

TEST_F(PlacementDeciderTest, FileWantedOnCacheStaysThere) {
    writeFile(onArray("tv/b.mkv"));
    writeFile(onCache("tv/b.mkv"));

    auto decider = makeDecider();
    const auto result = decider.decide({onArray("tv/b.mkv")}, Tier::Array, {onArray("tv/b.mkv")});

    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(exists(onCache("tv/b.mkv")));
    EXPECT_TRUE(exists(onArray("tv/b.mkv")));
}

TEST_F(PlacementDeciderTest, SkippedAndDuplicatePathsAreExcluded) {
    writeFile(onArray("movies/a.mkv"));
    writeFile(onArray("movies/playing.mkv"));

    auto decider = makeDecider();
    const auto result = decider.decide({onArray("movies/a.mkv"), onArray("movies/a.mkv"), onArray("movies/playing.mkv")},
                                       Tier::Cache, {}, {onArray("movies/playing.mkv")});

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], onArray("movies/a.mkv"));
}

TEST_F(PlacementDeciderTest, WritesExclusionListWhenSupported) {
    writeFile(onArray("movies/a.mkv"));
    writeFile(onArray("tv/b.mkv"));

    OperatingMode mode;
    mode.storageManagerExclusionSupported = true;
    auto decider = makeDecider(mode);
    decider.decide({onArray("movies/a.mkv"), onArray("tv/b.mkv"), onArray("movies/a.mkv")}, Tier::Cache);

    const auto lines = FileUtils::readPathList(exclusionList(), *logger);
    const std::vector<std::string> expected{onCache("movies/a.mkv"), onCache("tv/b.mkv")};
    EXPECT_EQ(lines, expected);
}

TEST_F(PlacementDeciderTest, NoExclusionListWithoutStorageManager) {
    writeFile(onArray("movies/a.mkv"));

    auto decider = makeDecider();
    decider.decide({onArray("movies/a.mkv")}, Tier::Cache);

    EXPECT_FALSE(std::filesystem::exists(exclusionList()));
}

TEST_F(PlacementDeciderTest, DryRunKeepsRedundantCopies) {
    writeFile(onArray("movies/a.mkv"));
    writeFile(onCache("movies/a.mkv"));

    OperatingMode mode;
    mode.dryRun = true;
    auto decider = makeDecider(mode);
    EXPECT_TRUE(decider.decide({onArray("movies/a.mkv")}, Tier::Cache).empty());

    EXPECT_TRUE(exists(onArray("movies/a.mkv")));
    EXPECT_TRUE(exists(onCache("movies/a.mkv")));
}

TEST_F(PlacementDeciderTest, PathsOutsideRealSourceAreIgnored) {
    auto decider = makeDecider();
    EXPECT_TRUE(decider.decide({"/elsewhere/a.mkv"}, Tier::Cache).empty());
}

TEST_F(PlacementDeciderTest, UnknownTierIsAProgrammingError) {
    auto decider = makeDecider();
    EXPECT_THROW(decider.decide({onArray("a.mkv")}, static_cast<Tier>(7)), std::logic_error);
}
