#include <gtest/gtest.h>

#include <fstream>

#include "MediaSetCache.hpp"
#include "TestTree.hpp"

class MediaSetCacheTest : public TestTree {};

TEST_F(MediaSetCacheTest, SaveThenLoad) {
    MediaSetCache cache(root / "watchlist.json", logger);
    const auto stamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

    cache.save({"/mnt/user/tv/b.mkv", "/mnt/user/movies/a.mkv", "/mnt/user/tv/b.mkv"}, stamp);
    const MediaSet loaded = cache.load();

    EXPECT_TRUE(loaded.loaded);
    EXPECT_EQ(loaded.media, (std::set<std::string>{"/mnt/user/movies/a.mkv", "/mnt/user/tv/b.mkv"}));
    EXPECT_EQ(loaded.lastUpdated, stamp);
}

TEST_F(MediaSetCacheTest, MissingFileLoadsEmpty) {
    MediaSetCache cache(root / "nothing.json", logger);
    const MediaSet loaded = cache.load();

    EXPECT_FALSE(loaded.loaded);
    EXPECT_TRUE(loaded.media.empty());
    EXPECT_FALSE(MediaSetCache::isFresh(loaded, std::chrono::hours(6)));
}

TEST_F(MediaSetCacheTest, MalformedFileLoadsEmpty) {
    {
        std::ofstream out(root / "broken.json");
        out << R"({"media": "not a list"})";
    }

    MediaSetCache cache(root / "broken.json", logger);
    EXPECT_FALSE(cache.load().loaded);
}

TEST_F(MediaSetCacheTest, FreshnessFollowsExpiry) {
    const auto now = std::chrono::system_clock::now();
    MediaSet set;
    set.loaded = true;
    set.lastUpdated = now - std::chrono::hours(2);

    EXPECT_TRUE(MediaSetCache::isFresh(set, std::chrono::hours(6), now));
    EXPECT_FALSE(MediaSetCache::isFresh(set, std::chrono::hours(1), now));
}
