#include <gtest/gtest.h>

#include <algorithm>

#include "CompanionResolver.hpp"
#include "TestTree.hpp"

class CompanionResolverTest : public TestTree {};

TEST_F(CompanionResolverTest, DefaultExtensions) {
    CompanionResolver resolver(logger);
    const std::vector<std::string> expected{".srt", ".vtt", ".sbv", ".sub", ".idx"};
    EXPECT_EQ(resolver.subtitleExtensions(), expected);
}

TEST_F(CompanionResolverTest, CustomExtensionsAreNormalized) {
    CompanionResolver resolver(logger, {"SRT", " .ass"});
    const std::vector<std::string> expected{".srt", ".ass"};
    EXPECT_EQ(resolver.subtitleExtensions(), expected);
}

TEST_F(CompanionResolverTest, FindsSubtitlesSharingTheBaseName) {
    const std::string show = onArray("tv/show.mkv");
    writeFile(show);
    writeFile(onArray("tv/show.srt"));
    writeFile(onArray("tv/show.en.vtt"));
    writeFile(onArray("tv/other.srt"));
    writeFile(onArray("tv/show.nfo"));

    CompanionResolver resolver(logger);
    const auto result = resolver.resolveSubtitles({show});

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], show);
    EXPECT_NE(std::find(result.begin(), result.end(), onArray("tv/show.srt")), result.end());
    EXPECT_NE(std::find(result.begin(), result.end(), onArray("tv/show.en.vtt")), result.end());
    EXPECT_EQ(std::find(result.begin(), result.end(), onArray("tv/other.srt")), result.end());
}

TEST_F(CompanionResolverTest, CompanionsFollowAllPrimaryEntries) {
    const std::string first = onArray("a/first.mkv");
    const std::string second = onArray("b/second.mkv");
    writeFile(first);
    writeFile(second);
    writeFile(onArray("a/first.srt"));
    writeFile(onArray("b/second.srt"));

    CompanionResolver resolver(logger);
    const auto result = resolver.resolveSubtitles({first, second});

    const std::vector<std::string> expected{first, second, onArray("a/first.srt"), onArray("b/second.srt")};
    EXPECT_EQ(result, expected);
}

TEST_F(CompanionResolverTest, RepeatedAndExcludedPathsAreListedOnce) {
    const std::string movie = onArray("m/movie.mkv");
    const std::string skipped = onArray("m/skipped.mkv");
    writeFile(movie);
    writeFile(skipped);
    writeFile(onArray("m/movie.srt"));
    writeFile(onArray("m/skipped.srt"));

    CompanionResolver resolver(logger);
    const auto result = resolver.resolveSubtitles({movie, movie, skipped}, {skipped});

    const std::vector<std::string> expected{movie, movie, skipped, onArray("m/movie.srt")};
    EXPECT_EQ(result, expected);
}

TEST_F(CompanionResolverTest, MissingDirectoryIsNotFatal) {
    const std::string missing = onArray("gone/missing.mkv");
    const std::string present = onArray("here/present.mkv");
    writeFile(present);
    writeFile(onArray("here/present.sub"));

    CompanionResolver resolver(logger);
    const auto result = resolver.resolveSubtitles({missing, present});

    const std::vector<std::string> expected{missing, present, onArray("here/present.sub")};
    EXPECT_EQ(result, expected);
}

TEST_F(CompanionResolverTest, ExtensionMatchIgnoresCase) {
    const std::string film = onArray("movies/film.mkv");
    writeFile(film);
    writeFile(onArray("movies/film.EN.SRT"));

    CompanionResolver resolver(logger);
    const auto result = resolver.resolveSubtitles({film});

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[1], onArray("movies/film.EN.SRT"));
}
