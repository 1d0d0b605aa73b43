#include "scrobble/text_normalizer.h"
#include "scrobble/track.h"

#include <gtest/gtest.h>

using scrobble::Snapshot;
using scrobble::TextNormalizer;
using scrobble::Track;

namespace {

Snapshot makeSnapshot(const char* title, const char* artist, const char* album = nullptr) {
    Snapshot s;
    if (title) {
        s.title = title;
    }
    if (artist) {
        s.artist = artist;
    }
    if (album) {
        s.album = album;
    }
    s.durationSeconds = 200;
    s.isPlaying = true;
    return s;
}

}  // namespace

TEST(TrackTest, BuildsNormalizedTrack) {
    TextNormalizer normalizer{scrobble::CleanupConfig{}};
    auto track = scrobble::makeTrack(makeSnapshot("Song [Explicit]", " Artist ", "Album (Clean)"),
                                     normalizer);

    ASSERT_TRUE(track.has_value());
    EXPECT_EQ(track->title, "Song");
    EXPECT_EQ(track->artist, "Artist");
    EXPECT_EQ(track->album, std::string("Album"));
    EXPECT_EQ(track->durationSeconds, 200u);
    EXPECT_EQ(track->displayName(), "Artist - Song");
}

TEST(TrackTest, MissingTitleOrArtistYieldsNothing) {
    TextNormalizer normalizer{scrobble::CleanupConfig{}};
    EXPECT_FALSE(scrobble::makeTrack(makeSnapshot(nullptr, "Artist"), normalizer).has_value());
    EXPECT_FALSE(scrobble::makeTrack(makeSnapshot("Song", nullptr), normalizer).has_value());
}

TEST(TrackTest, TitleEmptyAfterCleanupCountsAsMissing) {
    TextNormalizer normalizer{scrobble::CleanupConfig{}};
    EXPECT_FALSE(scrobble::makeTrack(makeSnapshot("[Explicit]", "Artist"), normalizer).has_value());
    EXPECT_FALSE(scrobble::makeTrack(makeSnapshot("Song", "   "), normalizer).has_value());
}

TEST(TrackTest, EmptyAlbumIsDropped) {
    TextNormalizer normalizer{scrobble::CleanupConfig{}};
    auto track = scrobble::makeTrack(makeSnapshot("Song", "Artist", " "), normalizer);
    ASSERT_TRUE(track.has_value());
    EXPECT_FALSE(track->album.has_value());
}

TEST(TrackTest, EqualityIgnoresDuration) {
    Track a{"Song", "Artist", std::string("Album"), 200};
    Track b{"Song", "Artist", std::string("Album"), 201};
    Track c{"Song", "Artist", std::nullopt, 200};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
