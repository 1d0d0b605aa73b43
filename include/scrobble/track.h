/**
 * @file track.h
 * @brief Snapshot (raw source data) and Track (normalized identity) types
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace scrobble {

class TextNormalizer;

/**
 * @brief One observation of the now-playing source, captured once per tick.
 *
 * Every field may be missing; the source reports what the player exposes.
 */
struct Snapshot {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<uint64_t> durationSeconds;
    std::optional<bool> isPlaying;
    std::optional<std::string> sourceAppId;
    std::optional<std::string> updateToken;  // Changes when the player starts a new item
};

/**
 * @brief Normalized track identity.
 *
 * Equality covers title, artist and album only. Duration is carried for the
 * eligibility check and for service payloads.
 */
struct Track {
    std::string title;
    std::string artist;
    std::optional<std::string> album;
    std::optional<uint64_t> durationSeconds;

    bool operator==(const Track& other) const {
        return title == other.title && artist == other.artist && album == other.album;
    }
    bool operator!=(const Track& other) const { return !(*this == other); }

    // "Artist - Title" for status text and logs
    std::string displayName() const { return artist + " - " + title; }
};

/**
 * @brief Build a Track from a snapshot's text fields.
 *
 * Returns nullopt when title or artist is missing or empty after
 * normalization. An album that normalizes to empty is dropped.
 */
std::optional<Track> makeTrack(const Snapshot& snapshot, const TextNormalizer& normalizer);

}  // namespace scrobble
