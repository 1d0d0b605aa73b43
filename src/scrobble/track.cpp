#include "scrobble/track.h"

#include "scrobble/text_normalizer.h"

namespace scrobble {

namespace {

std::optional<std::string> normalizedField(const std::optional<std::string>& raw,
                                           const TextNormalizer& normalizer) {
    auto value = normalizer.normalizeOptional(raw);
    if (!value || trimWhitespace(*value).empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<Track> makeTrack(const Snapshot& snapshot, const TextNormalizer& normalizer) {
    auto title = normalizedField(snapshot.title, normalizer);
    auto artist = normalizedField(snapshot.artist, normalizer);
    if (!title || !artist) {
        return std::nullopt;
    }

    Track track;
    track.title = std::move(*title);
    track.artist = std::move(*artist);
    track.album = normalizedField(snapshot.album, normalizer);
    track.durationSeconds = snapshot.durationSeconds;
    return track;
}

}  // namespace scrobble
