#pragma once

#include "scrobble/track.h"

#include <optional>

namespace now_playing {

class NowPlayingSource {
   public:
    virtual ~NowPlayingSource() = default;

    virtual const char* name() const = 0;

    // Latest snapshot, or nullopt when no media is available. Never throws.
    virtual std::optional<scrobble::Snapshot> fetch() = 0;
};

}  // namespace now_playing
