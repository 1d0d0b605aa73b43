/**
 * @file mpris_source.h
 * @brief Now-playing source backed by MPRIS players on the D-Bus session bus
 *
 * Each fetch lists the bus names, reads org.mpris.MediaPlayer2.Player
 * properties from every player and reports the first one that is playing
 * (or the first player found when none is).
 */

#pragma once

#include "source/now_playing_source.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct DBusConnection;

namespace now_playing {

/**
 * @brief Raw player state read from Properties.GetAll
 */
struct MprisPlayerState {
    std::string busName;
    std::string playbackStatus;  // "Playing", "Paused", "Stopped"
    std::optional<std::string> title;
    std::vector<std::string> artists;
    std::optional<std::string> album;
    std::optional<int64_t> lengthUs;
    std::optional<std::string> trackId;
};

constexpr const char* kMprisPrefix = "org.mpris.MediaPlayer2.";

bool isMprisBusName(const std::string& busName);

/**
 * @brief "org.mpris.MediaPlayer2.vlc.instance1234" -> "vlc"
 */
std::string appIdFromBusName(const std::string& busName);

// mpris:length sent as a double; nullopt for NaN, infinite or non-positive values
std::optional<int64_t> lengthFromDouble(double lengthUs);

scrobble::Snapshot toSnapshot(const MprisPlayerState& state);

/**
 * @brief Playing player first, otherwise the first entry; nullptr if empty
 */
const MprisPlayerState* selectPlayer(const std::vector<MprisPlayerState>& players);

class MprisSource : public NowPlayingSource {
   public:
    explicit MprisSource(int callTimeoutMs = 500);
    ~MprisSource() override;

    MprisSource(const MprisSource&) = delete;
    MprisSource& operator=(const MprisSource&) = delete;

    const char* name() const override {
        return "mpris";
    }

    std::optional<scrobble::Snapshot> fetch() override;

   private:
    bool ensureConnected();
    void disconnect();
    std::vector<std::string> listPlayers();
    std::optional<MprisPlayerState> readPlayer(const std::string& busName);

    DBusConnection* connection_ = nullptr;
    int callTimeoutMs_;
};

}  // namespace now_playing
