#include "source/mpris_source.h"

#include "logging/logger.h"

#include <cmath>
#include <dbus/dbus.h>
#include <limits>
#include <memory>

namespace now_playing {

namespace {

constexpr const char* kMprisPath = "/org/mpris/MediaPlayer2";
constexpr const char* kPlayerInterface = "org.mpris.MediaPlayer2.Player";
constexpr const char* kPropertiesInterface = "org.freedesktop.DBus.Properties";

class ScopedError {
   public:
    ScopedError() {
        dbus_error_init(&err_);
    }
    ~ScopedError() {
        dbus_error_free(&err_);
    }
    ScopedError(const ScopedError&) = delete;
    ScopedError& operator=(const ScopedError&) = delete;

    DBusError* get() {
        return &err_;
    }
    bool isSet() const {
        return dbus_error_is_set(&err_);
    }
    const char* message() const {
        return err_.message ? err_.message : "unknown error";
    }

   private:
    DBusError err_;
};

struct MessageDeleter {
    void operator()(DBusMessage* msg) const {
        dbus_message_unref(msg);
    }
};
using MessagePtr = std::unique_ptr<DBusMessage, MessageDeleter>;

std::optional<std::string> readString(DBusMessageIter* iter) {
    int type = dbus_message_iter_get_arg_type(iter);
    if (type != DBUS_TYPE_STRING && type != DBUS_TYPE_OBJECT_PATH) {
        return std::nullopt;
    }
    const char* value = nullptr;
    dbus_message_iter_get_basic(iter, &value);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<int64_t> readInteger(DBusMessageIter* iter) {
    switch (dbus_message_iter_get_arg_type(iter)) {
    case DBUS_TYPE_INT64: {
        dbus_int64_t v = 0;
        dbus_message_iter_get_basic(iter, &v);
        return static_cast<int64_t>(v);
    }
    case DBUS_TYPE_UINT64: {
        dbus_uint64_t v = 0;
        dbus_message_iter_get_basic(iter, &v);
        return static_cast<int64_t>(v);
    }
    case DBUS_TYPE_INT32: {
        dbus_int32_t v = 0;
        dbus_message_iter_get_basic(iter, &v);
        return static_cast<int64_t>(v);
    }
    case DBUS_TYPE_UINT32: {
        dbus_uint32_t v = 0;
        dbus_message_iter_get_basic(iter, &v);
        return static_cast<int64_t>(v);
    }
    case DBUS_TYPE_DOUBLE: {
        double v = 0.0;
        dbus_message_iter_get_basic(iter, &v);
        return lengthFromDouble(v);
    }
    default:
        return std::nullopt;
    }
}

// xesam:artist is "as" in MPRIS metadata, but some players send a bare string
std::vector<std::string> readStringList(DBusMessageIter* iter) {
    std::vector<std::string> out;
    if (dbus_message_iter_get_arg_type(iter) == DBUS_TYPE_ARRAY) {
        DBusMessageIter arrayIter;
        dbus_message_iter_recurse(iter, &arrayIter);
        while (dbus_message_iter_get_arg_type(&arrayIter) != DBUS_TYPE_INVALID) {
            if (auto value = readString(&arrayIter)) {
                out.push_back(std::move(*value));
            }
            dbus_message_iter_next(&arrayIter);
        }
    } else if (auto value = readString(iter)) {
        out.push_back(std::move(*value));
    }
    return out;
}

void parseMetadata(DBusMessageIter* dictArray, MprisPlayerState& state) {
    DBusMessageIter dictIter;
    dbus_message_iter_recurse(dictArray, &dictIter);

    while (dbus_message_iter_get_arg_type(&dictIter) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entryIter;
        dbus_message_iter_recurse(&dictIter, &entryIter);

        auto key = readString(&entryIter);
        if (key && dbus_message_iter_next(&entryIter) &&
            dbus_message_iter_get_arg_type(&entryIter) == DBUS_TYPE_VARIANT) {
            DBusMessageIter valueIter;
            dbus_message_iter_recurse(&entryIter, &valueIter);

            if (*key == "xesam:title") {
                state.title = readString(&valueIter);
            } else if (*key == "xesam:artist") {
                state.artists = readStringList(&valueIter);
            } else if (*key == "xesam:album") {
                state.album = readString(&valueIter);
            } else if (*key == "mpris:length") {
                state.lengthUs = readInteger(&valueIter);
            } else if (*key == "mpris:trackid") {
                state.trackId = readString(&valueIter);
            }
        }

        dbus_message_iter_next(&dictIter);
    }
}

}  // namespace

bool isMprisBusName(const std::string& busName) {
    const std::string prefix(kMprisPrefix);
    return busName.size() > prefix.size() && busName.compare(0, prefix.size(), prefix) == 0;
}

std::string appIdFromBusName(const std::string& busName) {
    std::string id = isMprisBusName(busName) ? busName.substr(std::string(kMprisPrefix).size())
                                             : busName;
    // Multi-instance players append ".instance<pid>"
    auto pos = id.find(".instance");
    if (pos != std::string::npos) {
        id.erase(pos);
    }
    return id;
}

std::optional<int64_t> lengthFromDouble(double lengthUs) {
    if (!std::isfinite(lengthUs) || lengthUs <= 0.0) {
        return std::nullopt;
    }
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    if (lengthUs >= static_cast<double>(kMax)) {
        return kMax;
    }
    return static_cast<int64_t>(lengthUs);
}

scrobble::Snapshot toSnapshot(const MprisPlayerState& state) {
    scrobble::Snapshot snapshot;
    snapshot.title = state.title;
    if (!state.artists.empty()) {
        snapshot.artist = state.artists.front();
    }
    snapshot.album = state.album;
    if (state.lengthUs && *state.lengthUs > 0) {
        snapshot.durationSeconds = static_cast<uint64_t>(*state.lengthUs / 1000000);
    }
    if (!state.playbackStatus.empty()) {
        snapshot.isPlaying = (state.playbackStatus == "Playing");
    }
    snapshot.sourceAppId = appIdFromBusName(state.busName);
    snapshot.updateToken = state.trackId;
    return snapshot;
}

const MprisPlayerState* selectPlayer(const std::vector<MprisPlayerState>& players) {
    for (const auto& player : players) {
        if (player.playbackStatus == "Playing") {
            return &player;
        }
    }
    return players.empty() ? nullptr : &players.front();
}

MprisSource::MprisSource(int callTimeoutMs) : callTimeoutMs_(callTimeoutMs) {}

MprisSource::~MprisSource() {
    disconnect();
}

bool MprisSource::ensureConnected() {
    if (connection_ && dbus_connection_get_is_connected(connection_)) {
        return true;
    }
    disconnect();

    ScopedError err;
    connection_ = dbus_bus_get(DBUS_BUS_SESSION, err.get());
    if (err.isSet() || !connection_) {
        LOG_EVERY_N(WARN, 60, "MPRIS: session bus unavailable: {}",
                    err.isSet() ? err.message() : "no connection");
        connection_ = nullptr;
        return false;
    }
    dbus_connection_set_exit_on_disconnect(connection_, FALSE);
    LOG_DEBUG("MPRIS: connected to session bus");
    return true;
}

void MprisSource::disconnect() {
    if (connection_) {
        dbus_connection_unref(connection_);
        connection_ = nullptr;
    }
}

std::vector<std::string> MprisSource::listPlayers() {
    std::vector<std::string> players;

    MessagePtr msg(dbus_message_new_method_call("org.freedesktop.DBus", "/org/freedesktop/DBus",
                                                "org.freedesktop.DBus", "ListNames"));
    if (!msg) {
        return players;
    }

    ScopedError err;
    MessagePtr reply(
        dbus_connection_send_with_reply_and_block(connection_, msg.get(), callTimeoutMs_, err.get()));
    if (err.isSet() || !reply) {
        LOG_DEBUG("MPRIS: ListNames failed: {}", err.message());
        return players;
    }

    DBusMessageIter iter;
    if (!dbus_message_iter_init(reply.get(), &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
        return players;
    }

    DBusMessageIter names;
    dbus_message_iter_recurse(&iter, &names);
    while (dbus_message_iter_get_arg_type(&names) != DBUS_TYPE_INVALID) {
        if (auto name = readString(&names); name && isMprisBusName(*name)) {
            players.push_back(std::move(*name));
        }
        dbus_message_iter_next(&names);
    }
    return players;
}

std::optional<MprisPlayerState> MprisSource::readPlayer(const std::string& busName) {
    MessagePtr msg(dbus_message_new_method_call(busName.c_str(), kMprisPath,
                                                kPropertiesInterface, "GetAll"));
    if (!msg) {
        return std::nullopt;
    }
    const char* iface = kPlayerInterface;
    if (!dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID)) {
        return std::nullopt;
    }

    ScopedError err;
    MessagePtr reply(
        dbus_connection_send_with_reply_and_block(connection_, msg.get(), callTimeoutMs_, err.get()));
    if (err.isSet() || !reply) {
        LOG_DEBUG("MPRIS: GetAll on {} failed: {}", busName, err.message());
        return std::nullopt;
    }

    DBusMessageIter iter;
    if (!dbus_message_iter_init(reply.get(), &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
        return std::nullopt;
    }

    MprisPlayerState state;
    state.busName = busName;

    DBusMessageIter props;
    dbus_message_iter_recurse(&iter, &props);
    while (dbus_message_iter_get_arg_type(&props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&props, &entry);

        auto key = readString(&entry);
        if (key && dbus_message_iter_next(&entry) &&
            dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
            DBusMessageIter value;
            dbus_message_iter_recurse(&entry, &value);

            if (*key == "PlaybackStatus") {
                state.playbackStatus = readString(&value).value_or("");
            } else if (*key == "Metadata" &&
                       dbus_message_iter_get_arg_type(&value) == DBUS_TYPE_ARRAY) {
                parseMetadata(&value, state);
            }
        }
        dbus_message_iter_next(&props);
    }
    return state;
}

std::optional<scrobble::Snapshot> MprisSource::fetch() {
    if (!ensureConnected()) {
        return std::nullopt;
    }

    std::vector<MprisPlayerState> states;
    for (const auto& busName : listPlayers()) {
        if (auto state = readPlayer(busName)) {
            states.push_back(std::move(*state));
        }
    }

    const MprisPlayerState* chosen = selectPlayer(states);
    if (!chosen) {
        return std::nullopt;
    }
    LOG_TRACE("MPRIS: {} is {}", chosen->busName, chosen->playbackStatus);
    return toSnapshot(*chosen);
}

}  // namespace now_playing
