#ifndef DAEMON_CONSTANTS_H
#define DAEMON_CONSTANTS_H

#include <cstddef>  // for size_t
#include <cstdint>

// Constants shared across the scrobbler engine and daemon components

namespace DaemonConstants {

// Poll cadence
constexpr int DEFAULT_REFRESH_INTERVAL_SEC = 5;

// Scrobble eligibility
constexpr int DEFAULT_SCROBBLE_THRESHOLD_PERCENT = 50;
constexpr int MIN_SCROBBLE_THRESHOLD_PERCENT = 1;
constexpr int MAX_SCROBBLE_THRESHOLD_PERCENT = 100;
constexpr uint64_t MIN_TRACK_DURATION_SEC = 30;    // Shorter tracks never scrobble
constexpr uint64_t SCROBBLE_TIME_CEILING_SEC = 240;  // Threshold never exceeds 4 minutes

// Retry budgets for one service call
constexpr int NOW_PLAYING_RETRY_BUDGET_MS = 10000;
constexpr int SCROBBLE_RETRY_BUDGET_MS = 30000;
constexpr int RETRY_BASE_DELAY_MS = 500;
constexpr double RETRY_MULTIPLIER = 2.0;
constexpr int NOW_PLAYING_MAX_DELAY_MS = 5000;
constexpr int SCROBBLE_MAX_DELAY_MS = 10000;

// Dispatch worker queue bound
constexpr size_t DISPATCH_QUEUE_CAPACITY = 256;

// HTTP
constexpr int DEFAULT_HTTP_TIMEOUT_MS = 10000;
constexpr const char* USER_AGENT = "np_scrobbler/1.0";
constexpr const char* CLIENT_NAME = "np_scrobbler";
constexpr const char* CLIENT_VERSION = "1.0.0";

// Service endpoints
constexpr const char* LASTFM_API_URL = "https://ws.audioscrobbler.com/2.0/";
constexpr const char* LASTFM_AUTH_URL = "https://www.last.fm/api/auth/";
constexpr const char* LISTENBRAINZ_API_URL = "https://api.listenbrainz.org";
constexpr const char* DEFAULT_LISTENBRAINZ_NAME = "Primary";

// ZeroMQ endpoints
constexpr const char* ZEROMQ_IPC_PATH = "ipc:///tmp/np_scrobbler.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";

// Files
constexpr const char* CONFIG_DIR_NAME = "np_scrobbler";
constexpr const char* CONFIG_FILE_NAME = "config.json";
constexpr const char* PID_FILE_NAME = "np_scrobbler.pid";

}  // namespace DaemonConstants

#endif  // DAEMON_CONSTANTS_H
