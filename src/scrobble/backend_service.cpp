#include "scrobble/backend_service.h"

namespace scrobble {

const char* serviceKindToString(ServiceKind kind) {
    switch (kind) {
    case ServiceKind::LastFm:
        return "lastfm";
    case ServiceKind::ListenBrainz:
        return "listenbrainz";
    }
    return "unknown";
}

}  // namespace scrobble
