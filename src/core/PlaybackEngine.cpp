#include "core/PlaybackEngine.h"

static const char* USER_AGENT = "tvdeck/1.0";

HttpHeaders defaultHttpHeaders() {
    HttpHeaders headers;
    headers.append(qMakePair(QByteArray("User-Agent"), QByteArray(USER_AGENT)));
    return headers;
}
