#include "core/AdaptiveManifest.h"

bool looksLikeAdaptiveManifest(const QString& text) {
    const QString head = text.left(4096).trimmed();
    if (head.startsWith(QLatin1String("#EXTM3U")))
        return head.contains(QLatin1String("#EXT-X-"));
    return head.contains(QLatin1String("<MPD"), Qt::CaseInsensitive);
}
