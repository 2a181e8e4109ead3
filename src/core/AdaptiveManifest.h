#ifndef TVDECK_ADAPTIVEMANIFEST_H
#define TVDECK_ADAPTIVEMANIFEST_H

#include <QString>

// True for an HLS media/master playlist or a DASH MPD. A plain IPTV channel
// list also starts with #EXTM3U but carries no #EXT-X- tags.
bool looksLikeAdaptiveManifest(const QString& text);

#endif // TVDECK_ADAPTIVEMANIFEST_H
