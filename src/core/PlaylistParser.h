#ifndef TVDECK_PLAYLISTPARSER_H
#define TVDECK_PLAYLISTPARSER_H

#include "core/Channel.h"

#include <QString>

// Best-effort M3U reader. A "#EXTINF:" directive opens a pending entry and the
// next non-blank, non-comment line closes it as the stream URL. Anything that
// does not fit that pairing is skipped.
class PlaylistParser {
public:
    static ChannelList parse(const QString& text);

    // Value of key="..." inside a directive line, or a null QString when the
    // attribute is absent or unterminated.
    static QString attribute(const QString& directive, const QString& key);

    static bool isDirective(const QString& line);
};

#endif // TVDECK_PLAYLISTPARSER_H
