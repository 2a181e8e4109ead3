#ifndef TVDECK_PLAYLISTSLOTS_H
#define TVDECK_PLAYLISTSLOTS_H

#include <QByteArray>
#include <QString>
#include <QVector>

struct PlaylistSlot {
    PlaylistSlot() {}
    PlaylistSlot(const QString& g, const QString& url) : glyph(g), streamUrl(url) {}

    bool isConfigured() const { return !streamUrl.trimmed().isEmpty(); }

    QString glyph;
    QString streamUrl;  // null for an unconfigured slot
};

typedef QVector<PlaylistSlot> PlaylistSlotList;

// Quick-load buttons. The configuration file is optional and any problem with
// it falls back to the built-in set without telling the user.
class PlaylistSlots {
public:
    static const int SlotCount = 6;

    static PlaylistSlotList defaults();

    // JSON array of up to SlotCount {"Emoji": string, "Url": string|null}.
    static PlaylistSlotList fromJson(const QByteArray& json);

    static PlaylistSlotList load(const QString& path);
    static QString defaultConfigPath();
};

#endif // TVDECK_PLAYLISTSLOTS_H
