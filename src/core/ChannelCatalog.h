#ifndef TVDECK_CHANNELCATALOG_H
#define TVDECK_CHANNELCATALOG_H

#include "core/Channel.h"

#include <QString>

// Last loaded channel list. Loads replace the whole list in one assignment so
// readers on the UI thread never see a half-built catalog.
class ChannelCatalog {
public:
    ChannelCatalog() {}

    void replace(const ChannelList& channels, const QString& label = QString());
    void clear();

    const ChannelList& channels() const { return m_channels; }
    int size() const { return m_channels.size(); }
    bool isEmpty() const { return m_channels.isEmpty(); }

    QString label() const { return m_label; }
    QString header() const;

    // Case-insensitive substring match on name or group, sorted by name.
    ChannelList filter(const QString& query) const;

    static ChannelList filter(const ChannelList& channels, const QString& query);
    static void sortByName(ChannelList& channels);

    static QString labelFromUrl(const QString& url);
    static QString labelFromPath(const QString& path);

private:
    ChannelList m_channels;
    QString m_label;
};

#endif // TVDECK_CHANNELCATALOG_H
