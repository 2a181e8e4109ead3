#ifndef TVDECK_CHANNEL_H
#define TVDECK_CHANNEL_H

#include <QMetaType>
#include <QString>
#include <QVector>

static const int MAX_NAME_LEN = 200;

struct Channel {
    Channel() {}
    Channel(const QString& n, const QString& g, const QString& logo, const QString& url)
        : name(n), group(g), logoUrl(logo), streamUrl(url) {}

    bool hasLogo() const { return !logoUrl.isNull(); }

    QString name;
    QString group;
    QString logoUrl;    // null when the directive carried no tvg-logo
    QString streamUrl;
};

typedef QVector<Channel> ChannelList;

Q_DECLARE_METATYPE(Channel)
Q_DECLARE_METATYPE(ChannelList)

#endif // TVDECK_CHANNEL_H
