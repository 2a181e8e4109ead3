#include "core/ChannelCatalog.h"
#include "core/Logging.h"

#include <QFileInfo>
#include <QUrl>

#include <algorithm>

namespace {

bool nameLessThan(const Channel& a, const Channel& b) {
    return QString::compare(a.name, b.name, Qt::CaseInsensitive) < 0;
}

bool isPlaylistFile(const QString& name) {
    return name.endsWith(QLatin1String(".m3u"), Qt::CaseInsensitive) ||
           name.endsWith(QLatin1String(".m3u8"), Qt::CaseInsensitive);
}

QString stripExtension(const QString& name) {
    int dot = name.lastIndexOf(QLatin1Char('.'));
    return dot > 0 ? name.left(dot) : name;
}

} // namespace

void ChannelCatalog::replace(const ChannelList& channels, const QString& label) {
    m_channels = channels;
    QString clean = label.trimmed();
    m_label = clean.isEmpty() ? QString() : clean;
    qCDebug(lcCatalog) << "catalog replaced:" << m_channels.size() << "channels, label" << m_label;
}

void ChannelCatalog::clear() {
    m_channels = ChannelList();
    m_label = QString();
}

QString ChannelCatalog::header() const {
    if (m_label.isEmpty()) return QStringLiteral("Channels");
    return QStringLiteral("Channels: %1").arg(m_label);
}

ChannelList ChannelCatalog::filter(const QString& query) const {
    return filter(m_channels, query);
}

ChannelList ChannelCatalog::filter(const ChannelList& channels, const QString& query) {
    const QString q = query.trimmed();
    ChannelList result;
    if (q.isEmpty()) {
        result = channels;
    } else {
        for (int i = 0; i < channels.size(); ++i) {
            const Channel& ch = channels[i];
            if (ch.name.contains(q, Qt::CaseInsensitive) ||
                (!ch.group.isEmpty() && ch.group.contains(q, Qt::CaseInsensitive))) {
                result.append(ch);
            }
        }
    }
    sortByName(result);
    return result;
}

void ChannelCatalog::sortByName(ChannelList& channels) {
    std::stable_sort(channels.begin(), channels.end(), nameLessThan);
}

QString ChannelCatalog::labelFromUrl(const QString& url) {
    QUrl u(url);
    if (!u.isValid() || u.host().isEmpty()) return QStringLiteral("Playlist");
    QString last = u.path().section(QLatin1Char('/'), -1, -1, QString::SectionSkipEmpty);
    if (isPlaylistFile(last)) return stripExtension(last);
    return u.host();
}

QString ChannelCatalog::labelFromPath(const QString& path) {
    return QFileInfo(path).completeBaseName();
}
