#include "core/PlaylistSlots.h"
#include "core/Logging.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStandardPaths>

static const char* SLOTS_FILE_NAME = "playlist-slots.json";

PlaylistSlotList PlaylistSlots::defaults() {
    PlaylistSlotList list;
    list.append(PlaylistSlot(QString::fromUtf8("\xF0\x9F\x9B\x95"),
        QStringLiteral("https://raw.githubusercontent.com/akkradet/IPTV-THAI/refs/heads/master/FREETV.m3u")));
    list.append(PlaylistSlot(QString::fromUtf8("\xF0\x9F\x92\x82"),
        QStringLiteral("https://raw.githubusercontent.com/iptv-org/iptv/refs/heads/master/streams/uk.m3u")));
    list.append(PlaylistSlot(QString::fromUtf8("\xF0\x9F\x8D\x81"),
        QStringLiteral("https://raw.githubusercontent.com/iptv-org/iptv/refs/heads/master/streams/ca.m3u")));
    list.append(PlaylistSlot(QString::fromUtf8("\xF0\x9F\x97\xBD"),
        QStringLiteral("https://raw.githubusercontent.com/iptv-org/iptv/refs/heads/master/streams/us.m3u")));
    list.append(PlaylistSlot(QString::fromUtf8("\xF0\x9F\xA6\x98"),
        QStringLiteral("https://raw.githubusercontent.com/iptv-org/iptv/refs/heads/master/streams/au.m3u")));
    list.append(PlaylistSlot(QString::fromUtf8("\xF0\x9F\x8C\x8F"),
        QStringLiteral("https://iptv-org.github.io/iptv/index.m3u")));
    return list;
}

PlaylistSlotList PlaylistSlots::fromJson(const QByteArray& json) {
    PlaylistSlotList result = defaults();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qCDebug(lcConfig) << "slot config is not valid JSON:" << parseError.errorString();
        return result;
    }
    if (!doc.isArray()) {
        qCDebug(lcConfig) << "slot config is not an array";
        return result;
    }

    const QJsonArray arr = doc.array();
    const int count = qMin(arr.size(), static_cast<int>(SlotCount));
    for (int i = 0; i < count; ++i) {
        if (!arr.at(i).isObject()) {
            qCDebug(lcConfig) << "slot" << i << "is not an object, keeping default";
            continue;
        }
        const QJsonObject obj = arr.at(i).toObject();
        const QJsonValue glyph = obj.value(QStringLiteral("Emoji"));
        const QJsonValue url = obj.value(QStringLiteral("Url"));

        const bool glyphOk = glyph.isString() && !glyph.toString().trimmed().isEmpty();
        const bool urlOk = url.isString() || url.isNull() || url.isUndefined();
        if (!glyphOk || !urlOk) {
            qCDebug(lcConfig) << "slot" << i << "is malformed, keeping default";
            continue;
        }

        QString streamUrl;
        if (url.isString() && !url.toString().trimmed().isEmpty())
            streamUrl = url.toString().trimmed();
        result[i] = PlaylistSlot(glyph.toString().trimmed(), streamUrl);
    }
    if (arr.size() > SlotCount)
        qCDebug(lcConfig) << "ignoring" << arr.size() - SlotCount << "extra slot entries";
    return result;
}

PlaylistSlotList PlaylistSlots::load(const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        qCDebug(lcConfig) << "no slot config at" << path << "- using defaults";
        return defaults();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCDebug(lcConfig) << "cannot read slot config" << path << file.errorString();
        return defaults();
    }
    return fromJson(file.readAll());
}

QString PlaylistSlots::defaultConfigPath() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath(QLatin1String(SLOTS_FILE_NAME));
}
