#include "core/PlaylistParser.h"
#include "core/Logging.h"

#include <QStringList>

static const char* DIRECTIVE_TAG = "#EXTINF:";

bool PlaylistParser::isDirective(const QString& line) {
    return line.startsWith(QLatin1String(DIRECTIVE_TAG), Qt::CaseInsensitive);
}

QString PlaylistParser::attribute(const QString& directive, const QString& key) {
    const QString needle = key + QLatin1String("=\"");
    int start = directive.indexOf(needle, 0, Qt::CaseInsensitive);
    if (start < 0) return QString();
    start += needle.length();
    int end = directive.indexOf(QLatin1Char('"'), start);
    if (end < 0) return QString();
    QString value = directive.mid(start, end - start);
    // key="" is present, just empty
    if (value.isNull()) value = QLatin1String("");
    return value;
}

ChannelList PlaylistParser::parse(const QString& text) {
    ChannelList channels;
    const QStringList lines = text.split(QLatin1Char('\n'));
    channels.reserve(lines.size() / 2);

    bool hasPending = false;
    QString name;
    QString group;
    QString logo;
    int skipped = 0;

    for (int i = 0; i < lines.size(); ++i) {
        // trimmed() also drops the '\r' of CRLF input
        const QString line = lines[i].trimmed();
        if (line.isEmpty()) continue;

        if (isDirective(line)) {
            if (hasPending) ++skipped;
            // Without a comma the whole directive becomes the name.
            int commaIdx = line.lastIndexOf(QLatin1Char(','));
            name = line.mid(commaIdx + 1).trimmed();
            if (name.length() > MAX_NAME_LEN) name = name.left(MAX_NAME_LEN);
            group = attribute(line, QStringLiteral("group-title"));
            if (group.isNull()) group = QLatin1String("");
            logo = attribute(line, QStringLiteral("tvg-logo"));
            hasPending = true;
        } else if (!line.startsWith(QLatin1Char('#'))) {
            if (!hasPending) {
                ++skipped;
                continue;
            }
            channels.append(Channel(name, group, logo, line));
            hasPending = false;
            name.clear();
            group.clear();
            logo = QString();
        }
    }

    if (hasPending) ++skipped;
    qCDebug(lcPlaylist) << "parsed" << channels.size() << "channels," << skipped << "unpaired lines skipped";
    return channels;
}
