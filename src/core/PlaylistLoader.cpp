#include "core/PlaylistLoader.h"
#include "core/ChannelCatalog.h"
#include "core/Logging.h"
#include "core/PlaylistParser.h"
#include "core/TextFetcher.h"

#include <QFile>
#include <QFileInfo>
#include <QPointer>
#include <QUrl>

PlaylistLoader::PlaylistLoader(TextFetcher* fetcher, QObject* parent)
    : QObject(parent), m_fetcher(fetcher), m_requestSerial(0), m_inFlight(0) {}

bool PlaylistLoader::isRemoteSource(const QString& input) {
    QUrl u(input.trimmed(), QUrl::StrictMode);
    if (!u.isValid() || u.host().isEmpty()) return false;
    return u.scheme() == QLatin1String("http") || u.scheme() == QLatin1String("https");
}

quint64 PlaylistLoader::loadFromUrl(const QString& url, const QString& label) {
    const quint64 request = ++m_requestSerial;
    m_inFlight = request;
    const QString source = url.trimmed();
    const QString name = label.isEmpty() ? ChannelCatalog::labelFromUrl(source) : label;

    qCInfo(lcPlaylist) << "loading playlist" << source << "request" << request;
    emit loadStarted(source);

    QPointer<PlaylistLoader> self(this);
    m_fetcher->fetchText(QUrl(source), defaultHttpHeaders(),
        [self, request, name, source](const QString& text) {
            if (!self) return;
            self->deliver(request, text, name, source);
        },
        [self, request, source](const QString& message) {
            if (!self) return;
            if (request != self->m_requestSerial) {
                qCDebug(lcPlaylist) << "discarding failure of superseded request" << request;
                return;
            }
            self->m_inFlight = 0;
            emit self->loadFailed(AppError(AppError::PlaylistFetch,
                                           QStringLiteral("Failed to load playlist.\n%1").arg(message)));
        });
    return request;
}

void PlaylistLoader::deliver(quint64 request, const QString& text, const QString& label, const QString& source) {
    if (request != m_requestSerial) {
        qCDebug(lcPlaylist) << "discarding result of superseded request" << request
                            << "current" << m_requestSerial;
        return;
    }
    m_inFlight = 0;
    ChannelList channels = PlaylistParser::parse(text);
    qCInfo(lcPlaylist) << "loaded" << channels.size() << "channels from" << source;
    emit playlistLoaded(channels, label, source);
}

bool PlaylistLoader::loadFromFile(const QString& path) {
    // A local load supersedes any fetch still running, even when it fails.
    const quint64 request = ++m_requestSerial;
    m_inFlight = 0;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcPlaylist) << "cannot open" << path << file.errorString();
        emit loadFailed(AppError(AppError::PlaylistFetch,
                                 QStringLiteral("Failed to load playlist.\n%1").arg(file.errorString())));
        return false;
    }
    m_inFlight = request;
    emit loadStarted(path);
    deliver(request, QString::fromUtf8(file.readAll()), ChannelCatalog::labelFromPath(path), path);
    return true;
}

void PlaylistLoader::loadFromSource(const QString& input) {
    const QString trimmed = input.trimmed();
    if (isRemoteSource(trimmed)) {
        loadFromUrl(trimmed);
        return;
    }
    if (!trimmed.isEmpty() && QFileInfo(trimmed).isFile()) {
        loadFromFile(trimmed);
        return;
    }
    ++m_requestSerial;
    m_inFlight = 0;
    emit loadFailed(AppError(AppError::Usage,
                             QStringLiteral("Not a valid URL or path to a .m3u/.m3u8 file.")));
}
