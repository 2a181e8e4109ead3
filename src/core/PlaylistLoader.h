#ifndef TVDECK_PLAYLISTLOADER_H
#define TVDECK_PLAYLISTLOADER_H

#include "core/AppError.h"
#include "core/Channel.h"

#include <QObject>
#include <QString>

class TextFetcher;

// Turns a playlist source (remote URL or local file) into a parsed channel
// list. Only the most recently started load may report a result.
class PlaylistLoader : public QObject {
    Q_OBJECT
public:
    explicit PlaylistLoader(TextFetcher* fetcher, QObject* parent = nullptr);

    // Returns the request id; a later call makes earlier ids stale.
    quint64 loadFromUrl(const QString& url, const QString& label = QString());
    bool loadFromFile(const QString& path);

    // http(s) URL or path to an existing file; anything else is a usage error.
    void loadFromSource(const QString& input);

    bool isLoading() const { return m_inFlight != 0; }
    quint64 currentRequest() const { return m_requestSerial; }

    static bool isRemoteSource(const QString& input);

signals:
    void loadStarted(const QString& source);
    void playlistLoaded(const ChannelList& channels, const QString& label, const QString& source);
    void loadFailed(const AppError& error);

private:
    void deliver(quint64 request, const QString& text, const QString& label, const QString& source);

    TextFetcher* m_fetcher;
    quint64 m_requestSerial;
    quint64 m_inFlight;
};

#endif // TVDECK_PLAYLISTLOADER_H
