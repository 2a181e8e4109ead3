#ifndef TVDECK_PLAYBACKENGINE_H
#define TVDECK_PLAYBACKENGINE_H

#include <QByteArray>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QPair>
#include <QString>

#include <functional>

typedef QList<QPair<QByteArray, QByteArray> > HttpHeaders;

HttpHeaders defaultHttpHeaders();

// Normalized lifecycle reported by an engine.
enum class EngineState {
    Opening,
    Buffering,
    Playing,
    Paused
};

// One handle of the external player. A controller allocates a fresh instance
// for every play intent and never reuses one after it failed.
class PlaybackEngine : public QObject {
    Q_OBJECT
public:
    explicit PlaybackEngine(QObject* parent = nullptr) : QObject(parent) {}
    ~PlaybackEngine() override {}

    // Asynchronous; answers with adaptiveResolved(). On success the manifest
    // is loaded as the engine's source.
    virtual void resolveAdaptive(const QString& url, const HttpHeaders& headers) = 0;

    // Loads url as a plain media resource. Returns false if the engine
    // refused the request outright.
    virtual bool openDirect(const QString& url, const HttpHeaders& headers) = 0;

    virtual void play() = 0;
    virtual void pause() = 0;

    // Drops the current source. The handle stays usable for attach/detach.
    virtual void releaseSource() = 0;
    virtual bool hasSource() const = 0;

    virtual void setVolume(int volume) = 0;
    virtual void setMuted(bool muted) = 0;

    // Object a VideoHost embeds to show this engine's picture.
    virtual QObject* renderTarget() const = 0;

signals:
    void adaptiveResolved(bool ok, const QString& detail);
    void opened();
    void stateChanged(EngineState state);
    void failed(int errorCode, const QString& message);
};

typedef std::function<PlaybackEngine*()> EngineFactory;

Q_DECLARE_METATYPE(EngineState)

#endif // TVDECK_PLAYBACKENGINE_H
