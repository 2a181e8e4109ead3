#ifndef TVDECK_PLAYBACKCONTROLLER_H
#define TVDECK_PLAYBACKCONTROLLER_H

#include "core/AppError.h"
#include "core/PlaybackEngine.h"
#include "core/PlaybackState.h"

#include <QObject>
#include <QPointer>
#include <QString>

// Owns the engine handle of the current play intent and the playback state
// machine. Engine callbacks only submit events; every state change goes
// through applyEvent() and the transition table.
class PlaybackController : public QObject {
    Q_OBJECT
public:
    explicit PlaybackController(const EngineFactory& factory, QObject* parent = nullptr);
    ~PlaybackController() override;

    // Starts a new play intent and returns its generation id.
    quint64 play(const QString& url, const HttpHeaders& headers = defaultHttpHeaders());

    void pause();
    void resume();
    void togglePause();

    void setVolume(int volume);
    int volume() const { return m_volume; }
    void setMuted(bool muted);
    bool isMuted() const { return m_muted; }

    PlaybackState state() const { return m_state; }
    quint64 generation() const { return m_generation; }
    bool everPlayed() const { return m_everPlayed; }
    QString currentUrl() const { return m_currentUrl; }
    PlaybackEngine* engine() const { return m_engine; }

signals:
    // Emitted with the fresh handle before the previous one is released.
    void engineReplaced(PlaybackEngine* engine);
    void stateChanged(PlaybackState state);
    void playbackOpened();
    void playbackFailed(const AppError& error);

private:
    bool isCurrent(quint64 generation) const;
    bool applyEvent(PlaybackEvent event);
    void connectEngine(PlaybackEngine* engine, quint64 generation);
    void releaseEngine(PlaybackEngine* engine);

    void onAdaptiveResolved(quint64 generation, bool ok, const QString& detail);
    void onEngineOpened(quint64 generation);
    void onEngineStateChanged(quint64 generation, EngineState state);
    void onEngineFailed(quint64 generation, int errorCode, const QString& message);
    void fail(const QString& message);

    EngineFactory m_factory;
    QPointer<PlaybackEngine> m_engine;
    PlaybackState m_state;
    quint64 m_generation;
    bool m_everPlayed;
    QString m_currentUrl;
    HttpHeaders m_currentHeaders;
    int m_volume;
    bool m_muted;
};

#endif // TVDECK_PLAYBACKCONTROLLER_H
