#ifndef TVDECK_MPVPLAYBACKENGINE_H
#define TVDECK_MPVPLAYBACKENGINE_H

#include "core/PlaybackEngine.h"

#include <QPointer>

struct mpv_handle;
class TextFetcher;
class VideoWidget;

// One libmpv instance rendering into its own native VideoWidget. mpv is
// initialized lazily, once the widget sits inside a host window.
class MpvPlaybackEngine : public PlaybackEngine {
    Q_OBJECT
public:
    explicit MpvPlaybackEngine(TextFetcher* fetcher, QObject* parent = nullptr);
    ~MpvPlaybackEngine() override;

    void resolveAdaptive(const QString& url, const HttpHeaders& headers) override;
    bool openDirect(const QString& url, const HttpHeaders& headers) override;
    void play() override;
    void pause() override;
    void releaseSource() override;
    bool hasSource() const override { return m_hasSource; }
    void setVolume(int volume) override;
    void setMuted(bool muted) override;
    QObject* renderTarget() const override;

private slots:
    void onMpvWakeup();

private:
    bool ensureInitialized();
    bool loadFile(const QString& url, const HttpHeaders& headers);
    void applyHeaders(const HttpHeaders& headers);
    void setPauseFlag(bool paused);
    void publishState();

    mpv_handle* m_mpv;
    bool m_initialized;
    TextFetcher* m_fetcher;
    QPointer<VideoWidget> m_video;

    bool m_hasSource;
    bool m_loaded;
    bool m_paused;
    bool m_cacheStalled;
    bool m_haveState;
    EngineState m_lastState;
    int m_volume;
    bool m_muted;
};

#endif // TVDECK_MPVPLAYBACKENGINE_H
