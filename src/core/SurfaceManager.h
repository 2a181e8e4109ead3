#ifndef TVDECK_SURFACEMANAGER_H
#define TVDECK_SURFACEMANAGER_H

#include "core/Surface.h"

#include <QObject>
#include <QPointer>
#include <QRect>

class PlaybackController;
class PlaybackEngine;

// Decides which surface holds the live engine. Ownership always moves
// attach-new-then-release-old, and at most one secondary window exists.
class SurfaceManager : public QObject {
    Q_OBJECT
public:
    SurfaceManager(SurfacePlatform* platform, PlaybackController* playback, QObject* parent = nullptr);
    ~SurfaceManager() override;

    Surface activeSurface() const { return m_active; }
    bool isActive(Surface surface) const { return m_active == surface; }

    bool enterFullscreen();
    void exitFullscreen();
    void toggleFullscreen();

    bool enterFloating();
    void exitFloating();
    void toggleFloating();

    // Leaves whichever secondary surface is active; no-op on Main.
    void exitSecondary();

    VideoHost* activeHost() const;

    void setResumeNudges(int attempts, int intervalMs);
    int resumeNudgesIssued() const { return m_nudgesIssued; }

    static QRect floatingGeometry(const QRect& workArea);

signals:
    void activeSurfaceChanged(Surface surface);

private:
    bool enterSecondary(Surface target);
    bool exitSurface(Surface surface);
    void onEngineReplaced(PlaybackEngine* engine);
    void scheduleResumeNudge(quint64 generation, int remaining);

    SurfacePlatform* m_platform;
    PlaybackController* m_playback;
    QPointer<SurfaceWindow> m_window;
    Surface m_active;
    bool m_transitioning;
    int m_nudgeAttempts;
    int m_nudgeIntervalMs;
    int m_nudgesIssued;
};

#endif // TVDECK_SURFACEMANAGER_H
