#include "core/SurfaceManager.h"
#include "core/Logging.h"
#include "core/PlaybackController.h"
#include "core/PlaybackEngine.h"

#include <QTimer>

static const int FLOATING_WIDTH = 480;
static const int FLOATING_HEIGHT = 270;
static const int FLOATING_MARGIN = 12;
static const int RESUME_NUDGES = 3;
static const int RESUME_NUDGE_MS = 150;

const char* surfaceName(Surface surface) {
    switch (surface) {
        case Surface::Main: return "Main";
        case Surface::Fullscreen: return "Fullscreen";
        case Surface::Floating: return "Floating";
    }
    return "Unknown";
}

SurfaceManager::SurfaceManager(SurfacePlatform* platform, PlaybackController* playback, QObject* parent)
    : QObject(parent), m_platform(platform), m_playback(playback), m_active(Surface::Main),
      m_transitioning(false), m_nudgeAttempts(RESUME_NUDGES), m_nudgeIntervalMs(RESUME_NUDGE_MS),
      m_nudgesIssued(0)
{
    connect(m_playback, &PlaybackController::engineReplaced, this, &SurfaceManager::onEngineReplaced);
    if (m_playback->engine())
        m_platform->mainHost()->attachEngine(m_playback->engine());
}

SurfaceManager::~SurfaceManager() {
    if (m_window) m_window->dispose();
}

QRect SurfaceManager::floatingGeometry(const QRect& workArea) {
    // 16:9, bottom-right corner of the work area
    int x = qMax(workArea.x() + FLOATING_MARGIN, workArea.x() + workArea.width() - FLOATING_WIDTH - FLOATING_MARGIN);
    int y = qMax(workArea.y() + FLOATING_MARGIN, workArea.y() + workArea.height() - FLOATING_HEIGHT - FLOATING_MARGIN);
    return QRect(x, y, FLOATING_WIDTH, FLOATING_HEIGHT);
}

VideoHost* SurfaceManager::activeHost() const {
    if (m_active != Surface::Main && m_window) return m_window->host();
    return m_platform->mainHost();
}

void SurfaceManager::setResumeNudges(int attempts, int intervalMs) {
    m_nudgeAttempts = qMax(0, attempts);
    m_nudgeIntervalMs = qMax(0, intervalMs);
}

bool SurfaceManager::enterFullscreen() { return enterSecondary(Surface::Fullscreen); }
void SurfaceManager::exitFullscreen() { exitSurface(Surface::Fullscreen); }
bool SurfaceManager::enterFloating() { return enterSecondary(Surface::Floating); }
void SurfaceManager::exitFloating() { exitSurface(Surface::Floating); }

void SurfaceManager::toggleFullscreen() {
    if (m_active == Surface::Fullscreen) exitFullscreen();
    else enterFullscreen();
}

void SurfaceManager::toggleFloating() {
    if (m_active == Surface::Floating) exitFloating();
    else enterFloating();
}

void SurfaceManager::exitSecondary() {
    if (m_active != Surface::Main) exitSurface(m_active);
}

bool SurfaceManager::enterSecondary(Surface target) {
    if (m_active == target || m_transitioning) return false;

    // One secondary at a time.
    if (m_active != Surface::Main && !exitSurface(m_active)) return false;

    m_transitioning = true;

    // Resolve the display before anything visible changes.
    const QRect geometry = target == Surface::Fullscreen
        ? m_platform->mainDisplayBounds()
        : floatingGeometry(m_platform->mainDisplayWorkArea());

    SurfaceWindow* window = m_platform->createSurfaceWindow(target, geometry);
    if (!window) {
        qCWarning(lcSurface) << "could not create" << surfaceName(target) << "window";
        m_transitioning = false;
        return false;
    }

    VideoHost* mainHost = m_platform->mainHost();
    PlaybackEngine* engine = m_playback->engine();
    if (engine) {
        if (!window->host()->attachEngine(engine)) {
            qCWarning(lcSurface) << "attach to" << surfaceName(target) << "failed, staying on Main";
            window->dispose();
            m_transitioning = false;
            return false;
        }
        mainHost->releaseEngine();
    }

    m_window = window;
    connect(window, &SurfaceWindow::closeRequested, this, [this, target]() {
        exitSurface(target);
    }, Qt::QueuedConnection);

    window->present();
    m_platform->saveMainGeometry();
    window->setShownInSwitchers(true);
    m_platform->setMainShownInSwitchers(false);
    m_platform->hideMainWindow();

    m_active = target;
    m_transitioning = false;
    qCInfo(lcSurface) << "entered" << surfaceName(target);
    emit activeSurfaceChanged(m_active);
    return true;
}

bool SurfaceManager::exitSurface(Surface surface) {
    // Every close path lands here; only the first one does any work.
    if (surface == Surface::Main || m_active != surface || m_transitioning) return false;
    m_transitioning = true;

    const bool wasPlaying = m_playback->state() == PlaybackState::Playing;
    PlaybackEngine* engine = m_playback->engine();
    if (engine && !m_platform->mainHost()->attachEngine(engine)) {
        // The secondary keeps the engine until Main can take it.
        qCWarning(lcSurface) << "reattach to Main failed, staying on" << surfaceName(surface);
        m_transitioning = false;
        return false;
    }

    SurfaceWindow* window = m_window;
    m_window = nullptr;
    if (window) {
        window->host()->releaseEngine();
        disconnect(window, nullptr, this, nullptr);
        window->dispose();
    }

    m_active = Surface::Main;
    m_platform->setMainShownInSwitchers(true);
    m_platform->restoreMainWindow();
    m_platform->restoreMainGeometry();
    m_transitioning = false;

    qCInfo(lcSurface) << "left" << surfaceName(surface);
    emit activeSurfaceChanged(m_active);

    if (wasPlaying && engine && m_playback->state() != PlaybackState::Playing)
        scheduleResumeNudge(m_playback->generation(), m_nudgeAttempts);
    return true;
}

void SurfaceManager::scheduleResumeNudge(quint64 generation, int remaining) {
    if (remaining <= 0) return;
    QPointer<SurfaceManager> self(this);
    QTimer::singleShot(m_nudgeIntervalMs, this, [self, generation, remaining]() {
        if (!self) return;
        PlaybackController* playback = self->m_playback;
        // A new play intent or a settled engine ends the nudging.
        if (playback->generation() != generation) return;
        if (playback->state() == PlaybackState::Playing) return;
        if (playback->state() == PlaybackState::Failed) return;
        ++self->m_nudgesIssued;
        qCDebug(lcSurface) << "resume nudge," << remaining - 1 << "left";
        playback->resume();
        self->scheduleResumeNudge(generation, remaining - 1);
    });
}

void SurfaceManager::onEngineReplaced(PlaybackEngine* engine) {
    VideoHost* host = activeHost();
    if (!host->attachEngine(engine))
        qCWarning(lcSurface) << "could not attach new engine to" << surfaceName(m_active);
}
