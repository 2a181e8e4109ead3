#include "core/PlaybackController.h"
#include "core/Logging.h"

static const int DEFAULT_VOLUME = 50;

PlaybackController::PlaybackController(const EngineFactory& factory, QObject* parent)
    : QObject(parent), m_factory(factory), m_state(PlaybackState::Idle),
      m_generation(0), m_everPlayed(false), m_volume(DEFAULT_VOLUME), m_muted(false) {}

PlaybackController::~PlaybackController() {
    if (m_engine) {
        disconnect(m_engine, nullptr, this, nullptr);
        delete m_engine.data();
    }
}

bool PlaybackController::isCurrent(quint64 generation) const {
    return generation == m_generation;
}

quint64 PlaybackController::play(const QString& url, const HttpHeaders& headers) {
    const quint64 generation = ++m_generation;
    m_currentUrl = url;
    m_currentHeaders = headers;

    PlaybackEngine* previous = m_engine;
    PlaybackEngine* fresh = m_factory ? m_factory() : nullptr;
    if (!fresh) {
        qCWarning(lcPlayback) << "engine factory produced no handle";
        m_engine = nullptr;
        applyEvent(PlaybackEvent::PlayRequested);
        if (previous) releaseEngine(previous);
        fail(QStringLiteral("Play failed.\nPlayback engine unavailable."));
        return generation;
    }

    fresh->setParent(this);
    fresh->setVolume(m_volume);
    fresh->setMuted(m_muted);
    m_engine = fresh;
    connectEngine(fresh, generation);

    qCInfo(lcPlayback) << "play" << url << "generation" << generation;
    applyEvent(PlaybackEvent::PlayRequested);

    // New handle is attached first, the old one goes afterwards.
    emit engineReplaced(fresh);
    if (previous) releaseEngine(previous);

    fresh->resolveAdaptive(url, headers);
    return generation;
}

void PlaybackController::connectEngine(PlaybackEngine* engine, quint64 generation) {
    connect(engine, &PlaybackEngine::adaptiveResolved, this, [this, generation](bool ok, const QString& detail) {
        onAdaptiveResolved(generation, ok, detail);
    });
    connect(engine, &PlaybackEngine::opened, this, [this, generation]() {
        onEngineOpened(generation);
    });
    connect(engine, &PlaybackEngine::stateChanged, this, [this, generation](EngineState state) {
        onEngineStateChanged(generation, state);
    });
    connect(engine, &PlaybackEngine::failed, this, [this, generation](int code, const QString& message) {
        onEngineFailed(generation, code, message);
    });
}

void PlaybackController::releaseEngine(PlaybackEngine* engine) {
    // Late callbacks from this handle are rejected by the generation check
    // until the deferred delete drops the connections.
    engine->releaseSource();
    engine->deleteLater();
}

bool PlaybackController::applyEvent(PlaybackEvent event) {
    PlaybackState next;
    if (!nextPlaybackState(m_state, event, &next)) {
        qCDebug(lcPlayback) << "ignoring" << playbackEventName(event) << "in" << playbackStateName(m_state);
        return false;
    }
    const PlaybackState previous = m_state;
    m_state = next;
    if (next == PlaybackState::Playing && previous != PlaybackState::Paused)
        m_everPlayed = true;
    qCDebug(lcPlayback) << playbackStateName(previous) << "->" << playbackStateName(next)
                        << "on" << playbackEventName(event);
    if (previous != next || event == PlaybackEvent::PlayRequested)
        emit stateChanged(m_state);
    return true;
}

void PlaybackController::onAdaptiveResolved(quint64 generation, bool ok, const QString& detail) {
    if (!isCurrent(generation)) {
        qCDebug(lcPlayback) << "discarding stale resolution of generation" << generation
                            << "current" << m_generation;
        return;
    }
    if (!m_engine) return;

    if (!ok) {
        // Not surfaced: the direct open below decides success or failure.
        qCDebug(lcPlayback) << "adaptive resolution failed:" << detail << "- opening directly";
        if (!m_engine->openDirect(m_currentUrl, m_currentHeaders)) {
            fail(QStringLiteral("Play failed.\nThe stream could not be opened."));
            return;
        }
    }
    m_engine->play();
}

void PlaybackController::onEngineOpened(quint64 generation) {
    if (!isCurrent(generation)) return;
    qCInfo(lcPlayback) << "opened" << m_currentUrl;
    emit playbackOpened();
}

void PlaybackController::onEngineStateChanged(quint64 generation, EngineState state) {
    if (!isCurrent(generation)) {
        qCDebug(lcPlayback) << "discarding state change from stale generation" << generation;
        return;
    }
    switch (state) {
        case EngineState::Opening:
        case EngineState::Buffering:
            applyEvent(PlaybackEvent::EngineBuffering);
            break;
        case EngineState::Playing:
            applyEvent(PlaybackEvent::EnginePlaying);
            break;
        case EngineState::Paused:
            applyEvent(PlaybackEvent::EnginePaused);
            break;
    }
}

void PlaybackController::onEngineFailed(quint64 generation, int errorCode, const QString& message) {
    if (!isCurrent(generation)) {
        qCDebug(lcPlayback) << "discarding failure from stale generation" << generation;
        return;
    }
    qCWarning(lcPlayback) << "playback failed:" << message << "code" << errorCode;
    fail(QStringLiteral("%1 (%2)").arg(message).arg(errorCode));
}

void PlaybackController::fail(const QString& message) {
    if (m_engine) m_engine->releaseSource();
    // Error first, so observers of the state change already see it.
    emit playbackFailed(AppError(AppError::PlaybackFailure, message));
    applyEvent(PlaybackEvent::EngineFailed);
}

void PlaybackController::pause() {
    if (m_engine && m_state == PlaybackState::Playing) m_engine->pause();
}

void PlaybackController::resume() {
    if (m_engine && m_engine->hasSource()) m_engine->play();
}

void PlaybackController::togglePause() {
    if (m_state == PlaybackState::Playing) pause();
    else resume();
}

void PlaybackController::setVolume(int volume) {
    m_volume = qBound(0, volume, 100);
    if (m_engine) m_engine->setVolume(m_volume);
}

void PlaybackController::setMuted(bool muted) {
    m_muted = muted;
    if (m_engine) m_engine->setMuted(m_muted);
}
