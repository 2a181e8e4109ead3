#include "core/PlayerSession.h"
#include "core/Logging.h"
#include "core/PlaybackController.h"
#include "core/PlaylistLoader.h"
#include "core/SurfaceManager.h"

PlayerSession::PlayerSession(TextFetcher* fetcher, const EngineFactory& engineFactory,
                             SurfacePlatform* platform, QObject* parent)
    : QObject(parent),
      m_loader(new PlaylistLoader(fetcher, this)),
      m_playback(new PlaybackController(engineFactory, this)),
      m_surfaces(new SurfaceManager(platform, m_playback, this))
{
    connect(m_loader, &PlaylistLoader::playlistLoaded, this, &PlayerSession::onPlaylistLoaded);
    connect(m_loader, &PlaylistLoader::loadFailed, this, &PlayerSession::onError);
    connect(m_loader, &PlaylistLoader::loadStarted, this, [this](const QString&) {
        emit statusMessage(QStringLiteral("Loading playlist..."));
    });

    connect(m_playback, &PlaybackController::stateChanged, this, &PlayerSession::onPlaybackStateChanged);
    connect(m_playback, &PlaybackController::playbackFailed, this, &PlayerSession::onError);
    connect(m_playback, &PlaybackController::playbackOpened, this, [this]() {
        m_errorMessage.clear();
        recomputeOverlay();
    });
}

PlayerSession::~PlayerSession() {
    // Windows go before the engine they display.
    delete m_surfaces;
    m_surfaces = nullptr;
}

void PlayerSession::setFilter(const QString& query) {
    m_filterQuery = query;
    m_visible = m_catalog.filter(query);
    emit visibleChannelsChanged(m_visible);
    recomputeOverlay();
}

void PlayerSession::playChannel(const Channel& channel) {
    startPlayback(channel.streamUrl, channel.name);
}

void PlayerSession::playUrl(const QString& url) {
    startPlayback(url, url.trimmed());
}

void PlayerSession::startPlayback(const QString& url, const QString& displayName) {
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty()) return;
    m_currentChannelName = displayName;
    m_errorMessage.clear();
    emit statusMessage(QStringLiteral("Connecting: %1").arg(m_currentChannelName));
    m_playback->play(trimmed);
}

void PlayerSession::retry() {
    if (m_playback->currentUrl().isEmpty()) return;
    emit statusMessage(QStringLiteral("Retrying: %1").arg(m_currentChannelName));
    m_errorMessage.clear();
    m_playback->play(m_playback->currentUrl());
}

void PlayerSession::loadSlot(const PlaylistSlot& slot) {
    if (!slot.isConfigured()) {
        onError(AppError(AppError::Usage,
                         QStringLiteral("This playlist button isn't configured yet.\n"
                                        "Use Load Playlist to open a list.")));
        return;
    }
    loadSource(slot.streamUrl);
}

void PlayerSession::loadSource(const QString& source) {
    m_loader->loadFromSource(source);
}

void PlayerSession::showError(const QString& message) {
    m_errorMessage = message;
    recomputeOverlay();
}

void PlayerSession::dismissError() {
    if (m_errorMessage.isEmpty()) return;
    m_errorMessage.clear();
    recomputeOverlay();
}

void PlayerSession::onPlaylistLoaded(const ChannelList& channels, const QString& label, const QString& source) {
    m_catalog.replace(channels, label);
    m_lastSource = source;
    m_errorMessage.clear();
    emit catalogChanged(m_catalog.header());
    emit statusMessage(QStringLiteral("Loaded %1 channel%2")
                       .arg(channels.size()).arg(channels.size() != 1 ? "s" : ""));
    // A new list always starts unfiltered.
    setFilter(QString());
}

void PlayerSession::onPlaybackStateChanged(PlaybackState state) {
    switch (state) {
        case PlaybackState::Playing:
            m_errorMessage.clear();
            emit statusMessage(QStringLiteral("Playing: %1").arg(m_currentChannelName));
            break;
        case PlaybackState::Paused:
            emit statusMessage(QStringLiteral("Paused"));
            break;
        case PlaybackState::Failed:
            emit statusMessage(QStringLiteral("Channel unavailable: %1").arg(m_currentChannelName));
            break;
        default:
            break;
    }
    recomputeOverlay();
}

void PlayerSession::onError(const AppError& error) {
    if (!error.isUserVisible()) {
        qCDebug(lcPlayback) << "suppressed error:" << error.message;
        return;
    }
    if (error.kind == AppError::PlaylistFetch)
        emit statusMessage(QStringLiteral("Failed to load playlist - check connection"));
    showError(error.message);
}

void PlayerSession::recomputeOverlay() {
    OverlayInputs inputs;
    inputs.hasCatalog = !m_catalog.isEmpty();
    inputs.state = m_playback->state();
    inputs.everPlayed = m_playback->everPlayed();
    inputs.errorMessage = m_errorMessage;

    OverlayState next = computeOverlay(inputs);
    if (next == m_overlay) return;
    m_overlay = next;
    qCDebug(lcPlayback) << "overlay ->" << overlayKindName(m_overlay.kind);
    emit overlayChanged(m_overlay);
}
