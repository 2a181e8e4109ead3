#ifndef TVDECK_PLAYERSESSION_H
#define TVDECK_PLAYERSESSION_H

#include "core/AppError.h"
#include "core/ChannelCatalog.h"
#include "core/OverlayState.h"
#include "core/PlaybackEngine.h"
#include "core/PlaylistSlots.h"
#include "core/Surface.h"

#include <QObject>
#include <QString>

class PlaybackController;
class PlaylistLoader;
class SurfaceManager;
class TextFetcher;

// Everything one viewing session shares: the catalog, the playback
// controller, the surface manager and the explicit error. It is the single
// place that recomputes the overlay.
class PlayerSession : public QObject {
    Q_OBJECT
public:
    PlayerSession(TextFetcher* fetcher, const EngineFactory& engineFactory,
                  SurfacePlatform* platform, QObject* parent = nullptr);
    ~PlayerSession() override;

    const ChannelCatalog& catalog() const { return m_catalog; }
    PlaylistLoader* loader() const { return m_loader; }
    PlaybackController* playback() const { return m_playback; }
    SurfaceManager* surfaces() const { return m_surfaces; }

    OverlayState overlay() const { return m_overlay; }
    QString errorMessage() const { return m_errorMessage; }

    QString filterQuery() const { return m_filterQuery; }
    ChannelList visibleChannels() const { return m_visible; }
    void setFilter(const QString& query);

    void playChannel(const Channel& channel);
    void playUrl(const QString& url);
    void retry();

    void loadSlot(const PlaylistSlot& slot);
    void loadSource(const QString& source);

    void showError(const QString& message);
    void dismissError();

    QString currentChannelName() const { return m_currentChannelName; }
    QString lastSource() const { return m_lastSource; }

signals:
    void overlayChanged(const OverlayState& overlay);
    void catalogChanged(const QString& header);
    void visibleChannelsChanged(const ChannelList& channels);
    void statusMessage(const QString& message);

private:
    void startPlayback(const QString& url, const QString& displayName);
    void onPlaylistLoaded(const ChannelList& channels, const QString& label, const QString& source);
    void onPlaybackStateChanged(PlaybackState state);
    void onError(const AppError& error);
    void recomputeOverlay();

    ChannelCatalog m_catalog;
    PlaylistLoader* m_loader;
    PlaybackController* m_playback;
    SurfaceManager* m_surfaces;

    QString m_errorMessage;
    QString m_filterQuery;
    ChannelList m_visible;
    OverlayState m_overlay;
    QString m_currentChannelName;
    QString m_lastSource;
};

#endif // TVDECK_PLAYERSESSION_H
