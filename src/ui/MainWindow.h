#ifndef TVDECK_MAINWINDOW_H
#define TVDECK_MAINWINDOW_H

#include "core/PlaybackState.h"
#include "core/PlaylistSlots.h"
#include "core/Surface.h"

#include <QMainWindow>

class ChannelDelegate;
class ChannelListModel;
class NetworkTextFetcher;
class OverlayPresenter;
class PlayerSession;
class QLabel;
class QLineEdit;
class QListView;
class QPushButton;
class QtSurfacePlatform;
class StatusIndicator;
class VideoHostWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    // Loads the given playlist, or the last one used when empty.
    void loadStartupSource(const QString& source);

    PlayerSession* session() const { return m_session; }

protected:
    void keyPressEvent(QKeyEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void closeEvent(QCloseEvent* event) override;
    bool eventFilter(QObject* obj, QEvent* event) override;

private slots:
    void onChannelActivated(const QModelIndex& index);
    void onPlaybackStateChanged(PlaybackState state);
    void onActiveSurfaceChanged(Surface surface);
    void openPlaylistUrl();
    void openPlaylistFile();

private:
    void setupUi();
    void applyTheme();
    void connectSession();
    void loadSettings();
    void saveSettings();
    void changeVolume(int delta);
    void toggleMute();
    void updateVolumeLabel();

    NetworkTextFetcher* m_fetcher;
    NetworkTextFetcher* m_probeFetcher;
    QtSurfacePlatform* m_platform;
    PlayerSession* m_session;
    PlaylistSlotList m_slots;

    QWidget* m_headerBar;
    QLineEdit* m_searchEdit;
    QLabel* m_channelHeader;
    QLabel* m_nowPlayingLabel;
    QLabel* m_volumeLabel;
    QPushButton* m_pauseBtn;
    QPushButton* m_muteBtn;
    QPushButton* m_floatingBtn;
    QPushButton* m_fullscreenBtn;
    StatusIndicator* m_statusIndicator;
    QListView* m_channelView;
    ChannelListModel* m_channelModel;
    ChannelDelegate* m_delegate;
    VideoHostWidget* m_videoHost;
    OverlayPresenter* m_overlays;
};

#endif // TVDECK_MAINWINDOW_H
