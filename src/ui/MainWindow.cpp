#include "ui/MainWindow.h"
#include "ui/ChannelListModel.h"
#include "ui/MpvPlaybackEngine.h"
#include "ui/OverlayWidgets.h"
#include "ui/QtSurfacePlatform.h"
#include "ui/StatusIndicator.h"
#include "ui/VideoHostWidget.h"
#include "core/Logging.h"
#include "core/NetworkTextFetcher.h"
#include "core/PlaybackController.h"
#include "core/PlayerSession.h"
#include "core/SurfaceManager.h"

#include <QApplication>
#include <QCloseEvent>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QInputDialog>
#include <QKeyEvent>
#include <QLabel>
#include <QLineEdit>
#include <QListView>
#include <QMenu>
#include <QPushButton>
#include <QSettings>
#include <QSplitter>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>

static const int PROBE_TIMEOUT_MS = 8000;
static const qint64 PROBE_MAX_BYTES = 512 * 1024;
static const int VOLUME_STEP = 5;
static const int STARTUP_LOAD_DELAY_MS = 200;

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent),
    m_fetcher(NULL), m_probeFetcher(NULL), m_platform(NULL), m_session(NULL),
    m_headerBar(NULL), m_searchEdit(NULL), m_channelHeader(NULL),
    m_nowPlayingLabel(NULL), m_volumeLabel(NULL), m_pauseBtn(NULL), m_muteBtn(NULL),
    m_floatingBtn(NULL), m_fullscreenBtn(NULL), m_statusIndicator(NULL),
    m_channelView(NULL), m_channelModel(NULL), m_delegate(NULL),
    m_videoHost(NULL), m_overlays(NULL)
{
    setWindowTitle("tvdeck");
    resize(1280, 720);
    setMinimumSize(900, 550);

    m_fetcher = new NetworkTextFetcher(this);

    // Manifest probes only need the head of the response.
    m_probeFetcher = new NetworkTextFetcher(this);
    m_probeFetcher->setTimeout(PROBE_TIMEOUT_MS);
    m_probeFetcher->setMaxBytes(PROBE_MAX_BYTES);

    m_slots = PlaylistSlots::load(PlaylistSlots::defaultConfigPath());

    setupUi();

    m_platform = new QtSurfacePlatform(this, m_videoHost);
    NetworkTextFetcher* probe = m_probeFetcher;
    m_session = new PlayerSession(m_fetcher, [probe]() -> PlaybackEngine* {
        return new MpvPlaybackEngine(probe);
    }, m_platform, this);

    connectSession();
    loadSettings();
    applyTheme();
    m_overlays->apply(m_session->overlay());
}

MainWindow::~MainWindow() {
    saveSettings();
    // Secondary windows and engines must go while the hosts still exist.
    delete m_session;
    m_session = NULL;
    delete m_platform;
    m_platform = NULL;
}

void MainWindow::loadStartupSource(const QString& source) {
    QString input = source.trimmed();
    if (input.isEmpty()) input = QSettings().value("lastSource").toString();
    if (input.isEmpty()) {
        statusBar()->showMessage("Ready - pick a playlist to start");
        return;
    }
    QTimer::singleShot(STARTUP_LOAD_DELAY_MS, this, [this, input]() {
        if (m_session) m_session->loadSource(input);
    });
}

// ─── Events ──────────────────────────────────────────────────────

void MainWindow::keyPressEvent(QKeyEvent* event) {
    SurfaceManager* surfaces = m_session->surfaces();
    switch (event->key()) {
        case Qt::Key_Space:
            m_session->playback()->togglePause();
            break;
        case Qt::Key_Up:
            changeVolume(VOLUME_STEP);
            break;
        case Qt::Key_Down:
            changeVolume(-VOLUME_STEP);
            break;
        case Qt::Key_M:
            toggleMute();
            break;
        case Qt::Key_F:
        case Qt::Key_F11:
            surfaces->toggleFullscreen();
            break;
        case Qt::Key_P:
            surfaces->toggleFloating();
            break;
        case Qt::Key_Escape:
            if (surfaces->activeSurface() != Surface::Main) surfaces->exitSecondary();
            else m_session->dismissError();
            break;
        default:
            QMainWindow::keyPressEvent(event);
    }
}

void MainWindow::resizeEvent(QResizeEvent* event) {
    QMainWindow::resizeEvent(event);
    if (m_overlays) m_overlays->updateGeometry();
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (m_session) m_session->surfaces()->exitSecondary();
    saveSettings();
    QMainWindow::closeEvent(event);
}

bool MainWindow::eventFilter(QObject* obj, QEvent* event) {
    if (obj == m_searchEdit && event->type() == QEvent::KeyPress) {
        QKeyEvent* ke = static_cast<QKeyEvent*>(event);
        switch (ke->key()) {
            case Qt::Key_Return:
            case Qt::Key_Enter:
            case Qt::Key_Down:
                if (m_channelModel->rowCount() > 0) {
                    m_channelView->setFocus();
                    m_channelView->setCurrentIndex(m_channelModel->index(0, 0));
                }
                return true;
            case Qt::Key_Escape:
                m_searchEdit->clear();
                return true;
            default:
                break;
        }
    }
    if (obj == m_videoHost && event->type() == QEvent::Resize && m_overlays)
        m_overlays->updateGeometry();
    return QMainWindow::eventFilter(obj, event);
}

// ─── Slots ───────────────────────────────────────────────────────

void MainWindow::onChannelActivated(const QModelIndex& index) {
    if (!index.isValid()) return;
    Channel channel = m_channelModel->channelAt(index.row());
    if (channel.streamUrl.isEmpty()) return;
    m_session->playChannel(channel);
    m_nowPlayingLabel->setText("  > " + channel.name);
    m_delegate->setActiveChannel(channel.streamUrl);
    m_channelView->viewport()->update();
}

void MainWindow::onPlaybackStateChanged(PlaybackState state) {
    m_statusIndicator->setPlaybackState(state);
    m_pauseBtn->setText(state == PlaybackState::Paused ? "Play" : "Pause");
}

void MainWindow::onActiveSurfaceChanged(Surface surface) {
    m_fullscreenBtn->setText(surface == Surface::Fullscreen ? "Exit FS" : "Fullscreen");
    m_floatingBtn->setText(surface == Surface::Floating ? "Dock" : "Float");
    qCDebug(lcSurface) << "main window sees surface" << surfaceName(surface);
}

void MainWindow::openPlaylistUrl() {
    bool ok = false;
    QString url = QInputDialog::getText(this, "Load Playlist", "Playlist URL (.m3u / .m3u8):",
                                        QLineEdit::Normal, QString(), &ok);
    if (!ok || url.trimmed().isEmpty()) return;
    m_session->loadSource(url.trimmed());
}

void MainWindow::openPlaylistFile() {
    QString path = QFileDialog::getOpenFileName(this, "Open Playlist", QString(),
                                                "Playlists (*.m3u *.m3u8);;All files (*)");
    if (path.isEmpty()) return;
    m_session->loadSource(path);
}

// ─── Setup ───────────────────────────────────────────────────────

void MainWindow::setupUi() {
    QWidget* central = new QWidget(this);
    setCentralWidget(central);
    QVBoxLayout* rootLayout = new QVBoxLayout(central);
    rootLayout->setContentsMargins(0, 0, 0, 0);
    rootLayout->setSpacing(0);

    // ── Header Bar ──
    m_headerBar = new QWidget(central);
    m_headerBar->setFixedHeight(54);
    m_headerBar->setObjectName("headerBar");
    QHBoxLayout* headerLayout = new QHBoxLayout(m_headerBar);
    headerLayout->setContentsMargins(16, 0, 16, 0);
    headerLayout->setSpacing(10);

    QLabel* appTitle = new QLabel("TVDECK", m_headerBar);
    appTitle->setObjectName("appTitle");
    headerLayout->addWidget(appTitle);
    headerLayout->addSpacing(8);

    for (int i = 0; i < m_slots.size(); ++i) {
        const PlaylistSlot slot = m_slots[i];
        QPushButton* btn = new QPushButton(slot.glyph, m_headerBar);
        btn->setObjectName("slotBtn");
        btn->setFixedSize(36, 32);
        btn->setToolTip(slot.isConfigured() ? slot.streamUrl : QString("Not configured"));
        connect(btn, &QPushButton::clicked, this, [this, slot]() { m_session->loadSlot(slot); });
        headerLayout->addWidget(btn);
    }

    QPushButton* loadBtn = new QPushButton("Load Playlist", m_headerBar);
    loadBtn->setObjectName("headerBtn");
    loadBtn->setFixedHeight(32);
    QMenu* loadMenu = new QMenu(loadBtn);
    loadMenu->addAction("Open URL...", this, &MainWindow::openPlaylistUrl);
    loadMenu->addAction("Open File...", this, &MainWindow::openPlaylistFile);
    loadBtn->setMenu(loadMenu);
    headerLayout->addWidget(loadBtn);

    headerLayout->addSpacing(8);

    m_searchEdit = new QLineEdit(m_headerBar);
    m_searchEdit->setPlaceholderText("Search channels...");
    m_searchEdit->setObjectName("searchEdit");
    m_searchEdit->setMaximumWidth(300);
    m_searchEdit->setMinimumWidth(160);
    m_searchEdit->setClearButtonEnabled(true);
    m_searchEdit->installEventFilter(this);
    headerLayout->addWidget(m_searchEdit);

    headerLayout->addStretch();

    m_nowPlayingLabel = new QLabel("No channel selected", m_headerBar);
    m_nowPlayingLabel->setObjectName("nowPlaying");
    m_nowPlayingLabel->setMaximumWidth(260);
    headerLayout->addWidget(m_nowPlayingLabel);

    headerLayout->addStretch();

    m_statusIndicator = new StatusIndicator(m_headerBar);
    headerLayout->addWidget(m_statusIndicator);

    m_pauseBtn = new QPushButton("Pause", m_headerBar);
    m_pauseBtn->setObjectName("headerBtn");
    m_pauseBtn->setFixedSize(54, 32);
    m_pauseBtn->setToolTip("Play / Pause (Space)");
    connect(m_pauseBtn, &QPushButton::clicked, this, [this]() { m_session->playback()->togglePause(); });
    headerLayout->addWidget(m_pauseBtn);

    QPushButton* volDown = new QPushButton("Vol -", m_headerBar);
    volDown->setObjectName("headerBtn");
    volDown->setFixedSize(48, 32);
    volDown->setToolTip("Volume Down (Down Arrow)");
    connect(volDown, &QPushButton::clicked, this, [this]() { changeVolume(-VOLUME_STEP); });
    headerLayout->addWidget(volDown);

    m_volumeLabel = new QLabel("50%", m_headerBar);
    m_volumeLabel->setObjectName("volumeLabel");
    m_volumeLabel->setFixedWidth(44);
    m_volumeLabel->setAlignment(Qt::AlignCenter);
    headerLayout->addWidget(m_volumeLabel);

    QPushButton* volUp = new QPushButton("Vol +", m_headerBar);
    volUp->setObjectName("headerBtn");
    volUp->setFixedSize(48, 32);
    volUp->setToolTip("Volume Up (Up Arrow)");
    connect(volUp, &QPushButton::clicked, this, [this]() { changeVolume(VOLUME_STEP); });
    headerLayout->addWidget(volUp);

    m_muteBtn = new QPushButton("Mute", m_headerBar);
    m_muteBtn->setObjectName("headerBtn");
    m_muteBtn->setFixedSize(54, 32);
    m_muteBtn->setToolTip("Toggle Mute (M)");
    connect(m_muteBtn, &QPushButton::clicked, this, [this]() { toggleMute(); });
    headerLayout->addWidget(m_muteBtn);

    m_floatingBtn = new QPushButton("Float", m_headerBar);
    m_floatingBtn->setObjectName("headerBtn");
    m_floatingBtn->setFixedHeight(32);
    m_floatingBtn->setToolTip("Floating window (P)");
    connect(m_floatingBtn, &QPushButton::clicked, this, [this]() { m_session->surfaces()->toggleFloating(); });
    headerLayout->addWidget(m_floatingBtn);

    m_fullscreenBtn = new QPushButton("Fullscreen", m_headerBar);
    m_fullscreenBtn->setObjectName("headerBtn");
    m_fullscreenBtn->setFixedHeight(32);
    m_fullscreenBtn->setToolTip("Fullscreen (F / double-click)");
    connect(m_fullscreenBtn, &QPushButton::clicked, this, [this]() { m_session->surfaces()->toggleFullscreen(); });
    headerLayout->addWidget(m_fullscreenBtn);

    rootLayout->addWidget(m_headerBar);

    // ── Main Content ──
    QSplitter* splitter = new QSplitter(Qt::Horizontal, central);
    splitter->setObjectName("mainSplitter");
    splitter->setHandleWidth(1);

    QWidget* leftPanel = new QWidget(splitter);
    leftPanel->setObjectName("leftPanel");
    leftPanel->setMinimumWidth(220);
    QVBoxLayout* leftLayout = new QVBoxLayout(leftPanel);
    leftLayout->setContentsMargins(8, 12, 6, 8);
    leftLayout->setSpacing(8);

    m_channelHeader = new QLabel("Channels", leftPanel);
    m_channelHeader->setObjectName("sectionTitle");
    leftLayout->addWidget(m_channelHeader);

    m_channelModel = new ChannelListModel(this);
    m_delegate = new ChannelDelegate(this);
    m_channelView = new QListView(leftPanel);
    m_channelView->setObjectName("channelList");
    m_channelView->setModel(m_channelModel);
    m_channelView->setItemDelegate(m_delegate);
    m_channelView->setUniformItemSizes(true);
    m_channelView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_channelView->setVerticalScrollMode(QAbstractItemView::ScrollPerPixel);
    m_channelView->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    m_channelView->setMouseTracking(true);
    connect(m_channelView, &QListView::clicked, this, &MainWindow::onChannelActivated);
    connect(m_channelView, &QListView::activated, this, &MainWindow::onChannelActivated);
    leftLayout->addWidget(m_channelView, 1);

    splitter->addWidget(leftPanel);

    m_videoHost = new VideoHostWidget(splitter);
    m_videoHost->installEventFilter(this);
    splitter->addWidget(m_videoHost);
    splitter->setStretchFactor(0, 0);
    splitter->setStretchFactor(1, 1);
    splitter->setSizes(QList<int>() << 320 << 960);

    rootLayout->addWidget(splitter, 1);

    m_overlays = new OverlayPresenter(m_videoHost);

    statusBar()->showMessage("Starting up...");
}

void MainWindow::connectSession() {
    PlaybackController* playback = m_session->playback();

    connect(m_session, &PlayerSession::overlayChanged, this, [this](const OverlayState& overlay) {
        m_overlays->apply(overlay);
    });
    connect(m_session, &PlayerSession::catalogChanged, this, [this](const QString& header) {
        m_channelHeader->setText(header);
        m_searchEdit->blockSignals(true);
        m_searchEdit->clear();
        m_searchEdit->blockSignals(false);
    });
    connect(m_session, &PlayerSession::visibleChannelsChanged, this, [this](const ChannelList& channels) {
        m_channelModel->setChannels(channels);
    });
    connect(m_session, &PlayerSession::statusMessage, this, [this](const QString& message) {
        statusBar()->showMessage(message);
    });
    connect(m_searchEdit, &QLineEdit::textChanged, m_session, &PlayerSession::setFilter);

    connect(playback, &PlaybackController::stateChanged, this, &MainWindow::onPlaybackStateChanged);
    connect(m_session->surfaces(), &SurfaceManager::activeSurfaceChanged,
            this, &MainWindow::onActiveSurfaceChanged);

    connect(m_overlays->errorOverlay(), &ErrorOverlay::retryClicked, m_session, &PlayerSession::retry);
    connect(m_overlays->errorOverlay(), &ErrorOverlay::dismissClicked, m_session, &PlayerSession::dismissError);

    connect(m_videoHost, &VideoHostWidget::doubleClicked, this, [this]() {
        m_session->surfaces()->toggleFullscreen();
    });
    // A freshly adopted view lands on top of the overlays.
    connect(m_videoHost, &VideoHostWidget::engineAttached, this, [this]() {
        m_overlays->apply(m_session->overlay());
    });
}

void MainWindow::applyTheme() {
    QString style =
        "* {"
        "  font-family: 'Segoe UI', 'Helvetica Neue', Arial, sans-serif;"
        "}"
        "QMainWindow, QWidget {"
        "  background-color: #0c0c18;"
        "  color: #e2e8f0;"
        "}"
        "#headerBar { background-color: #111122; }"
        "#appTitle {"
        "  font-size: 15px;"
        "  font-weight: bold;"
        "  color: #818cf8;"
        "  letter-spacing: 2px;"
        "}"
        "#searchEdit {"
        "  background-color: #181830;"
        "  border: 1px solid rgba(255,255,255,18);"
        "  border-radius: 10px;"
        "  padding: 7px 14px;"
        "  font-size: 13px;"
        "}"
        "#searchEdit:focus { border: 1px solid #6366f1; }"
        "#nowPlaying { color: #a5b4fc; font-size: 12px; font-weight: bold; }"
        "#volumeLabel { color: #94a3b8; font-size: 11px; font-weight: bold; }"
        "#headerBtn, #slotBtn {"
        "  background: rgba(255,255,255,6);"
        "  border: 1px solid rgba(255,255,255,10);"
        "  border-radius: 8px;"
        "  color: #c0c8e0;"
        "  font-size: 11px;"
        "  font-weight: bold;"
        "  padding: 2px 10px;"
        "}"
        "#slotBtn { font-size: 16px; padding: 0; }"
        "#headerBtn:hover, #slotBtn:hover {"
        "  background: rgba(99,102,241,50);"
        "  border-color: rgba(99,102,241,80);"
        "}"
        "#leftPanel { background-color: #0e0e1c; }"
        "#sectionTitle {"
        "  font-weight: bold;"
        "  font-size: 11px;"
        "  color: #4b5580;"
        "  letter-spacing: 1px;"
        "  padding: 4px 8px;"
        "}"
        "#channelList { background-color: transparent; border: none; outline: none; }"
        "QSplitter::handle { background-color: rgba(255,255,255,5); }"
        "QStatusBar {"
        "  background-color: #080812;"
        "  color: #5b6490;"
        "  font-size: 11px;"
        "}"
        "QScrollBar:vertical { background: transparent; width: 6px; margin: 0; }"
        "QScrollBar::handle:vertical {"
        "  background: rgba(99,102,241,30);"
        "  border-radius: 3px;"
        "  min-height: 40px;"
        "}"
        "QScrollBar::add-line:vertical, QScrollBar::sub-line:vertical { height: 0; }";
    qApp->setStyleSheet(style);
}

// ─── Settings & Volume ───────────────────────────────────────────

void MainWindow::loadSettings() {
    QSettings s;
    PlaybackController* playback = m_session->playback();
    playback->setVolume(s.value("volume", playback->volume()).toInt());
    playback->setMuted(s.value("muted", false).toBool());
    updateVolumeLabel();
}

void MainWindow::saveSettings() {
    if (!m_session) return;
    QSettings s;
    s.setValue("volume", m_session->playback()->volume());
    s.setValue("muted", m_session->playback()->isMuted());
    if (!m_session->lastSource().isEmpty()) s.setValue("lastSource", m_session->lastSource());
}

void MainWindow::changeVolume(int delta) {
    PlaybackController* playback = m_session->playback();
    playback->setVolume(playback->volume() + delta);
    if (playback->isMuted() && delta > 0) playback->setMuted(false);
    updateVolumeLabel();
    statusBar()->showMessage(QString("Volume: %1%").arg(playback->volume()), 1500);
}

void MainWindow::toggleMute() {
    PlaybackController* playback = m_session->playback();
    playback->setMuted(!playback->isMuted());
    updateVolumeLabel();
    statusBar()->showMessage(playback->isMuted() ? "Muted" : "Unmuted", 2000);
}

void MainWindow::updateVolumeLabel() {
    PlaybackController* playback = m_session->playback();
    m_volumeLabel->setText(playback->isMuted() ? QString("--") : QString("%1%").arg(playback->volume()));
    m_muteBtn->setText(playback->isMuted() ? "Unmute" : "Mute");
}
