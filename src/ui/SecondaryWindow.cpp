#include "ui/SecondaryWindow.h"
#include "ui/VideoHostWidget.h"
#include "ui/WindowChrome.h"
#include "core/Logging.h"

#include <QApplication>
#include <QCloseEvent>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPushButton>
#include <QTimer>
#include <QVBoxLayout>

static const int CHROME_HIDE_MS = 2000;
static const int EXIT_BTN_MARGIN = 16;

SecondaryWindow::SecondaryWindow(Surface kind, const QRect& geometry)
    : QWidget(nullptr),
      m_kind(kind), m_target(geometry), m_host(NULL), m_exitBtn(NULL),
      m_chromeTimer(NULL), m_disposing(false), m_dragging(false)
{
    Qt::WindowFlags flags = Qt::Window | Qt::FramelessWindowHint;
    if (kind == Surface::Floating) flags |= Qt::WindowStaysOnTopHint;
    setWindowFlags(flags);
    setWindowTitle(kind == Surface::Fullscreen ? "tvdeck - Fullscreen" : "tvdeck - Floating");
    setAttribute(Qt::WA_DeleteOnClose, false);

    QPalette pal = palette();
    pal.setColor(QPalette::Window, Qt::black);
    setPalette(pal);
    setAutoFillBackground(true);

    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);
    m_host = new VideoHostWidget(this);
    layout->addWidget(m_host);
    connect(m_host, &VideoHostWidget::doubleClicked, this, &SecondaryWindow::exitRequested);

    if (kind == Surface::Fullscreen) {
        m_exitBtn = new QPushButton("Exit Fullscreen", this);
        m_exitBtn->setObjectName("exitFullscreenBtn");
        m_exitBtn->setCursor(Qt::PointingHandCursor);
        m_exitBtn->setStyleSheet(
            "QPushButton { background: rgba(15,15,30,200); color: #e2e8f0;"
            " border: 1px solid rgba(255,255,255,40); border-radius: 8px; padding: 8px 16px; }"
            "QPushButton:hover { background: rgba(59,130,246,220); }");
        connect(m_exitBtn, &QPushButton::clicked, this, &SecondaryWindow::exitRequested);

        m_chromeTimer = new QTimer(this);
        m_chromeTimer->setSingleShot(true);
        m_chromeTimer->setInterval(CHROME_HIDE_MS);
        connect(m_chromeTimer, &QTimer::timeout, this, [this]() {
            m_exitBtn->hide();
            setCursor(Qt::BlankCursor);
        });
    }

    // The video view is a native child that swallows mouse input, so watch
    // the whole application and pick out events aimed at this window.
    qApp->installEventFilter(this);
}

SecondaryWindow::~SecondaryWindow() {
    qApp->removeEventFilter(this);
}

void SecondaryWindow::present() {
    setGeometry(m_target);
    if (m_kind == Surface::Fullscreen) {
        showFullScreen();
        showChrome();
    } else {
        show();
    }
    raise();
    activateWindow();
    qCDebug(lcSurface) << surfaceName(m_kind) << "window presented at" << m_target;
}

void SecondaryWindow::dispose() {
    if (m_disposing) return;
    m_disposing = true;
    qApp->removeEventFilter(this);
    close();
    deleteLater();
}

void SecondaryWindow::keyPressEvent(QKeyEvent* event) {
    switch (event->key()) {
        case Qt::Key_Escape:
            emit exitRequested();
            break;
        case Qt::Key_F:
        case Qt::Key_F11:
            if (m_kind == Surface::Fullscreen) emit exitRequested();
            break;
        case Qt::Key_P:
            if (m_kind == Surface::Floating) emit exitRequested();
            break;
        default:
            QWidget::keyPressEvent(event);
    }
}

void SecondaryWindow::closeEvent(QCloseEvent* event) {
    if (m_disposing) {
        event->accept();
        return;
    }
    // The surface manager tears the window down through dispose().
    event->ignore();
    emit exitRequested();
}

void SecondaryWindow::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    placeExitButton();
}

bool SecondaryWindow::eventFilter(QObject* obj, QEvent* event) {
    QWidget* w = qobject_cast<QWidget*>(obj);
    if (!w || w->window() != this) return QWidget::eventFilter(obj, event);

    switch (event->type()) {
        case QEvent::MouseMove: {
            if (m_kind == Surface::Fullscreen) {
                showChrome();
            } else if (m_dragging) {
                QMouseEvent* me = static_cast<QMouseEvent*>(event);
                move(me->globalPos() - m_dragOffset);
            }
            break;
        }
        case QEvent::MouseButtonPress: {
            QMouseEvent* me = static_cast<QMouseEvent*>(event);
            if (m_kind == Surface::Floating && me->button() == Qt::LeftButton) {
                m_dragging = true;
                m_dragOffset = me->globalPos() - frameGeometry().topLeft();
            }
            break;
        }
        case QEvent::MouseButtonRelease:
            m_dragging = false;
            break;
        default:
            break;
    }
    return QWidget::eventFilter(obj, event);
}

void SecondaryWindow::showChrome() {
    if (!m_exitBtn) return;
    placeExitButton();
    m_exitBtn->show();
    m_exitBtn->raise();
    setCursor(Qt::ArrowCursor);
    m_chromeTimer->start();
}

void SecondaryWindow::placeExitButton() {
    if (!m_exitBtn) return;
    m_exitBtn->adjustSize();
    m_exitBtn->move(width() - m_exitBtn->width() - EXIT_BTN_MARGIN, EXIT_BTN_MARGIN);
}

// ─── QtSurfaceWindow ─────────────────────────────────────────────

QtSurfaceWindow::QtSurfaceWindow(Surface kind, const QRect& geometry)
    : SurfaceWindow(nullptr), m_window(new SecondaryWindow(kind, geometry))
{
    connect(m_window.data(), &SecondaryWindow::exitRequested, this, &SurfaceWindow::closeRequested);
}

QtSurfaceWindow::~QtSurfaceWindow() {
    if (m_window) m_window->dispose();
}

VideoHost* QtSurfaceWindow::host() {
    return m_window ? m_window->host() : NULL;
}

void QtSurfaceWindow::present() {
    if (m_window) m_window->present();
}

void QtSurfaceWindow::setShownInSwitchers(bool shown) {
    if (m_window) ::setShownInSwitchers(m_window, shown);
}

void QtSurfaceWindow::dispose() {
    if (m_window) {
        disconnect(m_window.data(), nullptr, this, nullptr);
        m_window->dispose();
    }
    deleteLater();
}
