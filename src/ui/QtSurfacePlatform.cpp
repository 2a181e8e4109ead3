#include "ui/QtSurfacePlatform.h"
#include "ui/SecondaryWindow.h"
#include "ui/VideoHostWidget.h"
#include "ui/WindowChrome.h"
#include "core/Logging.h"

#include <QGuiApplication>
#include <QScreen>
#include <QWidget>

QtSurfacePlatform::QtSurfacePlatform(QWidget* mainWindow, VideoHostWidget* mainHost)
    : m_main(mainWindow), m_host(mainHost), m_wasMaximized(false)
{
}

VideoHost* QtSurfacePlatform::mainHost() {
    return m_host;
}

QScreen* QtSurfacePlatform::mainScreen() const {
    QScreen* screen = QGuiApplication::screenAt(m_main->frameGeometry().center());
    if (!screen) screen = QGuiApplication::primaryScreen();
    return screen;
}

QRect QtSurfacePlatform::mainDisplayBounds() const {
    QScreen* screen = mainScreen();
    return screen ? screen->geometry() : m_main->frameGeometry();
}

QRect QtSurfacePlatform::mainDisplayWorkArea() const {
    QScreen* screen = mainScreen();
    return screen ? screen->availableGeometry() : m_main->frameGeometry();
}

SurfaceWindow* QtSurfacePlatform::createSurfaceWindow(Surface surface, const QRect& geometry) {
    return new QtSurfaceWindow(surface, geometry);
}

void QtSurfacePlatform::saveMainGeometry() {
    m_wasMaximized = m_main->isMaximized();
    m_savedGeometry = m_main->saveGeometry();
}

void QtSurfacePlatform::restoreMainGeometry() {
    if (m_savedGeometry.isEmpty()) return;
    if (!m_main->restoreGeometry(m_savedGeometry))
        qCWarning(lcSurface) << "could not restore main window geometry";
    if (m_wasMaximized) m_main->showMaximized();
    m_savedGeometry.clear();
}

void QtSurfacePlatform::setMainShownInSwitchers(bool shown) {
    setShownInSwitchers(m_main, shown);
}

void QtSurfacePlatform::hideMainWindow() {
    m_main->showMinimized();
}

void QtSurfacePlatform::restoreMainWindow() {
    m_main->showNormal();
    m_main->raise();
    m_main->activateWindow();
}
