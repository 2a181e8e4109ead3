#ifndef TVDECK_QTSURFACEPLATFORM_H
#define TVDECK_QTSURFACEPLATFORM_H

#include "core/Surface.h"

#include <QByteArray>

class QScreen;
class QWidget;
class VideoHostWidget;

// Surface protocol backed by real Qt top-level windows.
class QtSurfacePlatform : public SurfacePlatform {
public:
    QtSurfacePlatform(QWidget* mainWindow, VideoHostWidget* mainHost);

    VideoHost* mainHost() override;
    QRect mainDisplayBounds() const override;
    QRect mainDisplayWorkArea() const override;
    SurfaceWindow* createSurfaceWindow(Surface surface, const QRect& geometry) override;

    void saveMainGeometry() override;
    void restoreMainGeometry() override;
    void setMainShownInSwitchers(bool shown) override;
    void hideMainWindow() override;
    void restoreMainWindow() override;

private:
    QScreen* mainScreen() const;

    QWidget* m_main;
    VideoHostWidget* m_host;
    QByteArray m_savedGeometry;
    bool m_wasMaximized;
};

#endif // TVDECK_QTSURFACEPLATFORM_H
