#ifndef TVDECK_SURFACE_H
#define TVDECK_SURFACE_H

#include <QMetaType>
#include <QObject>
#include <QRect>

class PlaybackEngine;

enum class Surface {
    Main,
    Fullscreen,
    Floating
};

const char* surfaceName(Surface surface);

// Element that can show one engine's picture. Holds at most one engine.
class VideoHost {
public:
    virtual ~VideoHost() {}

    virtual bool attachEngine(PlaybackEngine* engine) = 0;
    virtual void releaseEngine() = 0;
    virtual PlaybackEngine* attachedEngine() const = 0;
};

// A secondary presentation window (fullscreen or floating).
class SurfaceWindow : public QObject {
    Q_OBJECT
public:
    explicit SurfaceWindow(QObject* parent = nullptr) : QObject(parent) {}
    ~SurfaceWindow() override {}

    virtual VideoHost* host() = 0;
    virtual void present() = 0;
    virtual void setShownInSwitchers(bool shown) = 0;

    // Closes the window and schedules its deletion. Must not emit
    // closeRequested().
    virtual void dispose() = 0;

signals:
    // User or OS asked the window to go away (close button, Esc, ...).
    void closeRequested();
};

// Window-system side of the surface protocol.
class SurfacePlatform {
public:
    virtual ~SurfacePlatform() {}

    virtual VideoHost* mainHost() = 0;

    // Display the main window currently occupies.
    virtual QRect mainDisplayBounds() const = 0;
    virtual QRect mainDisplayWorkArea() const = 0;

    // Ownership passes to the caller, who releases it with dispose().
    virtual SurfaceWindow* createSurfaceWindow(Surface surface, const QRect& geometry) = 0;

    virtual void saveMainGeometry() = 0;
    virtual void restoreMainGeometry() = 0;
    virtual void setMainShownInSwitchers(bool shown) = 0;
    virtual void hideMainWindow() = 0;
    virtual void restoreMainWindow() = 0;
};

Q_DECLARE_METATYPE(Surface)

#endif // TVDECK_SURFACE_H
