#ifndef TVDECK_SECONDARYWINDOW_H
#define TVDECK_SECONDARYWINDOW_H

#include "core/Surface.h"

#include <QPoint>
#include <QPointer>
#include <QRect>
#include <QWidget>

class QPushButton;
class QTimer;
class VideoHostWidget;

// Borderless fullscreen or always-on-top floating window around a
// VideoHostWidget.
class SecondaryWindow : public QWidget {
    Q_OBJECT
public:
    SecondaryWindow(Surface kind, const QRect& geometry);
    ~SecondaryWindow() override;

    VideoHostWidget* host() const { return m_host; }
    Surface kind() const { return m_kind; }

    void present();
    void dispose();

signals:
    void exitRequested();

protected:
    void keyPressEvent(QKeyEvent* event) override;
    void closeEvent(QCloseEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    bool eventFilter(QObject* obj, QEvent* event) override;

private:
    void showChrome();
    void placeExitButton();

    Surface m_kind;
    QRect m_target;
    VideoHostWidget* m_host;
    QPushButton* m_exitBtn;
    QTimer* m_chromeTimer;
    bool m_disposing;
    bool m_dragging;
    QPoint m_dragOffset;
};

// SurfaceWindow seam implemented on top of a SecondaryWindow.
class QtSurfaceWindow : public SurfaceWindow {
    Q_OBJECT
public:
    QtSurfaceWindow(Surface kind, const QRect& geometry);
    ~QtSurfaceWindow() override;

    VideoHost* host() override;
    void present() override;
    void setShownInSwitchers(bool shown) override;
    void dispose() override;

    SecondaryWindow* window() const { return m_window; }

private:
    QPointer<SecondaryWindow> m_window;
};

#endif // TVDECK_SECONDARYWINDOW_H
