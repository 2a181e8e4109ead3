#include "ui/WindowChrome.h"
#include "core/Logging.h"

#include <QWidget>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

void setShownInSwitchers(QWidget* window, bool shown) {
    if (!window) return;
#ifdef Q_OS_WIN
    HWND hwnd = reinterpret_cast<HWND>(window->winId());
    LONG_PTR ex = GetWindowLongPtr(hwnd, GWL_EXSTYLE);
    if (shown) {
        ex &= ~WS_EX_TOOLWINDOW;
        ex |= WS_EX_APPWINDOW;
    } else {
        ex &= ~WS_EX_APPWINDOW;
        ex |= WS_EX_TOOLWINDOW;
    }
    SetWindowLongPtr(hwnd, GWL_EXSTYLE, ex);
    SetWindowPos(hwnd, NULL, 0, 0, 0, 0,
                 SWP_NOSIZE | SWP_NOMOVE | SWP_NOZORDER | SWP_NOACTIVATE | SWP_FRAMECHANGED);
#else
    // Toggling Qt::Tool here would recreate the native window and orphan the
    // mpv child; a hidden or minimized window is left to the window manager.
    qCDebug(lcSurface) << window->windowTitle() << (shown ? "shown in" : "hidden from") << "switchers";
#endif
}
