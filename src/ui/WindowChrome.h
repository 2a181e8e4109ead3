#ifndef TVDECK_WINDOWCHROME_H
#define TVDECK_WINDOWCHROME_H

class QWidget;

// Adds or removes a top-level window from the taskbar and Alt-Tab list
// without recreating its native window.
void setShownInSwitchers(QWidget* window, bool shown);

#endif // TVDECK_WINDOWCHROME_H
