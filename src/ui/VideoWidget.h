#ifndef TVDECK_VIDEOWIDGET_H
#define TVDECK_VIDEOWIDGET_H

#include <QWidget>

// Native child window mpv renders into. It moves between hosts when the
// active surface changes; its window id stays the same.
class VideoWidget : public QWidget {
    Q_OBJECT
public:
    explicit VideoWidget(QWidget* parent = nullptr);

signals:
    void doubleClicked();

protected:
    void mouseDoubleClickEvent(QMouseEvent* event) override;
};

#endif // TVDECK_VIDEOWIDGET_H
