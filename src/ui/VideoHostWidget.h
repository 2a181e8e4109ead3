#ifndef TVDECK_VIDEOHOSTWIDGET_H
#define TVDECK_VIDEOHOSTWIDGET_H

#include "core/Surface.h"

#include <QPointer>
#include <QWidget>

class PlaybackEngine;
class QVBoxLayout;

// Black container that adopts an engine's render widget.
class VideoHostWidget : public QWidget, public VideoHost {
    Q_OBJECT
public:
    explicit VideoHostWidget(QWidget* parent = nullptr);

    bool attachEngine(PlaybackEngine* engine) override;
    void releaseEngine() override;
    PlaybackEngine* attachedEngine() const override { return m_engine; }

signals:
    void doubleClicked();
    void engineAttached();

protected:
    void mouseDoubleClickEvent(QMouseEvent* event) override;

private:
    QVBoxLayout* m_layout;
    QPointer<PlaybackEngine> m_engine;
    QPointer<QWidget> m_view;
};

#endif // TVDECK_VIDEOHOSTWIDGET_H
