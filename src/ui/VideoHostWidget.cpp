#include "ui/VideoHostWidget.h"
#include "ui/VideoWidget.h"
#include "core/Logging.h"
#include "core/PlaybackEngine.h"

#include <QVBoxLayout>

VideoHostWidget::VideoHostWidget(QWidget* parent) : QWidget(parent) {
    setAttribute(Qt::WA_StyledBackground);
    setStyleSheet("background-color: #000;");
    setMinimumSize(320, 180);
    setMouseTracking(true);
    m_layout = new QVBoxLayout(this);
    m_layout->setContentsMargins(0, 0, 0, 0);
    m_layout->setSpacing(0);
}

bool VideoHostWidget::attachEngine(PlaybackEngine* engine) {
    if (!engine) return false;
    if (m_engine == engine) return true;

    QWidget* view = qobject_cast<QWidget*>(engine->renderTarget());
    if (!view) {
        qCWarning(lcSurface) << "engine has no widget to embed";
        return false;
    }

    // Anything held before is simply dropped; its owner disposes it.
    releaseEngine();

    m_layout->addWidget(view);
    view->show();
    m_engine = engine;
    m_view = view;

    VideoWidget* video = qobject_cast<VideoWidget*>(view);
    if (video) connect(video, &VideoWidget::doubleClicked, this, &VideoHostWidget::doubleClicked);

    emit engineAttached();
    return true;
}

void VideoHostWidget::releaseEngine() {
    if (m_view) {
        disconnect(m_view, nullptr, this, nullptr);
        // Still ours unless another host adopted it in the meantime.
        if (m_view->parentWidget() == this) {
            m_layout->removeWidget(m_view);
            m_view->hide();
        }
    }
    m_view = nullptr;
    m_engine = nullptr;
}

void VideoHostWidget::mouseDoubleClickEvent(QMouseEvent* event) {
    emit doubleClicked();
    QWidget::mouseDoubleClickEvent(event);
}
