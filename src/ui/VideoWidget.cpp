#include "ui/VideoWidget.h"

#include <QMouseEvent>

VideoWidget::VideoWidget(QWidget* parent) : QWidget(parent) {
    setAttribute(Qt::WA_DontCreateNativeAncestors);
    setAttribute(Qt::WA_NativeWindow);
    setAttribute(Qt::WA_OpaquePaintEvent);
    setStyleSheet("background-color: #000;");
    setFocusPolicy(Qt::NoFocus);
    setMouseTracking(true);
}

void VideoWidget::mouseDoubleClickEvent(QMouseEvent* event) {
    emit doubleClicked();
    QWidget::mouseDoubleClickEvent(event);
}
