#ifndef TVDECK_OVERLAYWIDGETS_H
#define TVDECK_OVERLAYWIDGETS_H

#include "core/OverlayState.h"

#include <QRect>
#include <QWidget>

class QTimer;

// ─── Error Overlay ───────────────────────────────────────────────

class ErrorOverlay : public QWidget {
    Q_OBJECT
public:
    explicit ErrorOverlay(QWidget* parent = nullptr);

    void setMessage(const QString& message);

signals:
    void retryClicked();
    void dismissClicked();

protected:
    void paintEvent(QPaintEvent*) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;

private:
    void layoutCard();

    QString m_title;
    QString m_detail;
    QRect m_card;
    QRect m_retryRect;
    QRect m_dismissRect;
};

// ─── Loading Spinner ─────────────────────────────────────────────

class LoadingSpinner : public QWidget {
    Q_OBJECT
public:
    explicit LoadingSpinner(QWidget* parent = nullptr);

    void startSpinning();
    void stopSpinning();

protected:
    void paintEvent(QPaintEvent*) override;

private:
    QTimer* m_timer;
    int m_angle;
};

// ─── Welcome Prompt ──────────────────────────────────────────────

class WelcomeOverlay : public QWidget {
    Q_OBJECT
public:
    explicit WelcomeOverlay(QWidget* parent = nullptr);

protected:
    void paintEvent(QPaintEvent*) override;
};

// Shows exactly the widget that matches an OverlayState.
class OverlayPresenter : public QObject {
    Q_OBJECT
public:
    explicit OverlayPresenter(QWidget* videoArea);

    void apply(const OverlayState& state);
    void updateGeometry();

    ErrorOverlay* errorOverlay() const { return m_error; }

private:
    QWidget* m_area;
    ErrorOverlay* m_error;
    LoadingSpinner* m_spinner;
    WelcomeOverlay* m_welcome;
};

#endif // TVDECK_OVERLAYWIDGETS_H
