#include "ui/StatusIndicator.h"

#include <QPainter>
#include <QTimer>

StatusIndicator::StatusIndicator(QWidget* parent)
    : QWidget(parent), m_state(PlaybackState::Idle), m_pulsePhase(false) {
    setFixedSize(130, 34);
    m_pulseTimer = new QTimer(this);
    m_pulseTimer->setInterval(800);
    connect(m_pulseTimer, &QTimer::timeout, this, [this]() {
        m_pulsePhase = !m_pulsePhase;
        update();
    });
    setPlaybackState(PlaybackState::Idle);
}

void StatusIndicator::setPlaybackState(PlaybackState state) {
    m_state = state;
    m_pulseTimer->stop();
    switch (state) {
        case PlaybackState::Idle:
            m_dotColor = QColor(120, 120, 140);
            m_text = "Idle";
            break;
        case PlaybackState::Opening:
        case PlaybackState::Buffering:
            m_dotColor = QColor(251, 191, 36);
            m_text = state == PlaybackState::Opening ? "Connecting..." : "Buffering...";
            m_pulseTimer->start();
            break;
        case PlaybackState::Playing:
            m_dotColor = QColor(34, 197, 94);
            m_text = "Live";
            break;
        case PlaybackState::Paused:
            m_dotColor = QColor(96, 165, 250);
            m_text = "Paused";
            break;
        case PlaybackState::Failed:
            m_dotColor = QColor(239, 68, 68);
            m_text = "Error";
            break;
    }
    m_pulsePhase = false;
    update();
}

void StatusIndicator::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);

    // Pill tinted with the state colour
    const QRectF pill = QRectF(rect()).adjusted(0.5, 3.5, -0.5, -3.5);
    QColor fill = m_dotColor;
    fill.setAlpha(28);
    QColor edge = m_dotColor;
    edge.setAlpha(90);
    p.setPen(QPen(edge, 1));
    p.setBrush(fill);
    p.drawRoundedRect(pill, pill.height() / 2, pill.height() / 2);

    // Blinks while connecting
    QColor dot = m_dotColor;
    if (m_pulsePhase) dot.setAlpha(90);
    p.setPen(Qt::NoPen);
    p.setBrush(dot);
    p.drawEllipse(QPointF(pill.left() + 14, pill.center().y()), 4, 4);

    QFont f = font();
    f.setPixelSize(11);
    f.setBold(true);
    p.setFont(f);
    p.setPen(m_dotColor.lighter(150));
    p.drawText(pill.adjusted(26, 0, -8, 0), Qt::AlignLeft | Qt::AlignVCenter, m_text);
}
