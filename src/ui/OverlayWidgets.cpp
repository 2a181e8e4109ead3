#include "ui/OverlayWidgets.h"

#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QResizeEvent>
#include <QTimer>

static const int CARD_MAX_WIDTH = 420;
static const int CARD_PADDING = 20;
static const int BUTTON_WIDTH = 92;
static const int BUTTON_HEIGHT = 30;

// ─── Error Overlay ───────────────────────────────────────────────

ErrorOverlay::ErrorOverlay(QWidget* parent) : QWidget(parent) {
    setAttribute(Qt::WA_NoSystemBackground);
    setAutoFillBackground(false);
    hide();
}

void ErrorOverlay::setMessage(const QString& message) {
    // First line is the headline, anything after it the detail.
    const int split = message.indexOf(QLatin1Char('\n'));
    m_title = split < 0 ? message : message.left(split);
    m_detail = split < 0 ? QString() : message.mid(split + 1).trimmed();
    layoutCard();
    update();
}

void ErrorOverlay::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    layoutCard();
}

void ErrorOverlay::layoutCard() {
    const int cardW = qMin(width() - 2 * CARD_PADDING, CARD_MAX_WIDTH);
    const int cardH = m_detail.isEmpty() ? 120 : 160;
    m_card = QRect((width() - cardW) / 2, (height() - cardH) / 2, cardW, cardH);

    const int y = m_card.bottom() - CARD_PADDING - BUTTON_HEIGHT + 1;
    m_dismissRect = QRect(m_card.right() - CARD_PADDING - BUTTON_WIDTH + 1, y, BUTTON_WIDTH, BUTTON_HEIGHT);
    m_retryRect = m_dismissRect.translated(-(BUTTON_WIDTH + 10), 0);
}

void ErrorOverlay::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.fillRect(rect(), QColor(8, 8, 16, 160));

    QPainterPath card;
    card.addRoundedRect(QRectF(m_card), 12, 12);
    p.fillPath(card, QColor(28, 26, 42));

    // Red accent along the left edge
    p.save();
    p.setClipPath(card);
    p.fillRect(QRect(m_card.left(), m_card.top(), 4, m_card.height()), QColor(239, 68, 68));
    p.restore();

    const QRect text = m_card.adjusted(CARD_PADDING + 4, CARD_PADDING, -CARD_PADDING,
                                       -(2 * CARD_PADDING + BUTTON_HEIGHT));
    QFont f = font();
    f.setPixelSize(15);
    f.setBold(true);
    p.setFont(f);
    p.setPen(Qt::white);
    p.drawText(QRect(text.left(), text.top(), text.width(), 22), Qt::AlignLeft | Qt::AlignVCenter,
               p.fontMetrics().elidedText(m_title, Qt::ElideRight, text.width()));

    if (!m_detail.isEmpty()) {
        f.setPixelSize(12);
        f.setBold(false);
        p.setFont(f);
        p.setPen(QColor(170, 175, 200));
        p.drawText(text.adjusted(0, 28, 0, 0), Qt::AlignLeft | Qt::AlignTop | Qt::TextWordWrap, m_detail);
    }

    f.setPixelSize(12);
    f.setBold(true);
    p.setFont(f);
    p.setPen(Qt::NoPen);
    p.setBrush(QColor(99, 102, 241));
    p.drawRoundedRect(m_retryRect, 6, 6);
    p.setBrush(QColor(255, 255, 255, 20));
    p.drawRoundedRect(m_dismissRect, 6, 6);
    p.setPen(Qt::white);
    p.drawText(m_retryRect, Qt::AlignCenter, "Retry");
    p.setPen(QColor(200, 200, 220));
    p.drawText(m_dismissRect, Qt::AlignCenter, "Dismiss");
}

void ErrorOverlay::mousePressEvent(QMouseEvent* event) {
    if (m_retryRect.contains(event->pos())) emit retryClicked();
    else if (m_dismissRect.contains(event->pos())) emit dismissClicked();
}

// ─── Loading Spinner ─────────────────────────────────────────────

LoadingSpinner::LoadingSpinner(QWidget* parent) : QWidget(parent), m_angle(0) {
    setAttribute(Qt::WA_TransparentForMouseEvents);
    setAttribute(Qt::WA_NoSystemBackground);
    setFixedSize(80, 80);
    hide();
    m_timer = new QTimer(this);
    m_timer->setInterval(30);
    connect(m_timer, &QTimer::timeout, this, [this]() {
        m_angle = (m_angle + 8) % 360;
        update();
    });
}

void LoadingSpinner::startSpinning() { show(); raise(); m_timer->start(); }
void LoadingSpinner::stopSpinning() { m_timer->stop(); hide(); }

void LoadingSpinner::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.translate(width() / 2, height() / 2);
    p.rotate(m_angle);
    p.setPen(QPen(QColor(99, 102, 241), 3, Qt::SolidLine, Qt::RoundCap));
    p.drawArc(-15, -15, 30, 30, 0, 270 * 16);
}

// ─── Welcome Prompt ──────────────────────────────────────────────

WelcomeOverlay::WelcomeOverlay(QWidget* parent) : QWidget(parent) {
    setAttribute(Qt::WA_TransparentForMouseEvents);
    setAttribute(Qt::WA_NoSystemBackground);
    hide();
}

void WelcomeOverlay::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);

    QFont f = font();
    f.setPixelSize(20);
    f.setBold(true);
    p.setFont(f);
    p.setPen(QColor(129, 140, 248));
    QRect r = rect();
    p.drawText(QRect(r.left(), r.center().y() - 34, r.width(), 30), Qt::AlignCenter, "Pick a channel");

    f.setPixelSize(12);
    f.setBold(false);
    p.setFont(f);
    p.setPen(QColor(150, 160, 190));
    p.drawText(QRect(r.left(), r.center().y() + 2, r.width(), 22), Qt::AlignCenter,
               "Choose a channel from the list to start watching.");
}

// ─── Overlay Presenter ───────────────────────────────────────────

OverlayPresenter::OverlayPresenter(QWidget* videoArea)
    : QObject(videoArea), m_area(videoArea),
      m_error(new ErrorOverlay(videoArea)),
      m_spinner(new LoadingSpinner(videoArea)),
      m_welcome(new WelcomeOverlay(videoArea))
{
    // The engine's view is a native child; overlays must be native too to
    // stack above it.
    m_error->setAttribute(Qt::WA_NativeWindow);
    m_spinner->setAttribute(Qt::WA_NativeWindow);
    m_welcome->setAttribute(Qt::WA_NativeWindow);
    m_error->hide();
    m_spinner->hide();
    m_welcome->hide();
}

void OverlayPresenter::apply(const OverlayState& state) {
    updateGeometry();
    m_error->setVisible(state.kind == OverlayState::Error);
    m_welcome->setVisible(state.kind == OverlayState::WelcomePrompt);
    if (state.kind == OverlayState::Loading) m_spinner->startSpinning();
    else m_spinner->stopSpinning();

    if (state.kind == OverlayState::Error) {
        m_error->setMessage(state.message);
        m_error->raise();
    } else if (state.kind == OverlayState::WelcomePrompt) {
        m_welcome->raise();
    }
}

void OverlayPresenter::updateGeometry() {
    const QRect r = m_area->rect();
    m_error->setGeometry(r);
    m_welcome->setGeometry(r);
    m_spinner->move((r.width() - m_spinner->width()) / 2, (r.height() - m_spinner->height()) / 2);
}
