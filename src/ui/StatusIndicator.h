#ifndef TVDECK_STATUSINDICATOR_H
#define TVDECK_STATUSINDICATOR_H

#include "core/PlaybackState.h"

#include <QColor>
#include <QWidget>

class QTimer;

// Header pill with a coloured dot that mirrors the playback state.
class StatusIndicator : public QWidget {
    Q_OBJECT
public:
    explicit StatusIndicator(QWidget* parent = nullptr);

    void setPlaybackState(PlaybackState state);

protected:
    void paintEvent(QPaintEvent*) override;

private:
    PlaybackState m_state;
    QColor m_dotColor;
    QString m_text;
    QTimer* m_pulseTimer;
    bool m_pulsePhase;
};

#endif // TVDECK_STATUSINDICATOR_H
