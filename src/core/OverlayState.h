#ifndef TVDECK_OVERLAYSTATE_H
#define TVDECK_OVERLAYSTATE_H

#include "core/PlaybackState.h"

#include <QMetaType>
#include <QString>

struct OverlayState {
    enum Kind {
        None,
        WelcomePrompt,
        Loading,
        Error
    };

    OverlayState() : kind(None) {}
    OverlayState(Kind k, const QString& msg = QString()) : kind(k), message(msg) {}

    bool operator==(const OverlayState& other) const {
        return kind == other.kind && message == other.message;
    }
    bool operator!=(const OverlayState& other) const { return !(*this == other); }

    Kind kind;
    QString message;    // only set for Error
};

struct OverlayInputs {
    OverlayInputs() : hasCatalog(false), state(PlaybackState::Idle), everPlayed(false) {}

    bool hasCatalog;
    PlaybackState state;
    bool everPlayed;
    QString errorMessage;
};

// Error > Loading > WelcomePrompt > None.
OverlayState computeOverlay(const OverlayInputs& inputs);

const char* overlayKindName(OverlayState::Kind kind);

Q_DECLARE_METATYPE(OverlayState)

#endif // TVDECK_OVERLAYSTATE_H
