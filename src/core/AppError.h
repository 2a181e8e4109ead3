#ifndef TVDECK_APPERROR_H
#define TVDECK_APPERROR_H

#include <QMetaType>
#include <QString>

// Failure value carried by the asynchronous signals of the core.
struct AppError {
    enum Kind {
        PlaylistFetch,
        PlaybackResolution,
        PlaybackFailure,
        Config,
        Usage
    };

    AppError() : kind(Usage) {}
    AppError(Kind k, const QString& msg) : kind(k), message(msg) {}

    // Resolution and config problems degrade silently; everything else
    // ends up in the error overlay.
    bool isUserVisible() const {
        return kind == PlaylistFetch || kind == PlaybackFailure || kind == Usage;
    }

    Kind kind;
    QString message;
};

Q_DECLARE_METATYPE(AppError)

#endif // TVDECK_APPERROR_H
