#ifndef TVDECK_PLAYBACKSTATE_H
#define TVDECK_PLAYBACKSTATE_H

#include <QMetaType>

enum class PlaybackState {
    Idle,
    Opening,
    Buffering,
    Playing,
    Paused,
    Failed
};

enum class PlaybackEvent {
    PlayRequested,
    EngineBuffering,    // engine reports opening or buffering
    EnginePlaying,
    EnginePaused,
    EngineFailed
};

// Looks up (from, event) in the transition table. Returns false and leaves
// *to untouched when the pair has no row, in which case the state must not
// change.
bool nextPlaybackState(PlaybackState from, PlaybackEvent event, PlaybackState* to);

const char* playbackStateName(PlaybackState state);
const char* playbackEventName(PlaybackEvent event);

Q_DECLARE_METATYPE(PlaybackState)

#endif // TVDECK_PLAYBACKSTATE_H
