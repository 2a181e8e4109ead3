#include "core/PlaybackState.h"

namespace {

enum StateMask {
    IdleBit      = 1 << 0,
    OpeningBit   = 1 << 1,
    BufferingBit = 1 << 2,
    PlayingBit   = 1 << 3,
    PausedBit    = 1 << 4,
    FailedBit    = 1 << 5,
    AnyState     = IdleBit | OpeningBit | BufferingBit | PlayingBit | PausedBit | FailedBit
};

struct Transition {
    int from;
    PlaybackEvent event;
    PlaybackState to;
};

const Transition TRANSITIONS[] = {
    { AnyState,                  PlaybackEvent::PlayRequested,   PlaybackState::Opening },
    { OpeningBit,                PlaybackEvent::EngineBuffering, PlaybackState::Buffering },
    { OpeningBit | BufferingBit, PlaybackEvent::EnginePlaying,   PlaybackState::Playing },
    { PlayingBit,                PlaybackEvent::EnginePaused,    PlaybackState::Paused },
    { PausedBit,                 PlaybackEvent::EnginePlaying,   PlaybackState::Playing },
    { AnyState,                  PlaybackEvent::EngineFailed,    PlaybackState::Failed },
};

int bitFor(PlaybackState state) {
    return 1 << static_cast<int>(state);
}

} // namespace

bool nextPlaybackState(PlaybackState from, PlaybackEvent event, PlaybackState* to) {
    const int count = sizeof(TRANSITIONS) / sizeof(TRANSITIONS[0]);
    for (int i = 0; i < count; ++i) {
        const Transition& t = TRANSITIONS[i];
        if (t.event == event && (t.from & bitFor(from))) {
            if (to) *to = t.to;
            return true;
        }
    }
    return false;
}

const char* playbackStateName(PlaybackState state) {
    switch (state) {
        case PlaybackState::Idle: return "Idle";
        case PlaybackState::Opening: return "Opening";
        case PlaybackState::Buffering: return "Buffering";
        case PlaybackState::Playing: return "Playing";
        case PlaybackState::Paused: return "Paused";
        case PlaybackState::Failed: return "Failed";
    }
    return "Unknown";
}

const char* playbackEventName(PlaybackEvent event) {
    switch (event) {
        case PlaybackEvent::PlayRequested: return "PlayRequested";
        case PlaybackEvent::EngineBuffering: return "EngineBuffering";
        case PlaybackEvent::EnginePlaying: return "EnginePlaying";
        case PlaybackEvent::EnginePaused: return "EnginePaused";
        case PlaybackEvent::EngineFailed: return "EngineFailed";
    }
    return "Unknown";
}
