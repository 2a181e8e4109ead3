#include "core/OverlayState.h"

OverlayState computeOverlay(const OverlayInputs& inputs) {
    if (!inputs.errorMessage.isEmpty())
        return OverlayState(OverlayState::Error, inputs.errorMessage);

    const bool loading = inputs.state == PlaybackState::Opening ||
                         inputs.state == PlaybackState::Buffering;
    if (loading)
        return OverlayState(OverlayState::Loading);

    const bool playingOrPaused = inputs.state == PlaybackState::Playing ||
                                 inputs.state == PlaybackState::Paused;
    // Welcome is only offered until the first stream of the session plays.
    if (inputs.hasCatalog && !inputs.everPlayed && !playingOrPaused)
        return OverlayState(OverlayState::WelcomePrompt);

    return OverlayState(OverlayState::None);
}

const char* overlayKindName(OverlayState::Kind kind) {
    switch (kind) {
        case OverlayState::None: return "None";
        case OverlayState::WelcomePrompt: return "WelcomePrompt";
        case OverlayState::Loading: return "Loading";
        case OverlayState::Error: return "Error";
    }
    return "Unknown";
}
