#include "core/PlaybackState.h"

#include <gtest/gtest.h>

namespace {

struct Row {
    PlaybackState from;
    PlaybackEvent event;
    PlaybackState to;
};

const PlaybackState ALL_STATES[] = {
    PlaybackState::Idle, PlaybackState::Opening, PlaybackState::Buffering,
    PlaybackState::Playing, PlaybackState::Paused, PlaybackState::Failed
};

} // namespace

TEST(PlaybackStateTest, PlayRequestedAlwaysOpens)
{
    for (PlaybackState from : ALL_STATES) {
        PlaybackState to = PlaybackState::Idle;
        EXPECT_TRUE(nextPlaybackState(from, PlaybackEvent::PlayRequested, &to)) << playbackStateName(from);
        EXPECT_EQ(to, PlaybackState::Opening);
    }
}

TEST(PlaybackStateTest, EngineFailedAlwaysFails)
{
    for (PlaybackState from : ALL_STATES) {
        PlaybackState to = PlaybackState::Idle;
        EXPECT_TRUE(nextPlaybackState(from, PlaybackEvent::EngineFailed, &to)) << playbackStateName(from);
        EXPECT_EQ(to, PlaybackState::Failed);
    }
}

TEST(PlaybackStateTest, EngineDrivenTransitions)
{
    const Row rows[] = {
        { PlaybackState::Opening,   PlaybackEvent::EngineBuffering, PlaybackState::Buffering },
        { PlaybackState::Opening,   PlaybackEvent::EnginePlaying,   PlaybackState::Playing },
        { PlaybackState::Buffering, PlaybackEvent::EnginePlaying,   PlaybackState::Playing },
        { PlaybackState::Playing,   PlaybackEvent::EnginePaused,    PlaybackState::Paused },
        { PlaybackState::Paused,    PlaybackEvent::EnginePlaying,   PlaybackState::Playing },
    };
    for (const Row& row : rows) {
        PlaybackState to = PlaybackState::Idle;
        EXPECT_TRUE(nextPlaybackState(row.from, row.event, &to))
            << playbackStateName(row.from) << " + " << playbackEventName(row.event);
        EXPECT_EQ(to, row.to);
    }
}

// Test that pairs without a row leave the state untouched
TEST(PlaybackStateTest, UnlistedPairsAreRejected)
{
    const Row rows[] = {
        { PlaybackState::Idle,      PlaybackEvent::EnginePlaying,   PlaybackState::Idle },
        { PlaybackState::Idle,      PlaybackEvent::EngineBuffering, PlaybackState::Idle },
        { PlaybackState::Idle,      PlaybackEvent::EnginePaused,    PlaybackState::Idle },
        { PlaybackState::Playing,   PlaybackEvent::EngineBuffering, PlaybackState::Playing },
        { PlaybackState::Buffering, PlaybackEvent::EngineBuffering, PlaybackState::Buffering },
        { PlaybackState::Buffering, PlaybackEvent::EnginePaused,    PlaybackState::Buffering },
        { PlaybackState::Paused,    PlaybackEvent::EngineBuffering, PlaybackState::Paused },
        { PlaybackState::Failed,    PlaybackEvent::EnginePlaying,   PlaybackState::Failed },
        { PlaybackState::Failed,    PlaybackEvent::EnginePaused,    PlaybackState::Failed },
    };
    for (const Row& row : rows) {
        PlaybackState to = row.from;
        EXPECT_FALSE(nextPlaybackState(row.from, row.event, &to))
            << playbackStateName(row.from) << " + " << playbackEventName(row.event);
        EXPECT_EQ(to, row.to);
    }
}

TEST(PlaybackStateTest, NamesAreReadable)
{
    EXPECT_STREQ(playbackStateName(PlaybackState::Buffering), "Buffering");
    EXPECT_STREQ(playbackEventName(PlaybackEvent::EnginePaused), "EnginePaused");
}
