#include "core/PlaybackController.h"
#include "core/PlayerSession.h"
#include "core/SurfaceManager.h"
#include "Fakes.h"

#include <gtest/gtest.h>

namespace {

const char* LIST =
    "#EXTM3U\n"
    "#EXTINF:-1 group-title=\"News\",Zulu News\n"
    "http://s/zulu\n"
    "#EXTINF:-1 group-title=\"Movies\",Alpha Films\n"
    "http://s/alpha\n"
    "#EXTINF:-1 group-title=\"news\",Bravo\n"
    "http://s/bravo\n";

} // namespace

class PlayerSessionTest : public ::testing::Test {
protected:
    PlayerSessionTest() : session(&fetcher, recorder.factory(), &platform) {
        session.surfaces()->setResumeNudges(0, 0);
        QObject::connect(&session, &PlayerSession::overlayChanged,
                         [this](const OverlayState& o) { overlays.append(o); });
        QObject::connect(&session, &PlayerSession::catalogChanged,
                         [this](const QString& h) { headers.append(h); });
        QObject::connect(&session, &PlayerSession::statusMessage,
                         [this](const QString& m) { messages.append(m); });
    }

    void loadList() {
        session.loadSource("https://example.org/lists/uk.m3u");
        fetcher.succeed(fetcher.requests.size() - 1, LIST);
    }

    Channel channelNamed(const QString& name) const {
        const ChannelList& all = session.catalog().channels();
        for (int i = 0; i < all.size(); ++i)
            if (all[i].name == name) return all[i];
        return Channel();
    }

    FakeFetcher fetcher;
    EngineRecorder recorder;
    FakePlatform platform;
    QList<OverlayState> overlays;
    QStringList headers;
    QStringList messages;
    PlayerSession session;
};

TEST_F(PlayerSessionTest, StartsWithNoOverlay)
{
    EXPECT_EQ(session.overlay().kind, OverlayState::None);
    EXPECT_TRUE(session.catalog().isEmpty());
    EXPECT_TRUE(session.visibleChannels().isEmpty());
}

TEST_F(PlayerSessionTest, LoadedCatalogOffersWelcome)
{
    loadList();
    EXPECT_EQ(session.catalog().size(), 3);
    ASSERT_EQ(headers.size(), 1);
    EXPECT_EQ(headers[0], QString("Channels: uk"));
    EXPECT_EQ(session.overlay().kind, OverlayState::WelcomePrompt);
    EXPECT_EQ(session.lastSource(), QString("https://example.org/lists/uk.m3u"));
    EXPECT_TRUE(messages.contains("Loaded 3 channels"));

    ChannelList visible = session.visibleChannels();
    ASSERT_EQ(visible.size(), 3);
    EXPECT_EQ(visible[0].name, QString("Alpha Films"));
    EXPECT_EQ(visible[2].name, QString("Zulu News"));
}

TEST_F(PlayerSessionTest, FilterNarrowsAndReloadResetsIt)
{
    loadList();
    session.setFilter("NEWS");
    ASSERT_EQ(session.visibleChannels().size(), 2);
    EXPECT_EQ(session.visibleChannels()[0].name, QString("Bravo"));

    loadList();
    EXPECT_TRUE(session.filterQuery().isEmpty());
    EXPECT_EQ(session.visibleChannels().size(), 3);
}

TEST_F(PlayerSessionTest, PlayingClearsWelcome)
{
    loadList();
    session.playChannel(channelNamed("Bravo"));
    EXPECT_EQ(session.overlay().kind, OverlayState::Loading);
    EXPECT_EQ(session.currentChannelName(), QString("Bravo"));
    EXPECT_TRUE(messages.contains("Connecting: Bravo"));

    FakeEngine* engine = recorder.last();
    ASSERT_NE(engine, nullptr);
    EXPECT_EQ(engine->lastUrl, QString("http://s/bravo"));
    engine->startPlaying();
    EXPECT_EQ(session.overlay().kind, OverlayState::None);

    // once something played, Welcome never returns
    engine->report(EngineState::Paused);
    session.playback()->play("http://s/zulu");
    recorder.last()->reportFailure(5, "dead");
    session.dismissError();
    EXPECT_EQ(session.overlay().kind, OverlayState::None);
}

// Test that a failing play goes straight from Loading to Error
TEST_F(PlayerSessionTest, PlaybackFailureShowsError)
{
    loadList();
    session.playChannel(channelNamed("Zulu News"));
    overlays.clear();
    recorder.last()->reportFailure(-2, "unrecognized file format");

    ASSERT_EQ(overlays.size(), 1);
    EXPECT_EQ(overlays[0].kind, OverlayState::Error);
    EXPECT_EQ(session.overlay().message, QString("unrecognized file format (-2)"));
    EXPECT_EQ(session.playback()->state(), PlaybackState::Failed);
}

TEST_F(PlayerSessionTest, RetryUsesFreshEngineAndClearsError)
{
    loadList();
    session.playChannel(channelNamed("Zulu News"));
    FakeEngine* first = recorder.last();
    first->reportFailure(1, "gone");
    ASSERT_EQ(session.overlay().kind, OverlayState::Error);

    session.retry();
    EXPECT_EQ(recorder.created(), 2);
    EXPECT_NE(recorder.last(), first);
    EXPECT_EQ(recorder.last()->lastUrl, QString("http://s/zulu"));
    EXPECT_TRUE(session.errorMessage().isEmpty());
    EXPECT_EQ(session.overlay().kind, OverlayState::Loading);
}

TEST_F(PlayerSessionTest, DismissBeforeFirstPlayReturnsToWelcome)
{
    loadList();
    session.playChannel(channelNamed("Alpha Films"));
    recorder.last()->reportFailure(1, "gone");
    session.dismissError();
    EXPECT_EQ(session.overlay().kind, OverlayState::WelcomePrompt);
}

TEST_F(PlayerSessionTest, OpenedClearsError)
{
    loadList();
    session.showError("something");
    session.playUrl("http://direct/stream");
    session.showError("stale");
    recorder.last()->resolve(true);
    recorder.last()->reportOpened();
    EXPECT_TRUE(session.errorMessage().isEmpty());
}

TEST_F(PlayerSessionTest, UnconfiguredSlotIsUsageError)
{
    session.loadSlot(PlaylistSlot("X", QString()));
    EXPECT_TRUE(fetcher.requests.isEmpty());
    EXPECT_EQ(session.overlay().kind, OverlayState::Error);
    EXPECT_TRUE(session.errorMessage().startsWith("This playlist button isn't configured yet."));
}

TEST_F(PlayerSessionTest, ConfiguredSlotLoadsItsPlaylist)
{
    session.loadSlot(PlaylistSlot("X", "https://example.org/slot.m3u"));
    ASSERT_EQ(fetcher.requests.size(), 1);
    EXPECT_EQ(fetcher.requests[0].url, QUrl("https://example.org/slot.m3u"));
}

TEST_F(PlayerSessionTest, FetchFailureShowsErrorAndSuccessClearsIt)
{
    session.loadSource("https://example.org/broken.m3u");
    fetcher.failRequest(0, "Connection refused");
    EXPECT_EQ(session.overlay().kind, OverlayState::Error);
    EXPECT_TRUE(session.errorMessage().startsWith("Failed to load playlist."));

    loadList();
    EXPECT_TRUE(session.errorMessage().isEmpty());
    EXPECT_EQ(session.overlay().kind, OverlayState::WelcomePrompt);
}

TEST_F(PlayerSessionTest, BadSourceIsUsageError)
{
    session.loadSource("nonsense");
    EXPECT_EQ(session.overlay().kind, OverlayState::Error);
    EXPECT_EQ(session.errorMessage(), QString("Not a valid URL or path to a .m3u/.m3u8 file."));
}

TEST_F(PlayerSessionTest, OverlayIsOnlyEmittedOnChange)
{
    loadList();
    const int before = overlays.size();
    session.setFilter("a");
    session.setFilter("b");
    session.dismissError();
    EXPECT_EQ(overlays.size(), before);
}

TEST_F(PlayerSessionTest, SurfacesFollowTheCurrentEngine)
{
    loadList();
    session.playChannel(channelNamed("Bravo"));
    recorder.last()->startPlaying();

    ASSERT_TRUE(session.surfaces()->enterFullscreen());
    FakeSurfaceWindow* window = platform.lastWindow();
    session.playChannel(channelNamed("Zulu News"));
    EXPECT_EQ(window->host()->attachedEngine(), recorder.last());

    session.surfaces()->exitSecondary();
    EXPECT_EQ(platform.fakeMain().attachedEngine(), recorder.last());
}

TEST(PlayerSessionLifetimeTest, DeletingSessionClosesSecondaryWindow)
{
    FakeFetcher fetcher;
    EngineRecorder recorder;
    FakePlatform platform;
    PlayerSession* session = new PlayerSession(&fetcher, recorder.factory(), &platform);
    session->playUrl("http://s/one");
    ASSERT_TRUE(session->surfaces()->enterFloating());
    QPointer<FakeSurfaceWindow> window = platform.lastWindow();

    delete session;
    ASSERT_FALSE(window.isNull());
    EXPECT_TRUE(window->disposed);
    EXPECT_TRUE(recorder.engines[0].isNull());
    pumpEvents();
}
