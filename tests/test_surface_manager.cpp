#include "core/PlaybackController.h"
#include "core/SurfaceManager.h"
#include "Fakes.h"

#include <gtest/gtest.h>

class SurfaceManagerTest : public ::testing::Test {
protected:
    SurfaceManagerTest()
        : controller(recorder.factory()), manager(&platform, &controller)
    {
        manager.setResumeNudges(3, 0);
        QObject::connect(&manager, &SurfaceManager::activeSurfaceChanged,
                         [this](Surface s) { changes.append(s); });
    }

    FakeEngine* startPlaying() {
        controller.play("http://live/channel");
        FakeEngine* engine = recorder.last();
        engine->startPlaying();
        return engine;
    }

    EngineRecorder recorder;
    FakePlatform platform;
    PlaybackController controller;
    SurfaceManager manager;
    QList<Surface> changes;
};

TEST_F(SurfaceManagerTest, NewEngineLandsOnMainHost)
{
    FakeEngine* engine = startPlaying();
    EXPECT_EQ(platform.fakeMain().attachedEngine(), engine);
    EXPECT_EQ(manager.activeSurface(), Surface::Main);
    EXPECT_EQ(manager.activeHost(), platform.mainHost());
}

TEST_F(SurfaceManagerTest, EnterFullscreenMovesPictureToNewWindow)
{
    FakeEngine* engine = startPlaying();
    platform.log.clear();

    ASSERT_TRUE(manager.enterFullscreen());
    FakeSurfaceWindow* window = platform.lastWindow();
    ASSERT_NE(window, nullptr);

    EXPECT_EQ(window->kind, Surface::Fullscreen);
    EXPECT_EQ(window->geometry, platform.bounds);
    EXPECT_EQ(window->host()->attachedEngine(), engine);
    EXPECT_EQ(platform.fakeMain().attachedEngine(), nullptr);
    EXPECT_TRUE(window->presented);
    EXPECT_TRUE(window->shownInSwitchers);
    EXPECT_FALSE(platform.mainShownInSwitchers);
    EXPECT_TRUE(platform.mainHidden);
    EXPECT_EQ(platform.saveCount, 1);

    EXPECT_TRUE(manager.isActive(Surface::Fullscreen));
    EXPECT_EQ(manager.activeHost(), window->host());
    ASSERT_EQ(changes.size(), 1);
    EXPECT_EQ(changes[0], Surface::Fullscreen);
}

// Test that the new surface is attached before the old one lets go
TEST_F(SurfaceManagerTest, HandoffAttachesBeforeReleasing)
{
    startPlaying();
    platform.log.clear();

    manager.enterFullscreen();
    EXPECT_EQ(platform.log, QStringList() << "attach:Fullscreen" << "release:Main");

    platform.log.clear();
    manager.exitFullscreen();
    EXPECT_EQ(platform.log, QStringList() << "attach:Main" << "release:Fullscreen");
}

TEST_F(SurfaceManagerTest, FloatingWindowSitsInBottomRightCorner)
{
    startPlaying();
    ASSERT_TRUE(manager.enterFloating());
    FakeSurfaceWindow* window = platform.lastWindow();
    ASSERT_NE(window, nullptr);
    EXPECT_EQ(window->kind, Surface::Floating);
    EXPECT_EQ(window->geometry, QRect(1920 - 480 - 12, 1040 - 270 - 12, 480, 270));
}

TEST_F(SurfaceManagerTest, FloatingGeometryClampsToSmallWorkArea)
{
    EXPECT_EQ(SurfaceManager::floatingGeometry(QRect(100, 50, 300, 200)), QRect(112, 62, 480, 270));
    EXPECT_EQ(SurfaceManager::floatingGeometry(QRect(-1920, 0, 1920, 1080)),
              QRect(-1920 + 1920 - 480 - 12, 1080 - 270 - 12, 480, 270));
}

TEST_F(SurfaceManagerTest, ExitRestoresMainWindow)
{
    FakeEngine* engine = startPlaying();
    manager.enterFullscreen();
    QPointer<FakeSurfaceWindow> window = platform.lastWindow();

    manager.exitFullscreen();
    EXPECT_EQ(manager.activeSurface(), Surface::Main);
    EXPECT_EQ(platform.fakeMain().attachedEngine(), engine);
    EXPECT_TRUE(platform.mainShownInSwitchers);
    EXPECT_FALSE(platform.mainHidden);
    EXPECT_EQ(platform.restoreCount, 1);
    ASSERT_FALSE(window.isNull());
    EXPECT_TRUE(window->disposed);

    pumpEvents();
    EXPECT_TRUE(window.isNull());
    EXPECT_EQ(changes, QList<Surface>() << Surface::Fullscreen << Surface::Main);
}

// Test that every close path funnels into a single exit
TEST_F(SurfaceManagerTest, RepeatedExitRequestsAreHarmless)
{
    startPlaying();
    manager.enterFullscreen();
    FakeSurfaceWindow* window = platform.lastWindow();

    window->requestClose();
    window->requestClose();
    manager.exitFullscreen();
    manager.exitFullscreen();
    pumpEvents();

    EXPECT_EQ(manager.activeSurface(), Surface::Main);
    EXPECT_EQ(platform.restoreCount, 1);
    EXPECT_EQ(changes, QList<Surface>() << Surface::Fullscreen << Surface::Main);
}

TEST_F(SurfaceManagerTest, CloseRequestFromWindowExits)
{
    startPlaying();
    manager.enterFloating();
    platform.lastWindow()->requestClose();
    EXPECT_TRUE(manager.isActive(Surface::Floating));

    pumpEvents();
    EXPECT_EQ(manager.activeSurface(), Surface::Main);
}

TEST_F(SurfaceManagerTest, EnteringActiveSurfaceAgainIsNoop)
{
    startPlaying();
    EXPECT_TRUE(manager.enterFullscreen());
    EXPECT_FALSE(manager.enterFullscreen());
    EXPECT_EQ(platform.windows.size(), 1);
    EXPECT_EQ(changes.size(), 1);
}

TEST_F(SurfaceManagerTest, SwitchingSecondariesClosesThePreviousOne)
{
    FakeEngine* engine = startPlaying();
    manager.enterFullscreen();
    FakeSurfaceWindow* fullscreen = platform.lastWindow();

    ASSERT_TRUE(manager.enterFloating());
    FakeSurfaceWindow* floating = platform.lastWindow();
    EXPECT_TRUE(fullscreen->disposed);
    EXPECT_FALSE(floating->disposed);
    EXPECT_EQ(floating->host()->attachedEngine(), engine);
    EXPECT_TRUE(manager.isActive(Surface::Floating));
    EXPECT_TRUE(platform.mainHidden);
}

TEST_F(SurfaceManagerTest, ToggleEntersAndLeaves)
{
    startPlaying();
    manager.toggleFloating();
    EXPECT_TRUE(manager.isActive(Surface::Floating));
    manager.toggleFloating();
    EXPECT_TRUE(manager.isActive(Surface::Main));
    manager.toggleFullscreen();
    EXPECT_TRUE(manager.isActive(Surface::Fullscreen));
    manager.exitSecondary();
    EXPECT_TRUE(manager.isActive(Surface::Main));
}

TEST_F(SurfaceManagerTest, FailedAttachStaysOnMain)
{
    FakeEngine* engine = startPlaying();
    platform.failWindowAttach = true;

    EXPECT_FALSE(manager.enterFullscreen());
    ASSERT_NE(platform.lastWindow(), nullptr);
    EXPECT_TRUE(platform.lastWindow()->disposed);
    EXPECT_EQ(platform.fakeMain().attachedEngine(), engine);
    EXPECT_EQ(manager.activeSurface(), Surface::Main);
    EXPECT_FALSE(platform.mainHidden);
    EXPECT_TRUE(changes.isEmpty());
}

// Test that a refused reattach keeps the secondary window holding the engine
TEST_F(SurfaceManagerTest, FailedReattachStaysOnSecondary)
{
    FakeEngine* engine = startPlaying();
    ASSERT_TRUE(manager.enterFullscreen());
    FakeSurfaceWindow* window = platform.lastWindow();
    platform.fakeMain().attachOk = false;
    platform.log.clear();
    changes.clear();

    manager.exitFullscreen();
    EXPECT_EQ(manager.activeSurface(), Surface::Fullscreen);
    EXPECT_FALSE(window->disposed);
    EXPECT_EQ(window->host()->attachedEngine(), engine);
    EXPECT_TRUE(platform.log.isEmpty());
    EXPECT_TRUE(platform.mainHidden);
    EXPECT_TRUE(changes.isEmpty());

    // Switching to Floating cannot leave Fullscreen either
    EXPECT_FALSE(manager.enterFloating());
    EXPECT_EQ(manager.activeSurface(), Surface::Fullscreen);
    EXPECT_EQ(platform.windows.size(), 1);

    platform.fakeMain().attachOk = true;
    manager.exitFullscreen();
    EXPECT_EQ(manager.activeSurface(), Surface::Main);
    EXPECT_EQ(platform.fakeMain().attachedEngine(), engine);
    EXPECT_TRUE(window->disposed);
}

TEST_F(SurfaceManagerTest, EngineReplacedWhileFullscreenStaysFullscreen)
{
    startPlaying();
    manager.enterFullscreen();
    FakeSurfaceWindow* window = platform.lastWindow();

    controller.play("http://live/other");
    FakeEngine* fresh = recorder.last();
    EXPECT_EQ(window->host()->attachedEngine(), fresh);
    EXPECT_EQ(platform.fakeMain().attachedEngine(), nullptr);
}

TEST_F(SurfaceManagerTest, SecondaryWithoutEngine)
{
    ASSERT_TRUE(manager.enterFloating());
    EXPECT_EQ(platform.lastWindow()->host()->attachedEngine(), nullptr);
    manager.exitFloating();
    EXPECT_EQ(manager.activeSurface(), Surface::Main);
    EXPECT_EQ(manager.resumeNudgesIssued(), 0);
}

// Test that a stream paused by the move back gets nudged a bounded number of times
TEST_F(SurfaceManagerTest, ResumeNudgesAfterExitAreBounded)
{
    FakeEngine* engine = startPlaying();
    manager.enterFullscreen();
    platform.fakeMain().onAttach = [engine](PlaybackEngine*) { engine->report(EngineState::Paused); };

    const int playsBefore = engine->playCalls;
    manager.exitFullscreen();
    EXPECT_EQ(controller.state(), PlaybackState::Paused);

    pumpEvents(50);
    EXPECT_EQ(manager.resumeNudgesIssued(), 3);
    EXPECT_EQ(engine->playCalls, playsBefore + 3);
    EXPECT_EQ(manager.activeSurface(), Surface::Main);
}

TEST_F(SurfaceManagerTest, ResumeNudgesStopOncePlaying)
{
    FakeEngine* engine = startPlaying();
    manager.enterFullscreen();
    platform.fakeMain().onAttach = [engine](PlaybackEngine*) { engine->report(EngineState::Paused); };
    engine->playReportsPlaying = true;

    manager.exitFullscreen();
    pumpEvents(50);
    EXPECT_EQ(manager.resumeNudgesIssued(), 1);
    EXPECT_EQ(controller.state(), PlaybackState::Playing);
}

TEST_F(SurfaceManagerTest, ResumeNudgesStopOnNewPlayIntent)
{
    FakeEngine* engine = startPlaying();
    manager.enterFullscreen();
    platform.fakeMain().onAttach = [engine](PlaybackEngine*) { engine->report(EngineState::Paused); };

    manager.exitFullscreen();
    platform.fakeMain().onAttach = nullptr;
    controller.play("http://live/next");
    pumpEvents(50);
    EXPECT_EQ(manager.resumeNudgesIssued(), 0);
}

TEST_F(SurfaceManagerTest, NoNudgesWhenNotPlayingBeforeExit)
{
    controller.play("http://live/channel");
    manager.enterFullscreen();
    manager.exitFullscreen();
    pumpEvents(50);
    EXPECT_EQ(manager.resumeNudgesIssued(), 0);
}

TEST(SurfaceManagerLifetimeTest, DestructionDisposesOpenWindow)
{
    EngineRecorder recorder;
    FakePlatform platform;
    PlaybackController controller(recorder.factory());
    QPointer<FakeSurfaceWindow> window;
    {
        SurfaceManager manager(&platform, &controller);
        manager.enterFullscreen();
        window = platform.lastWindow();
        ASSERT_FALSE(window.isNull());
        EXPECT_FALSE(window->disposed);
    }
    ASSERT_FALSE(window.isNull());
    EXPECT_TRUE(window->disposed);
    pumpEvents();
    EXPECT_TRUE(window.isNull());
}

// Test that a round trip through Fullscreen leaves playback alone
TEST_F(SurfaceManagerTest, RoundTripDoesNotTouchPlaybackState)
{
    FakeEngine* engine = startPlaying();
    QList<PlaybackState> states;
    QObject::connect(&controller, &PlaybackController::stateChanged,
                     [&states](PlaybackState s) { states.append(s); });
    const quint64 generation = controller.generation();

    manager.enterFullscreen();
    manager.exitFullscreen();
    pumpEvents();

    EXPECT_EQ(controller.state(), PlaybackState::Playing);
    EXPECT_EQ(controller.generation(), generation);
    EXPECT_TRUE(states.isEmpty());
    EXPECT_EQ(recorder.created(), 1);
    EXPECT_EQ(platform.fakeMain().attachedEngine(), engine);
    EXPECT_EQ(manager.resumeNudgesIssued(), 0);
}

// Test that Fullscreen is fully gone before Floating starts
TEST_F(SurfaceManagerTest, FloatingFromFullscreenExitsFirst)
{
    startPlaying();
    manager.enterFullscreen();
    platform.log.clear();

    manager.enterFloating();
    EXPECT_EQ(platform.log, QStringList() << "attach:Main" << "release:Fullscreen"
                                          << "attach:Floating" << "release:Main");
    EXPECT_EQ(changes, QList<Surface>() << Surface::Fullscreen << Surface::Main << Surface::Floating);
    EXPECT_EQ(platform.restoreCount, 1);
}
