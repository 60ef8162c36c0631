// daemon/tests/test_muter_engine.cpp
#include <gtest/gtest.h>
#include <thread>
#include "fakes.h"
#include "muter_engine.h"

using namespace std::chrono_literals;

namespace {
const uint32_t OWN_PID = 999;
const uint32_t DESKTOP_PID = 50;
}

class MuterEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        enumerator = std::make_shared<FakeSessionEnumerator>();
        audio_manager = std::make_shared<AudioManager>(enumerator);
        config = std::make_shared<ConfigStore>();
        foreground = std::make_shared<std::optional<uint32_t>>(DESKTOP_PID);
        engine = make_engine();
    }

    std::unique_ptr<MuterEngine> make_engine(FamilyMap initial_families = {}) {
        families = std::make_shared<FamilyMap>(std::move(initial_families));
        auto tracker = std::make_unique<ForegroundTracker>(
            std::make_unique<FakeForegroundSource>(foreground),
            std::make_unique<FakeProcessFamilySource>(families));
        MuterEngine::Options options;
        options.own_pid = OWN_PID;
        options.clock = clock.fn();
        return std::make_unique<MuterEngine>(audio_manager, config, std::move(tracker), nullptr, options);
    }

    // Past the refresh interval so the next tick re-enumerates.
    TickSummary tick_after_interval() {
        clock.advance(2100ms);
        return engine->tick();
    }

    void expect_muted_pids_are_cached() {
        for (const auto& state : engine->get_app_states()) {
            if (state.is_muted_by_us) {
                EXPECT_TRUE(audio_manager->contains(state.pid)) << "pid " << state.pid;
            }
        }
    }

    std::optional<AppAudioState> state_of(uint32_t pid) {
        for (const auto& state : engine->get_app_states()) {
            if (state.pid == pid) return state;
        }
        return std::nullopt;
    }

    ManualClock clock;
    std::shared_ptr<FakeSessionEnumerator> enumerator;
    std::shared_ptr<AudioManager> audio_manager;
    std::shared_ptr<ConfigStore> config;
    std::shared_ptr<std::optional<uint32_t>> foreground;
    std::shared_ptr<FamilyMap> families;
    std::unique_ptr<MuterEngine> engine;
};

TEST_F(MuterEngineTest, BackgroundSessionIsMuted) {
    auto os = enumerator->add(100, "spotify.exe");
    TickSummary summary = engine->tick();

    EXPECT_TRUE(engine->is_muted_by_us(100));
    EXPECT_TRUE(os->muted);
    EXPECT_EQ(summary.muted_count, 1u);
    EXPECT_EQ(summary.active_sessions, 1u);
    EXPECT_TRUE(summary.refreshed);
    EXPECT_EQ(summary.foreground_pid, std::optional<uint32_t>(DESKTOP_PID));
}

TEST_F(MuterEngineTest, ForegroundSwitchUnmutesImmediately) {
    auto os = enumerator->add(100, "spotify.exe");
    engine->tick();
    ASSERT_TRUE(engine->is_muted_by_us(100));

    clock.advance(500ms);
    *foreground = 100u;
    TickSummary summary = engine->tick();

    EXPECT_TRUE(summary.foreground_changed);
    EXPECT_FALSE(engine->is_muted_by_us(100));
    EXPECT_FALSE(os->muted);
}

TEST_F(MuterEngineTest, AlwaysMutedAppIsMutedWhileForeground) {
    auto os = enumerator->add(200, "game.exe");
    *foreground = 200u;
    engine->tick();
    ASSERT_FALSE(engine->is_muted_by_us(200));

    config->add_always_muted_app("Game.exe");
    engine->tick();

    EXPECT_TRUE(engine->is_muted_by_us(200));
    EXPECT_TRUE(os->muted);
}

TEST_F(MuterEngineTest, DisablingMutingReleasesEverything) {
    auto os100 = enumerator->add(100, "spotify.exe");
    auto os200 = enumerator->add(200, "chrome.exe");
    engine->tick();
    ASSERT_EQ(engine->muted_count(), 2u);

    config->set_muting_enabled(false);
    engine->tick();

    EXPECT_EQ(engine->muted_count(), 0u);
    EXPECT_FALSE(os100->muted);
    EXPECT_FALSE(os200->muted);

    tick_after_interval();
    EXPECT_EQ(engine->muted_count(), 0u);
    EXPECT_EQ(os100->mute_calls, 1);
}

TEST_F(MuterEngineTest, ReenablingMutingMutesBackgroundAgain) {
    enumerator->add(100, "spotify.exe");
    config->set_muting_enabled(false);
    engine->tick();
    EXPECT_FALSE(engine->is_muted_by_us(100));

    config->set_muting_enabled(true);
    engine->tick();
    EXPECT_TRUE(engine->is_muted_by_us(100));
}

TEST_F(MuterEngineTest, UnmuteAllClearsEveryFlag) {
    auto os100 = enumerator->add(100, "spotify.exe");
    auto os200 = enumerator->add(200, "chrome.exe");
    enumerator->add(300, "vlc.exe");
    config->add_always_muted_app("vlc.exe");
    *foreground = 300u;
    engine->tick();
    ASSERT_EQ(engine->muted_count(), 3u);

    // A failing handle must not keep the flag through the fail-safe.
    os200->fail_set = true;
    engine->unmute_all();

    EXPECT_EQ(engine->muted_count(), 0u);
    for (const auto& state : engine->get_app_states()) {
        EXPECT_FALSE(state.is_muted_by_us);
    }
    EXPECT_FALSE(os100->muted);
}

TEST_F(MuterEngineTest, UnmuteAllOnEmptyEngine) {
    engine->unmute_all();
    EXPECT_EQ(engine->muted_count(), 0u);
}

TEST_F(MuterEngineTest, ForegroundIsNeverMutedByUs) {
    enumerator->add(100, "spotify.exe");
    enumerator->add(200, "chrome.exe");
    *foreground = 100u;
    for (int i = 0; i < 5; ++i) {
        engine->tick();
        EXPECT_FALSE(engine->is_muted_by_us(100));
        clock.advance(700ms);
    }
    EXPECT_TRUE(engine->is_muted_by_us(200));

    *foreground = 200u;
    clock.advance(50ms);
    engine->tick();
    EXPECT_FALSE(engine->is_muted_by_us(200));
    EXPECT_TRUE(engine->is_muted_by_us(100));
    expect_muted_pids_are_cached();
}

TEST_F(MuterEngineTest, ExcludingAnAppReleasesItAndKeepsItReleased) {
    auto os = enumerator->add(100, "Spotify.exe");
    engine->tick();
    ASSERT_TRUE(engine->is_muted_by_us(100));

    config->add_excluded_app("SPOTIFY.EXE");
    engine->tick();
    EXPECT_FALSE(engine->is_muted_by_us(100));
    EXPECT_FALSE(os->muted);

    for (int i = 0; i < 3; ++i) {
        tick_after_interval();
        EXPECT_FALSE(engine->is_muted_by_us(100));
    }
    EXPECT_EQ(os->mute_calls, 1);
}

TEST_F(MuterEngineTest, VanishedSessionIsUnmutedOnceThenEvicted) {
    auto os = enumerator->add(100, "spotify.exe");
    engine->tick();
    ASSERT_TRUE(os->muted);

    enumerator->remove(100);
    tick_after_interval();

    EXPECT_FALSE(engine->is_muted_by_us(100));
    EXPECT_FALSE(os->muted);
    EXPECT_EQ(os->unmute_calls, 1);
    auto state = state_of(100);
    ASSERT_TRUE(state.has_value());
    EXPECT_FALSE(state->is_active);

    for (int i = 0; i < 15; ++i) tick_after_interval();

    EXPECT_FALSE(state_of(100).has_value());
    EXPECT_EQ(os->unmute_calls, 1);
}

TEST_F(MuterEngineTest, InactiveEntryStaysUntilStaleThreshold) {
    enumerator->add(100, "spotify.exe");
    engine->tick();
    enumerator->remove(100);

    clock.advance(29s);
    engine->tick();
    EXPECT_TRUE(state_of(100).has_value());

    clock.advance(2s);
    engine->tick();
    EXPECT_FALSE(state_of(100).has_value());
}

TEST_F(MuterEngineTest, OwnProcessIsNeverMuted) {
    auto os = enumerator->add(OWN_PID, "hushd.exe");
    engine->tick();
    EXPECT_FALSE(engine->is_muted_by_us(OWN_PID));

    config->add_always_muted_app("hushd.exe");
    engine->tick();
    EXPECT_FALSE(engine->is_muted_by_us(OWN_PID));

    config->set_app_policy("hushd.exe", AppPolicy::STANDARD);
    *foreground = 123u;
    tick_after_interval();
    EXPECT_FALSE(engine->is_muted_by_us(OWN_PID));
    EXPECT_EQ(os->mute_calls, 0);
}

TEST_F(MuterEngineTest, TicksWithinIntervalEnumerateOnce) {
    enumerator->add(100, "spotify.exe");
    engine->tick();
    clock.advance(500ms);
    TickSummary second = engine->tick();

    EXPECT_EQ(enumerator->calls(), 1);
    EXPECT_FALSE(second.refreshed);

    clock.advance(1600ms);
    engine->tick();
    EXPECT_EQ(enumerator->calls(), 2);
}

TEST_F(MuterEngineTest, FocusSwitchAlwaysReenumerates) {
    auto game = enumerator->add(100, "game.exe");
    *foreground = 100u;
    engine->tick();
    ASSERT_FALSE(game->muted);

    // Starts playing right after the refresh, then focus moves away.
    clock.advance(50ms);
    auto music = enumerator->add(300, "spotify.exe");
    clock.advance(50ms);
    *foreground = DESKTOP_PID;
    TickSummary summary = engine->tick();

    EXPECT_TRUE(summary.foreground_changed);
    EXPECT_TRUE(summary.refreshed);
    EXPECT_EQ(enumerator->calls(), 2);
    EXPECT_TRUE(engine->is_muted_by_us(300));
    EXPECT_TRUE(music->muted);
    EXPECT_TRUE(game->muted);
}

TEST_F(MuterEngineTest, FocusSwitchDuringOutsideRefreshUsesCache) {
    auto os = enumerator->add(100, "spotify.exe");
    engine->tick();
    ASSERT_TRUE(os->muted);

    enumerator->hold();
    std::thread outside([this] { audio_manager->refresh(); });
    enumerator->wait_until_held();

    clock.advance(100ms);
    *foreground = 100u;
    TickSummary summary = engine->tick();

    EXPECT_TRUE(summary.foreground_changed);
    EXPECT_FALSE(summary.refreshed);
    EXPECT_FALSE(engine->is_muted_by_us(100));
    EXPECT_FALSE(os->muted);

    enumerator->release();
    outside.join();

    // The skipped refresh is retried on the next tick.
    clock.advance(100ms);
    EXPECT_TRUE(engine->tick().refreshed);
}

TEST_F(MuterEngineTest, UserMuteSurvivesFocusSwitches) {
    auto os = enumerator->add(200, "chrome.exe");
    *foreground = 200u;
    engine->tick();

    // The user mutes it in the mixer, then switches away quickly.
    os->muted = true;
    clock.advance(100ms);
    *foreground = DESKTOP_PID;
    engine->tick();
    EXPECT_FALSE(engine->is_muted_by_us(200));

    clock.advance(100ms);
    *foreground = 200u;
    engine->tick();
    EXPECT_TRUE(os->muted);
    EXPECT_EQ(os->set_mute_calls, 0);
}

TEST_F(MuterEngineTest, UserMutedSessionIsNotClaimed) {
    auto os = enumerator->add(300, "discord.exe", true);
    engine->tick();
    EXPECT_FALSE(engine->is_muted_by_us(300));

    *foreground = 300u;
    clock.advance(400ms);
    engine->tick();
    EXPECT_TRUE(os->muted);
    EXPECT_EQ(os->set_mute_calls, 0);

    auto state = state_of(300);
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->original_mute_state);
}

TEST_F(MuterEngineTest, FailedMuteIsNotClaimed) {
    auto os = enumerator->add(100, "spotify.exe");
    os->fail_set = true;
    engine->tick();
    EXPECT_FALSE(engine->is_muted_by_us(100));

    os->fail_set = false;
    tick_after_interval();
    EXPECT_TRUE(engine->is_muted_by_us(100));
}

TEST_F(MuterEngineTest, FailedReleaseIsRetried) {
    auto os = enumerator->add(100, "spotify.exe");
    engine->tick();
    ASSERT_TRUE(os->muted);

    os->fail_set = true;
    clock.advance(500ms);
    *foreground = 100u;
    engine->tick();
    EXPECT_TRUE(engine->is_muted_by_us(100));

    os->fail_set = false;
    tick_after_interval();
    EXPECT_FALSE(engine->is_muted_by_us(100));
    EXPECT_FALSE(os->muted);
}

TEST_F(MuterEngineTest, ForegroundFamilyIsTreatedAsForeground) {
    engine = make_engine({{100u, {101u}}});
    enumerator->add(100, "chrome.exe");
    auto helper = enumerator->add(101, "chrome.exe");
    auto other = enumerator->add(200, "spotify.exe");
    *foreground = 100u;
    engine->tick();

    EXPECT_FALSE(engine->is_muted_by_us(101));
    EXPECT_FALSE(helper->muted);
    EXPECT_TRUE(other->muted);
}

TEST_F(MuterEngineTest, HelperSpawnedAfterFocusJoinsFamily) {
    enumerator->add(100, "browser.exe");
    *foreground = 100u;
    engine->tick();

    // The audio helper starts lazily, after the window already has focus.
    (*families)[100u] = {101u};
    auto helper = enumerator->add(101, "browser.exe");
    auto other = enumerator->add(200, "spotify.exe");
    tick_after_interval();

    EXPECT_FALSE(engine->is_muted_by_us(101));
    EXPECT_FALSE(helper->muted);
    EXPECT_TRUE(other->muted);

    json payload = engine->get_dashboard_payload();
    for (const auto& session : payload["sessions"]) {
        if (session["pid"].get<uint32_t>() == 101u) {
            EXPECT_EQ(session["status"].get<std::string>(), "FOREGROUND");
        }
    }
}

TEST_F(MuterEngineTest, PolicyChangeForcesRefresh) {
    enumerator->add(100, "spotify.exe");
    engine->tick();
    clock.advance(100ms);
    config->set_poll_interval_ms(300);
    TickSummary summary = engine->tick();
    EXPECT_TRUE(summary.refreshed);
    EXPECT_EQ(enumerator->calls(), 2);
}

TEST_F(MuterEngineTest, ForceRefreshEnumeratesImmediately) {
    enumerator->add(100, "spotify.exe");
    engine->tick();
    enumerator->add(200, "chrome.exe");
    clock.advance(10ms);

    TickSummary summary = engine->force_refresh();
    EXPECT_TRUE(summary.refreshed);
    EXPECT_EQ(enumerator->calls(), 2);
    EXPECT_TRUE(engine->is_muted_by_us(200));
}

TEST_F(MuterEngineTest, FailedEnumerationLeavesNothingMuted) {
    auto os = enumerator->add(100, "spotify.exe");
    engine->tick();
    ASSERT_TRUE(os->muted);

    enumerator->set_fail(true);
    tick_after_interval();
    EXPECT_EQ(engine->muted_count(), 0u);
    EXPECT_FALSE(os->muted);
    expect_muted_pids_are_cached();
}

TEST_F(MuterEngineTest, MutedPidsAlwaysHaveCachedHandles) {
    enumerator->add(100, "spotify.exe");
    enumerator->add(200, "chrome.exe");
    enumerator->add(300, "vlc.exe");
    engine->tick();
    expect_muted_pids_are_cached();

    enumerator->remove(200);
    tick_after_interval();
    expect_muted_pids_are_cached();

    *foreground = 300u;
    clock.advance(100ms);
    engine->tick();
    expect_muted_pids_are_cached();
    EXPECT_EQ(engine->muted_count(), 1u);
}

TEST_F(MuterEngineTest, ShutdownUnmutesAndStopsTicking) {
    auto os = enumerator->add(100, "spotify.exe");
    engine->tick();
    ASSERT_TRUE(os->muted);

    engine->shutdown();
    EXPECT_TRUE(engine->is_shut_down());
    EXPECT_FALSE(os->muted);

    auto late = enumerator->add(200, "chrome.exe");
    tick_after_interval();
    engine->force_refresh();
    EXPECT_FALSE(late->muted);
    EXPECT_EQ(engine->muted_count(), 0u);
}

TEST_F(MuterEngineTest, TeardownWithoutShutdownRunsFailSafe) {
    auto os = enumerator->add(100, "spotify.exe");
    engine->tick();
    ASSERT_TRUE(os->muted);

    engine.reset();
    EXPECT_FALSE(os->muted);
    EXPECT_EQ(os->unmute_calls, 1);
}

TEST_F(MuterEngineTest, ActiveSessionsForUi) {
    enumerator->add(100, "spotify.exe");
    enumerator->add(200, "chrome.exe");
    engine->tick();
    enumerator->remove(200);
    tick_after_interval();

    EXPECT_EQ(engine->get_active_sessions().size(), 1u);
    EXPECT_EQ(engine->get_app_states().size(), 2u);

    std::vector<AppAudioState> out;
    ASSERT_TRUE(engine->try_get_active_sessions(out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].pid, 100u);
    EXPECT_EQ(engine->audio_manager(), audio_manager);
}

TEST_F(MuterEngineTest, DashboardPayloadDescribesEachSession) {
    enumerator->add(100, "spotify.exe");
    enumerator->add(200, "chrome.exe");
    enumerator->add(300, "discord.exe");
    enumerator->add(400, "game.exe");
    config->add_excluded_app("discord.exe");
    *foreground = 200u;
    engine->tick();

    json payload = engine->get_dashboard_payload();
    EXPECT_TRUE(payload["muting_enabled"].get<bool>());
    EXPECT_EQ(payload["foreground_pid"].get<uint32_t>(), 200u);
    EXPECT_EQ(payload["muted_count"].get<size_t>(), 2u);
    EXPECT_EQ(payload["active_sessions"].get<size_t>(), 4u);

    std::map<uint32_t, std::string> status;
    for (const auto& session : payload["sessions"]) {
        status[session["pid"].get<uint32_t>()] = session["status"].get<std::string>();
    }
    EXPECT_EQ(status[100], "MUTED_BY_US");
    EXPECT_EQ(status[200], "FOREGROUND");
    EXPECT_EQ(status[300], "EXCLUDED");
    EXPECT_EQ(status[400], "MUTED_BY_US");
}
