// daemon/tests/test_audio_manager.cpp
#include <gtest/gtest.h>
#include <thread>
#include "audio_manager.h"
#include "fakes.h"

class AudioManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        enumerator = std::make_shared<FakeSessionEnumerator>();
        manager = std::make_shared<AudioManager>(enumerator);
    }

    std::shared_ptr<FakeSessionEnumerator> enumerator;
    std::shared_ptr<AudioManager> manager;
};

TEST_F(AudioManagerTest, RefreshReturnsSessionsAndCachesHandles) {
    enumerator->add(100, "spotify.exe");
    enumerator->add(200, "chrome.exe", true);

    auto sessions = manager->refresh();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(manager->cached_count(), 2u);
    EXPECT_TRUE(manager->contains(100));
    EXPECT_EQ(manager->refresh_count(), 1u);

    auto cached = manager->get_cached(200);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->process_name, "chrome.exe");
}

TEST_F(AudioManagerTest, MuteAndUnmuteGoThroughCachedHandleWithoutEnumerating) {
    auto os = enumerator->add(100, "spotify.exe");
    manager->refresh();
    int calls_after_refresh = enumerator->calls();

    EXPECT_EQ(manager->mute(100), MuteResult::APPLIED);
    EXPECT_TRUE(os->muted);
    EXPECT_EQ(manager->unmute(100), MuteResult::APPLIED);
    EXPECT_FALSE(os->muted);
    EXPECT_EQ(enumerator->calls(), calls_after_refresh);
}

TEST_F(AudioManagerTest, UnknownPidIsNoOp) {
    EXPECT_EQ(manager->mute(999), MuteResult::NOT_CACHED);
    EXPECT_EQ(manager->unmute(999), MuteResult::NOT_CACHED);
    EXPECT_FALSE(manager->is_muted(999).has_value());
}

TEST_F(AudioManagerTest, OsFailureIsReportedNotThrown) {
    auto os = enumerator->add(100, "spotify.exe");
    manager->refresh();
    os->fail_set = true;
    EXPECT_EQ(manager->mute(100), MuteResult::FAILED);
    EXPECT_FALSE(os->muted);
}

TEST_F(AudioManagerTest, IsMutedReadsLiveOsFlag) {
    auto os = enumerator->add(100, "spotify.exe");
    manager->refresh();
    EXPECT_EQ(manager->is_muted(100), std::optional<bool>(false));

    // Changed out of band, e.g. from the volume mixer.
    os->muted = true;
    EXPECT_EQ(manager->is_muted(100), std::optional<bool>(true));
    EXPECT_EQ(manager->read_mute_state(100), std::optional<bool>(true));
}

TEST_F(AudioManagerTest, RefreshReplacesMapAndRetiresVanishedPids) {
    auto os = enumerator->add(100, "spotify.exe");
    enumerator->add(200, "chrome.exe");
    manager->refresh();

    enumerator->remove(100);
    auto sessions = manager->refresh();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_FALSE(manager->contains(100));
    EXPECT_TRUE(manager->is_retired(100));
    EXPECT_EQ(manager->cached_pids(), std::vector<uint32_t>{200});

    // A retired handle still reaches the OS session until released.
    EXPECT_EQ(manager->unmute(100), MuteResult::APPLIED);
    EXPECT_FALSE(manager->read_mute_state(100).has_value());

    EXPECT_EQ(manager->release_retired(), 1u);
    EXPECT_EQ(manager->unmute(100), MuteResult::NOT_CACHED);
}

TEST_F(AudioManagerTest, ReappearingPidLeavesRetiredSet) {
    enumerator->add(100, "spotify.exe");
    manager->refresh();
    enumerator->remove(100);
    manager->refresh();
    ASSERT_TRUE(manager->is_retired(100));

    enumerator->resume(100);
    manager->refresh();
    EXPECT_TRUE(manager->contains(100));
    EXPECT_FALSE(manager->is_retired(100));
}

TEST_F(AudioManagerTest, FailedEnumerationEmptiesTheCache) {
    enumerator->add(100, "spotify.exe");
    manager->refresh();
    enumerator->set_fail(true);
    EXPECT_TRUE(manager->refresh().empty());
    EXPECT_EQ(manager->cached_count(), 0u);
}

TEST_F(AudioManagerTest, TryRefreshGivesWayToRunningRefresh) {
    auto os = enumerator->add(100, "spotify.exe");
    manager->refresh();

    enumerator->hold();
    std::thread running([this] { manager->refresh(); });
    enumerator->wait_until_held();

    EXPECT_FALSE(manager->try_refresh().has_value());
    // The cache stays usable meanwhile.
    EXPECT_EQ(manager->mute(100), MuteResult::APPLIED);
    EXPECT_TRUE(os->muted);

    enumerator->release();
    running.join();

    auto sessions = manager->try_refresh();
    ASSERT_TRUE(sessions.has_value());
    EXPECT_EQ(sessions->size(), 1u);
    EXPECT_EQ(manager->refresh_count(), 3u);
}
