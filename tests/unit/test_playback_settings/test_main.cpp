#include <unity.h>

#include "config_manager.h"
#include "fake_filesystem.h"
#include "fake_log_sink.h"
#include "playback_settings.h"

static FakeLogSink g_logSink;

void setUp(void) {
    g_logSink.clear();
    infra::setLogSink(&g_logSink);
}

void tearDown(void) {
    infra::setLogSink(nullptr);
}

static void test_defaults(void) {
    PlaybackSettings settings;
    TEST_ASSERT_TRUE(settings.easingMode() == EasingMode::Smooth);
    TEST_ASSERT_EQUAL_UINT32(1000, settings.durationMs());
    TEST_ASSERT_EQUAL_UINT32(100, settings.durationStepMs());
    TEST_ASSERT_FALSE(settings.loop());
}

static void test_faster_and_slower_stay_in_bounds(void) {
    PlaybackSettings settings;
    settings.setDurationMs(200);
    TEST_ASSERT_EQUAL_UINT32(100, settings.faster());
    TEST_ASSERT_EQUAL_UINT32(100, settings.faster());

    settings.setDurationMs(4950);
    TEST_ASSERT_EQUAL_UINT32(5000, settings.slower());
    TEST_ASSERT_EQUAL_UINT32(5000, settings.slower());
}

static void test_duration_is_clamped(void) {
    PlaybackSettings settings;
    settings.setDurationMs(10);
    TEST_ASSERT_EQUAL_UINT32(PlaybackSettings::kMinDurationMs, settings.durationMs());
    settings.setDurationMs(60000);
    TEST_ASSERT_EQUAL_UINT32(PlaybackSettings::kMaxDurationMs, settings.durationMs());
}

static void test_cycle_easing_visits_every_mode(void) {
    PlaybackSettings settings;
    TEST_ASSERT_TRUE(settings.cycleEasingMode() == EasingMode::Snap);
    TEST_ASSERT_TRUE(settings.cycleEasingMode() == EasingMode::Gentle);
    TEST_ASSERT_TRUE(settings.cycleEasingMode() == EasingMode::Linear);
    TEST_ASSERT_TRUE(settings.cycleEasingMode() == EasingMode::Instant);
    TEST_ASSERT_TRUE(settings.cycleEasingMode() == EasingMode::Smooth);
}

static void test_toggle_loop_announces_state(void) {
    PlaybackSettings settings;
    TEST_ASSERT_TRUE(settings.toggleLoop());
    TEST_ASSERT_EQUAL_STRING("Loop: ON - will repeat", g_logSink.entries.back().message.c_str());
    TEST_ASSERT_FALSE(settings.toggleLoop());
}

static void test_apply_config(void) {
    FakeFileSystem fs;
    fs.addFile("config.txt",
               "easing=linear\n"
               "pose_duration_ms=1500\n"
               "duration_step_ms=250\n"
               "loop=1\n");
    ConfigManager &config = ConfigManager::getInstance();
    config.setFileSystem(&fs);
    config.setLogSink(&g_logSink);
    TEST_ASSERT_TRUE(config.loadConfig());

    PlaybackSettings settings;
    settings.applyConfig(config);
    TEST_ASSERT_TRUE(settings.easingMode() == EasingMode::Linear);
    TEST_ASSERT_EQUAL_UINT32(1500, settings.durationMs());
    TEST_ASSERT_EQUAL_UINT32(250, settings.durationStepMs());
    TEST_ASSERT_TRUE(settings.loop());
    TEST_ASSERT_EQUAL_UINT32(1250, settings.faster());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_defaults);
    RUN_TEST(test_faster_and_slower_stay_in_bounds);
    RUN_TEST(test_duration_is_clamped);
    RUN_TEST(test_cycle_easing_visits_every_mode);
    RUN_TEST(test_toggle_loop_announces_state);
    RUN_TEST(test_apply_config);
    return UNITY_END();
}
