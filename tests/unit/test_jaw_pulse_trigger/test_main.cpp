#include <unity.h>

#include "jaw_pulse_trigger.h"

void setUp(void) {}
void tearDown(void) {}

static PulseTrigger::Params makeParams(float threshold, uint32_t cooldownMs, uint32_t openMs) {
    PulseTrigger::Params params;
    params.threshold = threshold;
    params.cooldownMs = cooldownMs;
    params.openDurationMs = openMs;
    return params;
}

static void test_rising_edge_opens(void) {
    PulseTrigger trigger;
    TEST_ASSERT_EQUAL(PulseTrigger::Transition::None, trigger.update(0, 0.0f));
    TEST_ASSERT_EQUAL(PulseTrigger::Transition::Opened, trigger.update(10, 0.2f));
    TEST_ASSERT_TRUE(trigger.isOpen());
    TEST_ASSERT_EQUAL_UINT32(10, trigger.openedAtMs());
    TEST_ASSERT_TRUE(trigger.hasTriggered());
}

static void test_first_trigger_ignores_cooldown(void) {
    PulseTrigger trigger(makeParams(0.05f, 1000, 100));
    TEST_ASSERT_EQUAL(PulseTrigger::Transition::Opened, trigger.update(0, 0.5f));
}

static void test_threshold_itself_counts_as_crossing(void) {
    PulseTrigger trigger(makeParams(0.25f, 50, 100));
    TEST_ASSERT_EQUAL(PulseTrigger::Transition::Opened, trigger.update(0, 0.25f));
}

static void test_closes_after_open_duration_regardless_of_amplitude(void) {
    PulseTrigger trigger(makeParams(0.05f, 50, 100));
    trigger.update(0, 0.9f);

    TEST_ASSERT_EQUAL(PulseTrigger::Transition::None, trigger.update(60, 0.9f));
    TEST_ASSERT_TRUE(trigger.isOpen());
    TEST_ASSERT_EQUAL(PulseTrigger::Transition::Closed, trigger.update(100, 0.9f));
    TEST_ASSERT_FALSE(trigger.isOpen());
}

static void test_sustained_loudness_does_not_retrigger(void) {
    PulseTrigger trigger(makeParams(0.05f, 50, 100));
    trigger.update(0, 0.9f);
    trigger.update(100, 0.9f);

    for (uint32_t t = 110; t < 1000; t += 10) {
        TEST_ASSERT_EQUAL(PulseTrigger::Transition::None, trigger.update(t, 0.9f));
    }
    TEST_ASSERT_EQUAL(PulseTrigger::State::Closed, trigger.state());
}

static void test_cooldown_blocks_early_edges(void) {
    PulseTrigger trigger(makeParams(0.05f, 200, 50));
    trigger.update(0, 0.5f);
    TEST_ASSERT_EQUAL(PulseTrigger::Transition::Closed, trigger.update(50, 0.0f));

    TEST_ASSERT_EQUAL(PulseTrigger::Transition::None, trigger.update(60, 0.5f));
    TEST_ASSERT_FALSE(trigger.isOpen());

    trigger.update(100, 0.0f);
    TEST_ASSERT_EQUAL(PulseTrigger::Transition::Opened, trigger.update(250, 0.5f));
    TEST_ASSERT_EQUAL_UINT32(250, trigger.lastTriggerMs());
}

static void test_release_then_trigger_in_one_update(void) {
    PulseTrigger trigger(makeParams(0.05f, 50, 50));
    trigger.update(0, 0.5f);
    trigger.update(20, 0.0f);

    TEST_ASSERT_EQUAL(PulseTrigger::Transition::Opened, trigger.update(50, 0.5f));
    TEST_ASSERT_TRUE(trigger.isOpen());
    TEST_ASSERT_EQUAL_UINT32(50, trigger.openedAtMs());
}

static void test_reset_forgets_history(void) {
    PulseTrigger trigger(makeParams(0.05f, 5000, 100));
    trigger.update(0, 0.5f);
    trigger.reset();

    TEST_ASSERT_FALSE(trigger.hasTriggered());
    TEST_ASSERT_EQUAL_STRING("CLOSED", pulseStateName(trigger.state()));
    TEST_ASSERT_EQUAL(PulseTrigger::Transition::Opened, trigger.update(10, 0.5f));
    TEST_ASSERT_EQUAL_STRING("OPEN", pulseStateName(trigger.state()));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_rising_edge_opens);
    RUN_TEST(test_first_trigger_ignores_cooldown);
    RUN_TEST(test_threshold_itself_counts_as_crossing);
    RUN_TEST(test_closes_after_open_duration_regardless_of_amplitude);
    RUN_TEST(test_sustained_loudness_does_not_retrigger);
    RUN_TEST(test_cooldown_blocks_early_edges);
    RUN_TEST(test_release_then_trigger_in_one_update);
    RUN_TEST(test_reset_forgets_history);
    return UNITY_END();
}
