#include <unity.h>

#include "frame_resampler.h"

namespace {

RecordedMotion makeMotion() {
    RecordedMotion motion;
    motion.frames.push_back(MotionFrame{0, {0, 0}});
    motion.frames.push_back(MotionFrame{1000, {100, 50}});
    motion.frames.push_back(MotionFrame{1500, {200, 50}});
    return motion;
}

void assertPose(const Pose &expected, const Pose &actual) {
    TEST_ASSERT_EQUAL_UINT32(expected.size(), actual.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        TEST_ASSERT_EQUAL_INT(expected[i], actual[i]);
    }
}

}  // namespace

void setUp(void) {}
void tearDown(void) {}

static void test_smooth_midpoint_of_first_span(void) {
    RecordedMotion motion = makeMotion();
    FrameResampler resampler(motion, EasingMode::Smooth);

    FrameResampler::Sample sample = resampler.sample(500);
    assertPose({50, 25}, sample.positions);
    TEST_ASSERT_FALSE(sample.finished);
    TEST_ASSERT_EQUAL_UINT32(0, resampler.cursor());
}

static void test_linear_inside_second_span(void) {
    RecordedMotion motion = makeMotion();
    FrameResampler resampler(motion, EasingMode::Linear);

    resampler.sample(200);
    FrameResampler::Sample sample = resampler.sample(1250);
    assertPose({150, 50}, sample.positions);
    TEST_ASSERT_EQUAL_UINT32(1, resampler.cursor());
}

static void test_finishes_on_last_frame(void) {
    RecordedMotion motion = makeMotion();
    FrameResampler resampler(motion, EasingMode::Linear);

    FrameResampler::Sample atEnd = resampler.sample(1500);
    TEST_ASSERT_TRUE(atEnd.finished);
    assertPose({200, 50}, atEnd.positions);

    FrameResampler::Sample past = resampler.sample(9000);
    TEST_ASSERT_TRUE(past.finished);
    assertPose({200, 50}, past.positions);
}

static void test_before_start_returns_first_frame(void) {
    RecordedMotion motion = makeMotion();
    FrameResampler resampler(motion, EasingMode::Linear);

    FrameResampler::Sample sample = resampler.sample(-20);
    assertPose({0, 0}, sample.positions);
    TEST_ASSERT_FALSE(sample.finished);
}

static void test_rewind_restarts_search(void) {
    RecordedMotion motion = makeMotion();
    FrameResampler resampler(motion, EasingMode::Linear);

    resampler.sample(1400);
    TEST_ASSERT_EQUAL_UINT32(1, resampler.cursor());

    FrameResampler::Sample sample = resampler.sample(250);
    assertPose({25, 13}, sample.positions);
    TEST_ASSERT_EQUAL_UINT32(0, resampler.cursor());
}

static void test_instant_holds_earlier_frame(void) {
    RecordedMotion motion = makeMotion();
    FrameResampler resampler(motion, EasingMode::Instant);

    assertPose({0, 0}, resampler.sample(999).positions);
    assertPose({100, 50}, resampler.sample(1000).positions);
    assertPose({100, 50}, resampler.sample(1499).positions);
}

static void test_single_frame_finishes_at_once(void) {
    RecordedMotion motion;
    motion.frames.push_back(MotionFrame{0, {7, 8}});
    FrameResampler resampler(motion, EasingMode::Smooth);

    FrameResampler::Sample sample = resampler.sample(0);
    TEST_ASSERT_TRUE(sample.finished);
    assertPose({7, 8}, sample.positions);
}

static void test_empty_recording_finishes_with_no_positions(void) {
    RecordedMotion motion;
    FrameResampler resampler(motion, EasingMode::Smooth);

    FrameResampler::Sample sample = resampler.sample(100);
    TEST_ASSERT_TRUE(sample.finished);
    TEST_ASSERT_TRUE(sample.positions.empty());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_smooth_midpoint_of_first_span);
    RUN_TEST(test_linear_inside_second_span);
    RUN_TEST(test_finishes_on_last_frame);
    RUN_TEST(test_before_start_returns_first_frame);
    RUN_TEST(test_rewind_restarts_search);
    RUN_TEST(test_instant_holds_earlier_frame);
    RUN_TEST(test_single_frame_finishes_at_once);
    RUN_TEST(test_empty_recording_finishes_with_no_positions);
    return UNITY_END();
}
