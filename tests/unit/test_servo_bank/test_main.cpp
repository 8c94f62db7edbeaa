#include <unity.h>

#include <map>
#include <set>
#include <vector>

#include "fake_log_sink.h"
#include "servo_bank.h"
#include "simulated_servo_bus.h"

namespace {

class FakeServoBus : public IServoBus {
public:
    bool writePosition(uint8_t id, int position) override {
        writes.push_back(std::make_pair(id, position));
        if (failingWrites.count(id)) {
            return false;
        }
        positions[id] = position;
        return true;
    }

    bool readPosition(uint8_t id, int &position) override {
        if (failingReads.count(id) || positions.find(id) == positions.end()) {
            return false;
        }
        position = positions[id];
        return true;
    }

    std::map<uint8_t, int> positions;
    std::vector<std::pair<uint8_t, int>> writes;
    std::set<uint8_t> failingWrites;
    std::set<uint8_t> failingReads;
};

FakeLogSink g_logSink;

}  // namespace

void setUp(void) {
    g_logSink.clear();
    infra::setLogSink(&g_logSink);
}

void tearDown(void) {
    infra::setLogSink(nullptr);
}

static void test_channels_map_to_bus_ids(void) {
    FakeServoBus bus;
    ServoBank bank(bus, {11, 12, 13});

    TEST_ASSERT_EQUAL_UINT32(3, bank.channelCount());
    TEST_ASSERT_TRUE(bank.writeChannel(2, 1000));
    TEST_ASSERT_EQUAL_UINT8(13, bus.writes.back().first);
    TEST_ASSERT_EQUAL_INT(1000, bus.writes.back().second);
}

static void test_writes_are_clamped_to_range(void) {
    FakeServoBus bus;
    ServoBank bank(bus, {1, 2}, 500, 2500);

    TEST_ASSERT_TRUE(bank.writeAll({100, 9000}));
    TEST_ASSERT_EQUAL_INT(500, bus.positions[1]);
    TEST_ASSERT_EQUAL_INT(2500, bus.positions[2]);
    TEST_ASSERT_EQUAL_INT(500, bank.lastKnown()[0]);
}

static void test_swapped_limits_are_normalized(void) {
    FakeServoBus bus;
    ServoBank bank(bus, {1}, 3000, 1000);
    TEST_ASSERT_EQUAL_INT(1000, bank.minPosition());
    TEST_ASSERT_EQUAL_INT(3000, bank.maxPosition());
    TEST_ASSERT_EQUAL_INT(3000, bank.clampPosition(4000));
}

static void test_short_pose_writes_overlap(void) {
    FakeServoBus bus;
    ServoBank bank(bus, {1, 2, 3});

    TEST_ASSERT_TRUE(bank.writeAll({10, 20}));
    TEST_ASSERT_EQUAL_UINT32(2, bus.writes.size());
}

static void test_write_failure_counted_not_retried(void) {
    FakeServoBus bus;
    bus.failingWrites.insert(2);
    ServoBank bank(bus, {1, 2, 3});

    TEST_ASSERT_FALSE(bank.writeAll({100, 200, 300}));
    TEST_ASSERT_EQUAL_UINT32(3, bus.writes.size());
    TEST_ASSERT_EQUAL_UINT32(1, bank.writeFailures());
    TEST_ASSERT_EQUAL_INT(300, bus.positions[3]);
    TEST_ASSERT_EQUAL(infra::LogLevel::Warn, g_logSink.entries.back().level);
}

static void test_unknown_channel_write_fails(void) {
    FakeServoBus bus;
    ServoBank bank(bus, {1});
    TEST_ASSERT_FALSE(bank.writeChannel(4, 100));
    TEST_ASSERT_TRUE(bus.writes.empty());
    TEST_ASSERT_EQUAL_UINT32(1, bank.writeFailures());
}

static void test_failed_read_uses_last_known(void) {
    FakeServoBus bus;
    bus.positions[1] = 1500;
    bus.positions[2] = 2500;
    ServoBank bank(bus, {1, 2}, 0, 4000);

    Pose first = bank.readAll();
    TEST_ASSERT_EQUAL_INT(1500, first[0]);
    TEST_ASSERT_EQUAL_INT(2500, first[1]);

    bus.failingReads.insert(2);
    bus.positions[1] = 1600;
    Pose second = bank.readAll();
    TEST_ASSERT_EQUAL_INT(1600, second[0]);
    TEST_ASSERT_EQUAL_INT(2500, second[1]);
    TEST_ASSERT_EQUAL_UINT32(1, bank.readFailures());
}

static void test_never_read_channel_reports_mid_range(void) {
    FakeServoBus bus;
    ServoBank bank(bus, {9}, 0, 4000);
    Pose pose = bank.readAll();
    TEST_ASSERT_EQUAL_INT(2000, pose[0]);
}

static void test_simulated_bus_echoes_writes(void) {
    SimulatedServoBus bus({1, 2}, 2048);
    ServoBank bank(bus, {1, 2});

    Pose rest = bank.readAll();
    TEST_ASSERT_EQUAL_INT(2048, rest[0]);

    TEST_ASSERT_TRUE(bank.writeAll({100, 200}));
    Pose after = bank.readAll();
    TEST_ASSERT_EQUAL_INT(100, after[0]);
    TEST_ASSERT_EQUAL_INT(200, after[1]);
    TEST_ASSERT_EQUAL_UINT32(2, bus.writeCount());

    int position = 0;
    TEST_ASSERT_FALSE(bus.writePosition(7, 10));
    TEST_ASSERT_FALSE(bus.readPosition(7, position));
    TEST_ASSERT_EQUAL_INT(2048, position);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_channels_map_to_bus_ids);
    RUN_TEST(test_writes_are_clamped_to_range);
    RUN_TEST(test_swapped_limits_are_normalized);
    RUN_TEST(test_short_pose_writes_overlap);
    RUN_TEST(test_write_failure_counted_not_retried);
    RUN_TEST(test_unknown_channel_write_fails);
    RUN_TEST(test_failed_read_uses_last_known);
    RUN_TEST(test_never_read_channel_reports_mid_range);
    RUN_TEST(test_simulated_bus_echoes_writes);
    return UNITY_END();
}
