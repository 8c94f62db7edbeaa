#include <unity.h>

#include <cstdio>
#include <string>
#include <vector>

#include "fake_log_sink.h"
#include "infra/log_sink.h"
#include "logging_manager.h"

void setUp(void) {
    infra::setLogSink(nullptr);
    LoggingManager::instance().setMinimumLevel(LogLevel::Info);
    LoggingManager::instance().begin(nullptr, 4, 2);
}

void tearDown(void) {
    LoggingManager::instance().end();
}

static void test_formats_level_and_tag(void) {
    LoggingManager &logs = LoggingManager::instance();
    logs.log(LogLevel::Warn, "Playback", "tick %d late", 3);

    std::vector<LogEntry> entries;
    logs.getEntriesSince(0, entries);
    TEST_ASSERT_EQUAL_UINT32(1, entries.size());
    TEST_ASSERT_EQUAL_STRING("W/Playback: tick 3 late", entries[0].message.c_str());
    TEST_ASSERT_TRUE(entries[0].level == LogLevel::Warn);
    TEST_ASSERT_EQUAL_UINT32(1, entries[0].sequence);
}

static void test_drops_lines_below_minimum_level(void) {
    LoggingManager &logs = LoggingManager::instance();
    logs.log(LogLevel::Debug, "T", "hidden");
    logs.setMinimumLevel(LogLevel::Verbose);
    logs.log(LogLevel::Verbose, "T", "shown");

    TEST_ASSERT_EQUAL_UINT32(1, logs.entryCount());
    TEST_ASSERT_TRUE(logs.minimumLevel() == LogLevel::Verbose);
}

static void test_ring_buffer_keeps_newest(void) {
    LoggingManager &logs = LoggingManager::instance();
    for (int i = 1; i <= 6; ++i) {
        logs.log(LogLevel::Info, "T", "line %d", i);
    }

    TEST_ASSERT_EQUAL_UINT32(4, logs.entryCount());
    TEST_ASSERT_EQUAL_UINT32(6, logs.latestSequence());

    std::vector<LogEntry> entries;
    logs.getEntriesSince(4, entries);
    TEST_ASSERT_EQUAL_UINT32(2, entries.size());
    TEST_ASSERT_EQUAL_STRING("I/T: line 5", entries[0].message.c_str());
    TEST_ASSERT_EQUAL_STRING("I/T: line 6", entries[1].message.c_str());

    std::vector<LogEntry> startup;
    logs.getStartupEntries(startup);
    TEST_ASSERT_EQUAL_UINT32(2, startup.size());
    TEST_ASSERT_EQUAL_STRING("I/T: line 1", startup[0].message.c_str());
}

static void test_trailing_newlines_are_trimmed(void) {
    LoggingManager &logs = LoggingManager::instance();
    logs.log(LogLevel::Error, "T", "broken\r\n\n");

    std::vector<LogEntry> entries;
    logs.getEntriesSince(0, entries);
    TEST_ASSERT_EQUAL_STRING("E/T: broken", entries[0].message.c_str());
}

static void test_listeners_receive_entries(void) {
    LoggingManager &logs = LoggingManager::instance();
    std::vector<std::string> seen;
    logs.registerListener([&seen](const LogEntry &entry) { seen.push_back(entry.message); });

    LOG_INFO("Main", "ready");
    TEST_ASSERT_EQUAL_UINT32(1, seen.size());
    TEST_ASSERT_EQUAL_STRING("I/Main: ready", seen[0].c_str());
}

static void test_forwards_to_stream(void) {
    std::FILE *stream = std::tmpfile();
    TEST_ASSERT_NOT_NULL(stream);
    LoggingManager &logs = LoggingManager::instance();
    logs.begin(stream, 8, 8);
    logs.log(LogLevel::Info, "Audio", "started");
    logs.enableStreamForwarding(false);
    logs.log(LogLevel::Info, "Audio", "quiet");
    logs.enableStreamForwarding(true);

    std::rewind(stream);
    char line[64] = {0};
    TEST_ASSERT_NOT_NULL(std::fgets(line, sizeof(line), stream));
    TEST_ASSERT_EQUAL_STRING("I/Audio: started\n", line);
    TEST_ASSERT_NULL(std::fgets(line, sizeof(line), stream));
    logs.end();
    std::fclose(stream);
}

static void test_nothing_recorded_before_begin(void) {
    LoggingManager &logs = LoggingManager::instance();
    logs.end();
    logs.log(LogLevel::Error, "T", "lost");
    TEST_ASSERT_FALSE(logs.isInitialized());
    TEST_ASSERT_EQUAL_UINT32(0, logs.entryCount());
}

static void test_installed_sink_takes_macro_output(void) {
    FakeLogSink sink;
    infra::setLogSink(&sink);
    LOG_WARN("Servo", "channel %u write failed", 4u);
    infra::setLogSink(nullptr);

    TEST_ASSERT_EQUAL_UINT32(1, sink.entries.size());
    TEST_ASSERT_TRUE(sink.entries[0].level == infra::LogLevel::Warn);
    TEST_ASSERT_EQUAL_STRING("Servo", sink.entries[0].tag.c_str());
    TEST_ASSERT_EQUAL_STRING("channel 4 write failed", sink.entries[0].message.c_str());
    TEST_ASSERT_EQUAL_UINT32(0, LoggingManager::instance().entryCount());
}

static void test_parse_level_names(void) {
    TEST_ASSERT_TRUE(LoggingManager::parseLevel("DEBUG", LogLevel::Info) == LogLevel::Debug);
    TEST_ASSERT_TRUE(LoggingManager::parseLevel("warning", LogLevel::Info) == LogLevel::Warn);
    TEST_ASSERT_TRUE(LoggingManager::parseLevel("loud", LogLevel::Error) == LogLevel::Error);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_formats_level_and_tag);
    RUN_TEST(test_drops_lines_below_minimum_level);
    RUN_TEST(test_ring_buffer_keeps_newest);
    RUN_TEST(test_trailing_newlines_are_trimmed);
    RUN_TEST(test_listeners_receive_entries);
    RUN_TEST(test_forwards_to_stream);
    RUN_TEST(test_nothing_recorded_before_begin);
    RUN_TEST(test_installed_sink_takes_macro_output);
    RUN_TEST(test_parse_level_names);
    return UNITY_END();
}
