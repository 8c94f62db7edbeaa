#include <unity.h>

#include "cli_command_router.h"

#include <cstdarg>
#include <cstdio>
#include <string>
#include <vector>

namespace {

class CapturePrinter : public CliCommandRouter::IPrinter {
public:
    void print(const std::string &value) override {
        buffer += value;
        transcript += value;
    }

    void println(const std::string &value) override {
        buffer += value;
        lines.push_back(buffer);
        transcript += value;
        transcript += "\n";
        buffer.clear();
    }

    void println() override {
        lines.push_back(buffer);
        transcript += "\n";
        buffer.clear();
    }

    void printf(const char *fmt, ...) override {
        char buf[256];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buf, sizeof(buf), fmt, args);
        va_end(args);
        buffer += buf;
        transcript += buf;
    }

    bool saw(const char *text) const {
        return transcript.find(text) != std::string::npos;
    }

    std::vector<std::string> lines;
    std::string transcript;

private:
    std::string buffer;
};

struct RouterFixture {
    CapturePrinter printer;
    std::string lastHandler;
    std::vector<std::string> lastArgs;
    int handlerResult = CliCommandRouter::kExitCompleted;
    int configCalls = 0;
    CliCommandRouter router;

    explicit RouterFixture(bool withHandlers = true)
        : router(buildDeps(withHandlers)) {}

    int run(const char *line) {
        return router.handleCommand(CliCommandRouter::tokenize(line));
    }

private:
    CliCommandRouter::Handler recorder(const char *name) {
        return [this, name](const std::vector<std::string> &args) {
            lastHandler = name;
            lastArgs = args;
            return handlerResult;
        };
    }

    CliCommandRouter::Dependencies buildDeps(bool withHandlers) {
        CliCommandRouter::Dependencies deps;
        deps.printer = &printer;
        if (withHandlers) {
            deps.talk = recorder("talk");
            deps.poses = recorder("poses");
            deps.motion = recorder("motion");
            deps.record = recorder("record");
            deps.pose = recorder("pose");
            deps.configPrinter = [this]() {
                ++configCalls;
                return CliCommandRouter::kExitCompleted;
            };
        }
        return deps;
    }
};

}  // namespace

void setUp(void) {}
void tearDown(void) {}

static void test_help_lists_commands(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(0, fx.run("help"));
    TEST_ASSERT_TRUE(fx.printer.saw("=== ARMSYNC COMMANDS ==="));
    TEST_ASSERT_TRUE(fx.printer.saw("talk <file.wav> [pulse|amplitude]"));
    TEST_ASSERT_TRUE(fx.printer.saw("exit code 130"));
    TEST_ASSERT_EQUAL_INT(0, fx.run("-h"));
}

static void test_no_command_prints_help_and_fails(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(1, fx.router.handleCommand({}));
    TEST_ASSERT_TRUE(fx.printer.saw("=== ARMSYNC COMMANDS ==="));
    TEST_ASSERT_TRUE(fx.lastHandler.empty());
}

static void test_talk_passes_file_and_lowercased_mode(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(0, fx.run("TALK hello.wav Amplitude"));
    TEST_ASSERT_EQUAL_STRING("talk", fx.lastHandler.c_str());
    TEST_ASSERT_EQUAL_UINT32(2, fx.lastArgs.size());
    TEST_ASSERT_EQUAL_STRING("hello.wav", fx.lastArgs[0].c_str());
    TEST_ASSERT_EQUAL_STRING("amplitude", fx.lastArgs[1].c_str());
}

static void test_talk_rejects_bad_arguments(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(1, fx.run("talk"));
    TEST_ASSERT_TRUE(fx.printer.saw(">>> Usage: armsync [--config <file>] talk"));

    TEST_ASSERT_EQUAL_INT(1, fx.run("talk hello.wav shout"));
    TEST_ASSERT_TRUE(fx.printer.saw("Unknown jaw mode 'shout'"));
    TEST_ASSERT_TRUE(fx.lastHandler.empty());
}

static void test_speak_is_an_alias_for_talk(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(0, fx.run("speak hi.wav"));
    TEST_ASSERT_EQUAL_STRING("talk", fx.lastHandler.c_str());
    TEST_ASSERT_EQUAL_UINT32(1, fx.lastArgs.size());
}

static void test_poses_accepts_optional_library(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(0, fx.run("poses"));
    TEST_ASSERT_EQUAL_STRING("poses", fx.lastHandler.c_str());
    TEST_ASSERT_EQUAL_UINT32(0, fx.lastArgs.size());

    TEST_ASSERT_EQUAL_INT(0, fx.run("play arm.json"));
    TEST_ASSERT_EQUAL_STRING("arm.json", fx.lastArgs[0].c_str());

    TEST_ASSERT_EQUAL_INT(1, fx.run("poses a.json b.json"));
}

static void test_handler_exit_code_is_returned(void) {
    RouterFixture fx;
    fx.handlerResult = CliCommandRouter::kExitCancelled;
    TEST_ASSERT_EQUAL_INT(130, fx.run("motion arm.json"));
    TEST_ASSERT_EQUAL_STRING("motion", fx.lastHandler.c_str());
}

static void test_record_requires_numeric_duration(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(1, fx.run("record arm.json soon"));
    TEST_ASSERT_EQUAL_INT(1, fx.run("record arm.json"));
    TEST_ASSERT_TRUE(fx.lastHandler.empty());

    TEST_ASSERT_EQUAL_INT(0, fx.run("record arm.json 2500"));
    TEST_ASSERT_EQUAL_STRING("record", fx.lastHandler.c_str());
    TEST_ASSERT_EQUAL_STRING("2500", fx.lastArgs[1].c_str());
}

static void test_pose_routes_to_save_handler(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(0, fx.run("pose arm.json"));
    TEST_ASSERT_EQUAL_STRING("pose", fx.lastHandler.c_str());
}

static void test_config_calls_printer(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(0, fx.run("settings"));
    TEST_ASSERT_EQUAL_INT(1, fx.configCalls);
}

static void test_unknown_command_fails(void) {
    RouterFixture fx;
    TEST_ASSERT_EQUAL_INT(1, fx.run("dance now"));
    TEST_ASSERT_TRUE(fx.printer.saw(">>> Unknown command: dance. Run 'armsync help' for commands."));
}

static void test_missing_handlers_report_unavailable(void) {
    RouterFixture fx(false);
    TEST_ASSERT_EQUAL_INT(1, fx.run("motion"));
    TEST_ASSERT_TRUE(fx.printer.saw(">>> ERROR: 'motion' is unavailable"));
    TEST_ASSERT_EQUAL_INT(1, fx.run("config"));
    TEST_ASSERT_TRUE(fx.printer.saw("Config printer unavailable"));
}

static void test_tokenize_collapses_whitespace(void) {
    std::vector<std::string> tokens = CliCommandRouter::tokenize("  talk\thello.wav   pulse \n");
    TEST_ASSERT_EQUAL_UINT32(3, tokens.size());
    TEST_ASSERT_EQUAL_STRING("talk", tokens[0].c_str());
    TEST_ASSERT_EQUAL_STRING("pulse", tokens[2].c_str());
    TEST_ASSERT_EQUAL_UINT32(0, CliCommandRouter::tokenize("   ").size());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_help_lists_commands);
    RUN_TEST(test_no_command_prints_help_and_fails);
    RUN_TEST(test_talk_passes_file_and_lowercased_mode);
    RUN_TEST(test_talk_rejects_bad_arguments);
    RUN_TEST(test_speak_is_an_alias_for_talk);
    RUN_TEST(test_poses_accepts_optional_library);
    RUN_TEST(test_handler_exit_code_is_returned);
    RUN_TEST(test_record_requires_numeric_duration);
    RUN_TEST(test_pose_routes_to_save_handler);
    RUN_TEST(test_config_calls_printer);
    RUN_TEST(test_unknown_command_fails);
    RUN_TEST(test_missing_handlers_report_unavailable);
    RUN_TEST(test_tokenize_collapses_whitespace);
    return UNITY_END();
}
