#include "cli_command_router.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

class NullPrinter : public CliCommandRouter::IPrinter {
public:
    void print(const std::string &) override {}
    void println(const std::string &) override {}
    void println() override {}
    void printf(const char *, ...) override {}
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isUnsignedNumber(const std::string &text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

CliCommandRouter::CliCommandRouter(const Dependencies &deps)
    : m_deps(deps) {
    if (!m_deps.printer) {
        static NullPrinter nullPrinter;
        m_deps.printer = &nullPrinter;
    }
}

std::vector<std::string> CliCommandRouter::tokenize(const std::string &line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

int CliCommandRouter::handleCommand(const std::vector<std::string> &tokens) {
    if (tokens.empty()) {
        printHelp();
        return kExitError;
    }

    std::string cmd = toLower(tokens.front());
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    if (cmd == "help" || cmd == "?" || cmd == "--help" || cmd == "-h") {
        printHelp();
        return kExitCompleted;
    }

    if (cmd == "talk" || cmd == "speak") {
        if (args.empty() || args.size() > 2) {
            return usageError("talk <file.wav> [pulse|amplitude]");
        }
        if (args.size() == 2) {
            std::string mode = toLower(args[1]);
            if (mode != "pulse" && mode != "amplitude") {
                m_deps.printer->printf(">>> ERROR: Unknown jaw mode '%s'\n", args[1].c_str());
                return usageError("talk <file.wav> [pulse|amplitude]");
            }
            args[1] = mode;
        }
        return dispatch(m_deps.talk, "talk", args);
    }

    if (cmd == "poses" || cmd == "play") {
        if (args.size() > 1) {
            return usageError("poses [library.json]");
        }
        return dispatch(m_deps.poses, "poses", args);
    }

    if (cmd == "motion") {
        if (args.size() > 1) {
            return usageError("motion [library.json]");
        }
        return dispatch(m_deps.motion, "motion", args);
    }

    if (cmd == "record") {
        if (args.size() != 2 || !isUnsignedNumber(args[1])) {
            return usageError("record <library.json> <duration_ms>");
        }
        return dispatch(m_deps.record, "record", args);
    }

    if (cmd == "pose") {
        if (args.size() > 1) {
            return usageError("pose [library.json]");
        }
        return dispatch(m_deps.pose, "pose", args);
    }

    if (cmd == "config" || cmd == "settings") {
        if (m_deps.configPrinter) {
            return m_deps.configPrinter();
        }
        m_deps.printer->println(">>> ERROR: Config printer unavailable");
        return kExitError;
    }

    m_deps.printer->print(">>> Unknown command: ");
    m_deps.printer->println(cmd + ". Run 'armsync help' for commands.");
    return kExitError;
}

int CliCommandRouter::dispatch(const Handler &handler, const char *name, const std::vector<std::string> &args) {
    if (!handler) {
        m_deps.printer->printf(">>> ERROR: '%s' is unavailable\n", name);
        return kExitError;
    }
    return handler(args);
}

int CliCommandRouter::usageError(const char *usage) {
    m_deps.printer->printf(">>> Usage: armsync [--config <file>] %s\n", usage);
    return kExitError;
}

void CliCommandRouter::printHelp() {
    m_deps.printer->println("\n=== ARMSYNC COMMANDS ===");
    m_deps.printer->println("talk <file.wav> [pulse|amplitude]  - Speak a WAV file with the jaw");
    m_deps.printer->println("poses [library.json]               - Play the saved poses");
    m_deps.printer->println("motion [library.json]              - Play the recorded motion");
    m_deps.printer->println("record <library.json> <ms>         - Record live motion into the library");
    m_deps.printer->println("pose [library.json]                - Append the current pose to the library");
    m_deps.printer->println("config                             - Show the loaded configuration");
    m_deps.printer->println("help                               - Show this help message");
    m_deps.printer->println();
    m_deps.printer->println("Without a library path, library_path from the config is used.");
    m_deps.printer->println("Ctrl-C stops a running session (exit code 130).");
}
