#ifndef CLI_COMMAND_ROUTER_H
#define CLI_COMMAND_ROUTER_H

#include <functional>
#include <string>
#include <vector>

class CliCommandRouter {
public:
    static constexpr int kExitCompleted = 0;
    static constexpr int kExitError = 1;
    static constexpr int kExitCancelled = 130;

    class IPrinter {
    public:
        virtual ~IPrinter() = default;
        virtual void print(const std::string &value) = 0;
        virtual void println(const std::string &value) = 0;
        virtual void println() = 0;
        virtual void printf(const char *fmt, ...) = 0;
    };

    using Handler = std::function<int(const std::vector<std::string> &args)>;

    struct Dependencies {
        IPrinter *printer = nullptr;
        Handler talk;
        Handler poses;
        Handler motion;
        Handler record;
        Handler pose;
        std::function<int()> configPrinter;
    };

    explicit CliCommandRouter(const Dependencies &deps);

    // Returns the process exit code for the command.
    int handleCommand(const std::vector<std::string> &tokens);
    void printHelp();

    static std::vector<std::string> tokenize(const std::string &line);

private:
    int dispatch(const Handler &handler, const char *name, const std::vector<std::string> &args);
    int usageError(const char *usage);

    Dependencies m_deps;
};

#endif  // CLI_COMMAND_ROUTER_H
