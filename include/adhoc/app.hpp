#pragma once
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace app
{
    class UsageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct Options
    {
        std::filesystem::path logFile;
        int progressPercent{0};
        std::chrono::milliseconds stepDelay{100};
        std::optional<int> failAt;
        std::string failMessage{"Simulated workload failure"};
        bool color{true};
        bool showHelp{false};
    };

    // <dir of executable>/<executable stem>.log
    std::filesystem::path default_log_path(const std::filesystem::path &executable);

    // Best effort absolute path of the running binary (argv0 as fallback).
    std::filesystem::path executable_path(const char *argv0);

    // Defaults, then ADHOC_LOG_FILE / ADHOC_STEP_DELAY_MS / NO_COLOR, then flags.
    // Throws UsageError on unknown flags or invalid values.
    Options parse_options(int argc, const char *const *argv);

    std::string usage(const std::string &program);

    class Application
    {
    public:
        explicit Application(Options options,
                             std::ostream &out = std::cout,
                             std::ostream &err = std::cerr);

        // 0 on success, 1 when initialization or the workload failed.
        int run();

    private:
        Options options_;
        std::ostream &out_;
        std::ostream &err_;
    };
}
