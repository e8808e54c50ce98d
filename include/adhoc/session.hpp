#pragma once
#include <chrono>
#include <filesystem>

namespace adhoc
{
    // One run of the harness. Created by log::Logger::initialize, closed by
    // log::Logger::close, which stamps endTime.
    struct RunSession
    {
        using clock = std::chrono::system_clock;

        clock::time_point startTime{};
        clock::time_point endTime{};
        std::filesystem::path logPath;
        bool closed{false};

        clock::duration duration() const { return endTime - startTime; }
    };
}
