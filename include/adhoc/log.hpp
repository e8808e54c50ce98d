#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "adhoc/session.hpp"

namespace adhoc::log
{
    enum class Level
    {
        Info,
        Warn,
        Error,
        Debug
    };

    // "INFO", "WARN", "ERROR", "DEBUG"
    const char *level_name(Level level);

    // yyyy-MM-dd HH:mm:ss in local time
    std::string format_timestamp(std::chrono::system_clock::time_point tp);

    // Seconds rounded to the nearest millisecond, three decimals: "12.345"
    std::string format_seconds(std::chrono::system_clock::duration d);

    // [yyyy-MM-dd HH:mm:ss] [LEVEL] message
    std::string format_line(std::chrono::system_clock::time_point tp,
                            Level level,
                            const std::string &message);

    // Append-mode session file with a header on open and a footer on close.
    class Transcript
    {
    public:
        Transcript() = default;
        ~Transcript();

        Transcript(const Transcript &) = delete;
        Transcript &operator=(const Transcript &) = delete;

        // Throws std::runtime_error when the file cannot be opened.
        void open(const std::filesystem::path &path,
                  std::chrono::system_clock::time_point started);
        // Does nothing once closed.
        void append(const std::string &line);
        // Writes the footer and releases the file. A failing footer write is
        // reported on stderr; the file is released regardless.
        void close(std::chrono::system_clock::time_point stopped) noexcept;

        bool is_open() const { return out_.is_open(); }
        const std::filesystem::path &path() const { return path_; }

    private:
        void write_footer(std::chrono::system_clock::time_point stopped);

        std::ofstream out_;
        std::filesystem::path path_;
    };

    class Logger
    {
    public:
        explicit Logger(std::ostream &console = std::cout, bool color = false);

        // Creates missing parent directories (std::filesystem::filesystem_error
        // on failure), opens the transcript and logs the start time.
        RunSession initialize(const std::filesystem::path &path);

        // File always; console unless level is Debug. Throws std::logic_error
        // when no session is open (before initialize or after close).
        void log(const std::string &message, Level level = Level::Info);

        void info(const std::string &message) { log(message, Level::Info); }
        void warn(const std::string &message) { log(message, Level::Warn); }
        void error(const std::string &message) { log(message, Level::Error); }
        void debug(const std::string &message) { log(message, Level::Debug); }

        // Stamps session.endTime, logs end time and total runtime, closes the
        // transcript. Second and later calls do nothing. Write failures go to
        // stderr so the transcript is still released.
        void close(RunSession &session) noexcept;

        bool is_open() const { return transcript_.is_open(); }

    private:
        std::ostream &console_;
        bool color_;
        Transcript transcript_;
    };
}
