#include "adhoc/log.hpp"
#include "adhoc/ansi.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    using sys_clock = std::chrono::system_clock;

    const char *kRule = "**********************";

    const char *level_color(adhoc::log::Level level)
    {
        switch (level)
        {
        case adhoc::log::Level::Warn:
            return adhoc::ansi::warn;
        case adhoc::log::Level::Error:
            return adhoc::ansi::err;
        default:
            return "";
        }
    }

} // namespace

namespace adhoc::log
{

    const char *level_name(Level level)
    {
        switch (level)
        {
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Debug:
            return "DEBUG";
        }
        return "INFO";
    }

    std::string format_timestamp(sys_clock::time_point tp)
    {
        auto t = sys_clock::to_time_t(tp);
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    std::string format_seconds(sys_clock::duration d)
    {
        long long ms = std::chrono::round<std::chrono::milliseconds>(d).count();
        std::ostringstream oss;
        if (ms < 0)
        {
            oss << '-';
            ms = -ms;
        }
        oss << ms / 1000 << '.' << std::setw(3) << std::setfill('0') << ms % 1000;
        return oss.str();
    }

    std::string format_line(sys_clock::time_point tp, Level level, const std::string &message)
    {
        std::string line;
        line.reserve(message.size() + 32);
        line += '[';
        line += format_timestamp(tp);
        line += "] [";
        line += level_name(level);
        line += "] ";
        line += message;
        return line;
    }

    // ---------------------------------------------------------------- Transcript

    Transcript::~Transcript()
    {
        if (out_.is_open())
            close(sys_clock::now());
    }

    void Transcript::write_footer(sys_clock::time_point stopped)
    {
        out_ << kRule << '\n'
             << "Transcript stopped " << format_timestamp(stopped) << '\n'
             << kRule << '\n';
    }

    void Transcript::open(const fs::path &path, sys_clock::time_point started)
    {
        out_.open(path, std::ios::out | std::ios::app);
        if (!out_.is_open())
            throw std::runtime_error("cannot open log file: " + path.string());
        path_ = path;

        out_ << kRule << '\n'
             << "Transcript started " << format_timestamp(started)
             << ", output file is " << path_.string() << '\n'
             << kRule << '\n';
        out_.flush();
    }

    void Transcript::append(const std::string &line)
    {
        if (!out_.is_open())
            return;
        out_ << line << '\n';
        out_.flush();
    }

    void Transcript::close(sys_clock::time_point stopped) noexcept
    {
        if (!out_.is_open())
            return;
        try
        {
            write_footer(stopped);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[ERR] cannot finish log file " << path_.string() << ": " << e.what() << "\n";
        }
        out_.close();
    }

    // -------------------------------------------------------------------- Logger

    Logger::Logger(std::ostream &console, bool color)
        : console_(console), color_(color)
    {
    }

    RunSession Logger::initialize(const fs::path &path)
    {
        if (transcript_.is_open())
            throw std::logic_error("log session already open: " + transcript_.path().string());

        const fs::path parent = path.parent_path();
        if (!parent.empty())
            fs::create_directories(parent);

        RunSession session;
        session.logPath = path;
        session.startTime = sys_clock::now();

        transcript_.open(path, session.startTime);
        info("Start time: " + format_timestamp(session.startTime));
        return session;
    }

    void Logger::log(const std::string &message, Level level)
    {
        if (!transcript_.is_open())
            throw std::logic_error("no log session open for: " + message);

        const std::string line = format_line(sys_clock::now(), level, message);

        transcript_.append(line);
        if (level == Level::Debug)
            return;

        const char *color = level_color(level);
        if (color_ && *color)
            console_ << color << line << ansi::reset << '\n';
        else
            console_ << line << '\n';
        console_.flush();
    }

    void Logger::close(RunSession &session) noexcept
    {
        if (session.closed)
            return;
        session.closed = true;
        session.endTime = sys_clock::now();

        try
        {
            info("End time: " + format_timestamp(session.endTime));
            info("Total runtime: " + format_seconds(session.duration()) + " seconds");
        }
        catch (const std::exception &e)
        {
            std::cerr << "[ERR] cannot log end of session: " << e.what() << "\n";
        }
        transcript_.close(session.endTime);
    }

} // namespace adhoc::log
