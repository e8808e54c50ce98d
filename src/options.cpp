#include "adhoc/app.hpp"
#include "adhoc/ansi.hpp"
#include "adhoc/progress.hpp"

#include <cstdlib> // std::getenv
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    int parse_int(const std::string &flag, const std::string &value)
    {
        std::size_t used = 0;
        int n = 0;
        try
        {
            n = std::stoi(value, &used);
        }
        catch (const std::exception &)
        {
            throw app::UsageError(flag + ": expected an integer, got '" + value + "'");
        }
        if (used != value.size())
            throw app::UsageError(flag + ": expected an integer, got '" + value + "'");
        return n;
    }

    int parse_percent(const std::string &flag, const std::string &value)
    {
        const int n = parse_int(flag, value);
        try
        {
            return adhoc::progress::validate_percent(n);
        }
        catch (const std::out_of_range &e)
        {
            throw app::UsageError(flag + ": " + e.what());
        }
    }

    std::chrono::milliseconds parse_delay(const std::string &flag, const std::string &value)
    {
        const int n = parse_int(flag, value);
        if (n < 0)
            throw app::UsageError(flag + ": delay must not be negative");
        return std::chrono::milliseconds(n);
    }

} // namespace

namespace app
{

    fs::path default_log_path(const fs::path &executable)
    {
        fs::path name = executable.stem();
        name += ".log";
        return executable.parent_path() / name;
    }

    fs::path executable_path(const char *argv0)
    {
#if defined(__linux__)
        std::error_code ec;
        fs::path self = fs::read_symlink("/proc/self/exe", ec);
        if (!ec && !self.empty())
            return self;
#endif
        const fs::path p = (argv0 && *argv0) ? fs::path(argv0) : fs::path("adhoc_task");
        std::error_code aec;
        fs::path abs = fs::absolute(p, aec);
        return aec ? p : abs;
    }

    Options parse_options(int argc, const char *const *argv)
    {
        Options o;
        o.logFile = default_log_path(executable_path(argc > 0 ? argv[0] : nullptr));
        o.color = adhoc::ansi::stdout_supports_color();

        if (const char *env = std::getenv("ADHOC_LOG_FILE"); env && *env)
            o.logFile = env;
        if (const char *env = std::getenv("ADHOC_STEP_DELAY_MS"); env && *env)
            o.stepDelay = parse_delay("ADHOC_STEP_DELAY_MS", env);

        for (int i = 1; i < argc; i++)
        {
            const std::string a = argv[i];
            const auto value = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw UsageError(a + ": missing value");
                return argv[++i];
            };

            if (a == "--help" || a == "-h")
                o.showHelp = true;
            else if (a == "--log-file" || a == "-LogFile")
                o.logFile = value();
            else if (a == "--progress" || a == "-ProgressPercent")
                o.progressPercent = parse_percent(a, value());
            else if (a == "--step-delay-ms")
                o.stepDelay = parse_delay(a, value());
            else if (a == "--fail-at")
                o.failAt = parse_percent(a, value());
            else if (a == "--fail-message")
                o.failMessage = value();
            else if (a == "--no-color")
                o.color = false;
            else
                throw UsageError("unknown option '" + a + "'");
        }

        if (o.logFile.empty())
            throw UsageError("log file path must not be empty");
        return o;
    }

    std::string usage(const std::string &program)
    {
        std::ostringstream oss;
        oss << "Usage: " << program << " [options]\n"
            << "\n"
            << "  --log-file PATH       log destination (alias -LogFile)\n"
            << "                        default: <exe dir>/<exe name>.log, env ADHOC_LOG_FILE\n"
            << "  --progress N          initial progress percent, 0-100 (alias -ProgressPercent)\n"
            << "  --step-delay-ms N     simulated work per step, default 100, env ADHOC_STEP_DELAY_MS\n"
            << "  --fail-at N           inject a workload failure at step N (0-100)\n"
            << "  --fail-message TEXT   message of the injected failure\n"
            << "  --no-color            plain console output (also NO_COLOR)\n"
            << "  -h, --help            show this help\n";
        return oss.str();
    }

} // namespace app
