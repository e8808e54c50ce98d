#include "adhoc/app.hpp"
#include "adhoc/ansi.hpp"
#include "adhoc/log.hpp"
#include "adhoc/progress.hpp"
#include "adhoc/workload.hpp"

#include <utility>

namespace app
{

    Application::Application(Options options, std::ostream &out, std::ostream &err)
        : options_(std::move(options)), out_(out), err_(err)
    {
    }

    int Application::run()
    {
        using adhoc::ansi::paint;

        adhoc::log::Logger logger(out_, options_.color);
        adhoc::progress::ProgressReporter progress(out_, options_.color);

        adhoc::workload::Settings settings;
        settings.initialPercent = options_.progressPercent;
        settings.stepDelay = options_.stepDelay;

        try
        {
            adhoc::workload::Runner runner(logger, progress, settings);
            if (options_.failAt)
                runner.set_step(adhoc::workload::failing_step(*options_.failAt, options_.failMessage));

            adhoc::RunSession session = logger.initialize(options_.logFile);
            runner.run(session);
        }
        catch (const std::exception &e)
        {
            err_ << paint(options_.color, adhoc::ansi::err) << "error: " << e.what()
                 << paint(options_.color, adhoc::ansi::reset) << "\n";
            return 1;
        }

        out_ << paint(options_.color, adhoc::ansi::muted) << "Log written to "
             << options_.logFile.string() << paint(options_.color, adhoc::ansi::reset) << "\n";
        return 0;
    }

} // namespace app
