#include "adhoc/workload.hpp"

#include <thread>
#include <utility>

namespace
{
    constexpr int kStepPercent = 10;

    // Closes the session when the run scope unwinds, normally or not.
    class SessionCloser
    {
    public:
        SessionCloser(adhoc::log::Logger &logger, adhoc::RunSession &session,
                      adhoc::workload::Stage &stage)
            : logger_(logger), session_(session), stage_(stage)
        {
        }
        ~SessionCloser()
        {
            stage_ = adhoc::workload::Stage::Closed;
            logger_.close(session_);
        }

        SessionCloser(const SessionCloser &) = delete;
        SessionCloser &operator=(const SessionCloser &) = delete;

    private:
        adhoc::log::Logger &logger_;
        adhoc::RunSession &session_;
        adhoc::workload::Stage &stage_;
    };

} // namespace

namespace adhoc::workload
{

    const char *stage_name(Stage stage)
    {
        switch (stage)
        {
        case Stage::Setup:
            return "setup";
        case Stage::Running:
            return "running";
        case Stage::Cleanup:
            return "cleanup";
        case Stage::Closed:
            return "closed";
        }
        return "unknown";
    }

    StepFn failing_step(int failAt, std::string message)
    {
        return [failAt, message = std::move(message)](int percent)
        {
            if (percent == failAt)
                throw WorkloadError(message);
        };
    }

    Runner::Runner(log::Logger &logger, progress::ProgressReporter &progress, Settings settings)
        : logger_(logger), progress_(progress), settings_(std::move(settings))
    {
        progress::validate_percent(settings_.initialPercent);
    }

    void Runner::run(RunSession &session)
    {
        SessionCloser closer(logger_, session, stage_);
        try
        {
            setup();
            running();
            cleanup();
        }
        catch (const std::exception &e)
        {
            progress_.complete();
            logger_.error(std::string("Workload failed during ") + stage_name(stage_) + ": " + e.what());
            throw;
        }
        catch (...)
        {
            progress_.complete();
            logger_.error(std::string("Workload failed during ") + stage_name(stage_) + ": unknown error");
            throw;
        }
    }

    void Runner::setup()
    {
        stage_ = Stage::Setup;
        logger_.info("Beginning workload execution");
        progress_.report(settings_.initialPercent, settings_.activity, "Initializing");
    }

    void Runner::running()
    {
        stage_ = Stage::Running;
        for (int percent = 0; percent <= 100; percent += kStepPercent)
        {
            if (settings_.stepDelay.count() > 0)
                std::this_thread::sleep_for(settings_.stepDelay);

            // ---- Insert task logic here (set_step) ----
            if (step_)
                step_(percent);

            progress_.report(percent, settings_.activity, "Processing step " + std::to_string(percent / kStepPercent));
            logger_.debug("Completed " + std::to_string(percent) + "% of workload");
        }
    }

    void Runner::cleanup()
    {
        stage_ = Stage::Cleanup;
        progress_.report(100, settings_.activity, "Complete");
        progress_.complete();
        logger_.info("Custom workload completed successfully.");
    }

} // namespace adhoc::workload
