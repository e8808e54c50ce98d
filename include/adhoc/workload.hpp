#pragma once
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include "adhoc/log.hpp"
#include "adhoc/progress.hpp"
#include "adhoc/session.hpp"

namespace adhoc::workload
{
    enum class Stage
    {
        Setup,
        Running,
        Cleanup,
        Closed
    };

    const char *stage_name(Stage stage);

    class WorkloadError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Called once per progress step with the step's percent (0, 10, ..., 100).
    // This is where real task logic goes.
    using StepFn = std::function<void(int percent)>;

    // Step that throws WorkloadError(message) when it reaches failAt.
    StepFn failing_step(int failAt, std::string message);

    struct Settings
    {
        int initialPercent{0};
        std::chrono::milliseconds stepDelay{100};
        std::string activity{"Custom workload"};
    };

    class Runner
    {
    public:
        Runner(log::Logger &logger, progress::ProgressReporter &progress, Settings settings);

        void set_step(StepFn step) { step_ = std::move(step); }

        // Setup -> Running -> Cleanup, then Closed on every exit path: the
        // session is closed (end time, runtime, log closure) even when a stage
        // throws. Exceptions are logged at ERROR and rethrown unchanged.
        void run(RunSession &session);

        Stage stage() const { return stage_; }

    private:
        void setup();
        void running();
        void cleanup();

        log::Logger &logger_;
        progress::ProgressReporter &progress_;
        Settings settings_;
        StepFn step_;
        Stage stage_{Stage::Setup};
    };

} // namespace adhoc::workload
