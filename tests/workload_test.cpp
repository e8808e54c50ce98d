#include "adhoc/workload.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using namespace std::chrono_literals;
using adhoc::test::count_containing;
using adhoc::test::BreakableBuf;
using adhoc::test::index_of;
using adhoc::test::read_lines;
using adhoc::test::split_lines;
using adhoc::test::TempDir;
using adhoc::workload::Runner;
using adhoc::workload::Settings;
using adhoc::workload::Stage;

namespace
{
    Settings fast_settings()
    {
        Settings s;
        s.stepDelay = 0ms;
        return s;
    }

    struct Harness
    {
        TempDir tmp;
        std::ostringstream console;
        adhoc::log::Logger logger{console};
        adhoc::progress::ProgressReporter progress{console};
        std::filesystem::path path{tmp.path() / "logs" / "task.log"};
    };
}

TEST(Workload, SuccessfulRunWritesFullTranscript)
{
    Harness h;
    Runner runner(h.logger, h.progress, fast_settings());
    std::vector<int> seen;
    runner.set_step([&](int percent)
                    { seen.push_back(percent); });

    auto session = h.logger.initialize(h.path);
    runner.run(session);

    EXPECT_EQ(runner.stage(), Stage::Closed);
    EXPECT_TRUE(session.closed);
    EXPECT_FALSE(h.logger.is_open());
    EXPECT_EQ(seen, (std::vector<int>{0, 10, 20, 30, 40, 50, 60, 70, 80, 90, 100}));

    const auto lines = read_lines(h.path);
    EXPECT_EQ(count_containing(lines, "] [DEBUG] Completed "), 11);
    for (int p = 0; p <= 100; p += 10)
        EXPECT_EQ(count_containing(lines, "] [DEBUG] Completed " + std::to_string(p) + "% of workload"), 1) << p;

    const int start = index_of(lines, "[INFO] Start time: ");
    const int begin = index_of(lines, "[INFO] Beginning workload execution");
    const int first = index_of(lines, "Completed 0%");
    const int last = index_of(lines, "Completed 100%");
    const int done = index_of(lines, "[INFO] Custom workload completed successfully.");
    const int end = index_of(lines, "[INFO] End time: ");
    const int total = index_of(lines, "[INFO] Total runtime: ");
    ASSERT_GE(start, 0);
    EXPECT_LT(start, begin);
    EXPECT_LT(begin, first);
    EXPECT_LT(first, last);
    EXPECT_LT(last, done);
    EXPECT_LT(done, end);
    EXPECT_LT(end, total);
    EXPECT_EQ(count_containing(lines, "[ERROR]"), 0);
    EXPECT_NE(lines[total].find(" seconds"), std::string::npos);
}

TEST(Workload, DebugLinesStayOffTheConsole)
{
    Harness h;
    Runner runner(h.logger, h.progress, fast_settings());
    auto session = h.logger.initialize(h.path);
    runner.run(session);

    const auto out = split_lines(h.console.str());
    EXPECT_EQ(count_containing(out, "[DEBUG]"), 0);
    EXPECT_EQ(count_containing(out, "Custom workload completed successfully."), 1);
    EXPECT_EQ(count_containing(out, "Total runtime: "), 1);
    EXPECT_GE(count_containing(out, "100%"), 1);
}

TEST(Workload, FailureIsLoggedThenRethrownAfterCleanup)
{
    Harness h;
    Runner runner(h.logger, h.progress, fast_settings());
    runner.set_step(adhoc::workload::failing_step(50, "share not reachable"));

    auto session = h.logger.initialize(h.path);
    EXPECT_THROW(runner.run(session), adhoc::workload::WorkloadError);

    EXPECT_EQ(runner.stage(), Stage::Closed);
    EXPECT_TRUE(session.closed);
    EXPECT_FALSE(h.logger.is_open());

    const auto lines = read_lines(h.path);
    const int err = index_of(lines, "] [ERROR] Workload failed during running: share not reachable");
    const int end = index_of(lines, "[INFO] End time: ");
    const int total = index_of(lines, "[INFO] Total runtime: ");
    ASSERT_GE(err, 0);
    EXPECT_LT(err, end);
    EXPECT_LT(end, total);

    EXPECT_EQ(count_containing(lines, "Completed 40% of workload"), 1);
    EXPECT_EQ(count_containing(lines, "Completed 50% of workload"), 0);
    EXPECT_EQ(count_containing(lines, "completed successfully"), 0);

    // The ERROR line starts on its own console line, not after the bar.
    const auto out = split_lines(h.console.str());
    const int consoleErr = index_of(out, "[ERROR] Workload failed");
    ASSERT_GE(consoleErr, 0);
    EXPECT_EQ(out[consoleErr].rfind("[", 0), 0u);
}

TEST(Workload, ThrownExceptionPropagatesUnchanged)
{
    Harness h;
    Runner runner(h.logger, h.progress, fast_settings());
    runner.set_step([](int percent)
                    {
                        if (percent == 0)
                            throw std::invalid_argument("bad input row");
                    });

    auto session = h.logger.initialize(h.path);
    try
    {
        runner.run(session);
        FAIL() << "expected std::invalid_argument";
    }
    catch (const std::invalid_argument &e)
    {
        EXPECT_STREQ(e.what(), "bad input row");
    }
    EXPECT_EQ(count_containing(read_lines(h.path), "[ERROR] Workload failed during running: bad input row"), 1);
}

TEST(Workload, NonStandardExceptionIsLoggedAndRethrown)
{
    Harness h;
    Runner runner(h.logger, h.progress, fast_settings());
    runner.set_step([](int percent)
                    {
                        if (percent == 30)
                            throw 42;
                    });

    auto session = h.logger.initialize(h.path);
    EXPECT_THROW(runner.run(session), int);

    const auto lines = read_lines(h.path);
    EXPECT_EQ(count_containing(lines, "[ERROR] Workload failed during running: unknown error"), 1);
    EXPECT_EQ(count_containing(lines, "Total runtime: "), 1);
}

TEST(Workload, InitialPercentIsReportedAndValidated)
{
    Harness h;
    Settings s = fast_settings();
    s.initialPercent = 25;
    Runner runner(h.logger, h.progress, s);
    auto session = h.logger.initialize(h.path);
    runner.run(session);
    EXPECT_NE(h.console.str().find(" 25% Initializing"), std::string::npos);

    Settings bad = fast_settings();
    bad.initialPercent = 150;
    EXPECT_THROW(Runner(h.logger, h.progress, bad), std::out_of_range);
}

TEST(Workload, StepDelayIsApplied)
{
    Harness h;
    Settings s;
    s.stepDelay = 2ms;
    Runner runner(h.logger, h.progress, s);
    auto session = h.logger.initialize(h.path);
    runner.run(session);
    EXPECT_GE(session.duration(), 22ms);
}

TEST(Workload, FailureNamesTheStageItHappenedIn)
{
    Harness h;
    BreakableBuf buf;
    std::ostream bar(&buf);
    bar.exceptions(std::ios::badbit);
    buf.broken = true;
    adhoc::progress::ProgressReporter progress(bar);
    Runner runner(h.logger, progress, fast_settings());

    auto session = h.logger.initialize(h.path);
    EXPECT_THROW(runner.run(session), std::runtime_error);
    EXPECT_EQ(runner.stage(), Stage::Closed);

    const auto lines = read_lines(h.path);
    EXPECT_EQ(count_containing(lines, "[ERROR] Workload failed during setup: console detached"), 1);
    EXPECT_EQ(count_containing(lines, "Completed 0% of workload"), 0);
    EXPECT_EQ(count_containing(lines, "Total runtime: "), 1);
}

TEST(Workload, StageNames)
{
    EXPECT_STREQ(adhoc::workload::stage_name(Stage::Setup), "setup");
    EXPECT_STREQ(adhoc::workload::stage_name(Stage::Running), "running");
    EXPECT_STREQ(adhoc::workload::stage_name(Stage::Cleanup), "cleanup");
    EXPECT_STREQ(adhoc::workload::stage_name(Stage::Closed), "closed");
}
