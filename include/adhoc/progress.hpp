#pragma once
#include <cstddef>
#include <iostream>
#include <string>

namespace adhoc::progress
{

    // Throws std::out_of_range unless 0 <= percent <= 100.
    int validate_percent(int percent);

    // Single-line console progress indicator, redrawn in place:
    //   <activity> [##########          ]  50% <status>
    class ProgressReporter
    {
    public:
        explicit ProgressReporter(std::ostream &console = std::cout,
                                  bool color = false,
                                  int barWidth = 42);

        void report(int percent, const std::string &activity, const std::string &status);

        // Ends the indicator line so following output starts on a fresh line.
        void complete();

        int last_percent() const { return last_percent_; }

    private:
        std::ostream &console_;
        bool color_;
        int barWidth_;
        int last_percent_{-1};
        std::size_t last_width_{0};
        bool active_{false};
    };

} // namespace adhoc::progress
