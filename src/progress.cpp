#include "adhoc/progress.hpp"
#include "adhoc/ansi.hpp"

#include <iomanip>
#include <stdexcept>

namespace adhoc::progress
{

    int validate_percent(int percent)
    {
        if (percent < 0 || percent > 100)
            throw std::out_of_range("progress percent must be within 0..100, got " +
                                    std::to_string(percent));
        return percent;
    }

    ProgressReporter::ProgressReporter(std::ostream &console, bool color, int barWidth)
        : console_(console), color_(color), barWidth_(barWidth > 0 ? barWidth : 42)
    {
    }

    void ProgressReporter::report(int percent, const std::string &activity, const std::string &status)
    {
        validate_percent(percent);

        const int filled = percent * barWidth_ / 100;
        // activity + " [" + bar + "] " + "nnn% " + status
        const std::size_t width = activity.size() + barWidth_ + 9 + status.size();

        console_ << (color_ ? ansi::erase_line : "\r");
        console_ << ansi::paint(color_, ansi::info) << activity << ansi::paint(color_, ansi::reset)
                 << " [" << ansi::paint(color_, ansi::ok) << std::string(filled, '#')
                 << ansi::paint(color_, ansi::reset) << std::string(barWidth_ - filled, ' ') << "] "
                 << std::setw(3) << percent << "% "
                 << ansi::paint(color_, ansi::muted) << status << ansi::paint(color_, ansi::reset);
        // A bare carriage return does not clear, so blank out what a longer
        // previous draw left behind.
        if (width < last_width_)
            console_ << std::string(last_width_ - width, ' ');
        console_.flush();

        last_width_ = width;
        last_percent_ = percent;
        active_ = true;
    }

    void ProgressReporter::complete()
    {
        if (!active_)
            return;
        console_ << "\n";
        console_.flush();
        active_ = false;
        last_width_ = 0;
    }

} // namespace adhoc::progress
