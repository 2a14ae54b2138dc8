#pragma once

#include <ctime>
#include <string>

namespace topclock::clock {

struct ClockTime
{
    int hours = 12; // 1..12
    int minutes = 0;
    int seconds = 0;
    bool pm = false;

    bool operator==(ClockTime const&) const = default;
};

ClockTime to_clock_time(std::tm const& local);

/// Current local time through the system timezone.
ClockTime local_clock_time(std::time_t now);

/// "HH:MM:SS AM", used for font sizing
std::string plain_text(ClockTime const& time);

/// "|0HH|1:|0MM|1:|0SS |2AM": digits colour 0, colons colour 1, AM/PM colour 2
std::string colored_markup(ClockTime const& time);

} // namespace topclock::clock
