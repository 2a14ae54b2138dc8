#include "time_format.hpp"
#include <spdlog/fmt/fmt.h>

namespace topclock::clock {

namespace {

char const* meridiem(ClockTime const& time) { return time.pm ? "PM" : "AM"; }

} // namespace

ClockTime to_clock_time(std::tm const& local)
{
    ClockTime time;
    time.pm = local.tm_hour >= 12;
    time.hours = local.tm_hour % 12 == 0 ? 12 : local.tm_hour % 12;
    time.minutes = local.tm_min;
    time.seconds = local.tm_sec;
    return time;
}

ClockTime local_clock_time(std::time_t now)
{
    std::tm local{};
    localtime_r(&now, &local);
    return to_clock_time(local);
}

std::string plain_text(ClockTime const& time)
{
    return fmt::format("{:02}:{:02}:{:02} {}", time.hours, time.minutes, time.seconds, meridiem(time));
}

std::string colored_markup(ClockTime const& time)
{
    return fmt::format("|0{:02}|1:|0{:02}|1:|0{:02} |2{}", time.hours, time.minutes, time.seconds, meridiem(time));
}

} // namespace topclock::clock
