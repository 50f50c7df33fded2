#pragma once

#include <cstdint>
#include <string>

namespace holdfast::game {

// A point on the world calendar.
//
// dayIndex/weekIndex are absolute (0-based, monotonic while the clock only
// advances). day/week/month are the 1-based calendar view of the same day.
struct WorldDate
{
    std::int64_t dayIndex = 0;
    std::int64_t weekIndex = 0;

    int day = 1;    // day of week
    int week = 1;   // week of month
    int month = 1;

    [[nodiscard]] std::string toString() const
    {
        return "Day " + std::to_string(day) + ", Week " + std::to_string(week) +
               ", Month " + std::to_string(month);
    }

    friend bool operator==(const WorldDate& a, const WorldDate& b) noexcept
    {
        return a.dayIndex == b.dayIndex && a.weekIndex == b.weekIndex &&
               a.day == b.day && a.week == b.week && a.month == b.month;
    }
    friend bool operator!=(const WorldDate& a, const WorldDate& b) noexcept { return !(a == b); }
};

} // namespace holdfast::game
