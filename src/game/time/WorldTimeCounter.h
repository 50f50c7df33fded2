#pragma once

#include <cstdint>

#include "game/time/WorldDate.h"

namespace holdfast::game {

// Pure calendar arithmetic over an absolute day index.
class WorldTimeCounter
{
public:
    static constexpr int kDefaultDaysPerWeek = 7;
    static constexpr int kDefaultWeeksPerMonth = 4;

    // Throws std::invalid_argument when either rule is < 1.
    WorldTimeCounter(std::int64_t startDayIndex, int daysPerWeek, int weeksPerMonth);

    [[nodiscard]] const WorldDate& currentDate() const noexcept { return m_current; }
    [[nodiscard]] int daysPerWeek() const noexcept { return m_daysPerWeek; }
    [[nodiscard]] int weeksPerMonth() const noexcept { return m_weeksPerMonth; }

    const WorldDate& advanceDay();

    // Negative indices clamp to 0.
    void reset(std::int64_t dayIndex);

    // Throws std::invalid_argument when either rule is < 1. Recomputes the current date.
    void setRules(int daysPerWeek, int weeksPerMonth);

    [[nodiscard]] WorldDate dateFor(std::int64_t dayIndex) const noexcept;

private:
    int m_daysPerWeek = kDefaultDaysPerWeek;
    int m_weeksPerMonth = kDefaultWeeksPerMonth;
    WorldDate m_current{};
};

} // namespace holdfast::game
