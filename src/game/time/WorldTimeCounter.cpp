#include "game/time/WorldTimeCounter.h"

#include <algorithm>
#include <stdexcept>

namespace holdfast::game {

WorldTimeCounter::WorldTimeCounter(std::int64_t startDayIndex, int daysPerWeek, int weeksPerMonth)
{
    setRules(daysPerWeek, weeksPerMonth);
    reset(startDayIndex);
}

const WorldDate& WorldTimeCounter::advanceDay()
{
    m_current = dateFor(m_current.dayIndex + 1);
    return m_current;
}

void WorldTimeCounter::reset(std::int64_t dayIndex)
{
    m_current = dateFor(std::max<std::int64_t>(0, dayIndex));
}

void WorldTimeCounter::setRules(int daysPerWeek, int weeksPerMonth)
{
    if (daysPerWeek < 1)
        throw std::invalid_argument("daysPerWeek must be >= 1, got " + std::to_string(daysPerWeek));
    if (weeksPerMonth < 1)
        throw std::invalid_argument("weeksPerMonth must be >= 1, got " + std::to_string(weeksPerMonth));

    m_daysPerWeek = daysPerWeek;
    m_weeksPerMonth = weeksPerMonth;
    m_current = dateFor(m_current.dayIndex);
}

WorldDate WorldTimeCounter::dateFor(std::int64_t dayIndex) const noexcept
{
    const std::int64_t dpw = m_daysPerWeek;
    const std::int64_t wpm = m_weeksPerMonth;

    WorldDate d;
    d.dayIndex = dayIndex;
    d.weekIndex = dayIndex / dpw;
    d.day = static_cast<int>(dayIndex % dpw) + 1;
    d.week = static_cast<int>(d.weekIndex % wpm) + 1;
    d.month = static_cast<int>(d.weekIndex / wpm) + 1;
    return d;
}

} // namespace holdfast::game
