#include "game/time/WorldTimeService.h"

namespace holdfast::game {

WorldTimeService::WorldTimeService(int daysPerWeek, int weeksPerMonth, std::int64_t startDayIndex)
    : m_counter(startDayIndex, daysPerWeek, weeksPerMonth)
{
}

void WorldTimeService::advanceDay()
{
    m_counter.advanceDay();
    raiseCurrentDate();
}

void WorldTimeService::resetTo(std::int64_t dayIndex)
{
    m_counter.reset(dayIndex);
    raiseCurrentDate();
}

void WorldTimeService::raiseCurrentDate()
{
    // Copy: a listener may reset the clock while we are publishing.
    const WorldDate date = m_counter.currentDate();
    m_dateChanged.publish(date);
}

} // namespace holdfast::game
