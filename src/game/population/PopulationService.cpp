#include "game/population/PopulationService.h"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace holdfast::game {

PopulationService::PopulationService(int startingAmount)
    : m_available(std::max(0, startingAmount))
{
}

void PopulationService::add(int delta)
{
    if (delta == 0)
        return;

    const std::int64_t next = static_cast<std::int64_t>(m_available) + delta;
    const std::int64_t clamped = std::clamp<std::int64_t>(next, 0, std::numeric_limits<int>::max());
    set(static_cast<int>(clamped));
}

bool PopulationService::trySpend(int amount)
{
    if (amount < 0)
        return false;
    if (amount == 0)
        return true;
    if (m_available < amount)
        return false;

    set(m_available - amount);
    return true;
}

void PopulationService::resetTo(int weeklyAmount)
{
    set(std::max(0, weeklyAmount));
}

void PopulationService::set(int value)
{
    if (value == m_available)
        return;
    m_available = value;
    m_changed.publish(m_available);
}

} // namespace holdfast::game
