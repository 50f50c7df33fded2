#include "game/farms/FarmProductionService.h"

#include "core/Log.h"
#include "game/farms/FarmNodeService.h"
#include "game/population/PopulationService.h"
#include "game/time/WorldTimeService.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace holdfast::game {

FarmProductionService::FarmProductionService(std::string ownerId)
    : m_ownerId(std::move(ownerId))
{
}

void FarmProductionService::bindServices(WorldTimeService& time, FarmNodeService& farms, PopulationService& population)
{
    unsubscribe();

    m_time = &time;
    m_farms = &farms;
    m_population = &population;
    m_lastProcessedWeek.reset();

    if (m_enabled)
        subscribe();
}

void FarmProductionService::unbind()
{
    unsubscribe();
    m_time = nullptr;
    m_farms = nullptr;
    m_population = nullptr;
    m_lastProcessedWeek.reset();
}

void FarmProductionService::setEnabled(bool enabled)
{
    m_enabled = enabled;
    if (enabled)
        subscribe();
    else
        unsubscribe();

    if (m_debugLogs)
        HF_LOG_TRACE("[FarmProduction] %s. subscribed=%d", enabled ? "Enabled" : "Disabled", isSubscribed() ? 1 : 0);
}

void FarmProductionService::subscribe()
{
    if (!m_time || m_dateConnection)
        return;
    m_dateConnection = m_time->onDateChanged().connect<&FarmProductionService::onDateChanged>(*this);
}

void FarmProductionService::unsubscribe()
{
    m_dateConnection.release();
}

int FarmProductionService::computeWeeklyYield() const
{
    if (!m_farms)
        return 0;

    std::int64_t total = 0;
    for (const auto& farm : m_farms->query(m_ownerId))
        total += std::max(0, farm.weeklyPopulationYield);

    return static_cast<int>(std::min<std::int64_t>(total, std::numeric_limits<int>::max()));
}

void FarmProductionService::onDateChanged(const WorldDate& date)
{
    if (!m_farms || !m_population)
    {
        HF_LOG_WARN("[FarmProduction] Date changed to %s but services are not bound. Skipping.", date.toString().c_str());
        return;
    }

    if (m_lastProcessedWeek && *m_lastProcessedWeek == date.weekIndex)
    {
        if (m_debugLogs)
            HF_LOG_TRACE("[FarmProduction] Week %lld already applied. Skipping %s.",
                         static_cast<long long>(date.weekIndex), date.toString().c_str());
        return;
    }

    const int totalWeekly = computeWeeklyYield();
    m_population->resetTo(totalWeekly);
    m_lastProcessedWeek = date.weekIndex;

    HF_LOG_INFO("[FarmProduction] Applied weekly population = %d for %s (owner '%s', farms=%zu)",
                totalWeekly, date.toString().c_str(), m_ownerId.c_str(), m_farms->size());
}

} // namespace holdfast::game
