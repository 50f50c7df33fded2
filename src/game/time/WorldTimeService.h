#pragma once

#include <cstddef>
#include <cstdint>

#include <entt/signal/sigh.hpp>

#include "game/time/WorldDate.h"
#include "game/time/WorldTimeCounter.h"

namespace holdfast::game {

// Owns the world clock and broadcasts every date change.
//
// Observers connected through onDateChanged() are invoked synchronously,
// inside advanceDay()/resetTo(), in connection order.
class WorldTimeService
{
public:
    using DateChangedSignal = entt::sigh<void(const WorldDate&)>;
    using DateChangedSink = entt::sink<DateChangedSignal>;

    explicit WorldTimeService(int daysPerWeek = WorldTimeCounter::kDefaultDaysPerWeek,
                              int weeksPerMonth = WorldTimeCounter::kDefaultWeeksPerMonth,
                              std::int64_t startDayIndex = 0);

    WorldTimeService(const WorldTimeService&) = delete;
    WorldTimeService& operator=(const WorldTimeService&) = delete;

    [[nodiscard]] const WorldDate& currentDate() const noexcept { return m_counter.currentDate(); }
    [[nodiscard]] int daysPerWeek() const noexcept { return m_counter.daysPerWeek(); }
    [[nodiscard]] int weeksPerMonth() const noexcept { return m_counter.weeksPerMonth(); }

    void advanceDay();
    void resetTo(std::int64_t dayIndex);

    [[nodiscard]] DateChangedSink onDateChanged() noexcept { return DateChangedSink{m_dateChanged}; }
    [[nodiscard]] std::size_t listenerCount() const noexcept { return m_dateChanged.size(); }

private:
    void raiseCurrentDate();

    WorldTimeCounter m_counter;
    DateChangedSignal m_dateChanged;
};

} // namespace holdfast::game
