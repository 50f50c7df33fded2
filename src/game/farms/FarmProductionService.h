#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <entt/signal/sigh.hpp>

#include "game/time/WorldDate.h"

namespace holdfast::game {

class FarmNodeService;
class PopulationService;
class WorldTimeService;

// Computes weekly population from owned farms and resets the population pool
// at the start of each week. Capturing a farm mid-week grants nothing; the
// farm only counts from the next week rollover.
//
// The first date observed after binding always applies, regardless of where
// in the week it falls.
//
// Lifetime: the bound services must outlive this object, or unbind() must be
// called first. The clock subscription is released on destruction.
class FarmProductionService
{
public:
    static constexpr const char* kDefaultOwnerId = "player";

    explicit FarmProductionService(std::string ownerId = kDefaultOwnerId);

    FarmProductionService(const FarmProductionService&) = delete;
    FarmProductionService& operator=(const FarmProductionService&) = delete;

    // Replaces the collaborators and forgets the last processed week.
    // Subscribes to the clock right away when enabled.
    void bindServices(WorldTimeService& time, FarmNodeService& farms, PopulationService& population);
    void unbind();

    [[nodiscard]] bool isBound() const noexcept { return m_time != nullptr; }

    // Idempotent: any enable/disable sequence leaves at most one subscription.
    void setEnabled(bool enabled);
    void enable() { setEnabled(true); }
    void disable() { setEnabled(false); }
    [[nodiscard]] bool isEnabled() const noexcept { return m_enabled; }
    [[nodiscard]] bool isSubscribed() const noexcept { return static_cast<bool>(m_dateConnection); }

    [[nodiscard]] const std::string& ownerId() const noexcept { return m_ownerId; }
    void setOwnerId(std::string ownerId) { m_ownerId = std::move(ownerId); }

    void setDebugLogs(bool on) noexcept { m_debugLogs = on; }

    // Week index of the last reset, or nullopt before the first one.
    [[nodiscard]] std::optional<std::int64_t> lastProcessedWeek() const noexcept { return m_lastProcessedWeek; }

    // Sum of weekly yield over the owner's farms as of now.
    [[nodiscard]] int computeWeeklyYield() const;

private:
    void subscribe();
    void unsubscribe();
    void onDateChanged(const WorldDate& date);

    WorldTimeService* m_time = nullptr;
    FarmNodeService* m_farms = nullptr;
    PopulationService* m_population = nullptr;

    std::string m_ownerId;
    bool m_enabled = true;
    bool m_debugLogs = false;

    std::optional<std::int64_t> m_lastProcessedWeek;
    entt::scoped_connection m_dateConnection;
};

} // namespace holdfast::game
