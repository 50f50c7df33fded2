#pragma once

#include <entt/signal/sigh.hpp>

namespace holdfast::game {

// In-memory population pool for the current session.
//
// The pool never goes negative. PopulationChanged fires only when the
// available amount actually changes.
class PopulationService
{
public:
    using ChangedSignal = entt::sigh<void(int)>;
    using ChangedSink = entt::sink<ChangedSignal>;

    explicit PopulationService(int startingAmount = 0);

    PopulationService(const PopulationService&) = delete;
    PopulationService& operator=(const PopulationService&) = delete;

    [[nodiscard]] int getAvailable() const noexcept { return m_available; }

    // Result is clamped at 0.
    void add(int delta);

    // Negative amounts are rejected. Zero always succeeds.
    [[nodiscard]] bool trySpend(int amount);

    // Overwrites the pool with this week's amount; any unspent remainder is lost.
    void resetTo(int weeklyAmount);

    [[nodiscard]] ChangedSink onPopulationChanged() noexcept { return ChangedSink{m_changed}; }

private:
    void set(int value);

    int m_available = 0;
    ChangedSignal m_changed;
};

} // namespace holdfast::game
