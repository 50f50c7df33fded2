// tests/test_farm_production_service.cpp
//
// Weekly population production: farms feed the pool once per week, and each
// new week replaces (never tops up) what was left of the previous one.

#include <doctest/doctest.h>

#include "game/farms/FarmNodeService.h"
#include "game/farms/FarmProductionService.h"
#include "game/population/PopulationService.h"
#include "game/time/WorldTimeService.h"

using holdfast::game::FarmNode;
using holdfast::game::FarmNodeService;
using holdfast::game::FarmProductionService;
using holdfast::game::GridCoord;
using holdfast::game::MakeFarmNode;
using holdfast::game::PopulationService;
using holdfast::game::WorldPosition;
using holdfast::game::WorldTimeService;

namespace {

FarmNode Farm(const char* id, int x, int yield, const char* owner = "player", bool owned = true)
{
    return MakeFarmNode(id, WorldPosition{}, GridCoord{x, 0}, owned, owner, yield);
}

// Declaration order matters: production must be destroyed before the clock.
struct Scene
{
    WorldTimeService time;
    FarmNodeService farms;
    PopulationService pop;
    FarmProductionService prod;

    Scene() { prod.bindServices(time, farms, pop); }

    void advance(int days)
    {
        for (int i = 0; i < days; ++i)
            time.advanceDay();
    }
};

} // namespace

TEST_CASE("Week start sets population to the sum of owned farms")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("farm-1", 0, 20));
    s.farms.registerOrUpdate(Farm("farm-2", 1, 40));

    // Toggling must not double-subscribe.
    s.prod.disable();
    s.prod.enable();
    s.time.advanceDay();

    // First observed date always counts as a week boundary.
    CHECK(s.pop.getAvailable() == 60);
    REQUIRE(s.prod.lastProcessedWeek().has_value());
    CHECK(*s.prod.lastProcessedWeek() == 0);
}

TEST_CASE("Mid-week capture does not affect population until next week")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("farm-1", 0, 20));

    s.prod.disable();
    s.prod.enable();
    s.time.advanceDay();
    CHECK(s.pop.getAvailable() == 20);

    s.farms.registerOrUpdate(Farm("farm-2", 1, 40));
    s.time.advanceDay();
    CHECK(s.pop.getAvailable() == 20);

    s.advance(7);
    CHECK(s.pop.getAvailable() == 60);
}

TEST_CASE("Weekly reset discards the unspent remainder")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("farm-1", 0, 30));

    s.time.advanceDay();
    CHECK(s.pop.getAvailable() == 30);

    CHECK(s.pop.trySpend(10));
    CHECK(s.pop.getAvailable() == 20);

    s.advance(7);
    CHECK(s.pop.getAvailable() == 30);
}

TEST_CASE("Week boundaries fall at day indices 7 and 14")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("farm-1", 0, 10));

    s.time.advanceDay();               // day 1, week 0 -> applied
    CHECK(s.pop.getAvailable() == 10);
    CHECK(s.pop.trySpend(10));

    s.advance(5);                      // day 6, still week 0
    CHECK(s.time.currentDate().dayIndex == 6);
    CHECK(s.pop.getAvailable() == 0);

    s.advance(1);                      // day 7, week 1
    CHECK(s.pop.getAvailable() == 10);
    CHECK(*s.prod.lastProcessedWeek() == 1);
    CHECK(s.pop.trySpend(10));

    s.advance(6);                      // day 13, still week 1
    CHECK(s.pop.getAvailable() == 0);

    s.advance(1);                      // day 14, week 2
    CHECK(s.pop.getAvailable() == 10);
    CHECK(*s.prod.lastProcessedWeek() == 2);
}

TEST_CASE("Only owned farms of the configured owner contribute")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("mine", 0, 15));
    s.farms.registerOrUpdate(Farm("unowned", 1, 100, "player", /*owned=*/false));
    s.farms.registerOrUpdate(Farm("theirs", 2, 50, "rival"));

    s.time.advanceDay();
    CHECK(s.pop.getAvailable() == 15);

    s.prod.setOwnerId("rival");
    s.advance(7);
    CHECK(s.pop.getAvailable() == 50);
}

TEST_CASE("First advance with no farms resets the pool to zero")
{
    Scene s;
    s.pop.resetTo(25);

    s.time.advanceDay();
    CHECK(s.pop.getAvailable() == 0);
    CHECK(s.prod.lastProcessedWeek().has_value());
}

TEST_CASE("Repeated enable/disable keeps exactly one subscription")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("farm-1", 0, 5));

    for (int i = 0; i < 4; ++i)
    {
        s.prod.enable();
        s.prod.disable();
        s.prod.enable();
    }
    CHECK(s.prod.isSubscribed());
    CHECK(s.time.listenerCount() == 1);

    s.prod.disable();
    s.prod.disable();
    CHECK_FALSE(s.prod.isSubscribed());
    CHECK(s.time.listenerCount() == 0);
}

TEST_CASE("Disabled service ignores day changes until re-enabled")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("farm-1", 0, 12));

    s.prod.disable();
    s.advance(3);
    CHECK(s.pop.getAvailable() == 0);
    CHECK_FALSE(s.prod.lastProcessedWeek().has_value());

    s.prod.enable();
    s.time.advanceDay();               // first observed date after enabling
    CHECK(s.pop.getAvailable() == 12);
}

TEST_CASE("Rebinding forgets the processed week")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("farm-1", 0, 8));
    s.time.advanceDay();
    CHECK(s.pop.getAvailable() == 8);

    PopulationService other;
    s.prod.bindServices(s.time, s.farms, other);
    CHECK_FALSE(s.prod.lastProcessedWeek().has_value());
    CHECK(s.time.listenerCount() == 1);

    s.time.advanceDay();               // same week, but first date for the new binding
    CHECK(other.getAvailable() == 8);

    s.prod.unbind();
    CHECK_FALSE(s.prod.isBound());
    CHECK(s.time.listenerCount() == 0);
}

TEST_CASE("Clock reset into a new week recomputes")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("farm-1", 0, 4));
    s.time.advanceDay();
    CHECK(s.pop.getAvailable() == 4);

    s.farms.registerOrUpdate(Farm("farm-2", 1, 6));
    s.time.resetTo(3);                 // still week 0
    CHECK(s.pop.getAvailable() == 4);

    s.time.resetTo(70);                // week 10
    CHECK(s.pop.getAvailable() == 10);
}

TEST_CASE("Farm yield updates apply at the next week rollover")
{
    Scene s;
    s.farms.registerOrUpdate(Farm("farm-1", 0, 20));
    s.time.advanceDay();
    CHECK(s.pop.getAvailable() == 20);

    s.farms.registerOrUpdate(Farm("farm-1", 0, 5));
    s.farms.unregisterNode("missing");
    s.time.advanceDay();
    CHECK(s.pop.getAvailable() == 20);

    s.advance(6);                      // day 8, week 1
    CHECK(s.pop.getAvailable() == 5);
    CHECK(s.prod.computeWeeklyYield() == 5);
}
