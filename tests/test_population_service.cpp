// tests/test_population_service.cpp
//
// Coverage for src/game/population/PopulationService.

#include <doctest/doctest.h>

#include "game/population/PopulationService.h"

#include <limits>
#include <vector>

using holdfast::game::PopulationService;

namespace {

struct ChangeRecorder
{
    std::vector<int> values;
    void onChanged(int v) { values.push_back(v); }
};

} // namespace

TEST_CASE("PopulationService starting amount is clamped at zero")
{
    CHECK(PopulationService(12).getAvailable() == 12);
    CHECK(PopulationService(-5).getAvailable() == 0);
    CHECK(PopulationService().getAvailable() == 0);
}

TEST_CASE("PopulationService trySpend succeeds only with enough available")
{
    PopulationService pop(30);

    CHECK(pop.trySpend(10));
    CHECK(pop.getAvailable() == 20);

    CHECK_FALSE(pop.trySpend(21));
    CHECK(pop.getAvailable() == 20);

    CHECK(pop.trySpend(20));
    CHECK(pop.getAvailable() == 0);

    CHECK_FALSE(pop.trySpend(1));
    CHECK(pop.getAvailable() == 0);
}

TEST_CASE("PopulationService rejects negative spends and accepts zero")
{
    PopulationService pop(5);
    CHECK_FALSE(pop.trySpend(-3));
    CHECK(pop.getAvailable() == 5);

    CHECK(pop.trySpend(0));
    CHECK(pop.getAvailable() == 5);
}

TEST_CASE("PopulationService resetTo overwrites instead of adding")
{
    PopulationService pop(7);
    pop.resetTo(30);
    CHECK(pop.getAvailable() == 30);

    CHECK(pop.trySpend(25));
    pop.resetTo(30);
    CHECK(pop.getAvailable() == 30);

    pop.resetTo(-10);
    CHECK(pop.getAvailable() == 0);
}

TEST_CASE("PopulationService add clamps at zero and at int max")
{
    PopulationService pop(10);
    pop.add(5);
    CHECK(pop.getAvailable() == 15);
    pop.add(-100);
    CHECK(pop.getAvailable() == 0);

    pop.resetTo(std::numeric_limits<int>::max() - 1);
    pop.add(10);
    CHECK(pop.getAvailable() == std::numeric_limits<int>::max());
}

TEST_CASE("PopulationService notifies only on actual change")
{
    PopulationService pop(0);
    ChangeRecorder rec;
    pop.onPopulationChanged().connect<&ChangeRecorder::onChanged>(rec);

    pop.resetTo(20);
    pop.resetTo(20);     // same value
    CHECK(pop.trySpend(5));
    CHECK_FALSE(pop.trySpend(100));
    CHECK(pop.trySpend(0));
    pop.add(0);

    REQUIRE(rec.values.size() == 2);
    CHECK(rec.values[0] == 20);
    CHECK(rec.values[1] == 15);
}
