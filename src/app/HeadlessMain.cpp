// src/app/HeadlessMain.cpp
//
// Runs the weekly production loop without a window: loads settings and a farm
// roster, advances the clock day by day and logs the population pool.

#include "app/CommandLineArgs.h"
#include "core/Config.h"
#include "core/Log.h"
#include "game/farms/FarmNodeService.h"
#include "game/farms/FarmProductionService.h"
#include "game/farms/FarmRosterLoader.h"
#include "game/population/PopulationService.h"
#include "game/time/WorldTimeService.h"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>

namespace {

constexpr int kDefaultDays = 14;

int Run(const holdfast::app::CommandLineArgs& args)
{
    using namespace holdfast;

    core::SimConfig cfg;
    if (args.configPath)
    {
        if (!core::LoadSimConfig(cfg, *args.configPath))
            HF_LOG_WARN("Config %s not readable; using defaults", args.configPath->string().c_str());
    }
    if (args.ownerId)
        cfg.ownerId = *args.ownerId;

    core::LogSetLevel(args.verbose ? core::LogLevel::Trace : cfg.logLevel);

    game::WorldTimeService time(cfg.daysPerWeek, cfg.weeksPerMonth);
    game::FarmNodeService farms;
    game::PopulationService population(cfg.startingPopulation);
    game::FarmProductionService production(cfg.ownerId);
    production.setDebugLogs(cfg.productionDebugLogs || args.verbose);

    if (args.farmsPath)
    {
        const auto roster = game::LoadFarmRoster(*args.farmsPath);
        const auto accepted = game::RegisterFarmRoster(farms, roster);
        HF_LOG_INFO("Loaded %zu farm(s) from %s", accepted, args.farmsPath->string().c_str());
    }
    else
    {
        HF_LOG_WARN("No --farms roster given; the population pool will stay empty");
    }

    production.bindServices(time, farms, population);

    const int days = args.days.value_or(kDefaultDays);
    for (int i = 0; i < days; ++i)
    {
        time.advanceDay();
        const auto& date = time.currentDate();
        HF_LOG_INFO("%s (day %lld): available population = %d",
                    date.toString().c_str(), static_cast<long long>(date.dayIndex), population.getAvailable());
    }

    std::printf("owner=%s days=%d farms=%zu available=%d\n",
                production.ownerId().c_str(), days, farms.size(), population.getAvailable());

    production.unbind();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    const auto args = holdfast::app::ParseCommandLineArgs(argc, argv);

    if (args.showHelp)
    {
        std::fputs(holdfast::app::BuildCommandLineHelpText().c_str(), stdout);
        return 0;
    }

    if (!args.unknown.empty())
    {
        for (const auto& u : args.unknown)
            std::fprintf(stderr, "holdfast_headless: unrecognized or malformed option '%s'\n", u.c_str());
        std::fputs(holdfast::app::BuildCommandLineHelpText().c_str(), stderr);
        return 2;
    }

    holdfast::core::LogInit(args.logDir.value_or(std::filesystem::path{}));

    int rc = 1;
    try
    {
        rc = Run(args);
    }
    catch (const std::exception& e)
    {
        HF_LOG_ERROR("Fatal: %s", e.what());
        rc = 1;
    }

    holdfast::core::LogShutdown();
    return rc;
}
