#pragma once
#include <filesystem>
#include <string>

#include "core/Log.h"

namespace holdfast::core {

// Tunables for the weekly production loop, stored as a key=value INI file.
struct SimConfig {
    int         daysPerWeek         = 7;
    int         weeksPerMonth       = 4;
    std::string ownerId             = "player";
    int         startingPopulation  = 0;
    bool        productionDebugLogs = false;
    LogLevel    logLevel            = LogLevel::Info;
};

// Returns false when the file is missing or unreadable; `cfg` keeps its values.
// Keys with unparsable values are skipped (warning logged).
bool LoadSimConfig(SimConfig& cfg, const std::filesystem::path& file);
bool SaveSimConfig(const SimConfig& cfg, const std::filesystem::path& file);

} // namespace holdfast::core
