#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "game/map/GridCoord.h"

namespace holdfast::game {

// Snapshot of a farm on the strategic map.
//
// Use MakeFarmNode() to build one from raw input: it trims the id, clamps the
// yield at 0 and normalizes the owner.
struct FarmNode
{
    std::string nodeId;
    WorldPosition worldPosition{};
    std::optional<GridCoord> entryCoord;
    bool isOwned = false;
    std::string ownerId;
    int weeklyPopulationYield = 0;

    [[nodiscard]] bool isValid() const noexcept { return !nodeId.empty(); }
    [[nodiscard]] bool hasEntryCoord() const noexcept { return entryCoord.has_value(); }

    friend bool operator==(const FarmNode& a, const FarmNode& b) noexcept
    {
        return a.nodeId == b.nodeId && a.worldPosition == b.worldPosition &&
               a.entryCoord == b.entryCoord && a.isOwned == b.isOwned &&
               a.ownerId == b.ownerId && a.weeklyPopulationYield == b.weeklyPopulationYield;
    }
    friend bool operator!=(const FarmNode& a, const FarmNode& b) noexcept { return !(a == b); }
};

[[nodiscard]] FarmNode MakeFarmNode(std::string_view nodeId,
                                    WorldPosition worldPosition,
                                    std::optional<GridCoord> entryCoord,
                                    bool isOwned,
                                    std::string_view ownerId,
                                    int weeklyPopulationYield = 0);

} // namespace holdfast::game
