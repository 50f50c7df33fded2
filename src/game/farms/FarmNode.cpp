#include "game/farms/FarmNode.h"

#include <algorithm>
#include <cctype>

namespace holdfast::game {

namespace {

[[nodiscard]] std::string_view Trim(std::string_view s) noexcept
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

} // namespace

FarmNode MakeFarmNode(std::string_view nodeId,
                      WorldPosition worldPosition,
                      std::optional<GridCoord> entryCoord,
                      bool isOwned,
                      std::string_view ownerId,
                      int weeklyPopulationYield)
{
    FarmNode node;
    node.nodeId = std::string(Trim(nodeId));
    node.worldPosition = worldPosition;
    node.entryCoord = entryCoord;
    node.isOwned = isOwned;
    node.ownerId = std::string(ownerId);
    node.weeklyPopulationYield = std::max(0, weeklyPopulationYield);
    return node;
}

} // namespace holdfast::game
