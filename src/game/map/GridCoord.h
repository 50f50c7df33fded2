#pragma once

namespace holdfast::game {

// Integer tile coordinate on the strategic map.
struct GridCoord
{
    int x = 0;
    int y = 0;

    friend bool operator==(const GridCoord& a, const GridCoord& b) noexcept { return a.x == b.x && a.y == b.y; }
    friend bool operator!=(const GridCoord& a, const GridCoord& b) noexcept { return !(a == b); }
};

struct WorldPosition
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    friend bool operator==(const WorldPosition& a, const WorldPosition& b) noexcept
    {
        return a.x == b.x && a.y == b.y && a.z == b.z;
    }
    friend bool operator!=(const WorldPosition& a, const WorldPosition& b) noexcept { return !(a == b); }
};

} // namespace holdfast::game
