#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "game/farms/FarmNode.h"

namespace holdfast::game {

class FarmNodeService;

// Reads a farm roster:
//
//   { "farms": [ { "id": "farm-1", "owner": "player", "owned": true,
//                  "yield": 20, "position": [0, 0, 0], "entry": [0, 0] } ] }
//
// Only "id" is required per farm. Throws std::runtime_error when the file
// cannot be opened, is not valid JSON, or lacks a "farms" array.
[[nodiscard]] std::vector<FarmNode> LoadFarmRoster(const std::filesystem::path& jsonPath);

// Same, from an in-memory document. `sourceName` is only used in error messages.
[[nodiscard]] std::vector<FarmNode> ParseFarmRoster(const std::string& jsonText,
                                                    const std::string& sourceName = "<memory>");

// Registers every node; returns how many were accepted.
std::size_t RegisterFarmRoster(FarmNodeService& service, const std::vector<FarmNode>& nodes);

} // namespace holdfast::game
