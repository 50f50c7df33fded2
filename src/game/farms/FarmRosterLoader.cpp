#include "game/farms/FarmRosterLoader.h"

#include "core/Log.h"
#include "game/farms/FarmNodeService.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace holdfast::game {

namespace {

using json = nlohmann::json;

FarmNode FarmFromJson(const json& f, std::size_t i, const std::string& sourceName)
{
    if (!f.is_object())
        throw std::runtime_error(sourceName + ": farms[" + std::to_string(i) + "] is not an object");
    if (!f.contains("id") || !f["id"].is_string())
        throw std::runtime_error(sourceName + ": farms[" + std::to_string(i) + "] has no string \"id\"");

    WorldPosition pos{};
    if (f.contains("position"))
    {
        const auto p = f["position"].get<std::vector<float>>();
        if (p.size() != 3)
            throw std::runtime_error(sourceName + ": farms[" + std::to_string(i) + "].position needs 3 numbers");
        pos = WorldPosition{p[0], p[1], p[2]};
    }

    std::optional<GridCoord> entry;
    if (f.contains("entry") && !f["entry"].is_null())
    {
        const auto e = f["entry"].get<std::vector<int>>();
        if (e.size() != 2)
            throw std::runtime_error(sourceName + ": farms[" + std::to_string(i) + "].entry needs 2 integers");
        entry = GridCoord{e[0], e[1]};
    }

    return MakeFarmNode(f["id"].get<std::string>(),
                        pos,
                        entry,
                        f.value("owned", false),
                        f.value("owner", std::string{}),
                        f.value("yield", 0));
}

} // namespace

std::vector<FarmNode> ParseFarmRoster(const std::string& jsonText, const std::string& sourceName)
{
    json J;
    try
    {
        J = json::parse(jsonText);
    }
    catch (const json::parse_error& e)
    {
        throw std::runtime_error(sourceName + ": invalid JSON: " + e.what());
    }

    if (!J.is_object() || !J.contains("farms") || !J["farms"].is_array())
        throw std::runtime_error(sourceName + ": expected an object with a \"farms\" array");

    std::vector<FarmNode> out;
    out.reserve(J["farms"].size());
    try
    {
        std::size_t i = 0;
        for (const auto& f : J["farms"])
            out.push_back(FarmFromJson(f, i++, sourceName));
    }
    catch (const json::exception& e)
    {
        throw std::runtime_error(sourceName + ": " + e.what());
    }

    return out;
}

std::vector<FarmNode> LoadFarmRoster(const std::filesystem::path& jsonPath)
{
    std::ifstream f(jsonPath, std::ios::binary);
    if (!f.is_open()) throw std::runtime_error("Could not open " + jsonPath.string());

    std::ostringstream oss;
    oss << f.rdbuf();
    return ParseFarmRoster(oss.str(), jsonPath.string());
}

std::size_t RegisterFarmRoster(FarmNodeService& service, const std::vector<FarmNode>& nodes)
{
    std::size_t accepted = 0;
    for (const auto& node : nodes)
    {
        if (service.registerOrUpdate(node))
            ++accepted;
    }

    if (accepted != nodes.size())
        HF_LOG_WARN("RegisterFarmRoster: %zu of %zu farms rejected", nodes.size() - accepted, nodes.size());
    return accepted;
}

} // namespace holdfast::game
