#include "game/farms/FarmNodeService.h"

#include "core/Log.h"

#include <utility>

namespace holdfast::game {

bool FarmNodeService::registerOrUpdate(const FarmNode& node)
{
    if (!node.isValid())
    {
        HF_LOG_WARN("FarmNodeService: rejecting farm node without an id (owner '%s')", node.ownerId.c_str());
        return false;
    }

    const auto it = m_index.find(node.nodeId);
    if (it == m_index.end())
    {
        m_index.emplace(node.nodeId, m_nodes.size());
        m_nodes.push_back(node);
        m_registered.publish(node);
        return true;
    }

    FarmNode& existing = m_nodes[it->second];
    if (existing == node)
        return true;

    existing = node;
    m_updated.publish(node);
    return true;
}

bool FarmNodeService::unregisterNode(std::string_view nodeId)
{
    const auto it = m_index.find(std::string(nodeId));
    if (it == m_index.end())
        return false;

    const std::size_t slot = it->second;
    std::string removedId = std::move(m_nodes[slot].nodeId);
    m_index.erase(it);

    // Swap-remove; re-point the moved node's index entry.
    if (slot + 1 != m_nodes.size())
    {
        m_nodes[slot] = std::move(m_nodes.back());
        m_index[m_nodes[slot].nodeId] = slot;
    }
    m_nodes.pop_back();

    m_unregistered.publish(removedId);
    return true;
}

std::optional<FarmNode> FarmNodeService::tryGetById(std::string_view nodeId) const
{
    const auto it = m_index.find(std::string(nodeId));
    if (it == m_index.end())
        return std::nullopt;
    return m_nodes[it->second];
}

std::optional<FarmNode> FarmNodeService::tryGetByCoord(const GridCoord& coord) const
{
    for (const auto& node : m_nodes)
    {
        if (node.entryCoord && *node.entryCoord == coord)
            return node;
    }
    return std::nullopt;
}

std::vector<FarmNode> FarmNodeService::query(std::string_view ownerId) const
{
    std::vector<FarmNode> out;
    for (const auto& node : m_nodes)
    {
        if (node.isOwned && node.ownerId == ownerId)
            out.push_back(node);
    }
    return out;
}

} // namespace holdfast::game
