#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <entt/signal/sigh.hpp>

#include "game/farms/FarmNode.h"

namespace holdfast::game {

// Registry of farm nodes keyed by node id.
//
// Notes:
//  - registerOrUpdate() is an upsert; re-registering an identical node is a no-op.
//  - nodes() order is unspecified and changes when a node is unregistered.
class FarmNodeService
{
public:
    using NodeSignal = entt::sigh<void(const FarmNode&)>;
    using NodeSink = entt::sink<NodeSignal>;
    using IdSignal = entt::sigh<void(const std::string&)>;
    using IdSink = entt::sink<IdSignal>;

    FarmNodeService() = default;
    FarmNodeService(const FarmNodeService&) = delete;
    FarmNodeService& operator=(const FarmNodeService&) = delete;

    // Returns false (and changes nothing) when the node has no id.
    bool registerOrUpdate(const FarmNode& node);

    // Returns false when no node has that id.
    bool unregisterNode(std::string_view nodeId);

    [[nodiscard]] std::optional<FarmNode> tryGetById(std::string_view nodeId) const;
    [[nodiscard]] std::optional<FarmNode> tryGetByCoord(const GridCoord& coord) const;

    // Owned farms whose owner equals `ownerId`.
    [[nodiscard]] std::vector<FarmNode> query(std::string_view ownerId) const;

    [[nodiscard]] const std::vector<FarmNode>& nodes() const noexcept { return m_nodes; }
    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }

    [[nodiscard]] NodeSink onNodeRegistered() noexcept { return NodeSink{m_registered}; }
    [[nodiscard]] NodeSink onNodeUpdated() noexcept { return NodeSink{m_updated}; }
    [[nodiscard]] IdSink onNodeUnregistered() noexcept { return IdSink{m_unregistered}; }

private:
    std::vector<FarmNode> m_nodes;
    std::unordered_map<std::string, std::size_t> m_index;

    NodeSignal m_registered;
    NodeSignal m_updated;
    IdSignal m_unregistered;
};

} // namespace holdfast::game
