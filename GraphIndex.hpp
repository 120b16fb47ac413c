// GraphIndex.hpp
//
// Validated, read-only adjacency over a Graph for one generation pass.
// Malformed connections and zone memberships are dropped here (with a
// diagnostic) so the later stages only ever see a consistent graph.
#pragma once
#include "BloxGraph.hpp"
#include "Diagnostic.hpp"
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace BloxScript {

class GraphIndex {
public:
    GraphIndex(const Graph& graph, std::vector<Diagnostic>& diagnostics);

    const std::vector<const Connection*>& edges() const { return validEdges; }

    // Blocks without a parent, in snapshot order
    const std::vector<const Block*>& topLevel() const { return roots; }
    // Valid children of one zone, in zone order; empty when the zone is absent
    std::vector<const Block*> zoneChildren(const Block& container, const std::string& zoneName) const;
    // Every placed named-callable (nested ones included), in snapshot order
    std::vector<const Block*> callables() const;

    // Distinct source / target blocks of the valid edges touching a block
    const std::vector<const Block*>& upstreamOf(const BlockId& id) const;
    const std::vector<const Block*>& downstreamOf(const BlockId& id) const;

    bool isPlaced(const BlockId& id) const { return placed.count(id) != 0; }

private:
    void indexConnections(std::vector<Diagnostic>& diagnostics);
    void indexPlacement(std::vector<Diagnostic>& diagnostics);

    const Graph& source;
    std::vector<const Connection*> validEdges;
    std::vector<const Block*> roots;
    std::unordered_set<BlockId> placed; // reachable from the top level through valid zones
    std::unordered_map<BlockId, std::vector<const Block*>> upstream;
    std::unordered_map<BlockId, std::vector<const Block*>> downstream;
    std::vector<const Block*> none;
};

// The blocks of one scope plus in-scope adjacency queries. Connections whose
// other end lies outside the scope are ignored.
class ScopeView {
public:
    ScopeView(const GraphIndex& index, const std::vector<const Block*>& blocks);

    const std::vector<const Block*>& blocks() const { return members; }
    bool contains(const BlockId& id) const { return ids.count(id) != 0; }
    std::vector<const Block*> predecessors(const Block& block) const;
    std::vector<const Block*> successors(const Block& block) const;

private:
    const GraphIndex& index;
    std::vector<const Block*> members;
    std::unordered_set<BlockId> ids;
};

} // namespace BloxScript
