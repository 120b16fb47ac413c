// GraphIndex.cpp
//
// Builds the validated adjacency and placement tables the generator walks.
#include "GraphIndex.hpp"
#include "Log.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace BloxScript {

namespace {

void appendDistinct(std::vector<const Block*>& list, const Block* block) {
    if (std::find(list.begin(), list.end(), block) == list.end()) list.push_back(block);
}

} // namespace

GraphIndex::GraphIndex(const Graph& graph, std::vector<Diagnostic>& diagnostics) : source(graph) {
    indexConnections(diagnostics);
    indexPlacement(diagnostics);
    log::debug("Indexed graph: {} valid edges, {} top-level blocks, {} placed blocks", validEdges.size(), roots.size(),
               placed.size());
}

void GraphIndex::indexConnections(std::vector<Diagnostic>& diagnostics) {
    std::unordered_set<std::string> portPairs;   // from:port->to:port
    std::unordered_set<std::string> boundInputs; // to:port
    for (const auto& c : source.connections()) {
        const Block* from = source.find(c.fromBlock);
        const Block* to = source.find(c.toBlock);
        const std::string label = fmt::format("{}:{} -> {}:{}", c.fromBlock, c.fromPort, c.toBlock, c.toPort);
        if (!from || !to) {
            report(diagnostics, Diagnostic::Severity::Warning, from ? c.toBlock : c.fromBlock,
                   fmt::format("Skipping connection {}: unknown block", label));
            continue;
        }
        if (from == to) {
            report(diagnostics, Diagnostic::Severity::Warning, c.fromBlock,
                   fmt::format("Skipping connection {}: source and target are the same block", label));
            continue;
        }
        if (c.fromPort < 0 || static_cast<size_t>(c.fromPort) >= from->outputs.size() || c.toPort < 0 ||
            static_cast<size_t>(c.toPort) >= to->inputs.size()) {
            report(diagnostics, Diagnostic::Severity::Warning, c.fromBlock,
                   fmt::format("Skipping connection {}: unknown port", label));
            continue;
        }
        const std::string inputKey = c.toBlock + ":" + std::to_string(c.toPort);
        if (!portPairs.insert(c.fromBlock + ":" + std::to_string(c.fromPort) + "->" + inputKey).second) {
            report(diagnostics, Diagnostic::Severity::Warning, c.toBlock,
                   fmt::format("Skipping connection {}: duplicate", label));
            continue;
        }
        if (!boundInputs.insert(inputKey).second) {
            report(diagnostics, Diagnostic::Severity::Warning, c.toBlock,
                   fmt::format("Skipping connection {}: input port already connected", label));
            continue;
        }
        validEdges.push_back(&c);
        appendDistinct(downstream[c.fromBlock], to);
        appendDistinct(upstream[c.toBlock], from);
    }
}

void GraphIndex::indexPlacement(std::vector<Diagnostic>& diagnostics) {
    enum class State { Visiting, Placed, Orphan };
    std::unordered_map<BlockId, State> state;

    // Resolve one block's placement; the parent chain must reach the top level
    // through zones that actually list each child.
    auto resolve = [&](const Block& block, auto& self) -> bool {
        auto it = state.find(block.id);
        if (it != state.end()) return it->second == State::Placed;
        if (block.parentId.empty()) {
            state[block.id] = State::Placed;
            return true;
        }
        state[block.id] = State::Visiting;
        std::string problem;
        const Block* parent = source.find(block.parentId);
        if (!parent) {
            problem = "parent '" + block.parentId + "' does not exist";
        } else if (!parent->isContainer()) {
            problem = "parent '" + block.parentId + "' is not a container";
        } else {
            const Zone* z = parent->findZone(block.parentZone);
            if (!z) {
                problem = "parent '" + block.parentId + "' has no zone '" + block.parentZone + "'";
            } else if (std::find(z->children.begin(), z->children.end(), block.id) == z->children.end()) {
                problem = "zone '" + block.parentZone + "' of '" + block.parentId + "' does not list it";
            } else {
                auto ps = state.find(parent->id);
                if (ps != state.end() && ps->second == State::Visiting) {
                    problem = "container nesting loops back to it";
                } else if (!self(*parent, self)) {
                    problem = "parent '" + block.parentId + "' is not placed";
                }
            }
        }
        if (!problem.empty()) {
            report(diagnostics, Diagnostic::Severity::Warning, block.id,
                   fmt::format("Skipping block '{}': {}", block.id, problem));
            state[block.id] = State::Orphan;
            return false;
        }
        state[block.id] = State::Placed;
        return true;
    };

    for (const auto& block : source.blocks()) {
        if (resolve(block, resolve)) {
            placed.insert(block.id);
            if (block.parentId.empty()) roots.push_back(&block);
        }
    }

    for (const auto& block : source.blocks()) {
        for (const auto& z : block.zones) {
            for (const auto& childId : z.children) {
                const Block* child = source.find(childId);
                if (!child || child->parentId != block.id || child->parentZone != z.name) {
                    report(diagnostics, Diagnostic::Severity::Warning, block.id,
                           fmt::format("Ignoring zone entry '{}' in '{}'/{}: block is not a member", childId, block.id,
                                       z.name));
                }
            }
        }
    }
}

std::vector<const Block*> GraphIndex::zoneChildren(const Block& container, const std::string& zoneName) const {
    std::vector<const Block*> children;
    const Zone* z = container.findZone(zoneName);
    if (!z) return children;
    for (const auto& childId : z->children) {
        const Block* child = source.find(childId);
        if (!child || child->parentId != container.id || child->parentZone != zoneName || !isPlaced(childId)) continue;
        appendDistinct(children, child);
    }
    return children;
}

std::vector<const Block*> GraphIndex::callables() const {
    std::vector<const Block*> result;
    for (const auto& block : source.blocks()) {
        if (block.isCallable() && isPlaced(block.id)) result.push_back(&block);
    }
    return result;
}

const std::vector<const Block*>& GraphIndex::upstreamOf(const BlockId& id) const {
    auto it = upstream.find(id);
    return it == upstream.end() ? none : it->second;
}

const std::vector<const Block*>& GraphIndex::downstreamOf(const BlockId& id) const {
    auto it = downstream.find(id);
    return it == downstream.end() ? none : it->second;
}

ScopeView::ScopeView(const GraphIndex& graphIndex, const std::vector<const Block*>& blocks)
    : index(graphIndex), members(blocks) {
    for (const Block* b : members) ids.insert(b->id);
}

std::vector<const Block*> ScopeView::predecessors(const Block& block) const {
    std::vector<const Block*> result;
    for (const Block* b : index.upstreamOf(block.id)) if (contains(b->id)) result.push_back(b);
    return result;
}

std::vector<const Block*> ScopeView::successors(const Block& block) const {
    std::vector<const Block*> result;
    for (const Block* b : index.downstreamOf(block.id)) if (contains(b->id)) result.push_back(b);
    return result;
}

} // namespace BloxScript
