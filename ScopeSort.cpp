// ScopeSort.cpp
//
// Depth-first ordering: each block is placed after a visit of its in-scope
// predecessors. Meeting a block that is still being visited means the scope
// has a cycle.
#include "ScopeSort.hpp"
#include "Log.hpp"
#include <unordered_map>

namespace BloxScript {

std::optional<std::vector<const Block*>> sortScope(const GraphIndex& index, const std::vector<const Block*>& blocks) {
    enum class Mark { Visiting, Done };
    const ScopeView scope(index, blocks);
    std::unordered_map<BlockId, Mark> marks;
    std::vector<const Block*> order;
    order.reserve(blocks.size());

    auto visit = [&](const Block* block, auto& self) -> bool {
        auto it = marks.find(block->id);
        if (it != marks.end()) return it->second == Mark::Done;
        marks[block->id] = Mark::Visiting;
        for (const Block* dep : scope.predecessors(*block)) {
            if (!self(dep, self)) {
                log::debug("Cycle through '{}' -> '{}'", dep->id, block->id);
                return false;
            }
        }
        marks[block->id] = Mark::Done;
        order.push_back(block);
        return true;
    };

    for (const Block* block : blocks) {
        if (!visit(block, visit)) return std::nullopt;
    }
    return order;
}

} // namespace BloxScript
