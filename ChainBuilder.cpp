// ChainBuilder.cpp
#include "ChainBuilder.hpp"
#include "Log.hpp"
#include <unordered_set>

namespace BloxScript {

bool continuesChain(const ScopeView& scope, const Block& block) {
    if (block.isControlFlow()) return false;
    const auto preds = scope.predecessors(block);
    if (preds.size() != 1) return false;
    const Block* upstream = preds.front();
    return !upstream->isControlFlow() && scope.successors(*upstream).size() == 1;
}

std::vector<Chain> buildChains(const ScopeView& scope, const std::vector<const Block*>& sorted) {
    std::vector<Chain> chains;
    std::unordered_set<BlockId> assigned;

    for (const Block* block : sorted) {
        if (assigned.count(block->id) || block->isControlFlow()) continue;
        if (continuesChain(scope, *block)) continue;

        Chain chain{block};
        assigned.insert(block->id);
        const Block* current = block;
        while (true) {
            const auto next = scope.successors(*current);
            if (next.size() != 1) break;
            const Block* candidate = next.front();
            if (assigned.count(candidate->id) || candidate->isControlFlow()) break;
            if (scope.predecessors(*candidate).size() != 1) break;
            chain.push_back(candidate);
            assigned.insert(candidate->id);
            current = candidate;
        }
        log::debug("Chain of {} starting at '{}'", chain.size(), block->id);
        chains.push_back(std::move(chain));
    }
    return chains;
}

} // namespace BloxScript
