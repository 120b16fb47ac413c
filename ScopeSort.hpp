// ScopeSort.hpp
//
// Dependency ordering of the blocks of one scope.
#pragma once
#include "GraphIndex.hpp"
#include <optional>
#include <vector>

namespace BloxScript {

// Order `blocks` so every block follows its in-scope predecessors. Blocks with
// no relative dependency keep their input order. Returns std::nullopt when the
// in-scope connections form a cycle.
std::optional<std::vector<const Block*>> sortScope(const GraphIndex& index, const std::vector<const Block*>& blocks);

} // namespace BloxScript
