// ChainBuilder.hpp
//
// Fuses runs of 1:1 data-flow edges into chains that emit as one pipeline.
#pragma once
#include "GraphIndex.hpp"
#include <vector>

namespace BloxScript {

// Blocks of one pipeline, head first
using Chain = std::vector<const Block*>;

// Partition the leaf blocks and named-callables of a sorted scope into maximal
// chains, in order of their heads. Control-flow containers are never members.
std::vector<Chain> buildChains(const ScopeView& scope, const std::vector<const Block*>& sorted);

// True when `block` is absorbed into its single predecessor's chain
bool continuesChain(const ScopeView& scope, const Block& block);

} // namespace BloxScript
