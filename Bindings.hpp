// Bindings.hpp
//
// Variable bindings for one generation pass. Bindings live in an append-only
// table; each scope reads it through a BindingView covering the entries that
// scope created plus its enclosing scopes' views, so a nested scope resolves
// everything its ancestors bound and nothing a sibling scope bound.
#pragma once
#include "ChainBuilder.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace BloxScript {

struct Binding {
    BlockId blockId;
    std::string name; // without the '$' sigil
};

class BindingTable {
public:
    // Record `name` for `id`; returns the entry position
    size_t bind(const BlockId& id, const std::string& name);
    size_t size() const { return entries.size(); }
    const std::vector<Binding>& all() const { return entries; }
    bool isNameTaken(const std::string& name) const { return names.count(name) != 0; }
    void clear();

    // Latest binding of `id` among the entries [begin, end)
    std::optional<std::string> lookup(const BlockId& id, size_t begin, size_t end) const;

private:
    std::vector<Binding> entries;
    std::unordered_map<BlockId, std::vector<size_t>> byBlock;
    std::unordered_set<std::string> names;
};

// Immutable view of the bindings visible in one scope: a range of table
// entries plus the view of the enclosing scope. A parent view must outlive
// the views nested in it.
class BindingView {
public:
    // Root view with nothing visible
    explicit BindingView(const BindingTable& source) : table(&source) {}
    // Scope view over entries [begin, end) nested in `enclosing`
    BindingView(const BindingView& enclosing, size_t begin, size_t end)
        : table(enclosing.table), parent(&enclosing), first(begin), last(end) {}

    std::optional<std::string> lookup(const BlockId& id) const;
    // Number of entries visible through this view and its ancestors
    size_t size() const { return (last - first) + (parent ? parent->size() : 0); }

private:
    const BindingTable* table;
    const BindingView* parent = nullptr;
    size_t first = 0;
    size_t last = 0;
};

// A chain's terminal must be captured when it fans out to several in-scope
// consumers or feeds a control-flow container.
bool chainNeedsBinding(const ScopeView& scope, const Chain& chain);
// A control-flow container is captured whenever anything in scope consumes it
bool containerNeedsBinding(const ScopeView& scope, const Block& container);

// Binding name for a chain: the explicit name of the terminal (or the nearest
// earlier member that has one), else "<Title>_<id prefix>" of the head, with
// the id prefix lengthened until the name is unused in `table`.
std::string bindingNameFor(const Chain& chain, const BindingTable& table);

} // namespace BloxScript
