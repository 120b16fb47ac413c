// Bindings.cpp
#include "Bindings.hpp"
#include "Identifier.hpp"
#include <algorithm>
#include <cctype>

namespace BloxScript {

namespace {

constexpr size_t kIdPrefixLength = 4;

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

size_t BindingTable::bind(const BlockId& id, const std::string& name) {
    entries.push_back({id, name});
    byBlock[id].push_back(entries.size() - 1);
    names.insert(name);
    return entries.size() - 1;
}

void BindingTable::clear() {
    entries.clear();
    byBlock.clear();
    names.clear();
}

std::optional<std::string> BindingTable::lookup(const BlockId& id, size_t begin, size_t end) const {
    auto it = byBlock.find(id);
    if (it == byBlock.end()) return std::nullopt;
    for (auto pos = it->second.rbegin(); pos != it->second.rend(); ++pos) {
        if (*pos >= begin && *pos < end) return entries[*pos].name;
    }
    return std::nullopt;
}

std::optional<std::string> BindingView::lookup(const BlockId& id) const {
    if (auto name = table->lookup(id, first, last)) return name;
    return parent ? parent->lookup(id) : std::nullopt;
}

bool chainNeedsBinding(const ScopeView& scope, const Chain& chain) {
    if (chain.empty()) return false;
    const auto consumers = scope.successors(*chain.back());
    if (consumers.size() > 1) return true;
    return std::any_of(consumers.begin(), consumers.end(), [](const Block* b) { return b->isControlFlow(); });
}

bool containerNeedsBinding(const ScopeView& scope, const Block& container) {
    return !scope.successors(container).empty();
}

std::string bindingNameFor(const Chain& chain, const BindingTable& table) {
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (!isBlank((*it)->outputBinding)) return sanitizeIdentifier((*it)->outputBinding);
    }

    const Block& head = *chain.front();
    const NamedCallable* fn = head.callable();
    const std::string base = sanitizeIdentifier(fn ? fn->functionName : head.title);
    const std::string suffix = alphanumericOnly(head.id);

    std::string candidate = base;
    for (size_t len = std::min(kIdPrefixLength, suffix.size()); len <= suffix.size(); ++len) {
        candidate = suffix.empty() ? base : base + "_" + suffix.substr(0, len);
        if (!table.isNameTaken(candidate)) return candidate;
        if (suffix.empty()) break;
    }
    for (int n = 2;; ++n) {
        std::string numbered = candidate + "_" + std::to_string(n);
        if (!table.isNameTaken(numbered)) return numbered;
    }
}

} // namespace BloxScript
