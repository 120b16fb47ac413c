// Shared graph builders for the unit tests
#pragma once
#include "BloxGraph.hpp"
#include <string>

namespace BloxScript {
namespace test {

inline Parameter param(const std::string& name, ParamType type, const std::string& value,
                       const std::string& defaultValue = "") {
    Parameter p;
    p.name = name;
    p.type = type;
    p.value = value;
    p.defaultValue = defaultValue;
    return p;
}

inline Block& addScript(Graph& g, const BlockId& id, const std::string& title, const std::string& body) {
    return g.addBlock(makeScriptBlock(id, title, body));
}

inline Block& addCommand(Graph& g, const BlockId& id, const std::string& title, const std::string& command) {
    return g.addBlock(makeCommandBlock(id, title, command));
}

// Script block nested into a container zone
inline Block& addScriptIn(Graph& g, const BlockId& parent, const std::string& zoneName, const BlockId& id,
                          const std::string& title, const std::string& body) {
    Block& b = addScript(g, id, title, body);
    g.nest(id, parent, zoneName);
    return b;
}

} // namespace test
} // namespace BloxScript
