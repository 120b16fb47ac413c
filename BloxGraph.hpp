// BloxScript graph snapshot
//
// This header defines the editor-authored block graph (blocks, ports, zones,
// connections) as the code generator consumes it. The editor owns and mutates
// a Graph; the generator only ever reads it through a const reference.
#pragma once
#include <nlohmann/json.hpp>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace BloxScript {

using BlockId = std::string;

enum class PortDirection { Input, Output };

enum class ParamType { String, Int, Bool, StringArray, ScriptBlock, Path, Credential, Enum };

// Represents a port declared on a block. Ports are addressed by index within
// the block's input or output list.
struct Port {
    std::string name;
    PortDirection direction = PortDirection::Input;
};

// A typed block parameter with the user value and the catalog default
struct Parameter {
    std::string name;
    ParamType type = ParamType::String;
    std::string value;
    std::string defaultValue;

    // User value if non-blank, otherwise the default; always trimmed
    std::string effectiveValue() const;
    // Command-line argument form ("-Name value"); empty when the value is blank
    std::string toArgument() const;
};

// Directed wire from an output port to an input port
struct Connection {
    BlockId fromBlock;
    int fromPort = 0;
    BlockId toBlock;
    int toPort = 0;
};

// Named region inside a container holding ordered child blocks
struct Zone {
    std::string name;
    std::vector<BlockId> children;
};

// Container kinds. Each carries only the parameters its emitter uses.
// Control-flow kinds wrap their zones at the point of use; a named-callable is
// hoisted into a definition and referenced by name everywhere else.
struct Conditional {
    std::string condition = "$true";
};
struct ForEach {};
struct WhileLoop {
    std::string condition = "$true";
};
struct TryCatch {
    std::string errorAction;
};
struct NamedCallable {
    std::string functionName = "Invoke-MyFunction";
    std::string inputParameter;
    std::string returnType;
    std::string returnVariable;
};
using ControlFlowSpec = std::variant<Conditional, ForEach, WhileLoop, TryCatch>;
using ContainerSpec = std::variant<ControlFlowSpec, NamedCallable>;

// Well-known zone labels
namespace zone {
inline constexpr const char* Then = "Then";
inline constexpr const char* Else = "Else";
inline constexpr const char* Body = "Body";
inline constexpr const char* Try = "Try";
inline constexpr const char* Catch = "Catch";
}

// Represents a block (command, script filter, or control-flow container)
struct Block {
    BlockId id;
    std::string title;
    std::string category;
    std::string commandName; // catalog command; empty for script blocks
    std::string scriptBody;
    std::string outputBinding; // user-set binding name, may be empty
    std::vector<Parameter> parameters;
    std::vector<Port> inputs;
    std::vector<Port> outputs;
    std::optional<ContainerSpec> container;
    std::vector<Zone> zones;
    BlockId parentId; // empty for top-level blocks
    std::string parentZone;

    bool isContainer() const { return container.has_value(); }
    // Containers other than named-callables; these never stream inside a pipeline
    bool isControlFlow() const { return controlFlow() != nullptr; }
    bool isCallable() const { return callable() != nullptr; }
    const ControlFlowSpec* controlFlow() const { return container ? std::get_if<ControlFlowSpec>(&*container) : nullptr; }
    const NamedCallable* callable() const { return container ? std::get_if<NamedCallable>(&*container) : nullptr; }

    const Zone* findZone(const std::string& name) const;
    Zone* findZone(const std::string& name);
    const Parameter* findParameter(const std::string& name) const;
    std::string parameterValue(const std::string& name, const std::string& fallback) const;

    // Inline expression for a leaf block: "<Command> <args>" or the trimmed script body
    std::string leafExpression() const;
};

// Block construction helpers (what the editor's block factory produces)
Block makeCommandBlock(const BlockId& id, const std::string& title, const std::string& commandName,
                       std::vector<Parameter> parameters = {});
Block makeScriptBlock(const BlockId& id, const std::string& title, const std::string& scriptBody);
Block makeContainerBlock(const BlockId& id, ControlFlowSpec spec);
Block makeContainerBlock(const BlockId& id, NamedCallable spec);

// "IfElse", "ForEach", "While", "TryCatch", "Function"; empty for leaf blocks
std::string containerKindName(const Block& block);
std::optional<ParamType> parseParamType(const std::string& name);

// Graph owns the blocks and connections of one project
class Graph {
public:
    Graph() = default;

    // Append a block; throws std::runtime_error on a duplicate id.
    // Returned references stay valid across later additions.
    Block& addBlock(Block block);
    // Place child into the named zone of parent. Returns false (and changes
    // nothing) when parent or zone does not exist.
    bool nest(const BlockId& child, const BlockId& parent, const std::string& zone);
    void connect(const BlockId& fromBlock, int fromPort, const BlockId& toBlock, int toPort);
    void connect(const BlockId& fromBlock, const BlockId& toBlock) { connect(fromBlock, 0, toBlock, 0); }
    void clear();

    // Load a snapshot from JSON (nodes, zones, ports, parameters, connections)
    void loadFromJson(const nlohmann::json& json);

    const Block* find(const BlockId& id) const;
    Block* find(const BlockId& id);
    const std::deque<Block>& blocks() const { return blockList; }
    const std::vector<Connection>& connections() const { return connectionList; }

private:
    std::deque<Block> blockList;
    std::vector<Connection> connectionList;
    std::unordered_map<BlockId, size_t> blockIndex; // id -> position in blockList
};

} // namespace BloxScript
