// BloxGraph.cpp
//
// Implements the graph snapshot: parameter formatting, block factories,
// zone nesting, and JSON snapshot loading.
#include "BloxGraph.hpp"
#include "Log.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace BloxScript {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

std::string escapeQuotes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"') out += "`\"";
        else out += c;
    }
    return out;
}

std::vector<Port> defaultPorts(PortDirection dir) {
    return {Port{dir == PortDirection::Input ? "In" : "Out", dir}};
}

std::string jsonString(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

// Port index of a connection entry; 0 when absent, nullopt when not an integer
std::optional<int> portIndex(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return 0;
    if (!it->is_number_integer()) return std::nullopt;
    return it->get<int>();
}

// Comma-separated items, trimmed; empty items (a trailing comma included) are kept
std::vector<std::string> splitItems(const std::string& s) {
    std::vector<std::string> items;
    size_t start = 0;
    while (true) {
        const size_t comma = s.find(',', start);
        items.push_back(trim(s.substr(start, comma == std::string::npos ? std::string::npos : comma - start)));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return items;
}

} // namespace

std::string Parameter::effectiveValue() const {
    return trim(isBlank(value) ? defaultValue : value);
}

std::string Parameter::toArgument() const {
    const std::string val = effectiveValue();
    if (val.empty()) return std::string();

    switch (type) {
    case ParamType::String:
    case ParamType::Path:
    case ParamType::Credential:
        return "-" + name + " \"" + escapeQuotes(val) + "\"";
    case ParamType::Int:
        return "-" + name + " " + val;
    case ParamType::Bool:
        return equalsIgnoreCase(val, "true") ? "-" + name : std::string();
    case ParamType::StringArray: {
        std::ostringstream out;
        out << "-" << name << " @(";
        bool first = true;
        for (const auto& item : splitItems(val)) {
            out << (first ? "" : ", ") << "\"" << item << "\"";
            first = false;
        }
        out << ")";
        return out.str();
    }
    case ParamType::ScriptBlock:
        return "-" + name + " { " + val + " }";
    case ParamType::Enum:
        return "-" + name + " \"" + val + "\"";
    }
    return "-" + name + " \"" + val + "\"";
}

const Zone* Block::findZone(const std::string& name) const {
    for (const auto& z : zones) if (z.name == name) return &z;
    return nullptr;
}

Zone* Block::findZone(const std::string& name) {
    for (auto& z : zones) if (z.name == name) return &z;
    return nullptr;
}

const Parameter* Block::findParameter(const std::string& name) const {
    for (const auto& p : parameters) if (p.name == name) return &p;
    return nullptr;
}

std::string Block::parameterValue(const std::string& name, const std::string& fallback) const {
    const Parameter* p = findParameter(name);
    return p ? p->effectiveValue() : fallback;
}

std::string Block::leafExpression() const {
    if (commandName.empty()) return trim(scriptBody);
    std::string expr = commandName;
    for (const auto& p : parameters) {
        std::string arg = p.toArgument();
        if (!arg.empty()) expr += " " + arg;
    }
    return expr;
}

Block makeCommandBlock(const BlockId& id, const std::string& title, const std::string& commandName,
                       std::vector<Parameter> parameters) {
    Block b;
    b.id = id;
    b.title = title;
    b.category = "Custom";
    b.commandName = commandName;
    b.parameters = std::move(parameters);
    b.inputs = defaultPorts(PortDirection::Input);
    b.outputs = defaultPorts(PortDirection::Output);
    return b;
}

Block makeScriptBlock(const BlockId& id, const std::string& title, const std::string& scriptBody) {
    Block b;
    b.id = id;
    b.title = title;
    b.category = "Custom";
    b.scriptBody = scriptBody;
    b.inputs = defaultPorts(PortDirection::Input);
    b.outputs = defaultPorts(PortDirection::Output);
    return b;
}

namespace {

Block containerShell(const BlockId& id) {
    Block b;
    b.id = id;
    b.category = "Control Flow";
    b.inputs = defaultPorts(PortDirection::Input);
    b.outputs = defaultPorts(PortDirection::Output);
    return b;
}

} // namespace

Block makeContainerBlock(const BlockId& id, ControlFlowSpec spec) {
    Block b = containerShell(id);
    struct Configure {
        Block& b;
        void operator()(const Conditional&) const {
            b.title = "If / Else";
            b.zones = {Zone{zone::Then, {}}, Zone{zone::Else, {}}};
        }
        void operator()(const ForEach&) const {
            b.title = "ForEach-Object";
            b.zones = {Zone{zone::Body, {}}};
        }
        void operator()(const WhileLoop&) const {
            b.title = "While Loop";
            b.zones = {Zone{zone::Body, {}}};
        }
        void operator()(const TryCatch&) const {
            b.title = "Try / Catch";
            b.zones = {Zone{zone::Try, {}}, Zone{zone::Catch, {}}};
        }
    };
    std::visit(Configure{b}, spec);
    b.container = ContainerSpec{std::move(spec)};
    return b;
}

Block makeContainerBlock(const BlockId& id, NamedCallable spec) {
    Block b = containerShell(id);
    b.title = spec.functionName;
    b.category = "Function";
    b.zones = {Zone{zone::Body, {}}};
    b.container = ContainerSpec{std::move(spec)};
    return b;
}

std::string containerKindName(const Block& block) {
    struct Name {
        const char* operator()(const Conditional&) const { return "IfElse"; }
        const char* operator()(const ForEach&) const { return "ForEach"; }
        const char* operator()(const WhileLoop&) const { return "While"; }
        const char* operator()(const TryCatch&) const { return "TryCatch"; }
    };
    if (block.isCallable()) return "Function";
    if (const ControlFlowSpec* cf = block.controlFlow()) return std::visit(Name{}, *cf);
    return std::string();
}

std::optional<ParamType> parseParamType(const std::string& name) {
    static const std::pair<const char*, ParamType> table[] = {
        {"String", ParamType::String}, {"Int", ParamType::Int}, {"Bool", ParamType::Bool},
        {"StringArray", ParamType::StringArray}, {"ScriptBlock", ParamType::ScriptBlock},
        {"Path", ParamType::Path}, {"Credential", ParamType::Credential}, {"Enum", ParamType::Enum},
    };
    for (const auto& entry : table) if (name == entry.first) return entry.second;
    return std::nullopt;
}

Block& Graph::addBlock(Block block) {
    if (blockIndex.count(block.id)) throw std::runtime_error("Duplicate block id: " + block.id);
    blockIndex[block.id] = blockList.size();
    blockList.push_back(std::move(block));
    return blockList.back();
}

bool Graph::nest(const BlockId& child, const BlockId& parent, const std::string& zone) {
    Block* c = find(child);
    Block* p = find(parent);
    if (!c || !p || child == parent) return false;
    Zone* z = p->findZone(zone);
    if (!z) return false;
    if (!c->parentId.empty()) {
        if (Block* old = find(c->parentId)) {
            if (Zone* oz = old->findZone(c->parentZone)) {
                oz->children.erase(std::remove(oz->children.begin(), oz->children.end(), child), oz->children.end());
            }
        }
    }
    c->parentId = parent;
    c->parentZone = zone;
    z->children.push_back(child);
    return true;
}

void Graph::connect(const BlockId& fromBlock, int fromPort, const BlockId& toBlock, int toPort) {
    connectionList.push_back({fromBlock, fromPort, toBlock, toPort});
}

void Graph::clear() {
    blockList.clear();
    connectionList.clear();
    blockIndex.clear();
}

const Block* Graph::find(const BlockId& id) const {
    auto it = blockIndex.find(id);
    return it == blockIndex.end() ? nullptr : &blockList[it->second];
}

Block* Graph::find(const BlockId& id) {
    auto it = blockIndex.find(id);
    return it == blockIndex.end() ? nullptr : &blockList[it->second];
}

// Load a snapshot from JSON. Structural problems in the document itself throw;
// unknown block kinds and duplicate ids are skipped with a warning.
void Graph::loadFromJson(const nlohmann::json& json) {
    clear();
    if (!json.is_object() || !json.contains("nodes") || !json["nodes"].is_array()) {
        throw std::runtime_error("Graph document has no 'nodes' array");
    }

    struct Placement { BlockId child, parent; std::string zone; };
    std::vector<Placement> placements;

    for (const auto& nodeJson : json["nodes"]) {
        if (!nodeJson.is_object()) throw std::runtime_error("Graph node entry is not an object");
        Block block;
        block.id = jsonString(nodeJson, "id");
        if (block.id.empty()) throw std::runtime_error("Graph node without an 'id'");
        block.title = jsonString(nodeJson, "title");
        block.category = jsonString(nodeJson, "category");
        block.commandName = jsonString(nodeJson, "cmdletName");
        block.scriptBody = jsonString(nodeJson, "scriptBody");
        block.outputBinding = jsonString(nodeJson, "outputVariable");

        if (nodeJson.contains("parameters") && nodeJson["parameters"].is_array()) {
            for (const auto& paramJson : nodeJson["parameters"]) {
                Parameter p;
                p.name = jsonString(paramJson, "name");
                const std::string typeName = jsonString(paramJson, "type");
                auto pt = parseParamType(typeName.empty() ? "String" : typeName);
                if (!pt) log::warn("Block '{}': unknown parameter type '{}', treating as String", block.id, typeName);
                p.type = pt.value_or(ParamType::String);
                p.value = jsonString(paramJson, "value");
                p.defaultValue = jsonString(paramJson, "defaultValue");
                block.parameters.push_back(std::move(p));
            }
        }

        auto readPorts = [&](const char* key, PortDirection dir) {
            if (!nodeJson.contains(key) || !nodeJson[key].is_array()) return defaultPorts(dir);
            std::vector<Port> ports;
            for (const auto& portJson : nodeJson[key]) ports.push_back({jsonString(portJson, "name"), dir});
            return ports;
        };
        block.inputs = readPorts("inputs", PortDirection::Input);
        block.outputs = readPorts("outputs", PortDirection::Output);

        const std::string kind = jsonString(nodeJson, "containerType");
        if (!kind.empty() && kind != "None") {
            if (kind == "IfElse") {
                block.container = ContainerSpec{ControlFlowSpec{Conditional{block.parameterValue("Condition", "$true")}}};
            } else if (kind == "ForEach") {
                block.container = ContainerSpec{ControlFlowSpec{ForEach{}}};
            } else if (kind == "While") {
                block.container = ContainerSpec{ControlFlowSpec{WhileLoop{block.parameterValue("Condition", "$true")}}};
            } else if (kind == "TryCatch") {
                block.container = ContainerSpec{ControlFlowSpec{TryCatch{block.parameterValue("ErrorAction", "")}}};
            } else if (kind == "Function") {
                block.container = ContainerSpec{NamedCallable{block.parameterValue("FunctionName", "Invoke-MyFunction"),
                                                              block.parameterValue("InputParam", ""),
                                                              block.parameterValue("ReturnType", ""),
                                                              block.parameterValue("ReturnVariable", "")}};
            } else {
                log::warn("Skipping block '{}': unsupported container type '{}'", block.id, kind);
                continue;
            }
            if (nodeJson.contains("zones") && nodeJson["zones"].is_array()) {
                for (const auto& zoneJson : nodeJson["zones"]) block.zones.push_back({jsonString(zoneJson, "name"), {}});
            }
        }

        const std::string parent = jsonString(nodeJson, "parentNodeId");
        if (!parent.empty()) {
            block.parentId = parent;
            block.parentZone = jsonString(nodeJson, "parentZoneName");
            placements.push_back({block.id, parent, block.parentZone});
        }

        if (blockIndex.count(block.id)) {
            log::warn("Skipping block '{}': duplicate id", block.id);
            continue;
        }
        addBlock(std::move(block));
    }

    // Zone membership follows snapshot order; dangling parents are left for the
    // generator to report.
    for (const auto& pl : placements) {
        Block* parent = find(pl.parent);
        if (!parent) continue;
        if (Zone* z = parent->findZone(pl.zone)) z->children.push_back(pl.child);
    }

    if (json.contains("connections") && json["connections"].is_array()) {
        for (const auto& connJson : json["connections"]) {
            if (!connJson.is_object()) {
                log::warn("Skipping connection entry: not an object");
                continue;
            }
            Connection conn;
            conn.fromBlock = jsonString(connJson, "sourceNodeId");
            conn.toBlock = jsonString(connJson, "targetNodeId");
            const auto fromPort = portIndex(connJson, "sourcePortIndex");
            const auto toPort = portIndex(connJson, "targetPortIndex");
            if (!fromPort || !toPort) {
                log::warn("Skipping connection {} -> {}: port index is not an integer", conn.fromBlock, conn.toBlock);
                continue;
            }
            conn.fromPort = *fromPort;
            conn.toPort = *toPort;
            connectionList.push_back(std::move(conn));
        }
    }
    log::debug("Loaded graph: {} blocks, {} connections", blockList.size(), connectionList.size());
}

} // namespace BloxScript
