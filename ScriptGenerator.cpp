// ScriptGenerator.cpp
//
// Scope emission: sort a scope, fuse chains, decide bindings, then walk the
// sorted blocks emitting chains as pipelines and control-flow containers as
// constructs whose zones are emitted recursively with the container's input as
// their implicit input.
#include "ScriptGenerator.hpp"
#include "Log.hpp"
#include "ScopeSort.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace BloxScript {

namespace {

constexpr const char* kLoopVariable = "$_";
constexpr const char* kDefaultFunctionName = "Invoke-MyFunction";

std::string stripSigil(const std::string& name) {
    return (!name.empty() && name[0] == '$') ? name.substr(1) : name;
}

} // namespace

std::string callableName(const NamedCallable& fn) {
    return fn.functionName.empty() ? std::string(kDefaultFunctionName) : fn.functionName;
}

bool GenerationReport::hasErrors() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const Diagnostic& d) { return d.severity == Diagnostic::Severity::Error; });
}

ScriptGenerator::ScriptGenerator(const Graph& source, GeneratorOptions opts) : graph(source), options(std::move(opts)) {}

std::string ScriptGenerator::generate() { return generateReport().script; }

GenerationReport ScriptGenerator::generateReport() {
    diagnostics.clear();
    bindings.clear();
    complete = true;
    index = std::make_unique<GraphIndex>(graph, diagnostics);

    GenerationReport result;
    auto sorted = sortScope(*index, index->topLevel());
    if (!sorted) {
        report(diagnostics, Diagnostic::Severity::Error, BlockId(), "Cycle detected in graph");
        result.script = "# ERROR: Cycle detected in graph!\n";
        result.complete = false;
        result.diagnostics = std::move(diagnostics);
        diagnostics.clear();
        return result;
    }

    std::ostringstream out;
    if (options.header) emitHeader(out);

    // Callables keep their dependency order among themselves; if that fails
    // the snapshot order is still a valid definition order.
    std::vector<const Block*> callables = index->callables();
    if (auto ordered = sortScope(*index, callables)) callables = std::move(*ordered);
    if (!callables.empty()) {
        out << "# ---- Function Definitions ----\n\n";
        for (const Block* fn : callables) emitCallableDefinition(out, *fn);
    }

    if (!sorted->empty()) {
        out << "# ---- Execution ----\n\n";
        const size_t created = emitScope(out, *sorted, 0, std::nullopt, BindingView(bindings));
        log::debug("Execution scope: {} blocks, {} bindings", sorted->size(), created);
    }

    result.script = out.str();
    result.complete = complete;
    result.diagnostics = std::move(diagnostics);
    result.bindings = bindings.all();
    diagnostics.clear();
    return result;
}

void ScriptGenerator::emitHeader(std::ostream& out) const {
    out << "# ===========================================\n";
    out << "# Auto-generated PowerShell 5.1 Script\n";
    if (!options.timestamp.empty()) out << "# Generated: " << options.timestamp << "\n";
    out << "# ===========================================\n\n";
}

size_t ScriptGenerator::emitScope(std::ostream& out, const std::vector<const Block*>& sorted, int indent,
                                  const std::optional<std::string>& implicitInput, const BindingView& inherited) {
    const size_t before = bindings.size();
    const ScopeView scope(*index, sorted);
    const std::vector<Chain> chains = buildChains(scope, sorted);

    // Bindings first, so every statement (and every nested zone) can resolve
    // them. Entries appended later by nested zones stay invisible to `view`.
    std::unordered_map<BlockId, size_t> chainOf;
    std::unordered_map<BlockId, std::string> assignTo; // chain terminal / container -> binding
    for (size_t i = 0; i < chains.size(); ++i) {
        const Chain& chain = chains[i];
        for (const Block* member : chain) chainOf[member->id] = i;
        if (!chainNeedsBinding(scope, chain)) continue;
        const std::string name = bindingNameFor(chain, bindings);
        for (const Block* member : chain) bindings.bind(member->id, name);
        assignTo[chain.back()->id] = name;
    }
    for (const Block* block : sorted) {
        if (!block->isControlFlow() || !containerNeedsBinding(scope, *block)) continue;
        const std::string name = bindingNameFor(Chain{block}, bindings);
        bindings.bind(block->id, name);
        assignTo[block->id] = name;
    }
    const BindingView view(inherited, before, bindings.size());
    log::debug("Scope of {} blocks: {} chains, {} new bindings over {} inherited", sorted.size(), chains.size(),
               bindings.size() - before, inherited.size());

    auto targetOf = [&](const Block& block) -> std::optional<std::string> {
        auto it = assignTo.find(block.id);
        if (it == assignTo.end()) return std::nullopt;
        return it->second;
    };

    std::unordered_set<BlockId> emitted;
    for (const Block* block : sorted) {
        if (emitted.count(block->id)) continue;

        if (block->isControlFlow()) {
            emitted.insert(block->id);
            const auto input = resolveInput(*block, scope, view, implicitInput);
            emitControlFlow(out, *block, indent, input, targetOf(*block), view);
            out << "\n";
            continue;
        }

        auto found = chainOf.find(block->id);
        if (found == chainOf.end()) continue;
        const Chain& chain = chains[found->second];
        if (std::any_of(chain.begin(), chain.end(), [&](const Block* b) { return emitted.count(b->id) != 0; })) continue;
        for (const Block* member : chain) emitted.insert(member->id);

        const auto upstream = resolveInput(*chain.front(), scope, view, implicitInput);
        const std::string pipeline = pipelineExpression(chain, upstream);
        const auto target = targetOf(*chain.back());
        if (pipeline.empty()) {
            if (target) out << pad(indent) << "$" << *target << " = $null\n";
        } else if (target) {
            out << pad(indent) << "$" << *target << " = " << pipeline << "\n";
        } else {
            out << pad(indent) << pipeline << "\n";
        }
        out << "\n";
    }
    return bindings.size() - before;
}

// Input expression for a block: the binding of its single in-scope
// predecessor, or the scope's implicit input when it has none. More than one
// predecessor leaves the input unresolved.
std::optional<std::string> ScriptGenerator::resolveInput(const Block& block, const ScopeView& scope,
                                                         const BindingView& view,
                                                         const std::optional<std::string>& implicitInput) {
    const auto preds = scope.predecessors(block);
    if (preds.empty()) return implicitInput;
    if (preds.size() > 1) {
        report(diagnostics, Diagnostic::Severity::Warning, block.id,
               fmt::format("Block '{}' has {} upstream blocks; its input is left unresolved", block.id, preds.size()));
        return std::nullopt;
    }
    if (auto name = view.lookup(preds.front()->id)) return "$" + *name;
    return std::nullopt;
}

std::string ScriptGenerator::pipelineExpression(const Chain& chain, const std::optional<std::string>& upstream) const {
    std::vector<std::string> segments;
    if (upstream && !upstream->empty()) segments.push_back(*upstream);
    for (const Block* block : chain) {
        std::string expr = block->isCallable() ? callableName(*block->callable()) : block->leafExpression();
        if (!expr.empty()) segments.push_back(std::move(expr));
    }
    std::string joined;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i) joined += " | ";
        joined += segments[i];
    }
    return joined;
}

void ScriptGenerator::emitZone(std::ostream& out, const Block& container, const std::string& zoneName, int indent,
                               const std::optional<std::string>& implicitInput, const BindingView& inherited) {
    const auto children = index->zoneChildren(container, zoneName);
    if (children.empty()) {
        out << pad(indent) << "# (empty)\n";
        return;
    }
    auto sorted = sortScope(*index, children);
    if (!sorted) {
        report(diagnostics, Diagnostic::Severity::Error, container.id,
               fmt::format("Cycle detected in zone '{}' of '{}'", zoneName, container.id));
        out << pad(indent) << "# ERROR: Cycle detected in zone '" << zoneName << "'!\n";
        complete = false;
        return;
    }
    emitScope(out, *sorted, indent, implicitInput, inherited);
}

struct ScriptGenerator::ControlFlowEmitter {
    ScriptGenerator& gen;
    std::ostream& out;
    const Block& block;
    int indent;
    const std::optional<std::string>& input;
    std::string assign; // "$Name = " when the construct's result is captured
    const BindingView& view;

    void operator()(const Conditional& c) const {
        const std::string lead = gen.pad(indent);
        out << lead << assign << "if (" << c.condition << ") {\n";
        gen.emitZone(out, block, zone::Then, indent + 1, input, view);
        out << lead << "}\n";
        if (!gen.index->zoneChildren(block, zone::Else).empty()) {
            out << lead << "else {\n";
            gen.emitZone(out, block, zone::Else, indent + 1, input, view);
            out << lead << "}\n";
        }
    }

    void operator()(const ForEach&) const {
        const std::string lead = gen.pad(indent);
        out << lead << assign;
        if (input && !input->empty()) out << *input << " | ";
        out << "ForEach-Object {\n";
        gen.emitZone(out, block, zone::Body, indent + 1, std::string(kLoopVariable), view);
        out << lead << "}\n";
    }

    void operator()(const WhileLoop& w) const {
        const std::string lead = gen.pad(indent);
        out << lead << assign << "while (" << w.condition << ") {\n";
        gen.emitZone(out, block, zone::Body, indent + 1, input, view);
        out << lead << "}\n";
    }

    // The catch region gets no implicit input; the error record is not threaded
    void operator()(const TryCatch& t) const {
        const std::string lead = gen.pad(indent);
        out << lead << assign << "try {\n";
        if (!t.errorAction.empty()) out << gen.pad(indent + 1) << "$ErrorActionPreference = '" << t.errorAction << "'\n";
        gen.emitZone(out, block, zone::Try, indent + 1, input, view);
        out << lead << "}\n";
        out << lead << "catch {\n";
        gen.emitZone(out, block, zone::Catch, indent + 1, std::nullopt, view);
        out << lead << "}\n";
    }
};

void ScriptGenerator::emitControlFlow(std::ostream& out, const Block& container, int indent,
                                      const std::optional<std::string>& input, const std::optional<std::string>& target,
                                      const BindingView& inherited) {
    const ControlFlowSpec* spec = container.controlFlow();
    if (!spec) return;
    log::debug("Emitting {} '{}' (input: {})", containerKindName(container), container.id, input.value_or("none"));
    std::string assign = target ? "$" + *target + " = " : std::string();
    std::visit(ControlFlowEmitter{*this, out, container, indent, input, std::move(assign), inherited}, *spec);
}

void ScriptGenerator::emitCallableDefinition(std::ostream& out, const Block& callable) {
    const NamedCallable* fn = callable.callable();
    if (!fn) return;
    const std::string inputParam = stripSigil(fn->inputParameter);
    const std::string returnVar = stripSigil(fn->returnVariable);

    out << "function " << callableName(*fn) << " {\n";
    if (!fn->returnType.empty()) out << pad(1) << "[OutputType([" << fn->returnType << "])]\n";

    int bodyIndent = 1;
    if (!inputParam.empty()) {
        out << pad(1) << "param(\n";
        out << pad(2) << "[Parameter(ValueFromPipeline)]\n";
        out << pad(2) << "$" << inputParam << "\n";
        out << pad(1) << ")\n";
        out << pad(1) << "process {\n";
        bodyIndent = 2;
    } else if (!fn->returnType.empty()) {
        out << pad(1) << "param()\n";
    }

    const std::optional<std::string> bodyInput =
        inputParam.empty() ? std::nullopt : std::optional<std::string>("$" + inputParam);
    const BindingView root(bindings);
    emitZone(out, callable, zone::Body, bodyIndent, bodyInput, root);
    if (!returnVar.empty()) out << pad(bodyIndent) << "return $" << returnVar << "\n";

    if (!inputParam.empty()) out << pad(1) << "}\n";
    out << "}\n\n";
}

std::string ScriptGenerator::pad(int indent) const {
    const int width = std::max(0, options.indentWidth);
    return std::string(static_cast<size_t>(std::max(0, indent) * width), ' ');
}

} // namespace BloxScript
