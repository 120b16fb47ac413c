// ScriptGenerator.hpp
//
// Turns a block graph into one PowerShell script. Linear runs of blocks become
// pipelines, fan-out points and container inputs become variables, control-flow
// containers become their script constructs, and named-callables are hoisted
// into function definitions ahead of the execution section.
//
// A generator instance keeps per-pass state and is not reentrant: use one
// instance per concurrent generation.
#pragma once
#include "BloxGraph.hpp"
#include "Bindings.hpp"
#include "ChainBuilder.hpp"
#include "Diagnostic.hpp"
#include "GraphIndex.hpp"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace BloxScript {

struct GeneratorOptions {
    int indentWidth = 4;
    bool header = false;   // emit the banner comment
    std::string timestamp; // banner "Generated:" line; omitted when empty
};

struct GenerationReport {
    std::string script;
    bool complete = true; // false when a cycle aborted the pass or one of its zones
    std::vector<Diagnostic> diagnostics;
    std::vector<Binding> bindings;

    bool hasErrors() const;
};

class ScriptGenerator {
public:
    explicit ScriptGenerator(const Graph& graph, GeneratorOptions options = GeneratorOptions());

    // Script text only; failures are reported in-band as comment lines
    std::string generate();
    // Script text plus diagnostics and the bindings created by the pass
    GenerationReport generateReport();

private:
    struct ControlFlowEmitter;

    // Emit one sorted scope. Returns how many bindings this call and its
    // descendants appended to the table.
    size_t emitScope(std::ostream& out, const std::vector<const Block*>& sorted, int indent,
                     const std::optional<std::string>& implicitInput, const BindingView& inherited);
    void emitZone(std::ostream& out, const Block& container, const std::string& zoneName, int indent,
                  const std::optional<std::string>& implicitInput, const BindingView& inherited);
    void emitControlFlow(std::ostream& out, const Block& container, int indent, const std::optional<std::string>& input,
                         const std::optional<std::string>& target, const BindingView& inherited);
    void emitCallableDefinition(std::ostream& out, const Block& callable);
    void emitHeader(std::ostream& out) const;

    std::optional<std::string> resolveInput(const Block& block, const ScopeView& scope, const BindingView& view,
                                            const std::optional<std::string>& implicitInput);
    std::string pipelineExpression(const Chain& chain, const std::optional<std::string>& upstream) const;
    std::string pad(int indent) const;

    const Graph& graph;
    GeneratorOptions options;

    // Per-pass state, reset at the start of every generation
    std::unique_ptr<GraphIndex> index;
    BindingTable bindings;
    std::vector<Diagnostic> diagnostics;
    bool complete = true;
};

// Script name of a callable, with the catalog default when left blank
std::string callableName(const NamedCallable& fn);

} // namespace BloxScript
