#include "ScriptGenerator.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace BloxScript;
using namespace BloxScript::test;

namespace {

bool hasDiagnosticFor(const GenerationReport& report, const BlockId& id, Diagnostic::Severity severity) {
    return std::any_of(report.diagnostics.begin(), report.diagnostics.end(),
                       [&](const Diagnostic& d) { return d.blockId == id && d.severity == severity; });
}

} // namespace

TEST(ScriptGeneratorTest, EmptyGraphProducesEmptyScript) {
    Graph graph;
    ScriptGenerator gen(graph);
    EXPECT_EQ(gen.generate(), "");
}

TEST(ScriptGeneratorTest, LinearChainBecomesOnePipeline) {
    Graph graph;
    graph.addBlock(makeCommandBlock("aaaa0001", "Get Services", "Get-Service"));
    graph.addBlock(makeCommandBlock("bbbb0002", "Where Running", "Where-Object",
                                    {param("FilterScript", ParamType::ScriptBlock, "$_.Status -eq 'Running'")}));
    graph.connect("aaaa0001", "bbbb0002");

    ScriptGenerator gen(graph);
    const GenerationReport report = gen.generateReport();
    EXPECT_EQ(report.script,
              "# ---- Execution ----\n"
              "\n"
              "Get-Service | Where-Object -FilterScript { $_.Status -eq 'Running' }\n"
              "\n");
    EXPECT_TRUE(report.complete);
    EXPECT_TRUE(report.bindings.empty());
    EXPECT_TRUE(report.diagnostics.empty());
}

TEST(ScriptGeneratorTest, FanOutIsCapturedOnce) {
    Graph graph;
    graph.addBlock(makeCommandBlock("aaaa0001", "Get Services", "Get-Service"));
    addScript(graph, "bbbb0002", "First", "Select-Object -First 1");
    addScript(graph, "cccc0003", "Count", "Measure-Object");
    graph.connect("aaaa0001", "bbbb0002");
    graph.connect("aaaa0001", "cccc0003");

    ScriptGenerator gen(graph);
    const GenerationReport report = gen.generateReport();
    EXPECT_EQ(report.script,
              "# ---- Execution ----\n"
              "\n"
              "$GetServices_aaaa = Get-Service\n"
              "\n"
              "$GetServices_aaaa | Select-Object -First 1\n"
              "\n"
              "$GetServices_aaaa | Measure-Object\n"
              "\n");
    ASSERT_EQ(report.bindings.size(), 1u);
    EXPECT_EQ(report.bindings[0].blockId, "aaaa0001");
    EXPECT_EQ(report.bindings[0].name, "GetServices_aaaa");
}

TEST(ScriptGeneratorTest, ExplicitOutputNameIsUsedVerbatim) {
    Graph graph;
    Block& src = graph.addBlock(makeCommandBlock("aaaa0001", "Get Services", "Get-Service"));
    src.outputBinding = "services";
    addScript(graph, "bbbb0002", "First", "Select-Object -First 1");
    addScript(graph, "cccc0003", "Count", "Measure-Object");
    graph.connect("aaaa0001", "bbbb0002");
    graph.connect("aaaa0001", "cccc0003");

    ScriptGenerator gen(graph);
    const std::string script = gen.generate();
    EXPECT_NE(script.find("$Services = Get-Service\n"), std::string::npos);
    EXPECT_NE(script.find("$Services | Measure-Object\n"), std::string::npos);
}

TEST(ScriptGeneratorTest, SameTitleDifferentIdsGetDistinctNames) {
    Graph graph;
    addScript(graph, "abcd1111", "Get Data", "Get-One");
    addScript(graph, "abcd2222", "Get Data", "Get-Two");
    for (const char* id : {"w1", "w2", "w3", "w4"}) addScript(graph, id, "Sink", "Out-Host");
    graph.connect("abcd1111", "w1");
    graph.connect("abcd1111", "w2");
    graph.connect("abcd2222", "w3");
    graph.connect("abcd2222", "w4");

    ScriptGenerator gen(graph);
    const GenerationReport report = gen.generateReport();
    ASSERT_EQ(report.bindings.size(), 2u);
    EXPECT_EQ(report.bindings[0].name, "GetData_abcd");
    EXPECT_EQ(report.bindings[1].name, "GetData_abcd2");
    EXPECT_NE(report.script.find("$GetData_abcd2 | Out-Host\n"), std::string::npos);
}

TEST(ScriptGeneratorTest, TopLevelCycleOnlyEmitsDiagnostic) {
    Graph graph;
    addScript(graph, "a", "A", "Get-A");
    addScript(graph, "b", "B", "Get-B");
    addScript(graph, "c", "C", "Get-C");
    graph.connect("a", "b");
    graph.connect("b", "a");

    ScriptGenerator gen(graph);
    const GenerationReport report = gen.generateReport();
    EXPECT_EQ(report.script, "# ERROR: Cycle detected in graph!\n");
    EXPECT_FALSE(report.complete);
    EXPECT_TRUE(report.hasErrors());
    EXPECT_TRUE(report.bindings.empty());
}

TEST(ScriptGeneratorTest, AmbiguousUpstreamIsReported) {
    Graph graph;
    addScript(graph, "xxxx0001", "X", "Get-X");
    addScript(graph, "yyyy0001", "Y", "Get-Y");
    Block& merge = addScript(graph, "mmmm0001", "Join", "Merge-Things");
    merge.inputs.push_back(Port{"In2", PortDirection::Input});
    graph.connect("xxxx0001", 0, "mmmm0001", 0);
    graph.connect("yyyy0001", 0, "mmmm0001", 1);

    ScriptGenerator gen(graph);
    const GenerationReport report = gen.generateReport();
    EXPECT_EQ(report.script,
              "# ---- Execution ----\n"
              "\n"
              "Get-X\n"
              "\n"
              "Get-Y\n"
              "\n"
              "Merge-Things\n"
              "\n");
    EXPECT_TRUE(hasDiagnosticFor(report, "mmmm0001", Diagnostic::Severity::Warning));
    EXPECT_TRUE(report.complete);
    EXPECT_FALSE(report.hasErrors());
}

TEST(ScriptGeneratorTest, MalformedConnectionsAreSkipped) {
    Graph graph;
    addScript(graph, "a", "A", "Get-A");
    addScript(graph, "b", "B", "Get-B");
    graph.connect("a", "ghost");
    graph.connect("a", 3, "b", 0);

    ScriptGenerator gen(graph);
    const GenerationReport report = gen.generateReport();
    EXPECT_EQ(report.script, "# ---- Execution ----\n\nGet-A\n\nGet-B\n\n");
    EXPECT_EQ(report.diagnostics.size(), 2u);
    EXPECT_TRUE(report.complete);
}

TEST(ScriptGeneratorTest, OrphanedBlockIsLeftOut) {
    Graph graph;
    addScript(graph, "a", "A", "Get-A");
    Block lost = makeScriptBlock("lost", "Lost", "Remove-Everything");
    lost.parentId = "gone";
    lost.parentZone = zone::Body;
    graph.addBlock(std::move(lost));

    ScriptGenerator gen(graph);
    const GenerationReport report = gen.generateReport();
    EXPECT_EQ(report.script.find("Remove-Everything"), std::string::npos);
    EXPECT_TRUE(hasDiagnosticFor(report, "lost", Diagnostic::Severity::Warning));
}

TEST(ScriptGeneratorTest, CallableIsHoistedAheadOfExecution) {
    Graph graph;
    graph.addBlock(makeCommandBlock("aaaa0001", "Get Services", "Get-Service"));
    graph.addBlock(makeContainerBlock("ffff0001", NamedCallable{"Get-Report", "", "", ""}));
    addScriptIn(graph, "ffff0001", zone::Body, "ssss0001", "Say", "Write-Output 'report'");
    graph.connect("aaaa0001", "ffff0001");

    ScriptGenerator gen(graph);
    EXPECT_EQ(gen.generate(),
              "# ---- Function Definitions ----\n"
              "\n"
              "function Get-Report {\n"
              "    Write-Output 'report'\n"
              "\n"
              "}\n"
              "\n"
              "# ---- Execution ----\n"
              "\n"
              "Get-Service | Get-Report\n"
              "\n");
}

TEST(ScriptGeneratorTest, HeaderBannerCarriesTimestamp) {
    Graph graph;
    addScript(graph, "a", "Now", "Get-Date");
    GeneratorOptions options;
    options.header = true;
    options.timestamp = "2026-01-01 12:00:00";

    ScriptGenerator gen(graph, options);
    EXPECT_EQ(gen.generate(),
              "# ===========================================\n"
              "# Auto-generated PowerShell 5.1 Script\n"
              "# Generated: 2026-01-01 12:00:00\n"
              "# ===========================================\n"
              "\n"
              "# ---- Execution ----\n"
              "\n"
              "Get-Date\n"
              "\n");
}

TEST(ScriptGeneratorTest, HonoursIndentWidth) {
    Graph graph;
    addScript(graph, "aaaa0001", "Get Items", "Get-ChildItem");
    graph.addBlock(makeContainerBlock("llll0001", ForEach{}));
    addScriptIn(graph, "llll0001", zone::Body, "bbbb0001", "Show", "Out-Host");
    graph.connect("aaaa0001", "llll0001");

    GeneratorOptions options;
    options.indentWidth = 2;
    ScriptGenerator gen(graph, options);
    EXPECT_EQ(gen.generate(),
              "# ---- Execution ----\n"
              "\n"
              "$GetItems_aaaa = Get-ChildItem\n"
              "\n"
              "$GetItems_aaaa | ForEach-Object {\n"
              "  $_ | Out-Host\n"
              "\n"
              "}\n"
              "\n");
}

TEST(ScriptGeneratorTest, OutputIsDeterministic) {
    Graph graph;
    addScript(graph, "aaaa0001", "Get Items", "Get-ChildItem");
    graph.addBlock(makeContainerBlock("iiii0001", Conditional{"$GetItems_aaaa"}));
    addScriptIn(graph, "iiii0001", zone::Then, "bbbb0001", "Show", "Out-Host");
    addScript(graph, "cccc0001", "Count", "Measure-Object");
    graph.addBlock(makeContainerBlock("ffff0001", NamedCallable{"Get-Report", "Item", "", ""}));
    addScriptIn(graph, "ffff0001", zone::Body, "dddd0001", "Emit", "Write-Output");
    graph.connect("aaaa0001", "iiii0001");
    graph.connect("aaaa0001", "cccc0001");
    graph.connect("cccc0001", "ffff0001");

    ScriptGenerator first(graph);
    ScriptGenerator second(graph);
    const std::string expected = first.generate();
    EXPECT_FALSE(expected.empty());
    EXPECT_EQ(first.generate(), expected);
    EXPECT_EQ(second.generate(), expected);
    EXPECT_EQ(first.generateReport().bindings.size(), second.generateReport().bindings.size());
}

TEST(ScriptGeneratorTest, GeneratesFromLoadedSnapshot) {
    const auto doc = nlohmann::json::parse(R"({
        "nodes": [
            {"id": "n1", "title": "Get Processes", "cmdletName": "Get-Process"},
            {"id": "n2", "title": "Sort", "cmdletName": "Sort-Object",
             "parameters": [{"name": "Property", "type": "StringArray", "value": "CPU"},
                            {"name": "Descending", "type": "Bool", "value": "true"}]},
            {"id": "n3", "title": "Top", "cmdletName": "Select-Object",
             "parameters": [{"name": "First", "type": "Int", "value": "", "defaultValue": "5"}]}
        ],
        "connections": [
            {"sourceNodeId": "n1", "sourcePortIndex": 0, "targetNodeId": "n2", "targetPortIndex": 0},
            {"sourceNodeId": "n2", "sourcePortIndex": 0, "targetNodeId": "n3", "targetPortIndex": 0}
        ]
    })");
    Graph graph;
    graph.loadFromJson(doc);

    ScriptGenerator gen(graph);
    EXPECT_EQ(gen.generate(),
              "# ---- Execution ----\n"
              "\n"
              "Get-Process | Sort-Object -Property @(\"CPU\") -Descending | Select-Object -First 5\n"
              "\n");
}
