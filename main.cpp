// main.cpp
//
// BloxScript command line. Parses CLI (CLI11), loads the JSON graph snapshot,
// generates the PowerShell script and writes it to a file or stdout.
// Diagnostics go to stderr through the logger.
#include "BloxGraph.hpp"
#include "Log.hpp"
#include "ScriptGenerator.hpp"
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {

// Local wall-clock time for the banner, "YYYY-MM-DD HH:MM:SS"
std::string currentTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

// Read the graph document, also trying the parent directories the way a
// build-tree binary is usually launched
nlohmann::json readGraphDocument(const std::string& path) {
    for (const std::string& candidate : {path, "../" + path, "../../" + path}) {
        std::ifstream f(candidate);
        if (!f.good()) continue;
        try {
            return nlohmann::json::parse(f);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Malformed graph file '" + candidate + "': " + e.what());
        }
    }
    throw std::runtime_error("Could not find graph file: " + path);
}

} // namespace

int main(int argc, char** argv) {
    std::string graphPath;
    std::string outPath;
    std::string logLevel = "warn";
    bool header = false;
    bool strict = false;
    int indentWidth = 4;

    CLI::App app{"BloxScript - block graph to PowerShell generator"};
    try {
        app.add_option("--graph", graphPath, "Path to graph JSON file")->required();
        app.add_option("--out", outPath, "Write the script to this file (default: stdout)");
        app.add_flag("--header", header, "Emit the banner comment with the current time");
        app.add_option("--indent", indentWidth, "Spaces per indentation level")->check(CLI::Range(0, 16));
        app.add_option("--log-level", logLevel, "debug|info|warn|error|off")
            ->check(CLI::IsMember({"debug", "info", "warn", "warning", "error", "off"}));
        app.add_flag("--strict", strict, "Exit with status 2 when any diagnostic is reported");
        app.set_config("--config", "", "Read options from a TOML/INI config file");
        app.allow_extras(false);
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    BloxScript::log::setLevel(BloxScript::log::parseLevel(logLevel));

    BloxScript::Graph graph;
    try {
        graph.loadFromJson(readGraphDocument(graphPath));
    } catch (const std::exception& e) {
        BloxScript::log::error("{}", e.what());
        return 1;
    }

    BloxScript::GeneratorOptions options;
    options.indentWidth = indentWidth;
    options.header = header;
    if (header) options.timestamp = currentTimestamp();

    BloxScript::ScriptGenerator generator(graph, options);
    const BloxScript::GenerationReport result = generator.generateReport();
    BloxScript::log::info("Generated {} bytes, {} bindings, {} diagnostics", result.script.size(), result.bindings.size(),
                          result.diagnostics.size());

    if (outPath.empty()) {
        std::cout << result.script;
        std::cout.flush();
    } else {
        std::ofstream out(outPath, std::ios::binary);
        if (!out.is_open()) {
            BloxScript::log::error("Could not open output file: {}", outPath);
            return 1;
        }
        out << result.script;
        if (!out.good()) {
            BloxScript::log::error("Failed writing output file: {}", outPath);
            return 1;
        }
        fmt::print(stderr, "Wrote {}\n", outPath);
    }

    if (!result.complete) return 3;
    if (strict && !result.diagnostics.empty()) return 2;
    return 0;
}
