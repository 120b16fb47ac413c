// Diagnostic.hpp
//
// Non-fatal findings collected during one generation pass.
#pragma once
#include "BloxGraph.hpp"
#include <string>
#include <vector>

namespace BloxScript {

struct Diagnostic {
    enum class Severity { Warning, Error };
    Severity severity = Severity::Warning;
    BlockId blockId; // empty when the finding is not tied to one block
    std::string message;
};

// Append the diagnostic and echo it to the log at the matching level
void report(std::vector<Diagnostic>& sink, Diagnostic::Severity severity, const BlockId& blockId, std::string message);

} // namespace BloxScript
