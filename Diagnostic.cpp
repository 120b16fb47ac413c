// Diagnostic.cpp
#include "Diagnostic.hpp"
#include "Log.hpp"

namespace BloxScript {

void report(std::vector<Diagnostic>& sink, Diagnostic::Severity severity, const BlockId& blockId, std::string message) {
    if (severity == Diagnostic::Severity::Error) log::error("{}", message);
    else log::warn("{}", message);
    sink.push_back({severity, blockId, std::move(message)});
}

} // namespace BloxScript
