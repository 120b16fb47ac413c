// Identifier.hpp
//
// Maps display titles to script identifiers.
#pragma once
#include <string>

namespace BloxScript {

// Used when a title has no identifier characters at all
inline constexpr const char* kFallbackIdentifier = "Result";

// "get-service list" -> "GetServiceList". Splits on '-', ' ', '.' and '_',
// capitalizes each fragment, joins them and drops anything not [A-Za-z0-9].
std::string sanitizeIdentifier(const std::string& text);

// Only the [A-Za-z0-9] characters of text, in order
std::string alphanumericOnly(const std::string& text);

} // namespace BloxScript
