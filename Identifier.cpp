// Identifier.cpp
#include "Identifier.hpp"

namespace BloxScript {

namespace {

bool isAsciiAlnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool isSeparator(char c) { return c == '-' || c == ' ' || c == '.' || c == '_'; }

} // namespace

std::string alphanumericOnly(const std::string& text) {
    std::string out;
    for (char c : text) if (isAsciiAlnum(c)) out += c;
    return out;
}

std::string sanitizeIdentifier(const std::string& text) {
    std::string joined;
    bool fragmentStart = true;
    for (char c : text) {
        if (isSeparator(c)) {
            fragmentStart = true;
            continue;
        }
        if (fragmentStart && c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        fragmentStart = false;
        joined += c;
    }
    std::string result = alphanumericOnly(joined);
    return result.empty() ? std::string(kFallbackIdentifier) : result;
}

} // namespace BloxScript
