// src/Utils/Strings.cpp
#include <Kiln/Utils/Strings.hpp>

namespace Kiln {
namespace Utils {

void replaceAll(std::string& text, const std::string& token, const std::string& value) {
    if (token.empty()) return;
    std::string::size_type pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

std::string trim(const std::string& text) {
    static const char* whitespace = " \t\n\r\f\v";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::vector<std::string> splitArguments(const std::string& text) {
    std::vector<std::string> args;
    std::string current;
    bool inToken = false;
    bool inQuotes = false;
    for (char c : text) {
        if (c == '"') {
            inQuotes = !inQuotes;
            inToken = true;
        } else if (!inQuotes && (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v')) {
            if (inToken) {
                args.push_back(current);
                current.clear();
                inToken = false;
            }
        } else {
            current += c;
            inToken = true;
        }
    }
    if (inToken) {
        args.push_back(current);
    }
    return args;
}

} // namespace Utils
} // namespace Kiln
