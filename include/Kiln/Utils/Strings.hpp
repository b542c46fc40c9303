// include/Kiln/Utils/Strings.hpp
#ifndef KILN_STRINGS_UTIL_HPP
#define KILN_STRINGS_UTIL_HPP

#include <string>
#include <vector>

namespace Kiln::Utils {

    // Literal, non-recursive replacement of every occurrence of token
    void replaceAll(std::string& text, const std::string& token, const std::string& value);

    std::string trim(const std::string& text);

    // Splits on whitespace. A "..." run is kept together and its quotes are dropped.
    // Nothing else is interpreted: '$', backslashes and single quotes are ordinary characters.
    std::vector<std::string> splitArguments(const std::string& text);

} // namespace Kiln::Utils

#endif // KILN_STRINGS_UTIL_HPP
