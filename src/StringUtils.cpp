#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace utils {

std::string toLower(std::string_view str) {
    std::string result{str};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view str) {
    constexpr std::string_view WHITESPACE = " \t\v\f";

    size_t start = str.find_first_not_of(WHITESPACE);
    if (start == std::string_view::npos) {
        return {};  // String is all whitespace
    }

    size_t end = str.find_last_not_of(WHITESPACE);
    return str.substr(start, end - start + 1);
}

} // namespace utils
