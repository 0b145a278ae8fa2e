#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <string>
#include <string_view>

namespace utils {

/**
 * Convert a string to lowercase (ASCII only)
 *
 * @param str Input string
 * @return Lowercase copy of the input
 */
std::string toLower(std::string_view str);

/**
 * Trim horizontal whitespace (space, \t, \v, \f) from both ends of a string
 *
 * @param str Input string
 * @return Trimmed view into the input (empty if all whitespace)
 */
std::string_view trim(std::string_view str);

} // namespace utils

#endif // STRING_UTILS_HPP
