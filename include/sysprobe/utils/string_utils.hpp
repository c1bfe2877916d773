/**
 * @file string_utils.hpp
 * @brief String manipulation helpers for trace parsing and event search
 *
 * Provides the trimming, splitting and matching primitives used by the strace
 * and procfs parsers, the breakpoint condition parser, and event search.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace sysprobe {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto args = StringUtils::SplitTopLevel(R"(3, "a,b", {st_mode=S_IFREG, st_size=12})", ',');
 * // args = {"3", "\"a,b\"", "{st_mode=S_IFREG, st_size=12}"}
 *
 * auto value = StringUtils::ParseInteger("0x7f00");  // 32512
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /**
     * @brief Split on delimiter only outside quotes and brackets
     *
     * Tracks "..." strings (with backslash escapes) and nesting of (), [] and
     * {} so structured strace arguments stay intact. Tokens are trimmed.
     *
     * @param str Input text
     * @param delimiter Separator character
     * @return Tokens in order (empty input yields no tokens)
     */
    static std::vector<std::string> SplitTopLevel(const std::string& str, char delimiter);

    /***************************************************************************
     * Matching
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Case-insensitive substring test
     */
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Conversion
     ***************************************************************************/

    /**
     * @brief Parse a signed decimal or 0x-prefixed hexadecimal integer
     * @return Value, or nullopt if the whole string is not an integer
     */
    static std::optional<long> ParseInteger(const std::string& str);

    /**
     * @brief Strip surrounding double quotes and decode C escapes
     *
     * Handles \n, \t, \r, \\, \", octal (\0, \177) and hex (\x41) escapes.
     * A trailing "..." truncation marker after the closing quote is dropped.
     *
     * @param str Quoted literal such as "\"hello\\n\""
     * @return Decoded text, or nullopt if str is not a quoted literal
     */
    static std::optional<std::string> Unquote(const std::string& str);
};

} // namespace utils
} // namespace sysprobe
