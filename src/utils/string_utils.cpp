/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation helpers
 *
 * @date 2025
 */

#include "sysprobe/utils/string_utils.hpp"

#include <sstream>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace sysprobe {
namespace utils {

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split by any whitespace
std::vector<std::string> StringUtils::SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

// Split outside quotes and brackets
std::vector<std::string> StringUtils::SplitTopLevel(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    if (Trim(str).empty()) {
        return tokens;
    }

    std::string current;
    int depth = 0;
    bool in_quotes = false;
    bool escaped = false;

    for (char c : str) {
        if (in_quotes) {
            current += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_quotes = false;
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
        } else if (c == '(' || c == '[' || c == '{') {
            depth++;
        } else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
            depth--;
        } else if (c == delimiter && depth == 0) {
            tokens.push_back(Trim(current));
            current.clear();
            continue;
        }
        current += c;
    }

    tokens.push_back(Trim(current));
    return tokens;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return ToLower(str).find(ToLower(substring)) != std::string::npos;
}

std::optional<long> StringUtils::ParseInteger(const std::string& str) {
    std::string text = Trim(str);
    if (text.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    std::size_t pos = 0;
    if (text[0] == '-' || text[0] == '+') {
        negative = (text[0] == '-');
        pos = 1;
    }

    int base = 10;
    if (text.size() > pos + 1 && text[pos] == '0' && (text[pos + 1] == 'x' || text[pos + 1] == 'X')) {
        base = 16;
        pos += 2;
    }

    if (pos >= text.size()) {
        return std::nullopt;
    }

    const char* begin = text.c_str() + pos;
    char* end = nullptr;
    errno = 0;
    unsigned long long magnitude = std::strtoull(begin, &end, base);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }

    // Pointers above LONG_MAX wrap, matching the raw register value
    long value = static_cast<long>(magnitude);
    return negative ? -value : value;
}

std::optional<std::string> StringUtils::Unquote(const std::string& str) {
    std::string text = Trim(str);
    if (EndsWith(text, "...")) {
        text = text.substr(0, text.size() - 3);
    }
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        return std::nullopt;
    }

    std::string result;
    for (std::size_t i = 1; i + 1 < text.size(); ++i) {
        char c = text[i];
        if (c != '\\') {
            result += c;
            continue;
        }
        if (i + 2 >= text.size()) {
            result += c;  // dangling backslash before the closing quote
            break;
        }

        char next = text[++i];
        switch (next) {
            case 'n': result += '\n'; break;
            case 't': result += '\t'; break;
            case 'r': result += '\r'; break;
            case 'v': result += '\v'; break;
            case 'f': result += '\f'; break;
            case '\\': result += '\\'; break;
            case '"': result += '"'; break;
            case 'x': {
                std::string hex;
                while (hex.size() < 2 && i + 2 < text.size() &&
                       std::isxdigit(static_cast<unsigned char>(text[i + 1]))) {
                    hex += text[++i];
                }
                result += hex.empty() ? 'x' : static_cast<char>(std::stoi(hex, nullptr, 16));
                break;
            }
            default:
                if (next >= '0' && next <= '7') {
                    std::string oct(1, next);
                    while (oct.size() < 3 && i + 2 < text.size() &&
                           text[i + 1] >= '0' && text[i + 1] <= '7') {
                        oct += text[++i];
                    }
                    result += static_cast<char>(std::stoi(oct, nullptr, 8));
                } else {
                    result += next;
                }
                break;
        }
    }

    return result;
}

} // namespace utils
} // namespace sysprobe
