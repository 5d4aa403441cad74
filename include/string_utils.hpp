#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by runtime parsing utilities.
 *
 * Provides case normalization, trimming, list splitting, boolean parsing,
 * and JSON escaping. Functions are header-inline because they are small
 * and reused in configuration, CSV loading and report code paths.
 */

namespace petc
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 * @param value Source string view.
 * @return Lowercased string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Returns a copy with leading and trailing whitespace removed.
 * @param value Source string view.
 * @return Trimmed string.
 */
inline std::string trim_copy(std::string_view value)
{
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && is_space(static_cast<unsigned char>(value[begin])))
    {
        ++begin;
    }
    while (end > begin && is_space(static_cast<unsigned char>(value[end - 1])))
    {
        --end;
    }
    return std::string(value.substr(begin, end - begin));
}

/**
 * @brief Splits on a single delimiter, trimming every token.
 * @param value Input string view.
 * @param delimiter Separator character.
 * @return Tokens in input order; empty fields are kept.
 */
inline std::vector<std::string> split_trimmed(std::string_view value, char delimiter)
{
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t pos = value.find(delimiter, start);
        if (pos == std::string_view::npos)
        {
            tokens.push_back(trim_copy(value.substr(start)));
            break;
        }
        tokens.push_back(trim_copy(value.substr(start, pos - start)));
        start = pos + 1;
    }
    return tokens;
}

/**
 * @brief Joins strings with a separator.
 */
inline std::string join(const std::vector<std::string>& values, std::string_view separator)
{
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i > 0)
        {
            out.append(separator);
        }
        out += values[i];
    }
    return out;
}

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string view.
 * @return True for 1/true/yes/on (case-insensitive), false otherwise.
 */
inline bool parse_bool(std::string_view value)
{
    const std::string normalized = lower_copy(value);
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

/**
 * @brief Escapes control characters for safe JSON string emission.
 * @param value Input string view.
 * @return Escaped JSON-safe string.
 */
inline std::string json_escape(std::string_view value)
{
    std::ostringstream oss;
    for (char c : value)
    {
        switch (c)
        {
            case '\\': oss << "\\\\"; break;
            case '"': oss << "\\\""; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
    return oss.str();
}

} // namespace strutil
} // namespace petc
