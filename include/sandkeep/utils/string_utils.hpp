/**
 * @file string_utils.hpp
 * @brief String helpers used across the session manager
 *
 * Trimming, splitting and joining for docker CLI output, prefix checks for
 * label and path handling, Base64 for carrying file bytes over the JSON
 * request loop, and truncation for log lines.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace sandkeep {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string manipulation utilities
 *
 * **Usage Example**:
 * @code
 * auto labels = StringUtils::Split("service=sandkeep,session=s1", ',');
 * auto encoded = StringUtils::ToBase64(file_bytes);
 * auto decoded = StringUtils::FromBase64(encoded);
 * @endcode
 */
class StringUtils {
public:
    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Separator character
     * @return Non-empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Encode bytes to standard Base64 (with padding)
     * @param bytes Raw bytes
     * @return Base64 text
     */
    static std::string ToBase64(const std::string& bytes);

    /**
     * @brief Decode standard Base64
     *
     * Whitespace is ignored. Padding is honoured so the decoded length is
     * exact.
     *
     * @param base64 Encoded text
     * @return Decoded bytes
     * @throws std::invalid_argument if the input is not valid Base64
     */
    static std::string FromBase64(const std::string& base64);

    /**
     * @brief Truncate string to maximum length
     * @param str Input string
     * @param max_length Maximum result length including suffix
     * @param suffix Marker appended when truncated
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace sandkeep
