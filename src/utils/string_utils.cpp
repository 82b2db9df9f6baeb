/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation utilities
 *
 * Base64 goes through OpenSSL's EVP block coder so encoded payloads match
 * what any other client library produces.
 *
 * @date 2025
 */

#include "sandkeep/utils/string_utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace sandkeep {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];
    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }
    return oss.str();
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

// ============================================================================
// BASE64
// ============================================================================

std::string StringUtils::ToBase64(const std::string& bytes) {
    if (bytes.empty()) {
        return "";
    }

    std::string result(4 * ((bytes.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&result[0]),
        reinterpret_cast<const unsigned char*>(bytes.data()),
        static_cast<int>(bytes.size()));
    result.resize(static_cast<std::size_t>(written));
    return result;
}

std::string StringUtils::FromBase64(const std::string& base64) {
    std::string compact;
    compact.reserve(base64.size());
    for (unsigned char c : base64) {
        if (!std::isspace(c)) {
            compact.push_back(static_cast<char>(c));
        }
    }
    if (compact.empty()) {
        return "";
    }
    if (compact.size() % 4 != 0) {
        throw std::invalid_argument("Base64 input length is not a multiple of 4");
    }

    std::string result(3 * compact.size() / 4, '\0');
    const int written = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(&result[0]),
        reinterpret_cast<const unsigned char*>(compact.data()),
        static_cast<int>(compact.size()));
    if (written < 0) {
        throw std::invalid_argument("Invalid Base64 input");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    std::size_t padding = 0;
    if (compact.back() == '=') {
        ++padding;
        if (compact[compact.size() - 2] == '=') {
            ++padding;
        }
    }
    result.resize(static_cast<std::size_t>(written) - padding);
    return result;
}

// ============================================================================
// TRUNCATION
// ============================================================================

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace sandkeep
