/**
 * @file id_utils.cpp
 * @brief Random ids and name sanitizing
 *
 * @date 2025
 */

#include "sandkeep/utils/id_utils.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cctype>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace sandkeep {
namespace utils {

std::string IdUtils::GenerateId(std::size_t length) {
    std::vector<unsigned char> random(length);
    if (length > 0 && RAND_bytes(random.data(), static_cast<int>(length)) != 1) {
        throw std::runtime_error("RAND_bytes failed: " +
                                 std::to_string(ERR_get_error()));
    }

    std::string id;
    id.reserve(length);
    for (unsigned char byte : random) {
        id.push_back(kExternalIdAlphabet[byte & 63]);
    }
    return id;
}

bool IdUtils::IsExternalId(const std::string& value) {
    if (value.size() != kExternalIdLength) {
        return false;
    }
    for (char c : value) {
        if (std::strchr(kExternalIdAlphabet, c) == nullptr || c == '\0') {
            return false;
        }
    }
    return true;
}

std::string IdUtils::SanitizeId(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '_' || c == '-') {
            result.push_back(static_cast<char>(c));
        }
    }
    return result;
}

std::string IdUtils::SanitizeFileName(const std::string& name) {
    std::string base = name;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    std::string result;
    result.reserve(base.size());
    for (unsigned char c : base) {
        if (std::iscntrl(c)) {
            continue;
        }
        result.push_back(static_cast<char>(c));
    }

    auto first = result.find_first_not_of('.');
    if (first == std::string::npos) {
        return "";
    }
    return result.substr(first);
}

} // namespace utils
} // namespace sandkeep
