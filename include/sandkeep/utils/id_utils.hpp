/**
 * @file id_utils.hpp
 * @brief External identifier generation and input sanitization
 *
 * External ids are the only identifiers the boundary ever hands out for
 * sessions and files. Their shape is fixed by a downstream validator:
 * exactly 21 characters from `[A-Za-z0-9_-]`, never a dot.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace sandkeep {
namespace utils {

/// Length of every external id
constexpr std::size_t kExternalIdLength = 21;

/// Alphabet external ids are drawn from (64 symbols, URL safe)
constexpr const char* kExternalIdAlphabet =
    "useandom-26T198340PX75pxJACKVERYMINDBUSHWOLF_GQZbfghjklqvwyzrict";

/**
 * @class IdUtils
 * @brief Identifier helpers
 */
class IdUtils {
public:
    /**
     * @brief Generate a random id from the external alphabet
     *
     * Uses OpenSSL's CSPRNG. The alphabet has 64 symbols so each random byte
     * maps onto it without bias.
     *
     * @param length Number of characters (defaults to the external id length)
     * @return Random id
     * @throws std::runtime_error if the CSPRNG fails
     */
    static std::string GenerateId(std::size_t length = kExternalIdLength);

    /**
     * @brief Check that a string has the exact external id shape
     */
    static bool IsExternalId(const std::string& value);

    /**
     * @brief Strip everything outside `[A-Za-z0-9_-]`
     *
     * "../../etc" becomes "etc", "id with spaces" becomes "idwithspaces".
     */
    static std::string SanitizeId(const std::string& value);

    /**
     * @brief Reduce a client-supplied file name to a safe base name
     *
     * Drops any directory part (either slash style), control characters and
     * leading dots that would hide the file.
     *
     * @return Sanitized name, empty when nothing usable is left
     */
    static std::string SanitizeFileName(const std::string& name);
};

} // namespace utils
} // namespace sandkeep
