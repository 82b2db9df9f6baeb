/**
 * @file mime_types.hpp
 * @brief Content type guessing for session artifacts
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace sandkeep {
namespace utils {

class MimeTypes {
public:
    /**
     * @brief Guess content type from the file extension
     *
     * Text types carry "; charset=utf-8". Unknown extensions map to
     * "application/octet-stream".
     */
    static std::string Guess(const std::filesystem::path& file_name);

    /**
     * @brief Whether a browser should render the type inline
     *
     * True for images and PDF, false for everything else (downloaded as an
     * attachment).
     */
    static bool IsInline(const std::string& content_type);
};

} // namespace utils
} // namespace sandkeep
