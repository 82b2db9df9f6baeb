/**
 * @file mime_types.cpp
 * @brief Content type lookup by file extension
 *
 * @date 2025
 */

#include "sandkeep/utils/mime_types.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <map>

namespace sandkeep {
namespace utils {

namespace {

const std::map<std::string, std::string>& ExtensionTable() {
    static const std::map<std::string, std::string> table = {
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".bmp", "image/bmp"},
        {".pdf", "application/pdf"},
        {".json", "application/json"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".parquet", "application/vnd.apache.parquet"},
        {".txt", "text/plain; charset=utf-8"},
        {".log", "text/plain; charset=utf-8"},
        {".md", "text/markdown; charset=utf-8"},
        {".csv", "text/csv; charset=utf-8"},
        {".tsv", "text/tab-separated-values; charset=utf-8"},
        {".html", "text/html; charset=utf-8"},
        {".htm", "text/html; charset=utf-8"},
        {".xml", "text/xml; charset=utf-8"},
        {".py", "text/x-python; charset=utf-8"},
        {".js", "text/javascript; charset=utf-8"},
        {".css", "text/css; charset=utf-8"},
        {".yaml", "text/yaml; charset=utf-8"},
        {".yml", "text/yaml; charset=utf-8"},
    };
    return table;
}

} // anonymous namespace

std::string MimeTypes::Guess(const std::filesystem::path& file_name) {
    const auto ext = StringUtils::ToLower(file_name.extension().string());
    const auto& table = ExtensionTable();
    auto it = table.find(ext);
    if (it != table.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

bool MimeTypes::IsInline(const std::string& content_type) {
    return StringUtils::StartsWith(content_type, "image/") ||
           content_type == "application/pdf";
}

} // namespace utils
} // namespace sandkeep
