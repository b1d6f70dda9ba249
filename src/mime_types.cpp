#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "datasource/mime_types.hpp"

namespace datasource {
namespace mime_types {

const std::unordered_map<std::string, std::string> mime_map = {
    {"css", "text/css"},
    {"gif", "image/gif"},
    {"htm", "text/html"},
    {"xhtml", "application/xhtml+xml"},
    {"html", "text/html"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"js", "application/javascript"},
    {"mjs", "application/javascript"},
    {"map", "application/json"},
    {"jsonld", "application/ld+json"},
    {"webmanifest", "application/manifest+json"},
    {"json", "application/json"},
    {"png", "image/png"},
    {"bmp", "image/bmp"},
    {"webp", "image/webp"},
    {"avif", "image/avif"},
    {"tif", "image/tiff"},
    {"tiff", "image/tiff"},
    {"ico", "image/x-icon"},
    {"svg", "image/svg+xml"},
    {"txt", "text/plain"},
    {"csv", "text/csv"},
    {"md", "text/markdown"},
    {"xml", "application/xml"},
    {"pdf", "application/pdf"},
    {"zip", "application/zip"},
    {"gz", "application/gzip"},
    {"tgz", "application/gzip"},
    {"bz2", "application/x-bzip2"},
    {"xz", "application/x-xz"},
    {"zst", "application/zstd"},
    {"tar", "application/x-tar"},
    {"rtf", "application/rtf"},
    {"mp3", "audio/mpeg"},
    {"m4a", "audio/mp4"},
    {"mp4", "video/mp4"},
    {"mpeg", "video/mpeg"},
    {"avi", "video/x-msvideo"},
    {"mov", "video/quicktime"},
    {"webm", "video/webm"},
    {"ogg", "application/ogg"},
    {"ogv", "video/ogg"},
    {"wav", "audio/wav"},
    {"flac", "audio/flac"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf", "font/ttf"},
    {"otf", "font/otf"},
    {"eot", "application/vnd.ms-fontobject"},
    {"wasm", "application/wasm"},
    {"sh", "application/x-sh"},
    {"c", "text/x-c"},
    {"cpp", "text/x-c"},
    {"h", "text/x-c"},
    {"hpp", "text/x-c"},
    {"py", "text/x-python"},
    {"ts", "application/typescript"},
    {"jsx", "text/jsx"},
    {"tsx", "text/tsx"},
    {"yaml", "text/yaml"},
    {"yml", "text/yaml"},
    {"apk", "application/vnd.android.package-archive"},
    {"3gp", "video/3gpp"},
    {"bin", "application/octet-stream"}};

std::string extensionToType(const std::string &extension) {
    std::string ext = extension;
    std::transform(
        ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    auto it = mime_map.find(ext);
    if (it != mime_map.end()) {
        return it->second;
    }
    return kDefaultType;
}

}  // namespace mime_types
}  // namespace datasource
