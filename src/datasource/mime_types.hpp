#pragma once

#include <string>

namespace datasource {
namespace mime_types {

const char kDefaultType[] = "application/octet-stream";

/// Convert a file extension (without the dot, any case) into a MIME type.
/// Unknown and empty extensions give kDefaultType.
std::string extensionToType(const std::string &extension);

}  // namespace mime_types
}  // namespace datasource
