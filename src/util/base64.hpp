#pragma once
#include <string>
#include <optional>
#include <filesystem>

namespace execore::util {

std::string base64_encode(const std::string& data);

// Read a whole file and return it base64-encoded, nullopt if unreadable
std::optional<std::string> base64_encode_file(const std::filesystem::path& path);

} // namespace execore::util
