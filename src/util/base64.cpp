#include "util/base64.hpp"
#include <fstream>
#include <iterator>

namespace execore::util {

std::string base64_encode(const std::string& data) {
    static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i < data.size()) {
        const size_t start = i;
        const unsigned int octet_a = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;
        const unsigned int octet_b = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;
        const unsigned int octet_c = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;

        const unsigned int triple = (octet_a << 16) + (octet_b << 8) + octet_c;
        encoded.push_back(table[(triple >> 18) & 0x3F]);
        encoded.push_back(table[(triple >> 12) & 0x3F]);
        encoded.push_back(start + 1 < data.size() ? table[(triple >> 6) & 0x3F] : '=');
        encoded.push_back(start + 2 < data.size() ? table[triple & 0x3F] : '=');
    }
    return encoded;
}

std::optional<std::string> base64_encode_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return base64_encode(bytes);
}

} // namespace execore::util
