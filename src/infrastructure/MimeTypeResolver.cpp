#include "infrastructure/MimeTypeResolver.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace exporthub::infrastructure {

std::string MimeTypeResolver::FromExtension(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> types = {
        {"json", "application/json"},
        {"csv", "text/csv"},
        {"txt", "text/plain"},
        {"xml", "application/xml"},
        {"zip", "application/zip"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"gz", "application/gzip"}
    };

    std::string key = extension;
    if (!key.empty() && key.front() == '.') {
        key.erase(0, 1);
    }
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = types.find(key);
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string MimeTypeResolver::FromFileName(const std::string& fileName) {
    auto dot = fileName.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == fileName.size()) {
        return "application/octet-stream";
    }
    return FromExtension(fileName.substr(dot + 1));
}

} // namespace exporthub::infrastructure
