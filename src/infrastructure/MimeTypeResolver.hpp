#pragma once

#include <string>

namespace exporthub::infrastructure {

/**
 * @class MimeTypeResolver
 * @brief Maps a file name's extension to a content type (case-insensitive).
 */
class MimeTypeResolver {
public:
    static std::string FromFileName(const std::string& fileName);
    static std::string FromExtension(const std::string& extension);
};

} // namespace exporthub::infrastructure
