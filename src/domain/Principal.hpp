/**
 * @file Principal.hpp
 * @brief The authenticated caller of an export operation.
 */

#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace exporthub::domain {

/** @brief Permission names checked by the export endpoints. */
namespace permissions {
inline constexpr const char* Access = "export:access";
inline constexpr const char* Download = "export:download";
inline constexpr const char* PlatformExport = "platform:export";
} // namespace permissions

/**
 * @struct Principal
 * @brief User name plus the granted permissions. Authentication happens upstream.
 */
struct Principal {
    std::string userName;
    std::vector<std::string> permissions;

    bool hasPermission(const std::string& permission) const {
        return std::find(permissions.begin(), permissions.end(), permission) != permissions.end();
    }
};

} // namespace exporthub::domain
