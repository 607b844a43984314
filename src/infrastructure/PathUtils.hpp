// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace exporthub::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief Default storage root: <data home>/ExportHub/exports (not created). */
    static std::filesystem::path GetDefaultExportsDir();
};

} // namespace exporthub::infrastructure
