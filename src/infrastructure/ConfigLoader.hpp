/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the service configuration (settings.json).
 *
 * Keeps JSON parsing of the configuration in one place; the rest of the code only sees
 * ExportSettings.
 */

#pragma once

#include <string>

namespace exporthub::infrastructure {

/**
 * @struct ExportSettings
 * @brief Runtime configuration of the export service.
 */
struct ExportSettings {
    std::string host = "127.0.0.1";
    int port = 8089;
    std::string storageRoot;                          ///< Empty until resolved by Load().
    int workerCount = 2;
    int defaultPageSize = 50;
    int maxRetainedJobs = 1000;
    std::string downloadRoute = "api/export/download/";
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from @p path.
     *
     * A missing file yields defaults. A malformed file yields defaults plus an error line.
     * Missing or invalid keys fall back to their defaults (invalid ones with a warning).
     */
    static ExportSettings Load(const std::string& path);

    /** @brief <config home>/ExportHub/settings.json */
    static std::string DefaultPath();

    /** @brief Defaults with storageRoot resolved under the XDG data home. */
    static ExportSettings Defaults();

    /**
     * @brief Writes @p settings to @p path as pretty-printed JSON, preserving unknown keys
     * already present in the file.
     * @return false when the file could not be written.
     */
    static bool Save(const std::string& path, const ExportSettings& settings);
};

} // namespace exporthub::infrastructure
