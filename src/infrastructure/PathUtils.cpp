#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace exporthub::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path FromXdg(const char* variable, const fs::path& homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return FromXdg("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return FromXdg("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDefaultExportsDir() {
    return GetDataHome() / "ExportHub" / "exports";
}

} // namespace exporthub::infrastructure
