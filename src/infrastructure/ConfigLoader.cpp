/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace exporthub::infrastructure {

namespace {

void ReadPositiveInt(const nlohmann::json& j, const char* key, int& target, int maxValue) {
    if (!j.contains(key)) return;
    const auto& value = j.at(key);
    if (value.is_number_integer()) {
        auto number = value.get<long long>();
        if (number > 0 && number <= maxValue) {
            target = static_cast<int>(number);
            return;
        }
    }
    std::cerr << "[ConfigLoader] Invalid value for '" << key << "', using default " << target << std::endl;
}

void ReadNonEmptyString(const nlohmann::json& j, const char* key, std::string& target) {
    if (!j.contains(key)) return;
    const auto& value = j.at(key);
    if (value.is_string() && !value.get<std::string>().empty()) {
        target = value.get<std::string>();
        return;
    }
    std::cerr << "[ConfigLoader] Invalid value for '" << key << "', using default \"" << target << "\"" << std::endl;
}

} // namespace

std::string ConfigLoader::DefaultPath() {
    return (PathUtils::GetConfigHome() / "ExportHub" / "settings.json").string();
}

ExportSettings ConfigLoader::Defaults() {
    ExportSettings settings;
    settings.storageRoot = PathUtils::GetDefaultExportsDir().string();
    return settings;
}

ExportSettings ConfigLoader::Load(const std::string& path) {
    ExportSettings settings = Defaults();

    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] No " << configPath << ", using defaults" << std::endl;
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return settings;
    }

    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << configPath << " is not a JSON object, using defaults" << std::endl;
        return settings;
    }

    ReadNonEmptyString(j, "host", settings.host);
    ReadPositiveInt(j, "port", settings.port, 65535);
    ReadNonEmptyString(j, "storage_root", settings.storageRoot);
    ReadPositiveInt(j, "worker_count", settings.workerCount, 256);
    ReadPositiveInt(j, "default_page_size", settings.defaultPageSize, 100000);
    ReadPositiveInt(j, "max_retained_jobs", settings.maxRetainedJobs, 10000000);
    ReadNonEmptyString(j, "download_route", settings.downloadRoute);

    std::cout << "[ConfigLoader] Loaded " << configPath << std::endl;
    return settings;
}

bool ConfigLoader::Save(const std::string& path, const ExportSettings& settings) {
    std::filesystem::path configPath(path);
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json existing;
            f >> existing;
            if (existing.is_object()) {
                j = existing;
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
        }
    }

    j["host"] = settings.host;
    j["port"] = settings.port;
    j["storage_root"] = settings.storageRoot;
    j["worker_count"] = settings.workerCount;
    j["default_page_size"] = settings.defaultPageSize;
    j["max_retained_jobs"] = settings.maxRetainedJobs;
    j["download_route"] = settings.downloadRoute;

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace exporthub::infrastructure
