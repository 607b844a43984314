/**
 * @file ExportHubApp.hpp
 * @brief Main application class of the export service.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "infrastructure/ConfigLoader.hpp"

namespace httplib {
class Server;
}

namespace exporthub::application {
class ExportJobOrchestrator;
class ExportService;
}

namespace exporthub::infrastructure {
class HttpExportController;
class InMemoryPushNotificationHub;
}

namespace exporthub::app {

/**
 * @struct ExportHubOptions
 * @brief Command line overrides applied on top of the loaded settings.
 */
struct ExportHubOptions {
    std::string configPath = infrastructure::ConfigLoader::DefaultPath();
    std::optional<int> port;
    std::optional<std::string> storageRoot;
};

/**
 * @class ExportHubApp
 * @brief Wires the export components together and serves HTTP until a stop signal arrives.
 */
class ExportHubApp {
public:
    static constexpr const char* Version = "0.1.0";

    explicit ExportHubApp(ExportHubOptions options);
    ~ExportHubApp();

    /**
     * @brief Initializes, serves, and shuts down.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Loads settings and builds storage, registries, orchestrator and HTTP server.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Stops the worker pool gracefully. */
    void Shutdown();

    ExportHubOptions m_options;
    infrastructure::ExportSettings m_settings;

    std::shared_ptr<infrastructure::InMemoryPushNotificationHub> m_hub;
    std::shared_ptr<application::ExportJobOrchestrator> m_orchestrator;
    std::shared_ptr<application::ExportService> m_service;
    std::unique_ptr<infrastructure::HttpExportController> m_controller;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace exporthub::app
