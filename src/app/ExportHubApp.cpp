/**
 * @file ExportHubApp.cpp
 * @brief Implementation of ExportHubApp.
 */

#include "app/ExportHubApp.hpp"
#include "app/DemoCatalog.hpp"
#include "application/DataExporter.hpp"
#include "application/ExportAuthorizationGate.hpp"
#include "application/ExportJobOrchestrator.hpp"
#include "application/ExportProviderRegistry.hpp"
#include "application/ExportService.hpp"
#include "application/KnownExportTypesRegistry.hpp"
#include "infrastructure/CsvExportProvider.hpp"
#include "infrastructure/HttpExportController.hpp"
#include "infrastructure/InMemoryPushNotificationHub.hpp"
#include "infrastructure/JsonExportProvider.hpp"
#include "infrastructure/LocalExportFileStorage.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace exporthub::app {

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void HandleStopSignal(int) {
    g_stopRequested = 1;
}

} // namespace

ExportHubApp::ExportHubApp(ExportHubOptions options) : m_options(std::move(options)) {}

ExportHubApp::~ExportHubApp() {
    Shutdown();
}

bool ExportHubApp::Init() {
    m_settings = infrastructure::ConfigLoader::Load(m_options.configPath);
    if (m_options.port) {
        m_settings.port = *m_options.port;
    }
    if (m_options.storageRoot) {
        m_settings.storageRoot = *m_options.storageRoot;
    }

    std::shared_ptr<infrastructure::LocalExportFileStorage> storage;
    try {
        storage = std::make_shared<infrastructure::LocalExportFileStorage>(m_settings.storageRoot);
    } catch (const std::exception& e) {
        std::cerr << "[ExportHubApp] " << e.what() << std::endl;
        return false;
    }

    m_hub = std::make_shared<infrastructure::InMemoryPushNotificationHub>(
        static_cast<std::size_t>(m_settings.maxRetainedJobs));

    auto types = std::make_shared<application::KnownExportTypesRegistry>();
    auto providers = std::make_shared<application::ExportProviderRegistry>();
    providers->registerFactory(&infrastructure::JsonExportProvider::Create);
    providers->registerFactory(&infrastructure::CsvExportProvider::Create);
    auto gate = std::make_shared<application::ExportAuthorizationGate>();

    auto exporter = std::make_shared<application::DataExporter>(types, providers, storage);

    application::ExportJobSettings jobSettings;
    jobSettings.workerCount = m_settings.workerCount;
    jobSettings.maxRetainedJobs = static_cast<std::size_t>(m_settings.maxRetainedJobs);
    jobSettings.downloadRoute = m_settings.downloadRoute;

    m_orchestrator = std::make_shared<application::ExportJobOrchestrator>(
        m_hub,
        [exporter](const domain::ExportDataRequest& request, const std::string& outputBaseName,
                   const application::ExportProgressCallback& progress, const application::CancellationToken& token) {
            return exporter->exportData(request, outputBaseName, progress, token);
        },
        jobSettings);

    m_service = std::make_shared<application::ExportService>(types, providers, gate, m_orchestrator, storage);
    RegisterDemoTypes(*m_service, static_cast<std::size_t>(m_settings.defaultPageSize));

    if (!m_orchestrator->start()) {
        return false;
    }

    m_server = std::make_unique<httplib::Server>();
    m_controller = std::make_unique<infrastructure::HttpExportController>(m_service);
    m_controller->registerRoutes(*m_server);

    if (!m_server->bind_to_port(m_settings.host, m_settings.port)) {
        std::cerr << "[ExportHubApp] Cannot bind " << m_settings.host << ":" << m_settings.port << std::endl;
        return false;
    }
    return true;
}

int ExportHubApp::Run() {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    std::atomic<bool> serving{true};
    std::thread watcher([this, &serving] {
        while (serving.load() && !g_stopRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        if (g_stopRequested) {
            std::cout << "[ExportHubApp] Stop signal received" << std::endl;
            m_server->stop();
        }
    });

    std::cout << "[ExportHubApp] ExportHub " << Version << " listening on http://" << m_settings.host << ":"
              << m_settings.port << "/api/export/" << std::endl;
    bool listened = m_server->listen_after_bind();

    serving.store(false);
    watcher.join();

    Shutdown();
    return listened || g_stopRequested ? 0 : 1;
}

void ExportHubApp::Shutdown() {
    if (m_server) {
        m_server->stop();
    }
    if (m_orchestrator) {
        m_orchestrator->stop();
    }
}

} // namespace exporthub::app
