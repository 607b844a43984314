/**
 * @file ExportService.cpp
 * @brief Implementation of ExportService.
 */

#include "application/ExportService.hpp"
#include "domain/ExportErrors.hpp"
#include <chrono>
#include <iostream>
#include <random>

namespace exporthub::application {

ExportService::ExportService(std::shared_ptr<KnownExportTypesRegistry> types,
                             std::shared_ptr<ExportProviderRegistry> providers,
                             std::shared_ptr<ExportAuthorizationGate> gate,
                             std::shared_ptr<ExportJobOrchestrator> orchestrator,
                             std::shared_ptr<domain::ExportFileStorage> storage)
    : m_types(std::move(types)),
      m_providers(std::move(providers)),
      m_gate(std::move(gate)),
      m_orchestrator(std::move(orchestrator)),
      m_storage(std::move(storage)) {}

std::string ExportService::GenerateNotificationId() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);
    std::string id;
    id.reserve(32);
    for (int i = 0; i < 32; ++i) {
        id += hex[digit(engine)];
    }
    return id;
}

void ExportService::registerExportType(const domain::ExportedTypeDefinition& definition) {
    m_types->registerType(definition);
    m_gate->registerPolicyFor(definition);
}

void ExportService::requireAccess(const domain::Principal& principal) const {
    if (!ExportAuthorizationGate::HasPermission(principal, domain::permissions::Access)) {
        throw domain::AuthorizationDeniedError();
    }
}

domain::ExportedTypeDefinition ExportService::authorizeRequest(const domain::Principal& principal,
                                                               const domain::ExportDataRequest& request) const {
    requireAccess(principal);

    // Pure lookup: an unknown name is reported as such before the policy is consulted.
    auto definition = m_types->resolve(request.exportTypeName);

    auto result = m_gate->authorize(principal, request.dataQuery, PolicyNameFor(request.exportTypeName));
    if (result != AuthorizationResult::Allow) {
        throw domain::AuthorizationDeniedError();
    }
    return definition;
}

std::vector<domain::ExportedTypeDefinition> ExportService::knownTypes(const domain::Principal& principal) const {
    requireAccess(principal);
    return m_types->registeredTypes();
}

std::vector<domain::ExportProviderInfo> ExportService::providers(const domain::Principal& principal) const {
    requireAccess(principal);
    return m_providers->describeProviders();
}

ExportableSearchResult ExportService::previewData(const domain::Principal& principal,
                                                  const domain::ExportDataRequest& request) const {
    auto definition = authorizeRequest(principal, request);

    auto dataSource = definition.createDataSource(request.dataQuery);
    if (!dataSource) {
        throw domain::DataSourceError("Data source factory for " + definition.name + " returned nothing");
    }

    ExportableSearchResult result;
    result.results = dataSource->fetchPage();
    result.totalCount = dataSource->totalCount();
    return result;
}

domain::ExportNotification ExportService::runExport(const domain::Principal& principal,
                                                    const domain::ExportDataRequest& request) {
    authorizeRequest(principal, request);

    // Fail fast on a bad provider name instead of failing inside the job.
    m_providers->create(request);

    domain::ExportNotification notification;
    notification.id = GenerateNotificationId();
    notification.notifyType = "PlatformExportPushNotification";
    notification.creator = principal.userName;
    notification.title = domain::ExportTypeTitle(request.exportTypeName) + " export";
    notification.description = "Starting export task...";
    notification.created = std::chrono::system_clock::now();

    notification.jobId = m_orchestrator->enqueue(request, notification);
    notification.status = domain::ExportJobStatus::Queued;
    return notification;
}

void ExportService::cancelExport(const domain::Principal& principal, const std::string& jobId) {
    requireAccess(principal);
    m_orchestrator->cancel(jobId);
}

ExportDownload ExportService::openDownload(const domain::Principal& principal, const std::string& fileName) {
    if (!ExportAuthorizationGate::HasAnyPermission(principal, {domain::permissions::PlatformExport,
                                                               domain::permissions::Download})) {
        throw domain::AuthorizationDeniedError();
    }

    auto info = m_storage->stat(fileName);
    if (!info) {
        throw domain::FileNotFoundError(fileName);
    }

    ExportDownload download;
    download.info = *info;
    download.storage = m_storage;
    return download;
}

} // namespace exporthub::application
