/**
 * @file ExportService.hpp
 * @brief Synchronous surface of the export module (type listing, preview, run, cancel, download).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "application/ExportAuthorizationGate.hpp"
#include "application/ExportJobOrchestrator.hpp"
#include "application/ExportProviderRegistry.hpp"
#include "application/KnownExportTypesRegistry.hpp"
#include "domain/ExportFileStorage.hpp"
#include "domain/ExportNotification.hpp"
#include "domain/Principal.hpp"

namespace exporthub::application {

/**
 * @struct ExportableSearchResult
 * @brief One preview page plus the size of the whole selection.
 */
struct ExportableSearchResult {
    std::size_t totalCount = 0;
    std::vector<domain::ExportRecord> results;
};

/**
 * @struct ExportDownload
 * @brief A published file the caller is allowed to fetch, read in ranges.
 */
struct ExportDownload {
    domain::StoredFileInfo info;
    std::shared_ptr<domain::ExportFileStorage> storage;

    std::string read(std::uintmax_t offset, std::size_t length) const {
        return storage->readRange(info.name, offset, length);
    }
};

/**
 * @class ExportService
 * @brief Application service behind the export endpoints.
 *
 * Every operation checks permissions first. Per-type authorization runs before any data
 * source is built or job queued, and a denial leaves no trace besides a server log line.
 */
class ExportService {
public:
    ExportService(std::shared_ptr<KnownExportTypesRegistry> types,
                  std::shared_ptr<ExportProviderRegistry> providers,
                  std::shared_ptr<ExportAuthorizationGate> gate,
                  std::shared_ptr<ExportJobOrchestrator> orchestrator,
                  std::shared_ptr<domain::ExportFileStorage> storage);

    /** @brief Registers the type and the authorization policy that guards it. */
    void registerExportType(const domain::ExportedTypeDefinition& definition);

    std::vector<domain::ExportedTypeDefinition> knownTypes(const domain::Principal& principal) const;
    std::vector<domain::ExportProviderInfo> providers(const domain::Principal& principal) const;

    /**
     * @brief Fetches a single page of the selection.
     * @throws UnknownExportTypeError, AuthorizationDeniedError, DataSourceError.
     */
    ExportableSearchResult previewData(const domain::Principal& principal,
                                       const domain::ExportDataRequest& request) const;

    /**
     * @brief Queues an export run and returns its notification (with the job id).
     * @throws UnknownExportTypeError, AuthorizationDeniedError, UnknownExportProviderError.
     */
    domain::ExportNotification runExport(const domain::Principal& principal,
                                         const domain::ExportDataRequest& request);

    /** @brief Best-effort cancellation. Never fails for unknown or finished jobs. */
    void cancelExport(const domain::Principal& principal, const std::string& jobId);

    /**
     * @brief Opens a published export file.
     * @throws AuthorizationDeniedError, InvalidFileNameError, FileNotFoundError.
     */
    ExportDownload openDownload(const domain::Principal& principal, const std::string& fileName);

private:
    void requireAccess(const domain::Principal& principal) const;
    domain::ExportedTypeDefinition authorizeRequest(const domain::Principal& principal,
                                                    const domain::ExportDataRequest& request) const;
    static std::string GenerateNotificationId();

    std::shared_ptr<KnownExportTypesRegistry> m_types;
    std::shared_ptr<ExportProviderRegistry> m_providers;
    std::shared_ptr<ExportAuthorizationGate> m_gate;
    std::shared_ptr<ExportJobOrchestrator> m_orchestrator;
    std::shared_ptr<domain::ExportFileStorage> m_storage;
};

} // namespace exporthub::application
