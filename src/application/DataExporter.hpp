/**
 * @file DataExporter.hpp
 * @brief Executes one export run: data source -> provider -> file storage.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include "application/CancellationToken.hpp"
#include "application/ExportProviderRegistry.hpp"
#include "application/KnownExportTypesRegistry.hpp"
#include "domain/ExportFileStorage.hpp"

namespace exporthub::application {

/**
 * @struct ExportProgress
 * @brief Snapshot reported after each exported page.
 */
struct ExportProgress {
    std::size_t processedCount = 0;
    std::size_t totalCount = 0;
    std::string description;
};

using ExportProgressCallback = std::function<void(const ExportProgress&)>;

/**
 * @struct ExportResult
 * @brief Outcome of a run that did not fail. Cancellation is an outcome, not an error.
 */
struct ExportResult {
    bool cancelled = false;
    std::string fileName; ///< Published file, empty when cancelled.
    std::size_t processedCount = 0;
    std::size_t totalCount = 0;
};

/**
 * @class DataExporter
 * @brief The body of an export job.
 *
 * Drains the type's data source page by page into the selected provider, checking the
 * cancellation token at every page boundary. Output is written through a storage writer
 * and only published once the provider has finished; on cancellation or error the
 * writer is dropped and nothing becomes visible.
 */
class DataExporter {
public:
    DataExporter(std::shared_ptr<KnownExportTypesRegistry> types,
                 std::shared_ptr<ExportProviderRegistry> providers,
                 std::shared_ptr<domain::ExportFileStorage> storage);

    /**
     * @param request What to export.
     * @param outputBaseName File name without extension; the provider adds its own.
     * @param progress Called after each page, may be empty.
     * @param token Polled between pages.
     * @throws ExportError (DataSourceError, UnknownExportTypeError, ...) on failure.
     */
    ExportResult exportData(const domain::ExportDataRequest& request,
                            const std::string& outputBaseName,
                            const ExportProgressCallback& progress,
                            const CancellationToken& token);

    /** @brief Keeps only @p properties of an object record (missing ones become null). */
    static domain::ExportRecord ProjectRecord(const domain::ExportRecord& record,
                                              const std::vector<std::string>& properties);

private:
    std::shared_ptr<KnownExportTypesRegistry> m_types;
    std::shared_ptr<ExportProviderRegistry> m_providers;
    std::shared_ptr<domain::ExportFileStorage> m_storage;
};

} // namespace exporthub::application
