/**
 * @file DataExporter.cpp
 * @brief Implementation of DataExporter.
 */

#include "application/DataExporter.hpp"
#include "domain/ExportErrors.hpp"
#include <algorithm>
#include <iostream>

namespace exporthub::application {

DataExporter::DataExporter(std::shared_ptr<KnownExportTypesRegistry> types,
                           std::shared_ptr<ExportProviderRegistry> providers,
                           std::shared_ptr<domain::ExportFileStorage> storage)
    : m_types(std::move(types)), m_providers(std::move(providers)), m_storage(std::move(storage)) {}

domain::ExportRecord DataExporter::ProjectRecord(const domain::ExportRecord& record,
                                                 const std::vector<std::string>& properties) {
    if (properties.empty() || !record.is_object()) {
        return record;
    }
    domain::ExportRecord projected = domain::ExportRecord::object();
    for (const auto& property : properties) {
        auto it = record.find(property);
        projected[property] = (it != record.end()) ? *it : domain::ExportRecord(nullptr);
    }
    return projected;
}

ExportResult DataExporter::exportData(const domain::ExportDataRequest& request,
                                      const std::string& outputBaseName,
                                      const ExportProgressCallback& progress,
                                      const CancellationToken& token) {
    auto definition = m_types->resolve(request.exportTypeName);
    auto provider = m_providers->create(request);

    auto dataSource = definition.createDataSource(request.dataQuery);
    if (!dataSource) {
        throw domain::DataSourceError("Data source factory for " + definition.name + " returned nothing");
    }

    ExportResult result;
    result.totalCount = dataSource->totalCount();

    auto info = provider->info();
    auto writer = m_storage->openWrite(outputBaseName + "." + info.fileExtension);
    std::ostream& out = writer->stream();

    std::cout << "[DataExporter] Exporting " << definition.name << " (" << result.totalCount
              << " records) to " << writer->fileName() << " via " << info.typeName << std::endl;

    provider->begin(out);

    const auto& included = request.dataQuery.includedProperties;
    while (true) {
        if (token.isCancellationRequested()) {
            std::cout << "[DataExporter] Cancelled after " << result.processedCount << " records" << std::endl;
            result.cancelled = true;
            return result; // writer goes out of scope unpublished
        }

        auto page = dataSource->fetchPage();
        if (page.empty()) {
            break;
        }

        for (const auto& record : page) {
            provider->writeRecord(out, ProjectRecord(record, included));
        }
        if (!out) {
            throw domain::ExportError("Failed writing export output " + writer->fileName());
        }

        result.processedCount += page.size();
        result.totalCount = std::max(dataSource->totalCount(), result.processedCount);

        if (progress) {
            progress({result.processedCount, result.totalCount,
                      std::to_string(result.processedCount) + " of " + std::to_string(result.totalCount) +
                          " have been exported"});
        }
    }

    provider->end(out);

    if (token.isCancellationRequested()) {
        result.cancelled = true;
        return result;
    }

    writer->publish();
    result.fileName = writer->fileName();
    result.totalCount = result.processedCount;
    std::cout << "[DataExporter] Published " << result.fileName << " (" << result.processedCount << " records)" << std::endl;
    return result;
}

} // namespace exporthub::application
