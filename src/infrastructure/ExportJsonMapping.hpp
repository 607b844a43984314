/**
 * @file ExportJsonMapping.hpp
 * @brief Conversions between the export value types and their JSON wire form.
 *
 * Field names are camelCase, timestamps are ISO 8601 UTC strings.
 */

#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "application/ExportService.hpp"
#include "domain/ExportDataRequest.hpp"
#include "domain/ExportNotification.hpp"
#include "domain/ExportProvider.hpp"
#include "domain/ExportedTypeDefinition.hpp"

namespace exporthub::infrastructure {

class ExportJsonMapping {
public:
    /**
     * @brief Reads {exportTypeName, dataQuery, providerName, providerConfig}.
     * @throws InvalidExportRequestError when the shape is wrong or exportTypeName is missing.
     */
    static domain::ExportDataRequest ParseRequest(const nlohmann::json& j);

    /** @brief Reads a data query object. Unknown keys are kept in ExportDataQuery::raw. */
    static domain::ExportDataQuery ParseQuery(const nlohmann::json& j);

    /** @brief Reads {jobId} from a cancellation request. */
    static std::string ParseCancellationJobId(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::ExportNotification& notification);
    static nlohmann::json ToJson(const domain::ExportedTypeDefinition& definition);
    static nlohmann::json ToJson(const domain::ExportProviderInfo& info);
    static nlohmann::json ToJson(const application::ExportableSearchResult& result);

    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);
};

} // namespace exporthub::infrastructure
