/**
 * @file ExportJsonMapping.cpp
 * @brief Implementation of ExportJsonMapping.
 */

#include "infrastructure/ExportJsonMapping.hpp"
#include "domain/ExportErrors.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace exporthub::infrastructure {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::size_t ReadCount(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::size_t>();
    }
    if (it->is_number_integer() && it->get<long long>() >= 0) {
        return static_cast<std::size_t>(it->get<long long>());
    }
    throw domain::InvalidExportRequestError(std::string("'") + key + "' must be a non-negative integer");
}

std::string ReadString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw domain::InvalidExportRequestError(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

domain::ExportDataQuery ExportJsonMapping::ParseQuery(const nlohmann::json& j) {
    domain::ExportDataQuery query;
    if (j.is_null()) {
        return query;
    }
    if (!j.is_object()) {
        throw domain::InvalidExportRequestError("'dataQuery' must be an object");
    }

    query.raw = j;
    query.keyword = ReadString(j, "keyword");
    query.sort = ReadString(j, "sort");
    query.skip = ReadCount(j, "skip");
    query.take = ReadCount(j, "take");

    if (auto it = j.find("objectIds"); it != j.end() && it->is_array()) {
        for (const auto& id : *it) {
            query.objectIds.push_back(id.is_string() ? id.get<std::string>() : id.dump());
        }
    }

    // Accepts plain names or {"fullName": ...} descriptors.
    if (auto it = j.find("includedProperties"); it != j.end() && it->is_array()) {
        for (const auto& property : *it) {
            if (property.is_string()) {
                query.includedProperties.push_back(property.get<std::string>());
            } else if (property.is_object()) {
                auto name = property.value("fullName", property.value("name", std::string()));
                if (!name.empty()) {
                    query.includedProperties.push_back(name);
                }
            }
        }
    }
    return query;
}

domain::ExportDataRequest ExportJsonMapping::ParseRequest(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw domain::InvalidExportRequestError("Request body must be a JSON object");
    }

    domain::ExportDataRequest request;
    request.exportTypeName = ReadString(j, "exportTypeName");
    if (request.exportTypeName.empty()) {
        throw domain::InvalidExportRequestError("'exportTypeName' is required");
    }
    request.providerName = ReadString(j, "providerName");

    if (auto it = j.find("dataQuery"); it != j.end()) {
        request.dataQuery = ParseQuery(*it);
    }
    if (auto it = j.find("providerConfig"); it != j.end() && it->is_object()) {
        request.providerConfig = *it;
    }
    return request;
}

std::string ExportJsonMapping::ParseCancellationJobId(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw domain::InvalidExportRequestError("Request body must be a JSON object");
    }
    auto jobId = ReadString(j, "jobId");
    if (jobId.empty()) {
        throw domain::InvalidExportRequestError("'jobId' is required");
    }
    return jobId;
}

std::string ExportJsonMapping::FormatTimestamp(std::chrono::system_clock::time_point time) {
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(time));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

nlohmann::json ExportJsonMapping::ToJson(const domain::ExportNotification& notification) {
    nlohmann::json j;
    j["id"] = notification.id;
    j["jobId"] = notification.jobId;
    j["notifyType"] = notification.notifyType;
    j["creator"] = notification.creator;
    j["title"] = notification.title;
    j["description"] = notification.description;
    j["status"] = domain::JobStatusToString(notification.status);
    j["created"] = FormatTimestamp(notification.created);
    j["finished"] = notification.finished ? nlohmann::json(FormatTimestamp(*notification.finished)) : nlohmann::json(nullptr);
    j["processedCount"] = notification.processedCount;
    j["totalCount"] = notification.totalCount;
    j["errorCount"] = notification.errorCount;
    j["errors"] = notification.errors;
    j["fileName"] = notification.fileName;
    j["downloadUrl"] = notification.downloadUrl;
    return j;
}

nlohmann::json ExportJsonMapping::ToJson(const domain::ExportedTypeDefinition& definition) {
    return {
        {"typeName", definition.name},
        {"group", definition.group},
        {"requiredPermission", definition.requiredPermission},
        {"exportablePropertyNames", definition.exportablePropertyNames}
    };
}

nlohmann::json ExportJsonMapping::ToJson(const domain::ExportProviderInfo& info) {
    return {
        {"typeName", info.typeName},
        {"exportedFileExtension", info.fileExtension},
        {"contentType", info.contentType}
    };
}

nlohmann::json ExportJsonMapping::ToJson(const application::ExportableSearchResult& result) {
    return {
        {"totalCount", result.totalCount},
        {"results", result.results}
    };
}

} // namespace exporthub::infrastructure
