/**
 * @file ExportDataRequest.hpp
 * @brief Query and request value objects describing what to export and how.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace exporthub::domain {

/** @brief A single exported entity. Records are schemaless JSON objects. */
using ExportRecord = nlohmann::json;

/**
 * @struct ExportDataQuery
 * @brief Selection criteria for one export type.
 *
 * The common criteria are lifted into typed fields; the received JSON object is kept in
 * @c raw so that type-specific data sources can read their own keys.
 */
struct ExportDataQuery {
    std::string keyword;                          ///< Free-text filter.
    std::vector<std::string> objectIds;           ///< Restrict to these record ids.
    std::size_t skip = 0;                         ///< Records to skip before the window.
    std::size_t take = 0;                         ///< Window size, 0 means unlimited.
    std::vector<std::string> includedProperties;  ///< Projection, empty means all.
    std::string sort;                             ///< Sort expression, source specific.
    nlohmann::json raw = nlohmann::json::object();
};

/**
 * @struct ExportDataRequest
 * @brief A preview or run request as received from the client.
 */
struct ExportDataRequest {
    std::string exportTypeName;
    ExportDataQuery dataQuery;
    std::string providerName;                     ///< Empty selects the default provider.
    nlohmann::json providerConfig = nlohmann::json::object();
};

} // namespace exporthub::domain
