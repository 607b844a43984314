/**
 * @file ExportedTypeDefinition.hpp
 * @brief Metadata describing one exportable entity type.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "domain/ExportDataSource.hpp"
#include "domain/Principal.hpp"

namespace exporthub::domain {

/** @brief Creates a fresh data source for one request. */
using ExportDataSourceFactory = std::function<std::unique_ptr<ExportDataSource>(const ExportDataQuery&)>;

/** @brief Per-type authorization policy. Returns true to allow. */
using ExportAuthorizationPolicy = std::function<bool(const Principal&, const ExportDataQuery&)>;

/**
 * @struct ExportedTypeDefinition
 * @brief Name-keyed capability record of an exportable type.
 *
 * Definitions are registered at start-up and never mutated afterwards.
 */
struct ExportedTypeDefinition {
    std::string name;                                 ///< Unique key, e.g. "Catalog.Product".
    std::string group;                                ///< Display group, defaults to the name prefix.
    std::string requiredPermission;                   ///< Checked by the default policy.
    std::vector<std::string> exportablePropertyNames; ///< Advertised columns.
    ExportDataSourceFactory dataSourceFactory;
    ExportAuthorizationPolicy authorizationPolicy;    ///< Optional, replaces the default policy.

    /** @brief Builds the data source for @p query. */
    std::unique_ptr<ExportDataSource> createDataSource(const ExportDataQuery& query) const {
        return dataSourceFactory(query);
    }
};

/**
 * @brief Short display name: the segment after the last '.', or the whole name when the
 * last '.' is at position 0 or absent.
 */
inline std::string ExportTypeTitle(const std::string& typeName) {
    auto pos = typeName.rfind('.');
    if (pos != std::string::npos && pos > 0) {
        return typeName.substr(pos + 1);
    }
    return typeName;
}

/** @brief Default group: everything before the last '.', or empty. */
inline std::string ExportTypeGroup(const std::string& typeName) {
    auto pos = typeName.rfind('.');
    if (pos != std::string::npos && pos > 0) {
        return typeName.substr(0, pos);
    }
    return {};
}

} // namespace exporthub::domain
