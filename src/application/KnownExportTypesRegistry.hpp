/**
 * @file KnownExportTypesRegistry.hpp
 * @brief Registry and resolver of exportable types.
 */

#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "domain/ExportedTypeDefinition.hpp"

namespace exporthub::application {

/**
 * @class KnownExportTypesRegistry
 * @brief Name-keyed store of ExportedTypeDefinition, safe for concurrent lookups.
 */
class KnownExportTypesRegistry {
public:
    /**
     * @brief Adds or replaces a definition (last write wins, position is kept).
     * @throws InvalidExportRequestError when the name is empty or the factory is missing.
     */
    void registerType(domain::ExportedTypeDefinition definition);

    /** @brief All definitions in insertion order. */
    std::vector<domain::ExportedTypeDefinition> registeredTypes() const;

    /**
     * @brief Looks up a definition by name.
     * @throws UnknownExportTypeError when nothing is registered under @p name.
     */
    domain::ExportedTypeDefinition resolve(const std::string& name) const;

    bool isRegistered(const std::string& name) const;

private:
    std::vector<domain::ExportedTypeDefinition> m_definitions;
    std::unordered_map<std::string, std::size_t> m_index;
    mutable std::mutex m_mutex;
};

} // namespace exporthub::application
