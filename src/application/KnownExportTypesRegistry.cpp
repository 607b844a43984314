/**
 * @file KnownExportTypesRegistry.cpp
 * @brief Implementation of KnownExportTypesRegistry.
 */

#include "application/KnownExportTypesRegistry.hpp"
#include "domain/ExportErrors.hpp"
#include <iostream>

namespace exporthub::application {

void KnownExportTypesRegistry::registerType(domain::ExportedTypeDefinition definition) {
    if (definition.name.empty()) {
        throw domain::InvalidExportRequestError("Export type name must not be empty");
    }
    if (!definition.dataSourceFactory) {
        throw domain::InvalidExportRequestError("Export type " + definition.name + " has no data source factory");
    }
    if (definition.group.empty()) {
        definition.group = domain::ExportTypeGroup(definition.name);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(definition.name);
    if (it != m_index.end()) {
        std::cout << "[KnownExportTypesRegistry] Replacing export type: " << definition.name << std::endl;
        m_definitions[it->second] = std::move(definition);
        return;
    }

    std::cout << "[KnownExportTypesRegistry] Registered export type: " << definition.name << std::endl;
    m_index.emplace(definition.name, m_definitions.size());
    m_definitions.push_back(std::move(definition));
}

std::vector<domain::ExportedTypeDefinition> KnownExportTypesRegistry::registeredTypes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_definitions;
}

domain::ExportedTypeDefinition KnownExportTypesRegistry::resolve(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        throw domain::UnknownExportTypeError(name);
    }
    return m_definitions[it->second];
}

bool KnownExportTypesRegistry::isRegistered(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.count(name) > 0;
}

} // namespace exporthub::application
