/**
 * @file ExportProviderRegistry.hpp
 * @brief Discovery and selection of export providers.
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>
#include "domain/ExportProvider.hpp"

namespace exporthub::application {

class ExportProviderRegistry {
public:
    void registerFactory(domain::ExportProviderFactory factory);

    /** @brief Builds every factory once with a default request and reports what it builds. */
    std::vector<domain::ExportProviderInfo> describeProviders() const;

    /**
     * @brief Creates the provider named by request.providerName, or the first registered
     * one when the name is empty.
     * @throws UnknownExportProviderError when no factory matches.
     */
    std::unique_ptr<domain::ExportProvider> create(const domain::ExportDataRequest& request) const;

private:
    std::vector<domain::ExportProviderFactory> snapshot() const;

    std::vector<domain::ExportProviderFactory> m_factories;
    mutable std::mutex m_mutex;
};

} // namespace exporthub::application
