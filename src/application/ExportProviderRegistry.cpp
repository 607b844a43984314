/**
 * @file ExportProviderRegistry.cpp
 * @brief Implementation of ExportProviderRegistry.
 */

#include "application/ExportProviderRegistry.hpp"
#include "domain/ExportErrors.hpp"

namespace exporthub::application {

void ExportProviderRegistry::registerFactory(domain::ExportProviderFactory factory) {
    if (!factory) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_factories.push_back(std::move(factory));
}

std::vector<domain::ExportProviderFactory> ExportProviderRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_factories;
}

std::vector<domain::ExportProviderInfo> ExportProviderRegistry::describeProviders() const {
    std::vector<domain::ExportProviderInfo> infos;
    domain::ExportDataRequest defaults;
    for (const auto& factory : snapshot()) {
        auto provider = factory(defaults);
        if (provider) {
            infos.push_back(provider->info());
        }
    }
    return infos;
}

std::unique_ptr<domain::ExportProvider> ExportProviderRegistry::create(const domain::ExportDataRequest& request) const {
    for (const auto& factory : snapshot()) {
        auto provider = factory(request);
        if (!provider) continue;
        if (request.providerName.empty() || provider->info().typeName == request.providerName) {
            return provider;
        }
    }
    throw domain::UnknownExportProviderError(request.providerName.empty() ? "<default>" : request.providerName);
}

} // namespace exporthub::application
