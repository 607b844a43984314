/**
 * @file JsonExportProvider.hpp
 * @brief Writes the exported records as one JSON array.
 */

#pragma once

#include <memory>
#include "domain/ExportProvider.hpp"

namespace exporthub::infrastructure {

/**
 * @class JsonExportProvider
 * @brief Streams records as a JSON array, optionally pretty-printed
 * (providerConfig "indented": true).
 */
class JsonExportProvider : public domain::ExportProvider {
public:
    static constexpr const char* TypeName = "JsonExportProvider";

    explicit JsonExportProvider(const domain::ExportDataRequest& request);

    static std::unique_ptr<domain::ExportProvider> Create(const domain::ExportDataRequest& request);

    domain::ExportProviderInfo info() const override;

    void begin(std::ostream& out) override;
    void writeRecord(std::ostream& out, const domain::ExportRecord& record) override;
    void end(std::ostream& out) override;

private:
    bool m_indented = false;
    std::size_t m_written = 0;
};

} // namespace exporthub::infrastructure
