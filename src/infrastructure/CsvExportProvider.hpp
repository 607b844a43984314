/**
 * @file CsvExportProvider.hpp
 * @brief Writes the exported records as RFC 4180 CSV.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/ExportProvider.hpp"

namespace exporthub::infrastructure {

/**
 * @class CsvExportProvider
 * @brief One header row, then one row per record.
 *
 * Columns come from the query's includedProperties, or else from the keys of the first
 * record. providerConfig "delimiter" overrides the comma.
 */
class CsvExportProvider : public domain::ExportProvider {
public:
    static constexpr const char* TypeName = "CsvExportProvider";

    explicit CsvExportProvider(const domain::ExportDataRequest& request);

    static std::unique_ptr<domain::ExportProvider> Create(const domain::ExportDataRequest& request);

    domain::ExportProviderInfo info() const override;

    void begin(std::ostream& out) override;
    void writeRecord(std::ostream& out, const domain::ExportRecord& record) override;
    void end(std::ostream& out) override;

    /** @brief Quotes a cell when it holds the delimiter, a quote or a line break. */
    static std::string EscapeCell(const std::string& value, char delimiter);

private:
    void writeHeader(std::ostream& out);
    static std::string CellText(const domain::ExportRecord& value);

    std::vector<std::string> m_columns;
    char m_delimiter = ',';
    bool m_headerWritten = false;
};

} // namespace exporthub::infrastructure
