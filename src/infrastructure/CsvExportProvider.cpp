#include "infrastructure/CsvExportProvider.hpp"

namespace exporthub::infrastructure {

CsvExportProvider::CsvExportProvider(const domain::ExportDataRequest& request)
    : m_columns(request.dataQuery.includedProperties) {
    const auto& config = request.providerConfig;
    if (config.is_object()) {
        auto it = config.find("delimiter");
        if (it != config.end() && it->is_string()) {
            auto delimiter = it->get<std::string>();
            if (delimiter.size() == 1 && delimiter[0] != '"' && delimiter[0] != '\n' && delimiter[0] != '\r') {
                m_delimiter = delimiter[0];
            }
        }
    }
}

std::unique_ptr<domain::ExportProvider> CsvExportProvider::Create(const domain::ExportDataRequest& request) {
    return std::make_unique<CsvExportProvider>(request);
}

domain::ExportProviderInfo CsvExportProvider::info() const {
    return {TypeName, "csv", "text/csv"};
}

std::string CsvExportProvider::EscapeCell(const std::string& value, char delimiter) {
    if (value.find_first_of(std::string{delimiter, '"', '\r', '\n'}) == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string CsvExportProvider::CellText(const domain::ExportRecord& value) {
    if (value.is_null()) return {};
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

void CsvExportProvider::writeHeader(std::ostream& out) {
    for (std::size_t i = 0; i < m_columns.size(); ++i) {
        if (i > 0) out << m_delimiter;
        out << EscapeCell(m_columns[i], m_delimiter);
    }
    out << "\r\n";
    m_headerWritten = true;
}

void CsvExportProvider::begin(std::ostream&) {
    m_headerWritten = false;
}

void CsvExportProvider::writeRecord(std::ostream& out, const domain::ExportRecord& record) {
    if (!m_headerWritten) {
        if (m_columns.empty() && record.is_object()) {
            for (auto it = record.begin(); it != record.end(); ++it) {
                m_columns.push_back(it.key());
            }
        }
        writeHeader(out);
    }

    for (std::size_t i = 0; i < m_columns.size(); ++i) {
        if (i > 0) out << m_delimiter;
        if (record.is_object()) {
            auto it = record.find(m_columns[i]);
            if (it != record.end()) {
                out << EscapeCell(CellText(*it), m_delimiter);
            }
        }
    }
    out << "\r\n";
}

void CsvExportProvider::end(std::ostream& out) {
    if (!m_headerWritten && !m_columns.empty()) {
        writeHeader(out);
    }
}

} // namespace exporthub::infrastructure
