#include "infrastructure/JsonExportProvider.hpp"

namespace exporthub::infrastructure {

JsonExportProvider::JsonExportProvider(const domain::ExportDataRequest& request) {
    const auto& config = request.providerConfig;
    if (config.is_object()) {
        auto it = config.find("indented");
        if (it != config.end() && it->is_boolean()) {
            m_indented = it->get<bool>();
        }
    }
}

std::unique_ptr<domain::ExportProvider> JsonExportProvider::Create(const domain::ExportDataRequest& request) {
    return std::make_unique<JsonExportProvider>(request);
}

domain::ExportProviderInfo JsonExportProvider::info() const {
    return {TypeName, "json", "application/json"};
}

void JsonExportProvider::begin(std::ostream& out) {
    m_written = 0;
    out << '[';
}

void JsonExportProvider::writeRecord(std::ostream& out, const domain::ExportRecord& record) {
    if (m_written > 0) {
        out << ',';
    }
    if (m_indented) {
        // Shift the nested dump one level in so the array reads as a whole document.
        std::string text = record.dump(4);
        std::string shifted;
        shifted.reserve(text.size() + 16);
        for (char c : text) {
            shifted += c;
            if (c == '\n') shifted += "    ";
        }
        out << "\n    " << shifted;
    } else {
        out << record.dump();
    }
    ++m_written;
}

void JsonExportProvider::end(std::ostream& out) {
    if (m_indented && m_written > 0) {
        out << '\n';
    }
    out << ']';
}

} // namespace exporthub::infrastructure
