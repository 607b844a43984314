#include "infrastructure/InMemoryExportDataSource.hpp"
#include "domain/ExportErrors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace exporthub::infrastructure {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string IdText(const domain::ExportRecord& id) {
    return id.is_string() ? id.get<std::string>() : id.dump();
}

} // namespace

InMemoryExportDataSource::InMemoryExportDataSource(RecordSet records, domain::ExportDataQuery query, std::size_t pageSize)
    : PagedExportDataSource(std::move(query), pageSize), m_records(std::move(records)) {
    if (!m_records) {
        throw domain::DataSourceError("No record set");
    }
}

domain::ExportDataSourceFactory InMemoryExportDataSource::Factory(RecordSet records, std::size_t pageSize) {
    return [records, pageSize](const domain::ExportDataQuery& query) -> std::unique_ptr<domain::ExportDataSource> {
        return std::make_unique<InMemoryExportDataSource>(records, query, pageSize);
    };
}

bool InMemoryExportDataSource::matches(const domain::ExportRecord& record) const {
    const auto& q = query();

    if (!q.objectIds.empty()) {
        auto idIt = record.find("id");
        if (idIt == record.end()) return false;
        auto id = IdText(*idIt);
        if (std::find(q.objectIds.begin(), q.objectIds.end(), id) == q.objectIds.end()) return false;
    }

    if (!q.keyword.empty()) {
        auto needle = ToLower(q.keyword);
        bool found = false;
        for (auto it = record.begin(); it != record.end() && !found; ++it) {
            if (it->is_string() && ToLower(it->get<std::string>()).find(needle) != std::string::npos) {
                found = true;
            }
        }
        if (!found) return false;
    }
    return true;
}

void InMemoryExportDataSource::ensureSelection() {
    if (m_selected) return;

    const auto& records = *m_records;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (records[i].is_object() && matches(records[i])) {
            m_selection.push_back(i);
        }
    }

    std::istringstream sortSpec(query().sort);
    std::string property, direction;
    sortSpec >> property >> direction;
    if (!property.empty()) {
        bool descending = ToLower(direction) == "desc";
        std::stable_sort(m_selection.begin(), m_selection.end(), [&](std::size_t a, std::size_t b) {
            const auto& left = records[a].contains(property) ? records[a][property] : domain::ExportRecord();
            const auto& right = records[b].contains(property) ? records[b][property] : domain::ExportRecord();
            return descending ? right < left : left < right;
        });
    }
    m_selected = true;
}

domain::DataPage InMemoryExportDataSource::fetchData(std::size_t skip, std::size_t take) {
    ensureSelection();

    domain::DataPage page;
    page.totalCount = m_selection.size();
    for (std::size_t i = skip; i < m_selection.size() && page.items.size() < take; ++i) {
        page.items.push_back((*m_records)[m_selection[i]]);
    }
    return page;
}

} // namespace exporthub::infrastructure
