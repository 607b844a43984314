/**
 * @file InMemoryExportDataSource.hpp
 * @brief Data source over a shared, immutable set of records held in memory.
 */

#pragma once

#include <memory>
#include <vector>
#include "domain/ExportDataSource.hpp"
#include "domain/ExportedTypeDefinition.hpp"

namespace exporthub::infrastructure {

using RecordSet = std::shared_ptr<const std::vector<domain::ExportRecord>>;

/**
 * @class InMemoryExportDataSource
 * @brief Filters, sorts and pages a RecordSet for one query.
 *
 * Filters: objectIds matches the record's "id" (compared as text), keyword is a
 * case-insensitive substring match over string fields. sort is "<property> [asc|desc]".
 */
class InMemoryExportDataSource : public domain::PagedExportDataSource {
public:
    InMemoryExportDataSource(RecordSet records, domain::ExportDataQuery query, std::size_t pageSize);

    /** @brief Factory suitable for ExportedTypeDefinition::dataSourceFactory. */
    static domain::ExportDataSourceFactory Factory(RecordSet records, std::size_t pageSize);

protected:
    domain::DataPage fetchData(std::size_t skip, std::size_t take) override;

private:
    void ensureSelection();
    bool matches(const domain::ExportRecord& record) const;

    RecordSet m_records;
    std::vector<std::size_t> m_selection;
    bool m_selected = false;
};

} // namespace exporthub::infrastructure
