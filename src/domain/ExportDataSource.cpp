/**
 * @file ExportDataSource.cpp
 * @brief Implementation of PagedExportDataSource.
 */

#include "domain/ExportDataSource.hpp"
#include "domain/ExportErrors.hpp"
#include <algorithm>
#include <limits>

namespace exporthub::domain {

PagedExportDataSource::PagedExportDataSource(ExportDataQuery query, std::size_t pageSize)
    : m_query(std::move(query)), m_pageSize(pageSize == 0 ? 1 : pageSize) {}

std::size_t PagedExportDataSource::remainingInWindow() const {
    if (m_query.take == 0) {
        return std::numeric_limits<std::size_t>::max();
    }
    return m_query.take > m_fetched ? m_query.take - m_fetched : 0;
}

std::vector<ExportRecord> PagedExportDataSource::fetchPage() {
    if (m_exhausted) {
        return {};
    }

    std::size_t take = std::min(m_pageSize, remainingInWindow());
    if (take == 0) {
        m_exhausted = true;
        return {};
    }

    DataPage page;
    try {
        page = fetchData(m_query.skip + m_fetched, take);
    } catch (const DataSourceError&) {
        throw;
    } catch (const std::exception& e) {
        throw DataSourceError(e.what());
    }

    if (page.items.size() > take) {
        page.items.resize(take);
    }

    m_fetched += page.items.size();
    m_totalCount = page.totalCount;
    m_totalKnown = true;

    // A short page means the backend has nothing more for this window.
    if (page.items.size() < take) {
        m_exhausted = true;
    }
    return std::move(page.items);
}

std::size_t PagedExportDataSource::totalCount() {
    if (!m_totalKnown) {
        // Ask with an empty window so no record is consumed.
        DataPage counted;
        try {
            counted = fetchData(m_query.skip, 0);
        } catch (const DataSourceError&) {
            throw;
        } catch (const std::exception& e) {
            throw DataSourceError(e.what());
        }
        m_totalCount = counted.totalCount;
        m_totalKnown = true;
    }

    // The window bounds what this cursor will ever return.
    std::size_t available = m_totalCount > m_query.skip ? m_totalCount - m_query.skip : 0;
    if (m_query.take != 0) {
        available = std::min(available, m_query.take);
    }
    return available;
}

} // namespace exporthub::domain
