/**
 * @file ExportDataSource.hpp
 * @brief Paginated cursor abstraction over the backing data of one export type.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <vector>
#include "domain/ExportDataRequest.hpp"

namespace exporthub::domain {

/**
 * @class ExportDataSource
 * @brief Stateful cursor over the records selected by one query.
 *
 * Instances are created per request by the type's factory and are owned by that request
 * or job only. Calls on one instance must not be made concurrently.
 */
class ExportDataSource {
public:
    virtual ~ExportDataSource() = default;

    /**
     * @brief Advances the cursor and returns the next page.
     * @return The page, empty once the selection is drained.
     * @throws DataSourceError when the underlying query fails.
     */
    virtual std::vector<ExportRecord> fetchPage() = 0;

    /**
     * @brief Best-known number of records in the selection.
     * May be an estimate before the first page has been fetched.
     */
    virtual std::size_t totalCount() = 0;
};

/**
 * @struct DataPage
 * @brief Result of one backend query issued by a PagedExportDataSource.
 */
struct DataPage {
    std::vector<ExportRecord> items;
    std::size_t totalCount = 0;
};

/**
 * @class PagedExportDataSource
 * @brief Implements the paging state machine over a skip/take backend query.
 *
 * The selection window is [query.skip, query.skip + query.take) when take is set.
 * Subclasses only implement fetchData().
 */
class PagedExportDataSource : public ExportDataSource {
public:
    PagedExportDataSource(ExportDataQuery query, std::size_t pageSize);

    std::vector<ExportRecord> fetchPage() override;
    std::size_t totalCount() override;

    const ExportDataQuery& query() const { return m_query; }
    std::size_t pageSize() const { return m_pageSize; }
    std::size_t fetchedCount() const { return m_fetched; }

protected:
    /** @brief Issues one backend query. Any exception is reported as DataSourceError. */
    virtual DataPage fetchData(std::size_t skip, std::size_t take) = 0;

private:
    std::size_t remainingInWindow() const;

    ExportDataQuery m_query;
    std::size_t m_pageSize;
    std::size_t m_fetched = 0;
    std::size_t m_totalCount = 0;
    bool m_totalKnown = false;
    bool m_exhausted = false;
};

} // namespace exporthub::domain
