/**
 * @file DemoCatalog.hpp
 * @brief Sample export types served out of the box (products and customer orders).
 */

#pragma once

#include <cstddef>
#include "application/ExportService.hpp"
#include "infrastructure/InMemoryExportDataSource.hpp"

namespace exporthub::app {

infrastructure::RecordSet MakeDemoProducts(std::size_t count);
infrastructure::RecordSet MakeDemoOrders(std::size_t count);

/**
 * @brief Registers "Catalog.Product" (250 records, permission "catalog:read") and
 * "Orders.CustomerOrder" (120 records, permission "order:read").
 */
void RegisterDemoTypes(application::ExportService& service, std::size_t pageSize);

} // namespace exporthub::app
