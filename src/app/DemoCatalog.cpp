#include "app/DemoCatalog.hpp"
#include <cstdio>
#include <iostream>
#include <vector>

namespace exporthub::app {

namespace {

std::string Padded(const char* prefix, std::size_t n, int width) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s%0*zu", prefix, width, n);
    return buffer;
}

} // namespace

infrastructure::RecordSet MakeDemoProducts(std::size_t count) {
    static const char* categories[] = {"Beverages", "Snacks", "Household", "Electronics", "Garden"};

    auto records = std::make_shared<std::vector<domain::ExportRecord>>();
    records->reserve(count);
    for (std::size_t i = 1; i <= count; ++i) {
        records->push_back(domain::ExportRecord{
            {"id", Padded("product-", i, 4)},
            {"code", Padded("SKU-", i, 5)},
            {"name", "Product " + std::to_string(i)},
            {"category", categories[(i - 1) % 5]},
            {"price", static_cast<double>(i % 97) + 0.99},
            {"inStock", i % 7 != 0}
        });
    }
    return records;
}

infrastructure::RecordSet MakeDemoOrders(std::size_t count) {
    static const char* customers[] = {"Alice Martin", "Bruno Costa", "Chen Wei", "Dana Okafor"};
    static const char* statuses[] = {"New", "Processing", "Shipped", "Completed", "Cancelled"};

    auto records = std::make_shared<std::vector<domain::ExportRecord>>();
    records->reserve(count);
    for (std::size_t i = 1; i <= count; ++i) {
        records->push_back(domain::ExportRecord{
            {"id", Padded("order-", i, 4)},
            {"number", Padded("CO", i, 6)},
            {"customerName", customers[(i - 1) % 4]},
            {"status", statuses[(i - 1) % 5]},
            {"itemsCount", static_cast<int>(i % 9) + 1},
            {"total", static_cast<double>((i * 37) % 500) + 0.5}
        });
    }
    return records;
}

void RegisterDemoTypes(application::ExportService& service, std::size_t pageSize) {
    domain::ExportedTypeDefinition products;
    products.name = "Catalog.Product";
    products.requiredPermission = "catalog:read";
    products.exportablePropertyNames = {"id", "code", "name", "category", "price", "inStock"};
    products.dataSourceFactory = infrastructure::InMemoryExportDataSource::Factory(MakeDemoProducts(250), pageSize);
    service.registerExportType(products);

    domain::ExportedTypeDefinition orders;
    orders.name = "Orders.CustomerOrder";
    orders.requiredPermission = "order:read";
    orders.exportablePropertyNames = {"id", "number", "customerName", "status", "itemsCount", "total"};
    orders.dataSourceFactory = infrastructure::InMemoryExportDataSource::Factory(MakeDemoOrders(120), pageSize);
    service.registerExportType(orders);

    std::cout << "[DemoCatalog] Registered Catalog.Product and Orders.CustomerOrder" << std::endl;
}

} // namespace exporthub::app
