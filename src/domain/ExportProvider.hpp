/**
 * @file ExportProvider.hpp
 * @brief Interface of the pluggable writers that turn records into file bytes.
 */

#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include "domain/ExportDataRequest.hpp"

namespace exporthub::domain {

/**
 * @struct ExportProviderInfo
 * @brief Identity and capabilities a provider reports about itself.
 */
struct ExportProviderInfo {
    std::string typeName;      ///< Selection key, e.g. "JsonExportProvider".
    std::string fileExtension; ///< Without the dot, e.g. "json".
    std::string contentType;
};

/**
 * @class ExportProvider
 * @brief Streams records of one export run into an output stream.
 *
 * Call order per run: begin(), writeRecord() for every record, end().
 */
class ExportProvider {
public:
    virtual ~ExportProvider() = default;

    virtual ExportProviderInfo info() const = 0;

    virtual void begin(std::ostream& out) = 0;
    virtual void writeRecord(std::ostream& out, const ExportRecord& record) = 0;
    virtual void end(std::ostream& out) = 0;
};

/** @brief Creates a provider configured for one request. */
using ExportProviderFactory = std::function<std::unique_ptr<ExportProvider>(const ExportDataRequest&)>;

} // namespace exporthub::domain
