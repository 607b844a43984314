/**
 * @file ExportErrors.hpp
 * @brief Error taxonomy of the export workflow.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace exporthub::domain {

/**
 * @class ExportError
 * @brief Base class for every error raised by the export workflow.
 */
class ExportError : public std::runtime_error {
public:
    explicit ExportError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief The requested export type name has no registered definition (client error). */
class UnknownExportTypeError : public ExportError {
public:
    explicit UnknownExportTypeError(const std::string& typeName)
        : ExportError("Unknown export type: " + typeName), m_typeName(typeName) {}

    const std::string& typeName() const { return m_typeName; }

private:
    std::string m_typeName;
};

/**
 * @brief The caller is not allowed to perform the request.
 * Carries no detail about the policy or the reason on purpose.
 */
class AuthorizationDeniedError : public ExportError {
public:
    AuthorizationDeniedError() : ExportError("Unauthorized") {}
};

/** @brief A query against a type's backing data failed. */
class DataSourceError : public ExportError {
public:
    explicit DataSourceError(const std::string& message) : ExportError(message) {}
};

/** @brief The requested file is not present in storage. */
class FileNotFoundError : public ExportError {
public:
    explicit FileNotFoundError(const std::string& fileName)
        : ExportError("File not found: " + fileName) {}
};

/** @brief A file name would escape the storage root or is otherwise unusable. */
class InvalidFileNameError : public ExportError {
public:
    explicit InvalidFileNameError(const std::string& fileName)
        : ExportError("Invalid file name: " + fileName) {}
};

/** @brief No export provider matches the requested provider name. */
class UnknownExportProviderError : public ExportError {
public:
    explicit UnknownExportProviderError(const std::string& providerName)
        : ExportError("Unknown export provider: " + providerName) {}
};

/** @brief The request itself is malformed (missing type name, bad JSON shape, ...). */
class InvalidExportRequestError : public ExportError {
public:
    explicit InvalidExportRequestError(const std::string& message) : ExportError(message) {}
};

} // namespace exporthub::domain
