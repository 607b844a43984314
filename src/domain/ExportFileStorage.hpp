/**
 * @file ExportFileStorage.hpp
 * @brief Interface of the durable store for produced export files.
 */

#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace exporthub::domain {

/**
 * @struct StoredFileInfo
 * @brief Metadata of a published file.
 */
struct StoredFileInfo {
    std::string name;
    std::uintmax_t size = 0;
    std::string contentType;
};

/**
 * @class ExportFileWriter
 * @brief Pending output of one job.
 *
 * Bytes go to a location invisible to readers until publish() succeeds. Destroying the
 * writer without publishing discards everything written.
 */
class ExportFileWriter {
public:
    virtual ~ExportFileWriter() = default;

    virtual std::ostream& stream() = 0;

    /**
     * @brief Makes the file visible under its final name.
     * @throws ExportError when the data could not be flushed or the name is taken.
     */
    virtual void publish() = 0;

    virtual const std::string& fileName() const = 0;
};

/**
 * @class ExportFileStorage
 * @brief Write-once, read-many blob store keyed by file name.
 *
 * Every operation validates the name first and throws InvalidFileNameError for names
 * that could escape the storage root.
 */
class ExportFileStorage {
public:
    virtual ~ExportFileStorage() = default;

    virtual std::unique_ptr<ExportFileWriter> openWrite(const std::string& fileName) = 0;

    /** @throws FileNotFoundError when no published file has this name. */
    virtual std::unique_ptr<std::istream> openRead(const std::string& fileName) = 0;

    /** @brief Reads at most @p length bytes starting at @p offset. */
    virtual std::string readRange(const std::string& fileName, std::uintmax_t offset, std::size_t length) = 0;

    virtual std::optional<StoredFileInfo> stat(const std::string& fileName) = 0;

    /** @brief Deletes a published file. Returns false when it did not exist. */
    virtual bool remove(const std::string& fileName) = 0;
};

} // namespace exporthub::domain
