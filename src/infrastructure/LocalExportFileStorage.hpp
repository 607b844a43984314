/**
 * @file LocalExportFileStorage.hpp
 * @brief Directory-backed export file storage with atomic publication.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "domain/ExportFileStorage.hpp"

namespace exporthub::infrastructure {

/**
 * @class LocalExportFileStorage
 * @brief Stores export files as plain files under one root directory.
 *
 * Pending output lives in the hidden ".pending" directory under the root and is moved
 * into place by rename on publish, so readers never observe a partial file.
 */
class LocalExportFileStorage : public domain::ExportFileStorage {
public:
    explicit LocalExportFileStorage(std::filesystem::path root);

    std::unique_ptr<domain::ExportFileWriter> openWrite(const std::string& fileName) override;
    std::unique_ptr<std::istream> openRead(const std::string& fileName) override;
    std::string readRange(const std::string& fileName, std::uintmax_t offset, std::size_t length) override;
    std::optional<domain::StoredFileInfo> stat(const std::string& fileName) override;
    bool remove(const std::string& fileName) override;

    const std::filesystem::path& root() const { return m_root; }
    std::filesystem::path stagingDir() const { return m_root / ".pending"; }

    /**
     * @brief Rejects names that are empty, "." or "..", contain '/', '\\', "..",
     * NUL or control characters, or start with '.'.
     * @throws InvalidFileNameError.
     */
    static void ValidateFileName(const std::string& fileName);

private:
    friend class LocalExportFileWriter;

    /** @brief Renames a staged file to its final name. Fails if the name is taken. */
    void commit(const std::filesystem::path& tempPath, const std::string& fileName);

    std::filesystem::path m_root;
    std::mutex m_publishMutex;
};

} // namespace exporthub::infrastructure
