/**
 * @file LocalExportFileStorage.cpp
 * @brief Implementation of LocalExportFileStorage.
 */

#include "infrastructure/LocalExportFileStorage.hpp"
#include "domain/ExportErrors.hpp"
#include "infrastructure/MimeTypeResolver.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>

namespace exporthub::infrastructure {

namespace fs = std::filesystem;

/**
 * @class LocalExportFileWriter
 * @brief Writes into the staging directory; publish() renames into the root.
 */
class LocalExportFileWriter : public domain::ExportFileWriter {
public:
    LocalExportFileWriter(LocalExportFileStorage& storage, std::string fileName, fs::path tempPath)
        : m_storage(storage), m_fileName(std::move(fileName)), m_tempPath(std::move(tempPath)) {
        m_out.open(m_tempPath, std::ios::binary | std::ios::trunc);
        if (!m_out.is_open()) {
            throw domain::ExportError("Failed to open temp file: " + m_tempPath.string());
        }
    }

    ~LocalExportFileWriter() override {
        if (m_published) return;
        if (m_out.is_open()) {
            m_out.close();
        }
        std::error_code ec;
        fs::remove(m_tempPath, ec);
        if (ec) {
            std::cerr << "[LocalExportFileStorage] Could not discard " << m_tempPath << ": " << ec.message() << std::endl;
        } else {
            std::cout << "[LocalExportFileStorage] Discarded unpublished " << m_fileName << std::endl;
        }
    }

    std::ostream& stream() override { return m_out; }

    void publish() override {
        if (m_published) {
            throw domain::ExportError("File already published: " + m_fileName);
        }
        m_out.flush();
        if (m_out.fail()) {
            throw domain::ExportError("Write failed during output: " + m_tempPath.string());
        }
        m_out.close();

        m_storage.commit(m_tempPath, m_fileName);
        m_published = true;
    }

    const std::string& fileName() const override { return m_fileName; }

private:
    LocalExportFileStorage& m_storage;
    std::string m_fileName;
    fs::path m_tempPath;
    std::ofstream m_out;
    bool m_published = false;
};

LocalExportFileStorage::LocalExportFileStorage(fs::path root) : m_root(std::move(root)) {
    try {
        fs::create_directories(stagingDir());
    } catch (const fs::filesystem_error& e) {
        throw domain::ExportError(std::string("Cannot create storage root: ") + e.what());
    }
    std::cout << "[LocalExportFileStorage] Storing exports in " << m_root << std::endl;
}

void LocalExportFileStorage::ValidateFileName(const std::string& fileName) {
    if (fileName.empty() || fileName == "." || fileName == ".." || fileName.front() == '.') {
        throw domain::InvalidFileNameError(fileName);
    }
    if (fileName.find("..") != std::string::npos) {
        throw domain::InvalidFileNameError(fileName);
    }
    for (unsigned char c : fileName) {
        if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f) {
            throw domain::InvalidFileNameError(fileName);
        }
    }
}

std::unique_ptr<domain::ExportFileWriter> LocalExportFileStorage::openWrite(const std::string& fileName) {
    ValidateFileName(fileName);

    static std::atomic<unsigned long long> sequence{0};
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = stagingDir() / fileName;
    tempPath += "." + std::to_string(timestamp) + "-" + std::to_string(++sequence) + ".tmp";

    std::error_code ec;
    fs::create_directories(stagingDir(), ec);
    if (ec) {
        throw domain::ExportError("Cannot create staging directory: " + ec.message());
    }

    return std::make_unique<LocalExportFileWriter>(*this, fileName, tempPath);
}

void LocalExportFileStorage::commit(const fs::path& tempPath, const std::string& fileName) {
    fs::path finalPath = m_root / fileName;

    std::lock_guard<std::mutex> lock(m_publishMutex);
    if (fs::exists(finalPath)) {
        throw domain::ExportError("File already exists: " + fileName);
    }
    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[LocalExportFileStorage] Rename failed: " << e.what() << std::endl;
        throw domain::ExportError("Failed to publish " + fileName);
    }
    std::cout << "[LocalExportFileStorage] Published " << fileName << std::endl;
}

std::unique_ptr<std::istream> LocalExportFileStorage::openRead(const std::string& fileName) {
    ValidateFileName(fileName);

    fs::path path = m_root / fileName;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw domain::FileNotFoundError(fileName);
    }

    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!in->is_open()) {
        throw domain::FileNotFoundError(fileName);
    }
    return in;
}

std::string LocalExportFileStorage::readRange(const std::string& fileName, std::uintmax_t offset, std::size_t length) {
    auto in = openRead(fileName);

    std::string buffer;
    in->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!*in) {
        return buffer;
    }
    buffer.resize(length);
    in->read(&buffer[0], static_cast<std::streamsize>(length));
    buffer.resize(static_cast<std::size_t>(in->gcount()));
    return buffer;
}

std::optional<domain::StoredFileInfo> LocalExportFileStorage::stat(const std::string& fileName) {
    ValidateFileName(fileName);

    fs::path path = m_root / fileName;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return domain::StoredFileInfo{fileName, size, MimeTypeResolver::FromFileName(fileName)};
}

bool LocalExportFileStorage::remove(const std::string& fileName) {
    ValidateFileName(fileName);

    std::error_code ec;
    bool removed = fs::remove(m_root / fileName, ec);
    if (ec) {
        std::cerr << "[LocalExportFileStorage] Remove failed for " << fileName << ": " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

} // namespace exporthub::infrastructure
