#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>
#include <vector>
#include "domain/ExportErrors.hpp"
#include "infrastructure/LocalExportFileStorage.hpp"
#include "infrastructure/MimeTypeResolver.hpp"

using namespace exporthub;
using infrastructure::LocalExportFileStorage;
using infrastructure::MimeTypeResolver;

namespace fs = std::filesystem;

namespace {

fs::path MakeTestRoot(const std::string& name) {
    return fs::temp_directory_path() /
           ("exporthub_storage_" + name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
}

std::string ReadAll(std::istream& in) {
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool Rejects(const std::string& name) {
    try {
        LocalExportFileStorage::ValidateFileName(name);
    } catch (const domain::InvalidFileNameError&) {
        return true;
    }
    return false;
}

void TestFileNameValidation() {
    std::cout << "[Test] File name validation..." << std::endl;
    assert(Rejects(""));
    assert(Rejects("."));
    assert(Rejects(".."));
    assert(Rejects("../secret.json"));
    assert(Rejects("a/b.json"));
    assert(Rejects("a\\b.json"));
    assert(Rejects("a..b.json"));
    assert(Rejects(".pending"));
    assert(Rejects(std::string("bad\0name", 8)));
    assert(Rejects("line\nbreak.csv"));

    assert(!Rejects("Product_1718-1.json"));
    assert(!Rejects("report v2.csv"));
    std::cout << "[PASS] File name validation." << std::endl;
}

void TestPublishIsAtomicAndWriteOnce() {
    std::cout << "[Test] Partial output stays invisible until publish..." << std::endl;
    auto root = MakeTestRoot("publish");
    {
        LocalExportFileStorage storage(root);

        auto writer = storage.openWrite("orders.csv");
        writer->stream() << "id,number\r\n";
        writer->stream() << "1,CO000001\r\n";
        writer->stream().flush();

        assert(!storage.stat("orders.csv"));
        bool missing = false;
        try {
            storage.openRead("orders.csv");
        } catch (const domain::FileNotFoundError&) {
            missing = true;
        }
        assert(missing);

        writer->publish();
        auto info = storage.stat("orders.csv");
        assert(info);
        assert(info->name == "orders.csv");
        assert(info->contentType == "text/csv");
        assert(info->size == std::string("id,number\r\n1,CO000001\r\n").size());

        auto in = storage.openRead("orders.csv");
        assert(ReadAll(*in) == "id,number\r\n1,CO000001\r\n");

        // A second writer for the same name must not replace the published file.
        auto second = storage.openWrite("orders.csv");
        second->stream() << "replaced";
        bool rejected = false;
        try {
            second->publish();
        } catch (const domain::ExportError&) {
            rejected = true;
        }
        assert(rejected);
        second.reset();

        auto again = storage.openRead("orders.csv");
        assert(ReadAll(*again) == "id,number\r\n1,CO000001\r\n");
        assert(fs::is_empty(storage.stagingDir()));
    }
    fs::remove_all(root);
    std::cout << "[PASS] Atomic publish." << std::endl;
}

void TestAbandonedWriterLeavesNothing() {
    std::cout << "[Test] Dropping an unpublished writer discards it..." << std::endl;
    auto root = MakeTestRoot("abandon");
    {
        LocalExportFileStorage storage(root);
        {
            auto writer = storage.openWrite("draft.json");
            writer->stream() << "[{\"id\":1}";
        }
        assert(!storage.stat("draft.json"));
        assert(fs::is_empty(storage.stagingDir()));
    }
    fs::remove_all(root);
    std::cout << "[PASS] Abandoned writer." << std::endl;
}

void TestRangeReadsAndRemove() {
    std::cout << "[Test] Range reads and removal..." << std::endl;
    auto root = MakeTestRoot("range");
    {
        LocalExportFileStorage storage(root);
        auto writer = storage.openWrite("digits.txt");
        writer->stream() << "0123456789";
        writer->publish();

        assert(storage.readRange("digits.txt", 0, 4) == "0123");
        assert(storage.readRange("digits.txt", 6, 100) == "6789");
        assert(storage.readRange("digits.txt", 20, 5).empty());

        assert(storage.remove("digits.txt"));
        assert(!storage.remove("digits.txt"));
        assert(!storage.stat("digits.txt"));
    }
    fs::remove_all(root);
    std::cout << "[PASS] Range reads." << std::endl;
}

void TestConcurrentReadersDuringPublish() {
    std::cout << "[Test] Readers see complete files while other jobs publish..." << std::endl;
    auto root = MakeTestRoot("concurrent");
    {
        LocalExportFileStorage storage(root);
        const std::string payload(64 * 1024, 'x');

        auto writer = storage.openWrite("base.txt");
        writer->stream() << payload;
        writer->publish();

        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&storage, &payload, i]() {
                auto out = storage.openWrite("job" + std::to_string(i) + ".txt");
                out->stream() << payload;
                out->publish();
            });
            threads.emplace_back([&storage, &payload]() {
                for (int n = 0; n < 10; ++n) {
                    auto in = storage.openRead("base.txt");
                    assert(ReadAll(*in) == payload);
                }
            });
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }

        for (int i = 0; i < 4; ++i) {
            auto info = storage.stat("job" + std::to_string(i) + ".txt");
            assert(info && info->size == payload.size());
        }
    }
    fs::remove_all(root);
    std::cout << "[PASS] Concurrent readers." << std::endl;
}

void TestMimeTypes() {
    std::cout << "[Test] Content types from extensions..." << std::endl;
    assert(MimeTypeResolver::FromFileName("a.json") == "application/json");
    assert(MimeTypeResolver::FromFileName("a.CSV") == "text/csv");
    assert(MimeTypeResolver::FromFileName("a.txt") == "text/plain");
    assert(MimeTypeResolver::FromFileName("a.xml") == "application/xml");
    assert(MimeTypeResolver::FromFileName("a.zip") == "application/zip");
    assert(MimeTypeResolver::FromFileName("a.tar.gz") == "application/gzip");
    assert(MimeTypeResolver::FromFileName("a.xlsx") ==
           "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet");
    assert(MimeTypeResolver::FromFileName("a.bin") == "application/octet-stream");
    assert(MimeTypeResolver::FromFileName("noextension") == "application/octet-stream");
    assert(MimeTypeResolver::FromExtension(".Json") == "application/json");
    std::cout << "[PASS] Content types." << std::endl;
}

} // namespace

int main() {
    try {
        TestFileNameValidation();
        TestPublishIsAtomicAndWriteOnce();
        TestAbandonedWriterLeavesNothing();
        TestRangeReadsAndRemove();
        TestConcurrentReadersDuringPublish();
        TestMimeTypes();
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[PASS] All storage tests." << std::endl;
    return 0;
}
