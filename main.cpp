#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "app/ExportHubApp.hpp"

using namespace exporthub;

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <path>    Settings file (default: " << infrastructure::ConfigLoader::DefaultPath() << ")\n"
              << "  --port <n>         Override the listening port\n"
              << "  --storage <dir>    Override the export storage root\n"
              << "  --version          Print the version and exit\n"
              << "  --help             Show this help" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    app::ExportHubOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << "ExportHub " << app::ExportHubApp::Version << std::endl;
            return 0;
        } else if (arg == "--config" && hasValue) {
            options.configPath = argv[++i];
        } else if (arg == "--storage" && hasValue) {
            options.storageRoot = std::string(argv[++i]);
        } else if (arg == "--port" && hasValue) {
            std::string value = argv[++i];
            char* end = nullptr;
            long port = std::strtol(value.c_str(), &end, 10);
            if (end == value.c_str() || *end != '\0' || port < 1 || port > 65535) {
                std::cerr << "[main] Invalid port: " << value << std::endl;
                return 2;
            }
            options.port = static_cast<int>(port);
        } else {
            std::cerr << "[main] Unknown or incomplete option: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 2;
        }
    }

    app::ExportHubApp hub(std::move(options));
    return hub.Run();
}
