/**
 * @file HttpExportController.cpp
 * @brief Implementation of HttpExportController.
 */

#include "infrastructure/HttpExportController.hpp"
#include "domain/ExportErrors.hpp"
#include "infrastructure/ExportJsonMapping.hpp"
#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace exporthub::infrastructure {

namespace {

constexpr std::size_t kDownloadChunkSize = 64 * 1024;

void WriteJson(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
    res.set_header("Cache-Control", "no-store");
}

void WriteError(httplib::Response& res, int status, const std::string& message) {
    WriteJson(res, nlohmann::json{{"message", message}}, status);
}

std::string Trim(const std::string& value) {
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

std::string ContentDisposition(const std::string& fileName) {
    std::string escaped;
    for (char c : fileName) {
        if (c == '"' || c == '\\') escaped += '\\';
        escaped += c;
    }
    return "attachment; filename=\"" + escaped + "\"";
}

} // namespace

HttpExportController::HttpExportController(std::shared_ptr<application::ExportService> service, std::string basePath)
    : m_service(std::move(service)), m_basePath(std::move(basePath)) {
    while (!m_basePath.empty() && m_basePath.back() == '/') {
        m_basePath.pop_back();
    }
}

domain::Principal HttpExportController::PrincipalFromRequest(const httplib::Request& req) {
    domain::Principal principal;
    principal.userName = req.get_header_value("X-User-Name");

    std::stringstream list(req.get_header_value("X-User-Permissions"));
    std::string item;
    while (std::getline(list, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            principal.permissions.push_back(item);
        }
    }
    return principal;
}

void HttpExportController::registerRoutes(httplib::Server& server) {
    server.Get(m_basePath + "/knowntypes", [this](const httplib::Request& req, httplib::Response& res) {
        handleKnownTypes(req, res);
    });
    server.Get(m_basePath + "/providers", [this](const httplib::Request& req, httplib::Response& res) {
        handleProviders(req, res);
    });
    server.Post(m_basePath + "/data", [this](const httplib::Request& req, httplib::Response& res) {
        handleData(req, res);
    });
    server.Post(m_basePath + "/run", [this](const httplib::Request& req, httplib::Response& res) {
        handleRun(req, res);
    });
    server.Post(m_basePath + "/task/cancel", [this](const httplib::Request& req, httplib::Response& res) {
        handleCancel(req, res);
    });
    server.Get(m_basePath + R"(/download/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleDownload(req, res);
    });

    std::cout << "[HttpExportController] Routes registered under " << m_basePath << "/" << std::endl;
}

void HttpExportController::guarded(httplib::Response& res, const std::function<void()>& handler) const {
    try {
        handler();
    } catch (const domain::AuthorizationDeniedError&) {
        res.status = 401;
        res.body.clear();
    } catch (const domain::UnknownExportTypeError& e) {
        WriteError(res, 400, e.what());
    } catch (const domain::UnknownExportProviderError& e) {
        WriteError(res, 400, e.what());
    } catch (const domain::InvalidFileNameError& e) {
        WriteError(res, 400, e.what());
    } catch (const domain::InvalidExportRequestError& e) {
        WriteError(res, 400, e.what());
    } catch (const nlohmann::json::exception& e) {
        WriteError(res, 400, std::string("Malformed request body: ") + e.what());
    } catch (const domain::FileNotFoundError& e) {
        WriteError(res, 404, e.what());
    } catch (const domain::DataSourceError& e) {
        std::cerr << "[HttpExportController] Data source failure: " << e.what() << std::endl;
        WriteError(res, 500, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[HttpExportController] Unhandled error: " << e.what() << std::endl;
        WriteError(res, 500, "Internal server error");
    }
}

void HttpExportController::handleKnownTypes(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&] {
        auto body = nlohmann::json::array();
        for (const auto& definition : m_service->knownTypes(PrincipalFromRequest(req))) {
            body.push_back(ExportJsonMapping::ToJson(definition));
        }
        WriteJson(res, body);
    });
}

void HttpExportController::handleProviders(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&] {
        auto body = nlohmann::json::array();
        for (const auto& info : m_service->providers(PrincipalFromRequest(req))) {
            body.push_back(ExportJsonMapping::ToJson(info));
        }
        WriteJson(res, body);
    });
}

void HttpExportController::handleData(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&] {
        auto request = ExportJsonMapping::ParseRequest(nlohmann::json::parse(req.body));
        auto result = m_service->previewData(PrincipalFromRequest(req), request);
        WriteJson(res, ExportJsonMapping::ToJson(result));
    });
}

void HttpExportController::handleRun(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&] {
        auto request = ExportJsonMapping::ParseRequest(nlohmann::json::parse(req.body));
        auto notification = m_service->runExport(PrincipalFromRequest(req), request);
        WriteJson(res, ExportJsonMapping::ToJson(notification));
    });
}

void HttpExportController::handleCancel(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&] {
        auto jobId = ExportJsonMapping::ParseCancellationJobId(nlohmann::json::parse(req.body));
        m_service->cancelExport(PrincipalFromRequest(req), jobId);
        res.status = 200;
    });
}

void HttpExportController::handleDownload(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&] {
        std::string fileName = req.matches.size() > 1 ? req.matches[1].str() : std::string();
        auto download = m_service->openDownload(PrincipalFromRequest(req), fileName);

        auto info = download.info;

        res.status = 200;
        res.set_header("Content-Disposition", ContentDisposition(info.name));
        res.set_content_provider(
            static_cast<std::size_t>(info.size), info.contentType,
            [download](std::size_t offset, std::size_t length, httplib::DataSink& sink) {
                std::string chunk = download.read(offset, std::min(length, kDownloadChunkSize));
                if (chunk.empty()) {
                    std::cerr << "[HttpExportController] Short read on " << download.info.name << " at " << offset << std::endl;
                    return false;
                }
                return sink.write(chunk.data(), chunk.size());
            });

        std::cout << "[HttpExportController] Streaming " << info.name << " (" << info.size << " bytes, "
                  << info.contentType << ")" << std::endl;
    });
}

} // namespace exporthub::infrastructure
