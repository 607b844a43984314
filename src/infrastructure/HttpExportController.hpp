/**
 * @file HttpExportController.hpp
 * @brief REST front end of the export module on top of cpp-httplib.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <httplib.h>
#include "application/ExportService.hpp"
#include "domain/Principal.hpp"

namespace exporthub::infrastructure {

/**
 * @class HttpExportController
 * @brief Maps the export routes onto ExportService.
 *
 * Routes (relative to the base path, default "/api/export"):
 *  - GET  knowntypes
 *  - GET  providers
 *  - POST data
 *  - POST run
 *  - POST task/cancel
 *  - GET  download/{fileName}
 *
 * The caller is taken from the X-User-Name and X-User-Permissions (comma separated)
 * headers, which an authenticating proxy in front of the service is expected to set.
 */
class HttpExportController {
public:
    explicit HttpExportController(std::shared_ptr<application::ExportService> service,
                                  std::string basePath = "/api/export");

    void registerRoutes(httplib::Server& server);

    static domain::Principal PrincipalFromRequest(const httplib::Request& req);

private:
    /** @brief Runs a handler and translates export errors into HTTP statuses. */
    void guarded(httplib::Response& res, const std::function<void()>& handler) const;

    void handleKnownTypes(const httplib::Request& req, httplib::Response& res);
    void handleProviders(const httplib::Request& req, httplib::Response& res);
    void handleData(const httplib::Request& req, httplib::Response& res);
    void handleRun(const httplib::Request& req, httplib::Response& res);
    void handleCancel(const httplib::Request& req, httplib::Response& res);
    void handleDownload(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<application::ExportService> m_service;
    std::string m_basePath;
};

} // namespace exporthub::infrastructure
