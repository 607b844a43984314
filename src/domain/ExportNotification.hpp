/**
 * @file ExportNotification.hpp
 * @brief Job lifecycle states and the push notification that tracks one export job.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace exporthub::domain {

/**
 * @enum ExportJobStatus
 * @brief Lifecycle of one export run.
 */
enum class ExportJobStatus {
    Queued,     ///< Accepted, waiting for a worker.
    Running,    ///< Picked up by a worker.
    Completed,  ///< Output published.
    Failed,     ///< Aborted by an error, nothing published.
    Cancelled   ///< Stopped on request, nothing published.
};

inline std::string JobStatusToString(ExportJobStatus status) {
    switch (status) {
        case ExportJobStatus::Queued: return "Queued";
        case ExportJobStatus::Running: return "Running";
        case ExportJobStatus::Completed: return "Completed";
        case ExportJobStatus::Failed: return "Failed";
        case ExportJobStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline bool IsTerminal(ExportJobStatus status) {
    return status == ExportJobStatus::Completed ||
           status == ExportJobStatus::Failed ||
           status == ExportJobStatus::Cancelled;
}

/**
 * @struct ExportNotification
 * @brief Status record delivered to the requesting user.
 *
 * The same id is reused for every update of one job; consumers upsert by id.
 */
struct ExportNotification {
    std::string id;
    std::string jobId;
    std::string notifyType = "ExportPushNotification";
    std::string creator;
    std::string title;
    std::string description;
    ExportJobStatus status = ExportJobStatus::Queued;
    std::chrono::system_clock::time_point created{};
    std::optional<std::chrono::system_clock::time_point> finished;
    std::size_t processedCount = 0;
    std::size_t totalCount = 0;
    std::size_t errorCount = 0;
    std::vector<std::string> errors;
    std::string fileName;    ///< Published output, set on completion.
    std::string downloadUrl; ///< Route to fetch fileName, set on completion.
};

} // namespace exporthub::domain
