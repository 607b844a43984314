/**
 * @file ExportJobOrchestrator.hpp
 * @brief Background execution of export jobs with cancellation and status notifications.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "application/CancellationToken.hpp"
#include "application/DataExporter.hpp"
#include "domain/ExportDataRequest.hpp"
#include "domain/ExportNotification.hpp"
#include "domain/PushNotificationChannel.hpp"

namespace exporthub::application {

/** @brief The unit of work a worker runs for one job. */
using ExportJobBody = std::function<ExportResult(const domain::ExportDataRequest&,
                                                 const std::string& outputBaseName,
                                                 const ExportProgressCallback&,
                                                 const CancellationToken&)>;

/**
 * @struct ExportJobSettings
 * @brief Tunables of the worker pool.
 */
struct ExportJobSettings {
    int workerCount = 2;
    std::size_t maxRetainedJobs = 1000;            ///< Terminal jobs kept for status/cancel lookups.
    std::string downloadRoute = "api/export/download/";
};

/**
 * @class ExportJobOrchestrator
 * @brief Queue plus worker pool that runs export jobs.
 *
 * Per job: Queued -> Running -> {Completed | Failed | Cancelled}, or Queued -> Cancelled.
 * Each job sends exactly one terminal notification. Updates of one job are always sent
 * by one thread at a time, in transition order.
 */
class ExportJobOrchestrator {
public:
    ExportJobOrchestrator(std::shared_ptr<domain::PushNotificationChannel> channel,
                          ExportJobBody body,
                          ExportJobSettings settings = {});
    ~ExportJobOrchestrator();

    ExportJobOrchestrator(const ExportJobOrchestrator&) = delete;
    ExportJobOrchestrator& operator=(const ExportJobOrchestrator&) = delete;

    /** @brief Launches the worker threads. Jobs enqueued before start() wait in the queue. */
    bool start();

    /**
     * @brief Cancels running and queued jobs and joins the workers.
     * Every affected job still gets its Cancelled notification.
     */
    void stop();

    /**
     * @brief Records the job, sends its Queued notification and returns without waiting.
     * After stop() the job is cancelled right away instead of being queued.
     * @return The job id, also stored in the notification.
     */
    std::string enqueue(domain::ExportDataRequest request, domain::ExportNotification notification);

    /**
     * @brief Best-effort cancellation. Unknown or finished jobs are ignored silently.
     */
    void cancel(const std::string& jobId);

    std::optional<domain::ExportJobStatus> status(const std::string& jobId) const;
    std::size_t queueSize() const;
    bool isRunning() const { return m_running.load(); }

    /** @brief Blocks until nothing is queued or running, or the timeout expires. */
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    struct JobRecord {
        std::string id;
        domain::ExportDataRequest request;
        domain::ExportNotification notification;
        domain::ExportJobStatus status = domain::ExportJobStatus::Queued;
        CancellationToken token;
    };

    void workerLoop(int workerId);
    void execute(const std::shared_ptr<JobRecord>& job, int workerId);
    void finish(const std::shared_ptr<JobRecord>& job, domain::ExportJobStatus terminal);
    void send(const domain::ExportNotification& notification);
    void pruneFinishedLocked();
    static std::string GenerateJobId();

    std::shared_ptr<domain::PushNotificationChannel> m_channel;
    ExportJobBody m_body;
    ExportJobSettings m_settings;

    std::deque<std::string> m_queue;
    std::unordered_map<std::string, std::shared_ptr<JobRecord>> m_jobs;
    std::deque<std::string> m_finishedOrder;
    std::size_t m_activeCount = 0;

    mutable std::mutex m_mutex;
    std::condition_variable m_jobAvailable;
    std::condition_variable m_idle;

    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running{false};
    bool m_shutdown = false;
};

/** @brief Replaces everything outside [A-Za-z0-9_-] with '_'. */
std::string SanitizeFileComponent(const std::string& value);

} // namespace exporthub::application
