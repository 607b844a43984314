/**
 * @file ExportJobOrchestrator.cpp
 * @brief Implementation of ExportJobOrchestrator.
 */

#include "application/ExportJobOrchestrator.hpp"
#include "domain/ExportedTypeDefinition.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>

namespace exporthub::application {

using domain::ExportJobStatus;

std::string SanitizeFileComponent(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (unsigned char c : value) {
        result += (std::isalnum(c) || c == '_' || c == '-') ? static_cast<char>(c) : '_';
    }
    return result.empty() ? "export" : result;
}

ExportJobOrchestrator::ExportJobOrchestrator(std::shared_ptr<domain::PushNotificationChannel> channel,
                                             ExportJobBody body,
                                             ExportJobSettings settings)
    : m_channel(std::move(channel)), m_body(std::move(body)), m_settings(std::move(settings)) {
    if (m_settings.workerCount <= 0) {
        m_settings.workerCount = 1;
    }
}

ExportJobOrchestrator::~ExportJobOrchestrator() {
    stop();
}

bool ExportJobOrchestrator::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running.load()) {
        std::cerr << "[ExportJobOrchestrator] Already running" << std::endl;
        return false;
    }
    if (!m_body) {
        std::cerr << "[ExportJobOrchestrator] No job body configured" << std::endl;
        return false;
    }

    m_shutdown = false;
    try {
        m_workers.reserve(static_cast<std::size_t>(m_settings.workerCount));
        for (int i = 0; i < m_settings.workerCount; ++i) {
            m_workers.emplace_back(&ExportJobOrchestrator::workerLoop, this, i);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ExportJobOrchestrator] Failed to start workers: " << e.what() << std::endl;
        m_shutdown = true;
        m_jobAvailable.notify_all();
        return false;
    }

    m_running.store(true);
    std::cout << "[ExportJobOrchestrator] Started " << m_settings.workerCount << " worker(s)" << std::endl;
    return true;
}

void ExportJobOrchestrator::stop() {
    std::vector<std::string> queued;
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        for (auto& entry : m_jobs) {
            if (entry.second->status == ExportJobStatus::Running) {
                entry.second->token.cancel();
            }
        }
        queued.assign(m_queue.begin(), m_queue.end());
        workers.swap(m_workers);
    }
    m_jobAvailable.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    for (const auto& jobId : queued) {
        cancel(jobId);
    }

    bool wasRunning = m_running.exchange(false);
    if (wasRunning) {
        std::cout << "[ExportJobOrchestrator] Stopped" << std::endl;
    }
}

std::string ExportJobOrchestrator::GenerateJobId() {
    static std::atomic<std::uint64_t> counter{0};
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(now) + "-" + std::to_string(counter.fetch_add(1) + 1);
}

std::string ExportJobOrchestrator::enqueue(domain::ExportDataRequest request, domain::ExportNotification notification) {
    auto job = std::make_shared<JobRecord>();
    job->id = GenerateJobId();
    job->request = std::move(request);

    notification.jobId = job->id;
    notification.status = ExportJobStatus::Queued;
    if (notification.created == std::chrono::system_clock::time_point{}) {
        notification.created = std::chrono::system_clock::now();
    }
    job->notification = std::move(notification);

    // Sent before the job is visible to workers, so Queued always precedes Running.
    send(job->notification);

    std::optional<domain::ExportNotification> rejected;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs.emplace(job->id, job);
        if (m_shutdown) {
            job->status = ExportJobStatus::Cancelled;
            job->notification.status = ExportJobStatus::Cancelled;
            job->notification.description = "Export service is shutting down";
            job->notification.finished = std::chrono::system_clock::now();
            rejected = job->notification;
            m_finishedOrder.push_back(job->id);
            pruneFinishedLocked();
        } else {
            m_queue.push_back(job->id);
        }
    }

    if (rejected) {
        std::cerr << "[ExportJobOrchestrator] Rejected job " << job->id << ", orchestrator is stopped" << std::endl;
        send(*rejected);
        return job->id;
    }
    m_jobAvailable.notify_one();

    std::cout << "[ExportJobOrchestrator] Queued job " << job->id << " (" << job->request.exportTypeName << ")" << std::endl;
    return job->id;
}

void ExportJobOrchestrator::cancel(const std::string& jobId) {
    std::optional<domain::ExportNotification> cancelledBeforePickup;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(jobId);
        if (it == m_jobs.end()) {
            std::cout << "[ExportJobOrchestrator] Cancel ignored, unknown job " << jobId << std::endl;
            return;
        }

        auto job = it->second;
        switch (job->status) {
            case ExportJobStatus::Queued:
                m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), jobId), m_queue.end());
                job->status = ExportJobStatus::Cancelled;
                job->notification.status = ExportJobStatus::Cancelled;
                job->notification.description = "Export was cancelled by the user";
                job->notification.finished = std::chrono::system_clock::now();
                cancelledBeforePickup = job->notification;
                m_finishedOrder.push_back(jobId);
                pruneFinishedLocked();
                break;
            case ExportJobStatus::Running:
                job->token.cancel();
                std::cout << "[ExportJobOrchestrator] Cancellation requested for running job " << jobId << std::endl;
                break;
            default:
                std::cout << "[ExportJobOrchestrator] Cancel ignored, job " << jobId << " already "
                          << domain::JobStatusToString(job->status) << std::endl;
                break;
        }
    }

    if (cancelledBeforePickup) {
        std::cout << "[ExportJobOrchestrator] Removed queued job " << jobId << std::endl;
        send(*cancelledBeforePickup);
        m_idle.notify_all();
    }
}

std::optional<ExportJobStatus> ExportJobOrchestrator::status(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return std::nullopt;
    }
    return it->second->status;
}

std::size_t ExportJobOrchestrator::queueSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool ExportJobOrchestrator::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idle.wait_for(lock, timeout, [this] {
        return m_queue.empty() && m_activeCount == 0;
    });
}

void ExportJobOrchestrator::workerLoop(int workerId) {
    while (true) {
        std::shared_ptr<JobRecord> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_jobAvailable.wait(lock, [this] {
                return m_shutdown || !m_queue.empty();
            });

            if (m_shutdown) {
                return;
            }

            std::string jobId = m_queue.front();
            m_queue.pop_front();

            auto it = m_jobs.find(jobId);
            if (it == m_jobs.end() || it->second->status != ExportJobStatus::Queued) {
                continue;
            }
            job = it->second;
            job->status = ExportJobStatus::Running;
            ++m_activeCount;
        }

        std::cout << "[ExportJobOrchestrator] Worker " << workerId << " picked up job " << job->id << std::endl;
        execute(job, workerId);
    }
}

void ExportJobOrchestrator::execute(const std::shared_ptr<JobRecord>& job, int workerId) {
    auto& notification = job->notification;
    notification.status = ExportJobStatus::Running;
    notification.description = "Export task is running";
    send(notification);

    ExportJobStatus terminal = ExportJobStatus::Failed;
    try {
        auto onProgress = [this, &notification](const ExportProgress& progress) {
            notification.processedCount = progress.processedCount;
            notification.totalCount = progress.totalCount;
            notification.description = progress.description;
            send(notification);
        };

        std::string baseName = SanitizeFileComponent(domain::ExportTypeTitle(job->request.exportTypeName)) + "_" + job->id;
        ExportResult result = m_body(job->request, baseName, onProgress, job->token);

        notification.processedCount = result.processedCount;
        notification.totalCount = result.totalCount;
        if (result.cancelled) {
            terminal = ExportJobStatus::Cancelled;
            notification.description = "Export was cancelled by the user";
        } else {
            terminal = ExportJobStatus::Completed;
            notification.description = "Export finished";
            notification.fileName = result.fileName;
            notification.downloadUrl = m_settings.downloadRoute + result.fileName;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ExportJobOrchestrator] Worker " << workerId << " job " << job->id << " failed: " << e.what() << std::endl;
        terminal = ExportJobStatus::Failed;
        notification.description = "Export failed";
        notification.errors.push_back(e.what());
        notification.errorCount = notification.errors.size();
    } catch (...) {
        std::cerr << "[ExportJobOrchestrator] Worker " << workerId << " job " << job->id << " failed: unknown error" << std::endl;
        terminal = ExportJobStatus::Failed;
        notification.description = "Export failed";
        notification.errors.push_back("Unknown error");
        notification.errorCount = notification.errors.size();
    }

    finish(job, terminal);
}

void ExportJobOrchestrator::finish(const std::shared_ptr<JobRecord>& job, ExportJobStatus terminal) {
    job->notification.status = terminal;
    job->notification.finished = std::chrono::system_clock::now();
    send(job->notification);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        job->status = terminal;
        --m_activeCount;
        m_finishedOrder.push_back(job->id);
        pruneFinishedLocked();
    }
    m_idle.notify_all();

    std::cout << "[ExportJobOrchestrator] Job " << job->id << " " << domain::JobStatusToString(terminal) << std::endl;
}

void ExportJobOrchestrator::send(const domain::ExportNotification& notification) {
    if (!m_channel) return;
    try {
        m_channel->send(notification);
    } catch (const std::exception& e) {
        std::cerr << "[ExportJobOrchestrator] Notification " << notification.id << " not delivered: " << e.what() << std::endl;
    }
}

void ExportJobOrchestrator::pruneFinishedLocked() {
    while (m_finishedOrder.size() > m_settings.maxRetainedJobs) {
        m_jobs.erase(m_finishedOrder.front());
        m_finishedOrder.pop_front();
    }
}

} // namespace exporthub::application
