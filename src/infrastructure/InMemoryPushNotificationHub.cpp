#include "infrastructure/InMemoryPushNotificationHub.hpp"
#include <algorithm>
#include <iostream>

namespace exporthub::infrastructure {

InMemoryPushNotificationHub::InMemoryPushNotificationHub(std::size_t maxRetainedFinished)
    : m_maxRetainedFinished(maxRetainedFinished) {}

void InMemoryPushNotificationHub::send(const domain::ExportNotification& notification) {
    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& updates = m_history[notification.id];
        bool wasFinished = !updates.empty() && domain::IsTerminal(updates.back().status);
        updates.push_back(notification);
        if (!notification.jobId.empty()) {
            m_idByJob[notification.jobId] = notification.id;
        }
        if (domain::IsTerminal(notification.status) && !wasFinished) {
            m_finishedOrder.push_back(notification.id);
            pruneFinishedLocked();
        }
        for (const auto& entry : m_subscribers) {
            subscribers.push_back(entry.second);
        }
    }

    std::cout << "[PushNotificationHub] " << notification.title << " [" << notification.jobId << "] "
              << domain::JobStatusToString(notification.status) << ": " << notification.description << std::endl;

    for (const auto& subscriber : subscribers) {
        try {
            subscriber(notification);
        } catch (const std::exception& e) {
            std::cerr << "[PushNotificationHub] Subscriber failed: " << e.what() << std::endl;
        }
    }
}

int InMemoryPushNotificationHub::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(m_mutex);
    int id = m_nextSubscriptionId++;
    m_subscribers.emplace_back(id, std::move(subscriber));
    return id;
}

void InMemoryPushNotificationHub::unsubscribe(int subscriptionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscribers.erase(std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                                       [subscriptionId](const auto& entry) { return entry.first == subscriptionId; }),
                        m_subscribers.end());
}

std::optional<domain::ExportNotification> InMemoryPushNotificationHub::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_history.find(id);
    if (it == m_history.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::optional<domain::ExportNotification> InMemoryPushNotificationHub::findByJobId(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto idIt = m_idByJob.find(jobId);
    if (idIt == m_idByJob.end()) {
        return std::nullopt;
    }
    auto it = m_history.find(idIt->second);
    if (it == m_history.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::vector<domain::ExportNotification> InMemoryPushNotificationHub::history(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_history.find(id);
    if (it == m_history.end()) {
        return {};
    }
    return it->second;
}

void InMemoryPushNotificationHub::pruneFinishedLocked() {
    while (m_finishedOrder.size() > m_maxRetainedFinished) {
        auto it = m_history.find(m_finishedOrder.front());
        m_finishedOrder.pop_front();
        if (it == m_history.end()) continue;

        for (const auto& update : it->second) {
            auto jobIt = m_idByJob.find(update.jobId);
            if (jobIt != m_idByJob.end() && jobIt->second == it->first) {
                m_idByJob.erase(jobIt);
            }
        }
        m_history.erase(it);
    }
}

std::size_t InMemoryPushNotificationHub::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history.size();
}

} // namespace exporthub::infrastructure
