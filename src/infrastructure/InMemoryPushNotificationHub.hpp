/**
 * @file InMemoryPushNotificationHub.hpp
 * @brief Process-local notification channel keeping the latest state of every notification.
 */

#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "domain/PushNotificationChannel.hpp"

namespace exporthub::infrastructure {

/**
 * @class InMemoryPushNotificationHub
 * @brief Upserts notifications by id and forwards them to live subscribers.
 *
 * Subscribers are invoked on the sending thread, after the hub's lock is released.
 * Only the most recent @c maxRetainedFinished notifications that reached a terminal
 * status are kept; older ones are forgotten together with their job id mapping.
 */
class InMemoryPushNotificationHub : public domain::PushNotificationChannel {
public:
    using Subscriber = std::function<void(const domain::ExportNotification&)>;

    explicit InMemoryPushNotificationHub(std::size_t maxRetainedFinished = 1000);

    void send(const domain::ExportNotification& notification) override;

    /** @brief Registers a live consumer. Returns its subscription id. */
    int subscribe(Subscriber subscriber);
    void unsubscribe(int subscriptionId);

    std::optional<domain::ExportNotification> find(const std::string& id) const;
    std::optional<domain::ExportNotification> findByJobId(const std::string& jobId) const;

    /** @brief Every update delivered for one notification id, oldest first. */
    std::vector<domain::ExportNotification> history(const std::string& id) const;

    std::size_t size() const;

private:
    void pruneFinishedLocked();

    std::size_t m_maxRetainedFinished;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<domain::ExportNotification>> m_history;
    std::unordered_map<std::string, std::string> m_idByJob;
    std::deque<std::string> m_finishedOrder;
    std::vector<std::pair<int, Subscriber>> m_subscribers;
    int m_nextSubscriptionId = 1;
};

} // namespace exporthub::infrastructure
