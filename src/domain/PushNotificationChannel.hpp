/**
 * @file PushNotificationChannel.hpp
 * @brief Interface of the transport that delivers job status updates to users.
 */

#pragma once

#include "domain/ExportNotification.hpp"

namespace exporthub::domain {

class PushNotificationChannel {
public:
    virtual ~PushNotificationChannel() = default;

    /**
     * @brief Delivers the current state of a notification. Implementations upsert by id
     * and must be safe to call from several threads.
     */
    virtual void send(const ExportNotification& notification) = 0;
};

} // namespace exporthub::domain
