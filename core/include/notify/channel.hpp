#pragma once

#include <alarm/alarm_rule.hpp>
#include <pipeline/types.hpp>

#include <chrono>
#include <vector>

namespace sg {
    struct NotificationTask {
        AlarmRule rule;
        AlarmEvent event;
        std::vector<ChannelKind> channels;
        std::chrono::steady_clock::time_point enqueued_at{};
    };

    struct INotificationChannel {
        virtual ~INotificationChannel() = default;
        virtual ChannelKind kind() const = 0;
        // False when the task has nothing for this channel (skipped).
        // Throws NotificationChannelError on delivery failure.
        virtual bool deliver(const NotificationTask& task) = 0;
    };
}
