#pragma once

#include <notify/channel.hpp>

#include <atomic>
#include <iostream>
#include <mutex>
#include <ostream>

namespace sg {
    class LogChannel : public INotificationChannel {
    public:
        explicit LogChannel(std::ostream& out = std::cerr) : out_(out) {}

        ChannelKind kind() const override { return ChannelKind::Log; }
        bool deliver(const NotificationTask& task) override;

        int64_t written() const { return written_.load(); }

    private:
        std::ostream& out_;
        std::mutex mtx_;
        std::atomic<int64_t> written_{0};
    };
}
