#pragma once

#include <notify/channel.hpp>
#include <notify/mqtt_publisher.hpp>

#include <memory>
#include <string>

namespace sg {
    class BusChannel : public INotificationChannel {
    public:
        BusChannel(std::shared_ptr<IMessagePublisher> publisher, std::string topic);

        ChannelKind kind() const override { return ChannelKind::Bus; }
        bool deliver(const NotificationTask& task) override;

    private:
        std::shared_ptr<IMessagePublisher> publisher_;
        std::string topic_;
    };
}
