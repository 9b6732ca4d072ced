#include <notify/bus_channel.hpp>
#include <notify/payload.hpp>
#include <common/errors.hpp>

namespace sg {
    BusChannel::BusChannel(std::shared_ptr<IMessagePublisher> publisher, std::string topic)
        : publisher_(std::move(publisher)), topic_(std::move(topic)) {}

    bool BusChannel::deliver(const NotificationTask& task) {
        if (!publisher_) throw NotificationChannelError("bus publisher not configured");
        std::string err;
        if (!publisher_->publish(topic_, bus_payload(task.event), err)) {
            throw NotificationChannelError("bus publish to " + topic_ + " failed: " + err);
        }
        return true;
    }
}
