#pragma once

#include <common/config.hpp>

#include <memory>
#include <mutex>
#include <string>

struct mosquitto;

namespace sg {
    struct IMessagePublisher {
        virtual ~IMessagePublisher() = default;
        // Returns false and fills err on failure.
        virtual bool publish(const std::string& topic, const std::string& payload, std::string& err) = 0;
    };

    // libmosquitto client with a background network loop. Connection is
    // attempted lazily on first publish and retried on later publishes.
    class MqttPublisher : public IMessagePublisher {
    public:
        explicit MqttPublisher(MqttConfig cfg);
        ~MqttPublisher() override;

        MqttPublisher(const MqttPublisher&) = delete;
        MqttPublisher& operator=(const MqttPublisher&) = delete;

        bool publish(const std::string& topic, const std::string& payload, std::string& err) override;

    private:
        bool ensure_connected_(std::string& err);

        MqttConfig cfg_;
        std::mutex mtx_;
        std::unique_ptr<mosquitto, void (*)(mosquitto*)> client_;
        bool connected_ = false;
        bool loop_started_ = false;
    };
}
