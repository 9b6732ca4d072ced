#include <notify/mqtt_publisher.hpp>

#include <iostream>
#include <stdexcept>

#include <mosquitto.h>

namespace sg {
    namespace {
        std::once_flag g_mosq_init;
    }

    MqttPublisher::MqttPublisher(MqttConfig cfg)
        : cfg_(std::move(cfg)), client_(nullptr, &mosquitto_destroy) {
        std::call_once(g_mosq_init, [] { mosquitto_lib_init(); });

        const char* client_id = cfg_.client_id.empty() ? nullptr : cfg_.client_id.c_str();
        client_.reset(mosquitto_new(client_id, true, nullptr));
        if (!client_) {
            throw std::runtime_error("[MQTT] failed to create client");
        }

        if (!cfg_.username.empty()) {
            const char* password = cfg_.password.empty() ? nullptr : cfg_.password.c_str();
            const int rc = mosquitto_username_pw_set(client_.get(), cfg_.username.c_str(), password);
            if (rc != MOSQ_ERR_SUCCESS) {
                throw std::runtime_error(std::string("[MQTT] failed to set credentials: ") + mosquitto_strerror(rc));
            }
        }
        mosquitto_reconnect_delay_set(client_.get(), 1, 8, true);
    }

    MqttPublisher::~MqttPublisher() {
        if (!client_) return;
        if (connected_) mosquitto_disconnect(client_.get());
        if (loop_started_) mosquitto_loop_stop(client_.get(), true);
    }

    bool MqttPublisher::ensure_connected_(std::string& err) {
        if (connected_) return true;

        const int rc = mosquitto_connect(client_.get(), cfg_.host.c_str(), cfg_.port, cfg_.keepalive_s);
        if (rc != MOSQ_ERR_SUCCESS) {
            err = std::string("connect to ") + cfg_.host + ":" + std::to_string(cfg_.port) +
                  " failed: " + mosquitto_strerror(rc);
            return false;
        }
        if (!loop_started_) {
            const int lrc = mosquitto_loop_start(client_.get());
            if (lrc != MOSQ_ERR_SUCCESS) {
                err = std::string("loop start failed: ") + mosquitto_strerror(lrc);
                mosquitto_disconnect(client_.get());
                return false;
            }
            loop_started_ = true;
        }
        connected_ = true;
        std::cout << "[MQTT](connect) connected to " << cfg_.host << ":" << cfg_.port << "\n";
        return true;
    }

    bool MqttPublisher::publish(const std::string& topic, const std::string& payload, std::string& err) {
        std::lock_guard lk(mtx_);
        if (!ensure_connected_(err)) return false;

        const int rc = mosquitto_publish(client_.get(), nullptr, topic.c_str(),
                                         static_cast<int>(payload.size()), payload.data(), cfg_.qos, false);
        // on a lost connection the loop thread reconnects by itself
        if (rc != MOSQ_ERR_SUCCESS) {
            err = std::string("publish failed: ") + mosquitto_strerror(rc);
            return false;
        }
        return true;
    }
}
