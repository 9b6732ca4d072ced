#include <device/device_client.hpp>
#include <notify/payload.hpp>

#include <httplib.h>
#include <yaml-cpp/yaml.h>

#include <iostream>

namespace sg {
    namespace {
        // Platform responses are flat JSON, which yaml-cpp reads as flow YAML.
        YAML::Node parse_body(const std::string& body) {
            try {
                return YAML::Load(body);
            } catch (const YAML::Exception& e) {
                std::cerr << "[DeviceClient](parse) unreadable response: " << e.what() << "\n";
                return YAML::Node();
            }
        }

        std::string device_body(const std::string& device_id) {
            return R"({"deviceGbCode":")" + json_escape(device_id) + "\"}";
        }
    } // namespace

    bool platform_status_ok(const std::string& body) {
        const YAML::Node root = parse_body(body);
        if (!root || !root.IsMap() || !root["status"]) return false;
        try {
            return root["status"].as<int>() == 0;
        } catch (const YAML::Exception&) {
            return false;
        }
    }

    std::optional<std::string> platform_play_url(const std::string& body) {
        const YAML::Node root = parse_body(body);
        if (!root || !root.IsMap() || !root["status"]) return std::nullopt;
        try {
            if (root["status"].as<int>() != 0) return std::nullopt;
            const YAML::Node data = root["data"];
            if (!data || !data.IsMap()) return std::nullopt;
            for (const char* key : {"rtmp", "rtsp"}) {
                if (data[key] && data[key].IsScalar()) {
                    const std::string url = data[key].as<std::string>();
                    if (!url.empty()) return url;
                }
            }
        } catch (const YAML::Exception& e) {
            std::cerr << "[DeviceClient](platform_play_url) bad field: " << e.what() << "\n";
        }
        return std::nullopt;
    }

    DeviceClient::DeviceClient(DevicePlatformConfig cfg, int retry_times)
        : cfg_(std::move(cfg)), retry_times_(retry_times < 1 ? 1 : retry_times) {
        while (!cfg_.base_url.empty() && cfg_.base_url.back() == '/') cfg_.base_url.pop_back();
        const std::string base = cfg_.base_url;
        const int timeout_s = cfg_.timeout_s;
        transport_ = [base, timeout_s](const std::string& path, const std::string& body) -> std::optional<std::string> {
            httplib::Client cli(base);
            cli.set_connection_timeout(timeout_s, 0);
            cli.set_read_timeout(timeout_s, 0);
            auto res = cli.Post(path.c_str(), body, "application/json");
            if (!res) {
                std::cerr << "[DeviceClient](post) " << base << path << ": " << httplib::to_string(res.error()) << "\n";
                return std::nullopt;
            }
            if (res->status != 200) {
                std::cerr << "[DeviceClient](post) " << base << path << ": HTTP " << res->status << "\n";
                return std::nullopt;
            }
            return res->body;
        };
    }

    DeviceClient::DeviceClient(DevicePlatformConfig cfg, Transport transport, int retry_times)
        : cfg_(std::move(cfg)), transport_(std::move(transport)), retry_times_(retry_times < 1 ? 1 : retry_times) {}

    bool DeviceClient::send_heartbeat(const std::string& device_id) {
        const auto body = transport_("/api/channel/heartbeatByGbCode", device_body(device_id));
        return body && platform_status_ok(*body);
    }

    std::optional<std::string> DeviceClient::resolve_stream(const std::string& device_id) {
        for (int attempt = 1; attempt <= retry_times_; ++attempt) {
            const auto body = transport_("/api/channel/getPlayUrlByGbCode", device_body(device_id));
            if (body) {
                if (auto url = platform_play_url(*body)) {
                    std::cout << "[DeviceClient](resolve_stream) " << device_id << " -> " << *url << "\n";
                    return url;
                }
                std::cerr << "[DeviceClient](resolve_stream) no play url for " << device_id << "\n";
                return std::nullopt;
            }
            std::cerr << "[DeviceClient](resolve_stream) attempt " << attempt << "/" << retry_times_
                      << " for " << device_id << " failed\n";
        }
        return std::nullopt;
    }
}
