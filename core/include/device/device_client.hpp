#pragma once

#include <common/config.hpp>

#include <functional>
#include <optional>
#include <string>

namespace sg {
    struct IHeartbeatSender {
        virtual ~IHeartbeatSender() = default;
        virtual bool send_heartbeat(const std::string& device_id) = 0;
    };

    struct IDeviceDirectory {
        virtual ~IDeviceDirectory() = default;
        // Stream locator for a device, nullopt when it cannot be resolved.
        virtual std::optional<std::string> resolve_stream(const std::string& device_id) = 0;
    };

    // True for a platform response of the form {"status": 0, ...}.
    bool platform_status_ok(const std::string& body);
    // data.rtmp, falling back to data.rtsp.
    std::optional<std::string> platform_play_url(const std::string& body);

    // Device platform over HTTP (cpp-httplib).
    class DeviceClient : public IHeartbeatSender, public IDeviceDirectory {
    public:
        // Returns the response body, or nullopt on transport or HTTP error.
        using Transport = std::function<std::optional<std::string>(const std::string& path, const std::string& body)>;

        explicit DeviceClient(DevicePlatformConfig cfg, int retry_times = 3);
        DeviceClient(DevicePlatformConfig cfg, Transport transport, int retry_times = 3);

        bool send_heartbeat(const std::string& device_id) override;
        std::optional<std::string> resolve_stream(const std::string& device_id) override;

    private:
        DevicePlatformConfig cfg_;
        Transport transport_;
        int retry_times_;
    };
}
