#pragma once

#include <common/errors.hpp>
#include <pipeline/stream_config.hpp>
#include <scheduler/time_policy.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sg {
    struct DeviceSpec {
        std::string device_id; // deviceGbCode
        std::string area;      // detection region, may be empty
        std::string source;    // resolved through the device platform when empty
    };

    struct DeploymentRequest {
        std::string scene_id;
        std::string algorithm_code;
        std::vector<DeviceSpec> devices;
        int date_type = 3;
        std::string start;
        std::string end;
        std::vector<int> months;
        std::string callback_url; // optional per-scene alarm callback
    };

    // What an algorithm code deploys.
    struct AlgorithmSpec {
        std::string code;
        std::string model_id;
        std::vector<std::string> target_classes;
        PostProcessConfig post_process;
    };

    struct SceneDeployment {
        std::string scene_id;
        std::string algorithm_code;
        std::string model_id;
        std::map<std::string, std::string> sessions; // device id -> session id
        TimePolicy policy;
        std::optional<TimePoint> expiry;
        TimePoint deployed_at{};
    };

    struct DeployReport {
        Status status;
        int deployed = 0;
        std::vector<std::pair<std::string, std::string>> failed; // device id, reason
    };

    // "scene_<scene>_<device>" with spaces replaced by underscores.
    std::string scene_session_id(const std::string& scene_id, const std::string& device_id);
}
