#pragma once

#include <alarm/alarm_rule.hpp>
#include <pipeline/stream_config.hpp>
#include <scheduler/deployment.hpp>

#include <chrono>
#include <string>
#include <vector>
#include <unordered_map>

namespace sg {
    using std::chrono::milliseconds;

    struct EngineConfig {
        int max_sessions = 10;
        milliseconds health_interval{10000};
        milliseconds stall_timeout{60000};
        milliseconds reconnect_timeout{120000};
        milliseconds stop_timeout{5000};
    };

    struct WorkerConfig {
        int reconnect_attempts = 10;
        milliseconds reconnect_interval{5000};
        int read_timeout_ms = 1000;
        int max_transient_reads = 10;
        int min_frame_size = 50;
        int max_resolution = 640;
        milliseconds gate_poll{1000};
        int log_every = 10;
    };

    struct DetectionDefaults {
        float confidence = 0.25f;
        float iou = 0.45f;
        int image_size = 640;
        double fps_limit = 1.0;
    };

    struct ModelSpec {
        std::string id;
        std::string param_path;
        std::string bin_path;
        std::vector<std::string> class_names;
        std::string names_path; // one class per line, used when class_names is empty
        std::string input_blob = "in0";
        std::string output_blob = "out0";
        int threads = 1;
    };

    struct ModelsConfig {
        std::string mode = "shared"; // shared|dedicated
        std::string default_model;
        std::unordered_map<std::string, ModelSpec> catalog;
    };

    struct AlarmConfig {
        AlarmLevels levels;
        bool default_rule = true;
        std::vector<AlarmRule> rules;
    };

    struct CallbackConfig {
        int timeout_s = 5;
        int failure_threshold = 10;
        int warn_every = 3;
    };

    struct MqttConfig {
        bool enabled = false;
        std::string host = "localhost";
        int port = 1883;
        std::string client_id;
        std::string username;
        std::string password;
        std::string topic = "sceneguard/alarms";
        int qos = 1;
        int keepalive_s = 60;
    };

    struct NotifyConfig {
        size_t queue_capacity = 1000;
        int workers = 4;
        CallbackConfig callback;
        MqttConfig mqtt;
    };

    struct StorageConfig {
        std::string results_root = "results";
        std::string media_base_url;
    };

    struct SchedulerConfig {
        milliseconds expiry_scan{30000};
    };

    struct HeartbeatConfig {
        milliseconds interval{10000};
        int failure_threshold = 3;
        milliseconds stop_timeout{2000};
    };

    struct DevicePlatformConfig {
        std::string base_url;
        int timeout_s = 10;
    };

    struct StreamEntry {
        StreamConfig config;
        bool autostart = true;
    };

    struct AppConfig {
        EngineConfig engine;
        WorkerConfig worker;
        DetectionDefaults detection;
        ModelsConfig models;
        AlarmConfig alarm;
        NotifyConfig notify;
        StorageConfig storage;
        SchedulerConfig scheduler;
        HeartbeatConfig heartbeat;
        DevicePlatformConfig device_platform;
        std::unordered_map<std::string, AlgorithmSpec> algorithms;
        std::vector<StreamEntry> streams;
        std::vector<DeploymentRequest> scenes;
    };

    // Throws ConfigError (or YAML::Exception for unparsable files).
    AppConfig load_config_yaml(const std::string& path);

    // Rejects thresholds outside [0,1], non-positive fps and empty ids.
    void validate_stream_config(const StreamConfig& cfg);
}
