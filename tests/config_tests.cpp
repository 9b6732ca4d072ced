#include <common/config.hpp>
#include <common/errors.hpp>

#include "test_support.hpp"

#include <filesystem>
#include <string>

using sgtest::check;

namespace {
    bool load_throws(const std::string& yaml) {
        const std::string path = sgtest::write_yaml_file("sg_cfg", yaml);
        try {
            (void)sg::load_config_yaml(path);
            std::filesystem::remove(path);
            return false;
        } catch (...) {
            std::filesystem::remove(path);
            return true;
        }
    }

    sg::AppConfig load(const std::string& yaml) {
        const std::string path = sgtest::write_yaml_file("sg_cfg_ok", yaml);
        try {
            sg::AppConfig cfg = sg::load_config_yaml(path);
            std::filesystem::remove(path);
            return cfg;
        } catch (...) {
            std::filesystem::remove(path);
            throw;
        }
    }

    const char* kModels =
        "models:\n"
        "  catalog:\n"
        "    yolo:\n"
        "      param: \"/models/yolo.param\"\n"
        "      bin: \"/models/yolo.bin\"\n"
        "      classes: [\"person\", \"helmet\", \"fire\"]\n";

    void test_empty_config_uses_defaults() {
        const auto cfg = load("engine:\n  max_sessions: 10\n");
        check(cfg.engine.max_sessions == 10, "max_sessions default");
        check(cfg.engine.health_interval.count() == 10000, "health interval defaults to 10s");
        check(cfg.worker.reconnect_attempts == 10, "reconnect attempts default");
        check(cfg.worker.reconnect_interval.count() == 5000, "reconnect interval default");
        check(cfg.notify.queue_capacity == 1000, "notification queue default");
        check(cfg.heartbeat.failure_threshold == 3, "heartbeat threshold default");
        check(cfg.streams.empty() && cfg.scenes.empty(), "no streams or scenes");
        check(cfg.alarm.default_rule, "default alarm rule enabled");
    }

    void test_seconds_become_milliseconds() {
        const auto cfg = load(
            "engine:\n"
            "  stall_timeout_s: 1.5\n"
            "worker:\n"
            "  gate_poll_s: 0.25\n"
            "heartbeat:\n"
            "  interval_s: 20\n");
        check(cfg.engine.stall_timeout.count() == 1500, "stall_timeout_s 1.5 -> 1500 ms");
        check(cfg.worker.gate_poll.count() == 250, "gate_poll_s 0.25 -> 250 ms");
        check(cfg.heartbeat.interval.count() == 20000, "heartbeat interval 20 s");
    }

    void test_negative_duration_rejected() {
        check(load_throws("engine:\n  stop_timeout_s: -1\n"), "negative duration must be rejected");
    }

    void test_stream_inherits_detection_defaults() {
        const std::string yaml = std::string(kModels) +
            "detection:\n"
            "  confidence: 0.4\n"
            "  fps: 2\n"
            "streams:\n"
            "  - id: \"cam0\"\n"
            "    source: \"rtsp://10.0.0.5/live\"\n"
            "    classes: [\"person\"]\n"
            "    region: \"(0,0),(100,0),(100,100)\"\n"
            "    post_process: \"helmet_detection_alert\"\n"
            "    autostart: false\n";
        const auto cfg = load(yaml);
        check(cfg.streams.size() == 1, "one stream parsed");
        const auto& s = cfg.streams[0].config;
        check(s.conf_threshold > 0.39f && s.conf_threshold < 0.41f, "stream confidence inherited");
        check(s.fps_limit == 2.0, "stream fps inherited");
        check(s.name == "cam0", "name defaults to id");
        check(s.target_classes.size() == 1 && s.target_classes[0] == "person", "classes parsed");
        check(s.post_process.kind == sg::PostProcessKind::MissingEquipment, "legacy post-process alias");
        check(!cfg.streams[0].autostart, "autostart false kept");
        check(cfg.models.default_model == "yolo", "single catalog entry becomes the default");
    }

    void test_duplicate_stream_rejected() {
        const std::string yaml =
            "streams:\n"
            "  - id: \"cam0\"\n"
            "    source: \"a.mp4\"\n"
            "  - id: \"cam0\"\n"
            "    source: \"b.mp4\"\n";
        check(load_throws(yaml), "duplicate stream ids must be rejected");
    }

    void test_stream_thresholds_validated() {
        check(load_throws("streams:\n  - id: \"c\"\n    source: \"a.mp4\"\n    confidence: 1.5\n"),
              "confidence above 1 rejected");
        check(load_throws("streams:\n  - id: \"c\"\n    source: \"a.mp4\"\n    fps: 0\n"),
              "zero fps rejected");
        check(load_throws("streams:\n  - id: \"c\"\n"), "empty source rejected");
    }

    void test_unknown_default_model_rejected() {
        const std::string yaml = std::string(kModels) + "  default: \"missing\"\n";
        check(load_throws(yaml), "default model must exist in the catalog");
    }

    void test_algorithm_model_must_exist() {
        const std::string yaml = std::string(kModels) +
            "algorithms:\n"
            "  fire:\n"
            "    model: \"other\"\n";
        check(load_throws(yaml), "algorithm with unknown model rejected");
    }

    void test_alarm_rules_parse() {
        const auto cfg = load(
            "alarm:\n"
            "  levels:\n"
            "    high: 0.8\n"
            "    medium: 0.6\n"
            "  rules:\n"
            "    - id: \"night_intrusion\"\n"
            "      classes: [\"person\"]\n"
            "      consecutive_frames: 5\n"
            "      cooldown_s: 60\n"
            "      time_range:\n"
            "        start: \"22:00\"\n"
            "        end: \"06:00\"\n"
            "      channels: [\"log\", \"mqtt\"]\n");
        check(cfg.alarm.rules.size() == 1, "one rule parsed");
        const auto& r = cfg.alarm.rules[0];
        check(r.consecutive_frames == 5, "consecutive frames parsed");
        check(r.cooldown.count() == 60000, "cooldown parsed");
        check(r.time_range.has_value(), "time range parsed");
        check(r.time_range && r.time_range->contains(23 * 3600), "time range wraps midnight");
        check(r.time_range && !r.time_range->contains(12 * 3600), "noon outside night window");
        check(r.channels.size() == 2 && r.channels[1] == sg::ChannelKind::Bus, "mqtt alias maps to bus");
        check(cfg.alarm.levels.high > 0.79f, "high level parsed");
    }

    void test_alarm_levels_ordered() {
        check(load_throws("alarm:\n  levels:\n    high: 0.5\n    medium: 0.7\n"),
              "medium above high rejected");
    }

    void test_unknown_channel_rejected() {
        check(load_throws("alarm:\n  rules:\n    - id: \"r\"\n      channels: [\"sms\"]\n"),
              "unknown channel rejected");
    }

    void test_scene_parse() {
        const std::string yaml = std::string(kModels) +
            "algorithms:\n"
            "  helmet:\n"
            "    model: \"yolo\"\n"
            "    classes: [\"person\", \"helmet\"]\n"
            "    post_process:\n"
            "      type: \"missing_equipment\"\n"
            "      label: \"no_helmet\"\n"
            "scenes:\n"
            "  - scene: \"site A\"\n"
            "    algorithm: \"helmet\"\n"
            "    date_type: 2\n"
            "    start: \"08:00\"\n"
            "    end: \"18:00\"\n"
            "    months: [3, 4, 5]\n"
            "    devices:\n"
            "      - device: \"34020000001320000001\"\n"
            "        area: \"(0,0),(640,0),(640,480),(0,480)\"\n";
        const auto cfg = load(yaml);
        check(cfg.algorithms.count("helmet") == 1, "algorithm parsed");
        check(cfg.algorithms.at("helmet").post_process.kind == sg::PostProcessKind::MissingEquipment,
              "algorithm post-process parsed");
        check(cfg.scenes.size() == 1, "scene parsed");
        check(cfg.scenes[0].date_type == 2 && cfg.scenes[0].months.size() == 3, "scene schedule parsed");
        check(cfg.scenes[0].devices.size() == 1, "scene device parsed");
    }

    void test_scene_without_devices_rejected() {
        check(load_throws("scenes:\n  - scene: \"s\"\n    algorithm: \"a\"\n"), "scene without devices rejected");
    }

    void test_stream_time_policy_parse() {
        const auto cfg = load(
            "streams:\n"
            "  - id: \"cam0\"\n"
            "    source: \"a.mp4\"\n"
            "    time_policy:\n"
            "      date_type: 3\n"
            "      start: \"08:00\"\n"
            "      end: \"17:00\"\n");
        check(cfg.streams[0].config.time_policy.has_value(), "stream time policy parsed");
        check(load_throws(
                  "streams:\n"
                  "  - id: \"cam0\"\n"
                  "    source: \"a.mp4\"\n"
                  "    time_policy:\n"
                  "      date_type: 2\n"
                  "      start: \"08:00\"\n"
                  "      end: \"17:00\"\n"),
              "monthly policy without months rejected");
    }
}

int main() {
    test_empty_config_uses_defaults();
    test_seconds_become_milliseconds();
    test_negative_duration_rejected();
    test_stream_inherits_detection_defaults();
    test_duplicate_stream_rejected();
    test_stream_thresholds_validated();
    test_unknown_default_model_rejected();
    test_algorithm_model_must_exist();
    test_alarm_rules_parse();
    test_alarm_levels_ordered();
    test_unknown_channel_rejected();
    test_scene_parse();
    test_scene_without_devices_rejected();
    test_stream_time_policy_parse();

    return sgtest::finish("config");
}
