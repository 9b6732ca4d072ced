#include <common/config.hpp>
#include <common/errors.hpp>

#include <cmath>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace sg {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static double get_double(
        const YAML::Node& n, const char* key, double def) {
        return (n && n[key]) ? n[key].as<double>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static std::vector<std::string> get_str_list(const YAML::Node& n, const char* key) {
        if (!n || !n[key]) return {};
        if (!n[key].IsSequence()) {
            throw ConfigError(std::string("[Config] '") + key + "' must be a list");
        }
        return n[key].as<std::vector<std::string>>();
    }

    // Seconds in the file, milliseconds in memory.
    static milliseconds get_seconds(const YAML::Node& n, const char* key, milliseconds def) {
        if (!n || !n[key]) return def;
        const double s = n[key].as<double>();
        if (s < 0.0) {
            throw ConfigError(std::string("[Config] '") + key + "' must not be negative");
        }
        return milliseconds(static_cast<int64_t>(std::llround(s * 1000.0)));
    }

    static void require_unit(float v, const std::string& what) {
        if (!(v >= 0.0f && v <= 1.0f)) {
            throw ConfigError("[Config] " + what + " must be within [0, 1]");
        }
    }

    static void require_positive(int v, const std::string& what) {
        if (v <= 0) throw ConfigError("[Config] " + what + " must be positive");
    }

    void validate_stream_config(const StreamConfig& cfg) {
        if (cfg.id.empty()) throw ConfigError("[Config] stream id is empty");
        if (cfg.source.empty()) throw ConfigError("[Config] stream " + cfg.id + " has empty source");
        require_unit(cfg.conf_threshold, "stream " + cfg.id + " confidence");
        require_unit(cfg.iou_threshold, "stream " + cfg.id + " iou");
        require_positive(cfg.img_size, "stream " + cfg.id + " image_size");
        if (!(cfg.fps_limit > 0.0)) {
            throw ConfigError("[Config] stream " + cfg.id + " fps must be positive");
        }
    }

    static PostProcessConfig parse_post_process(const YAML::Node& p) {
        PostProcessConfig c;
        if (!p) return c;
        if (p.IsScalar()) {
            c.kind = post_process_from_str(p.as<std::string>());
            return c;
        }
        c.kind = post_process_from_str(get_str(p, "type", "none"));
        c.subject_class = get_str(p, "subject", c.subject_class);
        c.required_class = get_str(p, "required", c.required_class);
        c.violation_label = get_str(p, "label", c.violation_label);
        c.min_confidence = static_cast<float>(get_double(p, "min_confidence", c.min_confidence));
        c.presence_s = get_double(p, "presence_s", c.presence_s);
        require_unit(c.min_confidence, "post_process.min_confidence");
        return c;
    }

    static std::vector<int> parse_months(const YAML::Node& n) {
        if (!n) return {};
        if (!n.IsSequence()) throw ConfigError("[Config] months must be a list");
        return n.as<std::vector<int>>();
    }

    static std::optional<TimePolicy> parse_time_policy(const YAML::Node& t) {
        if (!t) return std::nullopt;
        return TimePolicy::parse(get_int(t, "date_type", 3),
                                 get_str(t, "start", ""),
                                 get_str(t, "end", ""),
                                 parse_months(t["months"]));
    }

    static StreamEntry parse_stream(const YAML::Node& s, const DetectionDefaults& det) {
        StreamEntry e;
        StreamConfig& c = e.config;
        c.id = get_str(s, "id", "");
        c.source = get_str(s, "source", "");
        c.name = get_str(s, "name", c.id);
        c.conf_threshold = static_cast<float>(get_double(s, "confidence", det.confidence));
        c.iou_threshold = static_cast<float>(get_double(s, "iou", det.iou));
        c.img_size = get_int(s, "image_size", det.image_size);
        c.fps_limit = get_double(s, "fps", det.fps_limit);
        c.model_id = get_str(s, "model", "");
        c.target_classes = get_str_list(s, "classes");
        c.region = get_str(s, "region", "");
        c.post_process = parse_post_process(s["post_process"]);
        c.time_policy = parse_time_policy(s["time_policy"]);
        c.target.callback_url = get_str(s, "callback_url", "");
        c.target.scene_id = get_str(s, "scene", "");
        c.target.device_id = get_str(s, "device", "");
        e.autostart = get_bool(s, "autostart", true);
        validate_stream_config(c);
        return e;
    }

    static AlarmRule parse_rule(const YAML::Node& r) {
        AlarmRule rule;
        rule.id = get_str(r, "id", "");
        if (rule.id.empty()) throw ConfigError("[Config] alarm rule without id");
        rule.name = get_str(r, "name", rule.id);
        rule.session_ids = get_str_list(r, "sessions");
        rule.class_names = get_str_list(r, "classes");
        rule.min_confidence = static_cast<float>(get_double(r, "min_confidence", rule.min_confidence));
        rule.consecutive_frames = get_int(r, "consecutive_frames", rule.consecutive_frames);
        rule.cooldown = get_seconds(r, "cooldown_s", rule.cooldown);
        rule.enabled = get_bool(r, "enabled", true);
        if (const YAML::Node tr = r["time_range"]) {
            rule.time_range = parse_daily_window(get_str(tr, "start", "00:00"), get_str(tr, "end", "23:59"));
        }
        if (r["channels"]) {
            rule.channels.clear();
            for (const auto& ch : get_str_list(r, "channels")) {
                rule.channels.push_back(channel_from_str(ch));
            }
        }
        require_unit(rule.min_confidence, "rule " + rule.id + " min_confidence");
        require_positive(rule.consecutive_frames, "rule " + rule.id + " consecutive_frames");
        return rule;
    }

    static ModelsConfig parse_models(const YAML::Node& m) {
        ModelsConfig c;
        if (!m) return c;
        c.mode = get_str(m, "mode", c.mode);
        if (c.mode != "shared" && c.mode != "dedicated") {
            throw ConfigError("[Config] models.mode must be shared or dedicated");
        }
        c.default_model = get_str(m, "default", "");

        const YAML::Node catalog = m["catalog"];
        if (catalog) {
            if (!catalog.IsMap()) throw ConfigError("[Config] models.catalog must be a map!");
            for (auto it = catalog.begin(); it != catalog.end(); ++it) {
                ModelSpec spec;
                spec.id = it->first.as<std::string>();
                const YAML::Node n = it->second;
                spec.param_path = get_str(n, "param", "");
                spec.bin_path = get_str(n, "bin", "");
                spec.class_names = get_str_list(n, "classes");
                spec.names_path = get_str(n, "names", "");
                spec.input_blob = get_str(n, "input_blob", spec.input_blob);
                spec.output_blob = get_str(n, "output_blob", spec.output_blob);
                spec.threads = get_int(n, "threads", spec.threads);
                if (spec.param_path.empty() || spec.bin_path.empty()) {
                    throw ConfigError("[Config] model " + spec.id + " needs param and bin paths");
                }
                c.catalog[spec.id] = std::move(spec);
            }
        }
        if (c.default_model.empty() && c.catalog.size() == 1) {
            c.default_model = c.catalog.begin()->first;
        }
        if (!c.default_model.empty() && !c.catalog.count(c.default_model)) {
            throw ConfigError("[Config] default model '" + c.default_model + "' is not in the catalog");
        }
        return c;
    }

    static std::unordered_map<std::string, AlgorithmSpec> parse_algorithms(const YAML::Node& a) {
        std::unordered_map<std::string, AlgorithmSpec> out;
        if (!a) return out;
        if (!a.IsMap()) throw ConfigError("[Config] algorithms must be a map!");
        for (auto it = a.begin(); it != a.end(); ++it) {
            AlgorithmSpec spec;
            spec.code = it->first.as<std::string>();
            const YAML::Node n = it->second;
            spec.model_id = get_str(n, "model", "");
            spec.target_classes = get_str_list(n, "classes");
            spec.post_process = parse_post_process(n["post_process"]);
            out[spec.code] = std::move(spec);
        }
        return out;
    }

    static DeploymentRequest parse_scene(const YAML::Node& s) {
        DeploymentRequest req;
        req.scene_id = get_str(s, "scene", "");
        req.algorithm_code = get_str(s, "algorithm", "");
        req.date_type = get_int(s, "date_type", 3);
        req.start = get_str(s, "start", "00:00");
        req.end = get_str(s, "end", "00:00");
        req.months = parse_months(s["months"]);
        req.callback_url = get_str(s, "callback_url", "");
        if (req.scene_id.empty()) throw ConfigError("[Config] scene without id");
        const YAML::Node devs = s["devices"];
        if (!devs || !devs.IsSequence() || devs.size() == 0) {
            throw ConfigError("[Config] scene " + req.scene_id + " has no devices");
        }
        for (const auto& d : devs) {
            DeviceSpec dev;
            dev.device_id = get_str(d, "device", "");
            dev.area = get_str(d, "area", "");
            dev.source = get_str(d, "source", "");
            if (dev.device_id.empty()) {
                throw ConfigError("[Config] scene " + req.scene_id + " has a device without id");
            }
            req.devices.push_back(std::move(dev));
        }
        return req;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        const YAML::Node eng = root["engine"];
        cfg.engine.max_sessions = get_int(eng, "max_sessions", cfg.engine.max_sessions);
        cfg.engine.health_interval = get_seconds(eng, "health_interval_s", cfg.engine.health_interval);
        cfg.engine.stall_timeout = get_seconds(eng, "stall_timeout_s", cfg.engine.stall_timeout);
        cfg.engine.reconnect_timeout = get_seconds(eng, "reconnect_timeout_s", cfg.engine.reconnect_timeout);
        cfg.engine.stop_timeout = get_seconds(eng, "stop_timeout_s", cfg.engine.stop_timeout);
        require_positive(cfg.engine.max_sessions, "engine.max_sessions");

        const YAML::Node wk = root["worker"];
        cfg.worker.reconnect_attempts = get_int(wk, "reconnect_attempts", cfg.worker.reconnect_attempts);
        cfg.worker.reconnect_interval = get_seconds(wk, "reconnect_interval_s", cfg.worker.reconnect_interval);
        cfg.worker.read_timeout_ms = get_int(wk, "read_timeout_ms", cfg.worker.read_timeout_ms);
        cfg.worker.max_transient_reads = get_int(wk, "max_transient_reads", cfg.worker.max_transient_reads);
        cfg.worker.min_frame_size = get_int(wk, "min_frame_size", cfg.worker.min_frame_size);
        cfg.worker.max_resolution = get_int(wk, "max_resolution", cfg.worker.max_resolution);
        cfg.worker.gate_poll = get_seconds(wk, "gate_poll_s", cfg.worker.gate_poll);
        cfg.worker.log_every = get_int(wk, "log_every", cfg.worker.log_every);
        require_positive(cfg.worker.read_timeout_ms, "worker.read_timeout_ms");

        const YAML::Node det = root["detection"];
        cfg.detection.confidence = static_cast<float>(get_double(det, "confidence", cfg.detection.confidence));
        cfg.detection.iou = static_cast<float>(get_double(det, "iou", cfg.detection.iou));
        cfg.detection.image_size = get_int(det, "image_size", cfg.detection.image_size);
        cfg.detection.fps_limit = get_double(det, "fps", cfg.detection.fps_limit);
        require_unit(cfg.detection.confidence, "detection.confidence");
        require_unit(cfg.detection.iou, "detection.iou");

        cfg.models = parse_models(root["models"]);

        const YAML::Node al = root["alarm"];
        const YAML::Node levels = al ? al["levels"] : YAML::Node();
        cfg.alarm.levels.high = static_cast<float>(get_double(levels, "high", cfg.alarm.levels.high));
        cfg.alarm.levels.medium = static_cast<float>(get_double(levels, "medium", cfg.alarm.levels.medium));
        if (cfg.alarm.levels.medium > cfg.alarm.levels.high) {
            throw ConfigError("[Config] alarm.levels.medium must not exceed alarm.levels.high");
        }
        cfg.alarm.default_rule = get_bool(al, "default_rule", cfg.alarm.default_rule);
        if (al && al["rules"]) {
            if (!al["rules"].IsSequence()) throw ConfigError("[Config] alarm.rules must be a list");
            for (const auto& r : al["rules"]) cfg.alarm.rules.push_back(parse_rule(r));
        }

        const YAML::Node nt = root["notify"];
        const int cap = get_int(nt, "queue_capacity", static_cast<int>(cfg.notify.queue_capacity));
        require_positive(cap, "notify.queue_capacity");
        cfg.notify.queue_capacity = static_cast<size_t>(cap);
        cfg.notify.workers = get_int(nt, "workers", cfg.notify.workers);
        require_positive(cfg.notify.workers, "notify.workers");
        const YAML::Node cb = nt ? nt["callback"] : YAML::Node();
        cfg.notify.callback.timeout_s = get_int(cb, "timeout_s", cfg.notify.callback.timeout_s);
        cfg.notify.callback.failure_threshold = get_int(cb, "failure_threshold", cfg.notify.callback.failure_threshold);
        cfg.notify.callback.warn_every = get_int(cb, "warn_every", cfg.notify.callback.warn_every);
        const YAML::Node mq = nt ? nt["mqtt"] : YAML::Node();
        cfg.notify.mqtt.enabled = get_bool(mq, "enabled", cfg.notify.mqtt.enabled);
        cfg.notify.mqtt.host = get_str(mq, "host", cfg.notify.mqtt.host);
        cfg.notify.mqtt.port = get_int(mq, "port", cfg.notify.mqtt.port);
        cfg.notify.mqtt.client_id = get_str(mq, "client_id", cfg.notify.mqtt.client_id);
        cfg.notify.mqtt.username = get_str(mq, "username", cfg.notify.mqtt.username);
        cfg.notify.mqtt.password = get_str(mq, "password", cfg.notify.mqtt.password);
        cfg.notify.mqtt.topic = get_str(mq, "topic", cfg.notify.mqtt.topic);
        cfg.notify.mqtt.qos = get_int(mq, "qos", cfg.notify.mqtt.qos);
        cfg.notify.mqtt.keepalive_s = get_int(mq, "keepalive_s", cfg.notify.mqtt.keepalive_s);
        if (cfg.notify.mqtt.enabled && cfg.notify.mqtt.topic.empty()) {
            throw ConfigError("[Config] notify.mqtt.topic is empty");
        }

        const YAML::Node st = root["storage"];
        cfg.storage.results_root = get_str(st, "results_root", cfg.storage.results_root);
        cfg.storage.media_base_url = get_str(st, "media_base_url", cfg.storage.media_base_url);

        cfg.scheduler.expiry_scan = get_seconds(root["scheduler"], "expiry_scan_s", cfg.scheduler.expiry_scan);

        const YAML::Node hb = root["heartbeat"];
        cfg.heartbeat.interval = get_seconds(hb, "interval_s", cfg.heartbeat.interval);
        cfg.heartbeat.failure_threshold = get_int(hb, "failure_threshold", cfg.heartbeat.failure_threshold);
        cfg.heartbeat.stop_timeout = get_seconds(hb, "stop_timeout_s", cfg.heartbeat.stop_timeout);

        const YAML::Node dp = root["device_platform"];
        cfg.device_platform.base_url = get_str(dp, "base_url", "");
        cfg.device_platform.timeout_s = get_int(dp, "timeout_s", cfg.device_platform.timeout_s);

        cfg.algorithms = parse_algorithms(root["algorithms"]);
        for (const auto& kv : cfg.algorithms) {
            const std::string& model = kv.second.model_id;
            if (!model.empty() && !cfg.models.catalog.count(model)) {
                throw ConfigError("[Config] algorithm " + kv.first + " references unknown model " + model);
            }
        }

        if (const YAML::Node arr = root["streams"]) {
            if (!arr.IsSequence()) throw ConfigError("[Config] streams must be a list");
            for (const auto& s : arr) {
                StreamEntry e = parse_stream(s, cfg.detection);
                for (const auto& prev : cfg.streams) {
                    if (prev.config.id == e.config.id) {
                        throw ConfigError("[Config] duplicate stream id " + e.config.id);
                    }
                }
                cfg.streams.push_back(std::move(e));
            }
        }

        if (const YAML::Node arr = root["scenes"]) {
            if (!arr.IsSequence()) throw ConfigError("[Config] scenes must be a list");
            for (const auto& s : arr) cfg.scenes.push_back(parse_scene(s));
        }

        if (cfg.streams.empty() && cfg.scenes.empty()) {
            std::cerr << "[Config](load_config_yaml) no streams or scenes configured, waiting idle\n";
        }
        return cfg;
    }
}
