#include <alarm/alarm_engine.hpp>
#include <common/config.hpp>
#include <common/errors.hpp>
#include <device/device_client.hpp>
#include <device/heartbeat_manager.hpp>
#include <inference/model_pool.hpp>
#include <ingest/frame_source_factory.hpp>
#include <notify/bus_channel.hpp>
#include <notify/callback_channel.hpp>
#include <notify/dispatcher.hpp>
#include <notify/log_channel.hpp>
#include <notify/mqtt_publisher.hpp>
#include <pipeline/post_processor.hpp>
#include <pipeline/stream_manager.hpp>
#include <scheduler/scene_scheduler.hpp>
#include <storage/artifact_layout.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

static void print_summary(const sg::StreamManager& streams,
                          const sg::NotificationDispatcher& dispatcher,
                          const sg::AlarmEngine& alarms) {
    const auto st = streams.stats();
    const auto ds = dispatcher.stats();
    const auto as = alarms.stats();
    std::cout << "[Service](status) sessions=" << st.sessions << " running=" << st.running
              << "/" << st.max_sessions << " frames=" << st.frames << " detections=" << st.detections
              << " alarms=" << as.total << " queued=" << ds.queued << " dropped=" << ds.dropped << "\n";
    for (const auto& s : streams.list()) {
        std::cout << "  " << s.config.id << " " << sg::to_string(s.status) << " frames=" << s.frames
                  << " fps=" << s.avg_fps;
        if (!s.last_error.empty()) std::cout << " last_error=\"" << s.last_error << "\"";
        std::cout << "\n";
    }
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "configs/sceneguard.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    sg::AppConfig cfg;
    try {
        cfg = sg::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const sg::ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    std::shared_ptr<sg::DeviceClient> device_client;
    if (!cfg.device_platform.base_url.empty()) {
        device_client = std::make_shared<sg::DeviceClient>(cfg.device_platform);
    }
    sg::HeartbeatManager heartbeats(device_client, cfg.heartbeat);

    sg::NotificationDispatcher dispatcher(cfg.notify.queue_capacity, cfg.notify.workers);
    dispatcher.add_channel(std::make_shared<sg::LogChannel>());
    dispatcher.add_channel(std::make_shared<sg::CallbackChannel>(
        sg::make_http_poster(cfg.notify.callback.timeout_s),
        cfg.notify.callback.failure_threshold,
        cfg.notify.callback.warn_every));
    if (cfg.notify.mqtt.enabled) {
        try {
            auto publisher = std::make_shared<sg::MqttPublisher>(cfg.notify.mqtt);
            dispatcher.add_channel(std::make_shared<sg::BusChannel>(publisher, cfg.notify.mqtt.topic));
        } catch (const std::exception& e) {
            std::cerr << "[Service](main) message bus disabled: " << e.what() << "\n";
        }
    }
    dispatcher.start();

    sg::AlarmEngine alarms(cfg.alarm.levels, &dispatcher);
    if (cfg.alarm.default_rule) {
        sg::Status st = alarms.add_rule(sg::default_alarm_rule());
        if (!st.ok()) std::cerr << "[Service](main) default rule: " << st.message << "\n";
    }
    for (const auto& rule : cfg.alarm.rules) {
        sg::Status st = alarms.add_rule(rule);
        if (!st.ok()) std::cerr << "[Service](main) rule " << rule.id << ": " << st.message << "\n";
    }

    sg::ModelPool models(sg::pool_mode_from_str(cfg.models.mode), cfg.models, sg::make_ncnn_detector_factory());
    sg::PostProcessRegistry post;

    sg::StreamManager streams(cfg.engine,
                              cfg.worker,
                              &sg::make_frame_source,
                              models,
                              &alarms,
                              post,
                              sg::ArtifactLayout(cfg.storage.results_root, cfg.storage.media_base_url));

    sg::SceneScheduler scheduler(cfg.scheduler,
                                 cfg.detection,
                                 cfg.algorithms,
                                 streams,
                                 device_client ? &heartbeats : nullptr,
                                 device_client.get());
    streams.set_gate(&scheduler);
    streams.start_monitor();
    scheduler.start_monitor();

    for (const auto& entry : cfg.streams) {
        sg::Status st = streams.register_stream(entry.config);
        if (st.ok() && entry.autostart) st = streams.start(entry.config.id);
        if (!st.ok()) {
            std::cerr << "[Service](main) stream " << entry.config.id << ": "
                      << sg::to_string(st.code) << " " << st.message << "\n";
        }
    }

    for (const auto& scene : cfg.scenes) {
        const sg::DeployReport rep = scheduler.deploy(scene);
        if (!rep.status.ok()) {
            std::cerr << "[Service](main) scene " << scene.scene_id << ": " << rep.status.message << "\n";
        }
        for (const auto& f : rep.failed) {
            std::cerr << "[Service](main) scene " << scene.scene_id << " device " << f.first
                      << ": " << f.second << "\n";
        }
    }

    auto last_summary = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        const auto now = std::chrono::steady_clock::now();
        if (now - last_summary >= std::chrono::seconds(60)) {
            print_summary(streams, dispatcher, alarms);
            last_summary = now;
        }
    }

    std::cerr << "Shutting down...\n";
    scheduler.shutdown();
    streams.shutdown();
    heartbeats.stop_all();
    dispatcher.shutdown();
    print_summary(streams, dispatcher, alarms);

    return 0;
}
