#include <alarm/alarm_engine.hpp>
#include <common/errors.hpp>
#include <device/heartbeat_manager.hpp>
#include <inference/model_pool.hpp>
#include <pipeline/post_processor.hpp>
#include <pipeline/stream_manager.hpp>
#include <scheduler/scene_scheduler.hpp>

#include "test_support.hpp"

#include <chrono>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

using sgtest::check;
using sgtest::Step;
using std::chrono::milliseconds;

namespace {
    class FakeDirectory : public sg::IDeviceDirectory {
    public:
        std::optional<std::string> resolve_stream(const std::string& device_id) override {
            std::lock_guard lk(mtx);
            ++lookups;
            auto it = urls.find(device_id);
            if (it == urls.end()) return std::nullopt;
            return it->second;
        }

        std::mutex mtx;
        std::map<std::string, std::string> urls;
        int lookups = 0;
    };

    class OkSender : public sg::IHeartbeatSender {
    public:
        bool send_heartbeat(const std::string&) override { return true; }
    };

    sg::ModelsConfig one_model() {
        sg::ModelsConfig m;
        sg::ModelSpec s;
        s.id = "yolo";
        s.param_path = "yolo.param";
        s.bin_path = "yolo.bin";
        m.catalog[s.id] = s;
        m.default_model = "yolo";
        return m;
    }

    std::unordered_map<std::string, sg::AlgorithmSpec> algorithms() {
        sg::AlgorithmSpec fire;
        fire.code = "fire";
        fire.model_id = "yolo";
        fire.target_classes = {"fire", "smoke"};
        sg::AlgorithmSpec helmet;
        helmet.code = "helmet";
        helmet.model_id = "yolo";
        helmet.post_process.kind = sg::PostProcessKind::MissingEquipment;
        return {{fire.code, fire}, {helmet.code, helmet}};
    }

    sg::WorkerConfig quiet_worker() {
        sg::WorkerConfig w;
        w.read_timeout_ms = 5;
        w.max_transient_reads = 1000000;
        w.gate_poll = milliseconds(10);
        w.log_every = 1000;
        return w;
    }

    std::string hhmm(int tod_s) {
        tod_s = ((tod_s % 86400) + 86400) % 86400;
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%02d:%02d", tod_s / 3600, (tod_s / 60) % 60);
        return buf;
    }

    struct Harness {
        sg::AlarmEngine alarms{sg::AlarmLevels{}, nullptr};
        sg::PostProcessRegistry post;
        sg::ModelPool models{sg::PoolMode::Shared, one_model(),
                             [](const sg::ModelSpec&) -> std::unique_ptr<sg::IDetector> {
                                 return std::make_unique<sgtest::FakeDetector>();
                             }};
        FakeDirectory directory;
        sg::HeartbeatManager heartbeats{std::make_shared<OkSender>(), [] {
                                            sg::HeartbeatConfig c;
                                            c.interval = milliseconds(1000);
                                            return c;
                                        }()};
        sg::StreamManager streams;
        sg::SceneScheduler scheduler;

        explicit Harness(int max_sessions = 10)
            : streams([&] {
                          sg::EngineConfig e;
                          e.max_sessions = max_sessions;
                          e.stop_timeout = milliseconds(1000);
                          return e;
                      }(),
                      quiet_worker(),
                      [](const std::string& id, const std::string&) -> std::unique_ptr<sg::IFrameSource> {
                          return std::make_unique<sgtest::FakeSource>(id, std::deque<Step>{Step::Frame}, Step::Timeout);
                      },
                      models, &alarms, post, sg::ArtifactLayout("results", "")),
              scheduler(sg::SchedulerConfig{}, sg::DetectionDefaults{}, algorithms(), streams, &heartbeats, &directory) {
            streams.set_gate(&scheduler);
        }

        ~Harness() {
            scheduler.shutdown();
            streams.shutdown();
        }
    };

    sg::DeploymentRequest request(const std::string& scene, const std::string& algo = "fire") {
        sg::DeploymentRequest r;
        r.scene_id = scene;
        r.algorithm_code = algo;
        r.date_type = 3;
        r.start = "00:00";
        r.end = "00:00";
        r.devices = {{"dev1", "", "rtsp://cam/1"}, {"dev2", "(0,0),(100,0),(100,100)", ""}};
        r.callback_url = "http://cb.local/alarm";
        return r;
    }

    void test_scene_session_ids() {
        check(sg::scene_session_id("s1", "dev1") == "scene_s1_dev1", "session id layout");
        check(sg::scene_session_id("site A", "dev 1") == "scene_site_A_dev_1", "spaces replaced");
    }

    void test_deploy_starts_every_device() {
        Harness h;
        h.directory.urls["dev2"] = "rtmp://cam/2";
        const sg::DeployReport rep = h.scheduler.deploy(request("s1"));
        check(rep.status.ok(), "deploy succeeds");
        check(rep.deployed == 2 && rep.failed.empty(), "both devices deployed");

        const auto snap = h.streams.status("scene_s1_dev2");
        check(snap.has_value(), "session registered for dev2");
        if (snap) {
            check(snap->config.source == "rtmp://cam/2", "source resolved through the directory");
            check(snap->config.region == "(0,0),(100,0),(100,100)", "device area becomes the region");
            check(snap->config.target.callback_url == "http://cb.local/alarm", "callback url propagated");
            check(snap->config.target.device_id == "dev2", "device id propagated");
            check(snap->config.target_classes.size() == 2, "algorithm classes applied");
            check(sg::is_running(snap->status), "session running");
        }
        check(h.heartbeats.running("dev1") && h.heartbeats.running("dev2"), "heartbeats started");

        const auto dep = h.scheduler.deployment("s1");
        check(dep && dep->sessions.size() == 2, "deployment recorded");
        check(dep && dep->model_id == "yolo", "deployment model");
        check(dep && !dep->expiry, "daily deployment never expires");
    }

    void test_unknown_algorithm_rejected() {
        Harness h;
        const auto rep = h.scheduler.deploy(request("s1", "teleport"));
        check(rep.status.code == sg::ErrorCode::ConfigError, "unknown algorithm is a config error");
        check(h.streams.list().empty(), "nothing registered");
        check(!h.scheduler.deployment("s1"), "nothing recorded");
    }

    void test_bad_schedule_rejected() {
        Harness h;
        sg::DeploymentRequest r = request("s1");
        r.date_type = 2;
        check(h.scheduler.deploy(r).status.code == sg::ErrorCode::ConfigError, "type 2 without months rejected");
        r.date_type = 1;
        r.start = "2025-01-10 10:00:00";
        r.end = "2025-01-10 09:00:00";
        check(h.scheduler.deploy(r).status.code == sg::ErrorCode::ConfigError, "absolute end before start rejected");

        sg::DeploymentRequest empty = request("s2");
        empty.devices.clear();
        check(h.scheduler.deploy(empty).status.code == sg::ErrorCode::ConfigError, "no devices rejected");
    }

    void test_repeated_device_rejected() {
        Harness h;
        sg::DeploymentRequest r = request("s1");
        r.devices = {{"dev1", "", "rtsp://cam/1"}, {"dev1", "", "rtsp://cam/1"}};
        const auto rep = h.scheduler.deploy(r);
        check(rep.status.code == sg::ErrorCode::ConfigError, "device listed twice is a config error");
        check(h.streams.list().empty(), "nothing registered for the rejected scene");
        check(!h.heartbeats.running("dev1"), "no heartbeat left behind");

        r.devices = {{"", "", "rtsp://cam/1"}};
        check(h.scheduler.deploy(r).status.code == sg::ErrorCode::ConfigError, "device without an id rejected");
    }

    void test_partial_failure_reported() {
        Harness h;
        // dev2 cannot be resolved
        const auto rep = h.scheduler.deploy(request("s1"));
        check(rep.status.ok(), "partial deployment still succeeds");
        check(rep.deployed == 1, "one device deployed");
        check(rep.failed.size() == 1 && rep.failed[0].first == "dev2", "dev2 reported as failed");
        check(!h.streams.status("scene_s1_dev2"), "failed device leaves no session behind");
        check(!h.heartbeats.running("dev2"), "no heartbeat for the failed device");
    }

    void test_total_failure_is_an_error() {
        Harness h;
        sg::DeploymentRequest r = request("s1");
        r.devices = {{"devX", "", ""}};
        const auto rep = h.scheduler.deploy(r);
        check(!rep.status.ok(), "no device deployed is an error");
        check(rep.status.code == sg::ErrorCode::ConnectivityError, "unresolvable stream is a connectivity error");
        check(!h.scheduler.deployment("s1"), "failed deployment not recorded");
    }

    void test_capacity_failure_cleans_up() {
        Harness h(1);
        h.directory.urls["dev2"] = "rtmp://cam/2";
        const auto rep = h.scheduler.deploy(request("s1"));
        check(rep.deployed == 1, "only one session fits");
        check(rep.failed.size() == 1, "second device reported");
        check(h.streams.list().size() == 1, "rejected session not left registered");
    }

    void test_redeploy_replaces() {
        Harness h;
        h.directory.urls["dev2"] = "rtmp://cam/2";
        check(h.scheduler.deploy(request("s1")).status.ok(), "first deploy");
        check(h.scheduler.deploy(request("s1")).status.ok(), "second deploy of the same scene");
        check(h.scheduler.deployments().size() == 1, "one deployment per scene");
        check(h.streams.list().size() == 2, "sessions replaced, not duplicated");
        const auto hb = h.heartbeats.stats("dev1");
        check(hb && hb->refs == 1, "heartbeat reference not leaked by redeploy");
    }

    void test_shared_device_heartbeat_refcount() {
        Harness h;
        sg::DeploymentRequest a = request("a");
        a.devices = {{"dev1", "", "rtsp://cam/1"}};
        sg::DeploymentRequest b = request("b");
        b.devices = {{"dev1", "", "rtsp://cam/1"}};
        h.scheduler.deploy(a);
        h.scheduler.deploy(b);
        check(h.heartbeats.stats("dev1") && h.heartbeats.stats("dev1")->refs == 2, "two scenes share dev1");
        h.scheduler.stop_deployment("a");
        check(h.heartbeats.running("dev1"), "heartbeat kept while scene b runs");
        h.scheduler.stop_deployment("b");
        check(!h.heartbeats.running("dev1"), "heartbeat stopped with the last scene");
    }

    void test_is_permitted_follows_policy() {
        Harness h;
        sg::DeploymentRequest r = request("s1");
        r.devices = {{"dev1", "", "rtsp://cam/1"}};
        r.start = "08:00";
        r.end = "18:00";
        h.scheduler.deploy(r);

        check(h.scheduler.is_permitted("scene_s1_dev1", sg::parse_datetime("2025-01-10 12:00:00")),
              "inside the daily window");
        check(!h.scheduler.is_permitted("scene_s1_dev1", sg::parse_datetime("2025-01-10 20:00:00")),
              "outside the daily window");
        check(h.scheduler.is_permitted("plain_stream", sg::parse_datetime("2025-01-10 20:00:00")),
              "sessions outside deployments are always permitted");
    }

    void test_gate_blocks_outside_window() {
        Harness h;
        const int now_s = sg::seconds_of_day(sg::Clock::now());
        sg::DeploymentRequest r = request("s1");
        r.devices = {{"dev1", "", "rtsp://cam/1"}};
        r.start = hhmm(now_s + 2 * 3600);
        r.end = hhmm(now_s + 3 * 3600);
        check(h.scheduler.deploy(r).status.ok(), "deploy with a closed window");
        std::this_thread::sleep_for(milliseconds(100));
        const auto snap = h.streams.status("scene_s1_dev1");
        check(snap && snap->frames == 0, "no frames processed outside the window");
        check(snap && sg::is_running(snap->status), "session stays up while paused");
    }

    void test_expire_due_stops_absolute_deployments() {
        Harness h;
        const auto now = sg::Clock::now();
        sg::DeploymentRequest r = request("s1");
        r.devices = {{"dev1", "", "rtsp://cam/1"}};
        r.date_type = 1;
        r.start = sg::format_datetime(now - std::chrono::hours(1));
        r.end = sg::format_datetime(now + std::chrono::hours(1));
        check(h.scheduler.deploy(r).status.ok(), "absolute deployment");
        check(h.scheduler.deployment("s1") && h.scheduler.deployment("s1")->expiry.has_value(), "expiry recorded");

        check(h.scheduler.expire_due(now) == 0, "not due yet");
        check(h.scheduler.expire_due(now + std::chrono::hours(2)) == 1, "due after the end");
        check(!h.scheduler.deployment("s1"), "expired deployment removed");
        check(!h.streams.status("scene_s1_dev1"), "expired sessions unregistered");
        check(!h.heartbeats.running("dev1"), "expired heartbeats stopped");
    }

    void test_stop_deployment() {
        Harness h;
        check(h.scheduler.stop_deployment("ghost").code == sg::ErrorCode::NotFound, "unknown scene");
        sg::DeploymentRequest r = request("s1");
        r.devices = {{"dev1", "", "rtsp://cam/1"}};
        h.scheduler.deploy(r);
        check(h.scheduler.stop_deployment("s1").ok(), "stop known scene");
        check(h.streams.list().empty(), "sessions removed");
        check(h.scheduler.is_permitted("scene_s1_dev1", sg::parse_datetime("2025-01-10 20:00:00")),
              "policy index cleared");
    }

    void test_leftover_session_is_replaced() {
        Harness h;
        sg::StreamConfig stale;
        stale.id = "scene_s1_dev1";
        stale.source = "rtsp://old/1";
        check(h.streams.register_stream(stale).ok(), "stale session registered by hand");

        sg::DeploymentRequest r = request("s1");
        r.devices = {{"dev1", "", "rtsp://cam/1"}};
        check(h.scheduler.deploy(r).status.ok(), "deploy over a stale session");
        const auto snap = h.streams.status("scene_s1_dev1");
        check(snap && snap->config.source == "rtsp://cam/1", "stale session replaced");
    }
}

int main() {
    test_scene_session_ids();
    test_deploy_starts_every_device();
    test_unknown_algorithm_rejected();
    test_bad_schedule_rejected();
    test_repeated_device_rejected();
    test_partial_failure_reported();
    test_total_failure_is_an_error();
    test_capacity_failure_cleans_up();
    test_redeploy_replaces();
    test_shared_device_heartbeat_refcount();
    test_is_permitted_follows_policy();
    test_gate_blocks_outside_window();
    test_expire_due_stops_absolute_deployments();
    test_stop_deployment();
    test_leftover_session_is_replaced();

    return sgtest::finish("scene scheduler");
}
