#include <scheduler/scene_scheduler.hpp>

#include <algorithm>
#include <iostream>
#include <set>

namespace sg {
    std::string scene_session_id(const std::string& scene_id, const std::string& device_id) {
        std::string id = "scene_" + scene_id + "_" + device_id;
        std::replace(id.begin(), id.end(), ' ', '_');
        return id;
    }

    SceneScheduler::SceneScheduler(SchedulerConfig cfg,
                                   DetectionDefaults defaults,
                                   std::unordered_map<std::string, AlgorithmSpec> algorithms,
                                   StreamManager& streams,
                                   HeartbeatManager* heartbeats,
                                   IDeviceDirectory* directory)
        : cfg_(cfg),
          defaults_(defaults),
          algorithms_(std::move(algorithms)),
          streams_(streams),
          heartbeats_(heartbeats),
          directory_(directory) {}

    SceneScheduler::~SceneScheduler() {
        stop_monitor();
    }

    DeployReport SceneScheduler::deploy(const DeploymentRequest& req) {
        DeployReport rep;
        if (req.scene_id.empty()) {
            rep.status = Status::error(ErrorCode::ConfigError, "sceneId is empty");
            return rep;
        }
        if (req.devices.empty()) {
            rep.status = Status::error(ErrorCode::ConfigError, "scene " + req.scene_id + " lists no devices");
            return rep;
        }

        std::set<std::string> seen;
        for (const auto& dev : req.devices) {
            if (dev.device_id.empty() || !seen.insert(dev.device_id).second) {
                rep.status = Status::error(ErrorCode::ConfigError,
                                           "scene " + req.scene_id + " lists device '" + dev.device_id +
                                               "' more than once or without an id");
                return rep;
            }
        }

        TimePolicy policy;
        try {
            policy = TimePolicy::parse(req.date_type, req.start, req.end, req.months);
        } catch (const ConfigError& e) {
            rep.status = Status::error(ErrorCode::ConfigError, e.what());
            return rep;
        }

        auto algo_it = algorithms_.find(req.algorithm_code);
        if (algo_it == algorithms_.end()) {
            rep.status = Status::error(ErrorCode::ConfigError, "unknown algorithm '" + req.algorithm_code + "'");
            return rep;
        }
        const AlgorithmSpec& algo = algo_it->second;

        std::lock_guard ops(ops_mtx_);
        if (deployments_.count(req.scene_id)) {
            std::cout << "[SceneScheduler](deploy) replacing live deployment of scene " << req.scene_id << "\n";
            Status st = stop_locked_(req.scene_id);
            if (!st.ok()) {
                std::cerr << "[SceneScheduler](deploy) teardown of " << req.scene_id << ": " << st.message << "\n";
            }
        }

        SceneDeployment dep;
        dep.scene_id = req.scene_id;
        dep.algorithm_code = req.algorithm_code;
        dep.model_id = algo.model_id;
        dep.policy = policy;
        dep.expiry = policy.expiry();
        dep.deployed_at = Clock::now();

        Status last_failure;
        for (const auto& dev : req.devices) {
            std::string source = dev.source;
            if (source.empty() && directory_) {
                source = directory_->resolve_stream(dev.device_id).value_or("");
            }
            if (source.empty()) {
                rep.failed.emplace_back(dev.device_id, "stream address unavailable");
                last_failure = Status::error(ErrorCode::ConnectivityError, "stream address unavailable");
                continue;
            }

            StreamConfig sc;
            sc.id = scene_session_id(req.scene_id, dev.device_id);
            sc.source = source;
            sc.name = req.scene_id + "/" + dev.device_id;
            sc.conf_threshold = defaults_.confidence;
            sc.iou_threshold = defaults_.iou;
            sc.img_size = defaults_.image_size;
            sc.fps_limit = defaults_.fps_limit;
            sc.model_id = algo.model_id;
            sc.target_classes = algo.target_classes;
            sc.region = dev.area;
            sc.post_process = algo.post_process;
            sc.target.callback_url = req.callback_url;
            sc.target.scene_id = req.scene_id;
            sc.target.device_id = dev.device_id;

            {
                std::unique_lock idx(index_mtx_);
                policies_[sc.id] = policy;
            }

            Status st = streams_.register_stream(sc);
            if (st.code == ErrorCode::DuplicateId) {
                // left over from a deployment that was not torn down cleanly
                Status un = streams_.unregister(sc.id);
                if (un.ok()) st = streams_.register_stream(sc);
            }
            if (st.ok()) {
                st = streams_.start(sc.id);
                if (!st.ok()) {
                    Status un = streams_.unregister(sc.id);
                    if (!un.ok()) {
                        std::cerr << "[SceneScheduler](deploy) cleanup of " << sc.id << ": " << un.message << "\n";
                    }
                }
            }
            if (!st.ok()) {
                std::unique_lock idx(index_mtx_);
                policies_.erase(sc.id);
                rep.failed.emplace_back(dev.device_id, st.message);
                last_failure = st;
                continue;
            }

            if (heartbeats_) heartbeats_->start(dev.device_id);
            dep.sessions[dev.device_id] = sc.id;
            ++rep.deployed;
        }

        std::cout << "[SceneScheduler](deploy) scene " << req.scene_id << " algorithm " << req.algorithm_code
                  << ": " << rep.deployed << " deployed, " << rep.failed.size() << " failed, policy "
                  << policy.describe() << "\n";

        if (rep.deployed == 0) {
            rep.status = last_failure.ok()
                ? Status::error(ErrorCode::ConnectivityError, "no device could be deployed")
                : last_failure;
            return rep;
        }
        deployments_[req.scene_id] = std::move(dep);
        rep.status = Status::success();
        return rep;
    }

    Status SceneScheduler::stop_locked_(const std::string& scene_id) {
        auto it = deployments_.find(scene_id);
        if (it == deployments_.end()) {
            return Status::error(ErrorCode::NotFound, "scene " + scene_id + " is not deployed");
        }

        for (const auto& kv : it->second.sessions) {
            Status st = streams_.unregister(kv.second);
            if (!st.ok()) {
                std::cerr << "[SceneScheduler](stop) " << kv.second << ": " << st.message << "\n";
            }
            {
                std::unique_lock idx(index_mtx_);
                policies_.erase(kv.second);
            }
            if (heartbeats_) heartbeats_->stop(kv.first);
        }
        deployments_.erase(it);
        std::cout << "[SceneScheduler](stop) scene " << scene_id << " stopped\n";
        return Status::success();
    }

    Status SceneScheduler::stop_deployment(const std::string& scene_id) {
        std::lock_guard ops(ops_mtx_);
        return stop_locked_(scene_id);
    }

    bool SceneScheduler::is_permitted(const std::string& session_id, TimePoint now) const {
        std::shared_lock idx(index_mtx_);
        auto it = policies_.find(session_id);
        if (it == policies_.end()) return true;
        return it->second.permits(now);
    }

    std::optional<SceneDeployment> SceneScheduler::deployment(const std::string& scene_id) const {
        std::lock_guard ops(ops_mtx_);
        auto it = deployments_.find(scene_id);
        if (it == deployments_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<SceneDeployment> SceneScheduler::deployments() const {
        std::lock_guard ops(ops_mtx_);
        std::vector<SceneDeployment> out;
        out.reserve(deployments_.size());
        for (const auto& kv : deployments_) out.push_back(kv.second);
        return out;
    }

    size_t SceneScheduler::expire_due(TimePoint now) {
        std::lock_guard ops(ops_mtx_);
        std::vector<std::string> due;
        for (const auto& kv : deployments_) {
            if (kv.second.expiry && now > *kv.second.expiry) due.push_back(kv.first);
        }
        for (const auto& scene : due) {
            std::cout << "[SceneScheduler](expire) scene " << scene << " reached its end time\n";
            Status st = stop_locked_(scene);
            if (!st.ok()) std::cerr << "[SceneScheduler](expire) " << scene << ": " << st.message << "\n";
        }
        return due.size();
    }

    void SceneScheduler::start_monitor() {
        if (monitor_.joinable()) return;
        {
            std::lock_guard lk(monitor_mtx_);
            monitor_stop_ = false;
        }
        monitor_ = std::thread([this] {
            while (true) {
                {
                    std::unique_lock lk(monitor_mtx_);
                    if (monitor_cv_.wait_for(lk, cfg_.expiry_scan, [this] { return monitor_stop_; })) break;
                }
                try {
                    expire_due(Clock::now());
                } catch (const std::exception& e) {
                    std::cerr << "[SceneScheduler](monitor) scan failed: " << e.what() << "\n";
                }
            }
        });
    }

    void SceneScheduler::stop_monitor() {
        {
            std::lock_guard lk(monitor_mtx_);
            monitor_stop_ = true;
        }
        monitor_cv_.notify_all();
        if (monitor_.joinable()) monitor_.join();
    }

    void SceneScheduler::shutdown() {
        stop_monitor();
        std::lock_guard ops(ops_mtx_);
        std::vector<std::string> scenes;
        for (const auto& kv : deployments_) scenes.push_back(kv.first);
        for (const auto& s : scenes) {
            Status st = stop_locked_(s);
            if (!st.ok()) std::cerr << "[SceneScheduler](shutdown) " << s << ": " << st.message << "\n";
        }
    }
}
