#pragma once

#include <common/config.hpp>
#include <device/device_client.hpp>
#include <device/heartbeat_manager.hpp>
#include <pipeline/session_worker.hpp>
#include <pipeline/stream_manager.hpp>
#include <scheduler/deployment.hpp>

#include <condition_variable>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sg {
    // Scene deployments keyed by scene id, and the time-window gate their
    // sessions run under.
    class SceneScheduler : public ISessionGate {
    public:
        SceneScheduler(SchedulerConfig cfg,
                       DetectionDefaults defaults,
                       std::unordered_map<std::string, AlgorithmSpec> algorithms,
                       StreamManager& streams,
                       HeartbeatManager* heartbeats,
                       IDeviceDirectory* directory);
        ~SceneScheduler() override;

        SceneScheduler(const SceneScheduler&) = delete;
        SceneScheduler& operator=(const SceneScheduler&) = delete;

        // Replaces a live deployment with the same scene id.
        DeployReport deploy(const DeploymentRequest& req);
        Status stop_deployment(const std::string& scene_id);

        // Sessions outside every deployment are always permitted.
        bool is_permitted(const std::string& session_id, TimePoint now) const override;

        std::optional<SceneDeployment> deployment(const std::string& scene_id) const;
        std::vector<SceneDeployment> deployments() const;

        // Stops deployments whose absolute end lies before now.
        size_t expire_due(TimePoint now);
        void start_monitor();
        void stop_monitor();

        // Stops the monitor and every deployment.
        void shutdown();

    private:
        Status stop_locked_(const std::string& scene_id);

        SchedulerConfig cfg_;
        DetectionDefaults defaults_;
        std::unordered_map<std::string, AlgorithmSpec> algorithms_;
        StreamManager& streams_;
        HeartbeatManager* heartbeats_;
        IDeviceDirectory* directory_;

        mutable std::mutex ops_mtx_;
        std::unordered_map<std::string, SceneDeployment> deployments_;

        mutable std::shared_mutex index_mtx_;
        std::unordered_map<std::string, TimePolicy> policies_; // session id -> policy

        std::mutex monitor_mtx_;
        std::condition_variable monitor_cv_;
        bool monitor_stop_ = false;
        std::thread monitor_;
    };
}
