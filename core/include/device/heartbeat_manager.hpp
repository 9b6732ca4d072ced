#pragma once

#include <common/config.hpp>
#include <device/device_client.hpp>

#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sg {
    struct HeartbeatStats {
        int64_t success = 0;
        int64_t failure = 0;
        int consecutive_failures = 0;
        int refs = 0;
    };

    // One keepalive thread per device. start() is reference counted so
    // several deployments may share a device.
    class HeartbeatManager {
    public:
        HeartbeatManager(std::shared_ptr<IHeartbeatSender> sender, HeartbeatConfig cfg);
        ~HeartbeatManager();

        HeartbeatManager(const HeartbeatManager&) = delete;
        HeartbeatManager& operator=(const HeartbeatManager&) = delete;

        // True when a new task was spawned, false when an existing one gained a reference.
        bool start(const std::string& device_id);
        // Drops a reference; the task stops at zero. False if unknown.
        bool stop(const std::string& device_id);
        void stop_all();

        bool running(const std::string& device_id) const;
        std::optional<HeartbeatStats> stats(const std::string& device_id) const;
        std::vector<std::string> devices() const;

    private:
        struct Task {
            std::string device_id;
            int refs = 1;
            std::mutex mtx;
            std::condition_variable cv;
            bool stop = false;
            std::atomic<int64_t> success{0};
            std::atomic<int64_t> failure{0};
            std::atomic<int> consecutive{0};
            std::thread thr;
            std::future<void> done;
        };

        void run_(Task& task, std::promise<void> done);
        void halt_(std::shared_ptr<Task> task);

        std::shared_ptr<IHeartbeatSender> sender_;
        HeartbeatConfig cfg_;

        mutable std::mutex mtx_;
        std::unordered_map<std::string, std::shared_ptr<Task>> tasks_;
        std::vector<std::shared_ptr<Task>> abandoned_;
    };
}
