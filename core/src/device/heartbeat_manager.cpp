#include <device/heartbeat_manager.hpp>

#include <iostream>

namespace sg {
    HeartbeatManager::HeartbeatManager(std::shared_ptr<IHeartbeatSender> sender, HeartbeatConfig cfg)
        : sender_(std::move(sender)), cfg_(cfg) {}

    HeartbeatManager::~HeartbeatManager() {
        stop_all();
        std::vector<std::shared_ptr<Task>> late;
        {
            std::lock_guard lk(mtx_);
            late.swap(abandoned_);
        }
        for (auto& t : late) {
            if (t->thr.joinable()) t->thr.join();
        }
    }

    bool HeartbeatManager::start(const std::string& device_id) {
        std::lock_guard lk(mtx_);
        auto it = tasks_.find(device_id);
        if (it != tasks_.end()) {
            ++it->second->refs;
            return false;
        }

        auto task = std::make_shared<Task>();
        task->device_id = device_id;
        std::promise<void> done;
        task->done = done.get_future();
        Task* raw = task.get();
        task->thr = std::thread([this, raw, done = std::move(done)]() mutable { run_(*raw, std::move(done)); });
        tasks_[device_id] = std::move(task);
        std::cout << "[Heartbeat](start) " << device_id << " every "
                  << cfg_.interval.count() << " ms\n";
        return true;
    }

    void HeartbeatManager::run_(Task& task, std::promise<void> done) {
        while (true) {
            bool ok = false;
            try {
                ok = sender_ && sender_->send_heartbeat(task.device_id);
            } catch (const std::exception& e) {
                std::cerr << "[Heartbeat](run) " << task.device_id << ": " << e.what() << "\n";
            }

            if (ok) {
                ++task.success;
                task.consecutive = 0;
            } else {
                ++task.failure;
                const int n = ++task.consecutive;
                if (n == cfg_.failure_threshold) {
                    std::cerr << "[Heartbeat](run) " << task.device_id << " failed "
                              << n << " times in a row\n";
                }
            }

            std::unique_lock lk(task.mtx);
            if (task.cv.wait_for(lk, cfg_.interval, [&] { return task.stop; })) break;
        }
        done.set_value();
    }

    void HeartbeatManager::halt_(std::shared_ptr<Task> task) {
        {
            std::lock_guard lk(task->mtx);
            task->stop = true;
        }
        task->cv.notify_all();

        if (task->done.wait_for(cfg_.stop_timeout) == std::future_status::ready) {
            if (task->thr.joinable()) task->thr.join();
            return;
        }
        std::cerr << "[Heartbeat](stop) " << task->device_id << " did not stop within "
                  << cfg_.stop_timeout.count() << " ms\n";
        std::lock_guard lk(mtx_);
        abandoned_.push_back(std::move(task));
    }

    bool HeartbeatManager::stop(const std::string& device_id) {
        std::shared_ptr<Task> task;
        {
            std::lock_guard lk(mtx_);
            auto it = tasks_.find(device_id);
            if (it == tasks_.end()) return false;
            if (--it->second->refs > 0) return true;
            task = std::move(it->second);
            tasks_.erase(it);
        }
        halt_(std::move(task));
        std::cout << "[Heartbeat](stop) " << device_id << "\n";
        return true;
    }

    void HeartbeatManager::stop_all() {
        std::vector<std::shared_ptr<Task>> all;
        {
            std::lock_guard lk(mtx_);
            for (auto& kv : tasks_) all.push_back(std::move(kv.second));
            tasks_.clear();
        }
        for (auto& t : all) halt_(std::move(t));
    }

    bool HeartbeatManager::running(const std::string& device_id) const {
        std::lock_guard lk(mtx_);
        return tasks_.count(device_id) > 0;
    }

    std::optional<HeartbeatStats> HeartbeatManager::stats(const std::string& device_id) const {
        std::lock_guard lk(mtx_);
        auto it = tasks_.find(device_id);
        if (it == tasks_.end()) return std::nullopt;
        HeartbeatStats s;
        s.success = it->second->success.load();
        s.failure = it->second->failure.load();
        s.consecutive_failures = it->second->consecutive.load();
        s.refs = it->second->refs;
        return s;
    }

    std::vector<std::string> HeartbeatManager::devices() const {
        std::lock_guard lk(mtx_);
        std::vector<std::string> out;
        for (const auto& kv : tasks_) out.push_back(kv.first);
        return out;
    }
}
