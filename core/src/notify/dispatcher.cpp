#include <notify/dispatcher.hpp>

#include <algorithm>
#include <iostream>

namespace sg {
    NotificationDispatcher::NotificationDispatcher(size_t capacity, int workers)
        : queue_(capacity), worker_count_(std::max(1, workers)) {}

    NotificationDispatcher::~NotificationDispatcher() {
        shutdown();
    }

    void NotificationDispatcher::add_channel(std::shared_ptr<INotificationChannel> channel) {
        if (!channel) return;
        if (started_) {
            std::cerr << "[Dispatcher](add_channel) ignored " << to_string(channel->kind())
                      << " channel added after start\n";
            return;
        }
        channels_[channel->kind()] = std::move(channel);
    }

    void NotificationDispatcher::start() {
        if (started_.exchange(true)) return;
        workers_.reserve(static_cast<size_t>(worker_count_));
        for (int i = 0; i < worker_count_; ++i) {
            workers_.emplace_back([this] { worker_loop_(); });
        }
        std::cout << "[Dispatcher](start) " << worker_count_ << " workers, queue capacity "
                  << queue_.capacity() << "\n";
    }

    void NotificationDispatcher::shutdown() {
        queue_.close();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();

        // not started: nothing consumed the queue, deliver inline
        NotificationTask task;
        while (queue_.try_pop(task)) dispatch_(task);
    }

    bool NotificationDispatcher::submit(const AlarmRule& rule, const AlarmEvent& event) {
        NotificationTask task;
        task.rule = rule;
        task.event = event;
        task.channels = rule.channels;
        task.enqueued_at = std::chrono::steady_clock::now();

        if (!queue_.try_push(std::move(task))) {
            const int64_t n = ++dropped_;
            std::cerr << "[Dispatcher](submit) queue full or closed, dropped alarm " << rule.id
                      << " for " << event.session_id << " (total dropped " << n << ")\n";
            return false;
        }
        ++enqueued_;
        return true;
    }

    void NotificationDispatcher::worker_loop_() {
        NotificationTask task;
        while (true) {
            if (!queue_.pop_for(task, std::chrono::milliseconds(200))) {
                if (queue_.closed() && queue_.size() == 0) break;
                continue;
            }
            dispatch_(task);
        }
    }

    void NotificationDispatcher::dispatch_(const NotificationTask& task) {
        for (ChannelKind kind : task.channels) {
            auto it = channels_.find(kind);
            if (it == channels_.end()) continue;

            bool ok = true;
            bool sent = false;
            try {
                sent = it->second->deliver(task);
            } catch (const std::exception& e) {
                ok = false;
                std::cerr << "[Dispatcher](dispatch) " << to_string(kind) << " channel failed for rule "
                          << task.rule.id << ": " << e.what() << "\n";
            }

            std::lock_guard lk(stats_mtx_);
            if (!ok) ++failed_[kind];
            else if (sent) ++delivered_[kind];
            else ++skipped_[kind];
        }
    }

    DispatcherStats NotificationDispatcher::stats() const {
        DispatcherStats s;
        s.enqueued = enqueued_.load();
        s.dropped = dropped_.load();
        s.queued = queue_.size();
        std::lock_guard lk(stats_mtx_);
        s.delivered = delivered_;
        s.failed = failed_;
        s.skipped = skipped_;
        return s;
    }
}
