#pragma once

#include <alarm/alarm_engine.hpp>
#include <notify/channel.hpp>
#include <pipeline/bounded_queue.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sg {
    struct DispatcherStats {
        int64_t enqueued = 0;
        int64_t dropped = 0;
        size_t queued = 0;
        std::map<ChannelKind, int64_t> delivered;
        std::map<ChannelKind, int64_t> failed;
        std::map<ChannelKind, int64_t> skipped; // channel had nothing to send
    };

    // Bounded queue drained by a fixed worker pool. submit() never blocks;
    // a full queue drops the new task.
    class NotificationDispatcher : public IAlarmSink {
    public:
        NotificationDispatcher(size_t capacity, int workers);
        ~NotificationDispatcher() override;

        NotificationDispatcher(const NotificationDispatcher&) = delete;
        NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

        // Channels must be added before start().
        void add_channel(std::shared_ptr<INotificationChannel> channel);

        void start();
        // Rejects new tasks, drains the queue, joins the workers.
        void shutdown();

        bool submit(const AlarmRule& rule, const AlarmEvent& event) override;

        DispatcherStats stats() const;

    private:
        void worker_loop_();
        void dispatch_(const NotificationTask& task);

        BoundedQueue<NotificationTask> queue_;
        int worker_count_;
        std::vector<std::thread> workers_;
        std::atomic<bool> started_{false};

        std::map<ChannelKind, std::shared_ptr<INotificationChannel>> channels_;

        std::atomic<int64_t> enqueued_{0};
        std::atomic<int64_t> dropped_{0};
        mutable std::mutex stats_mtx_;
        std::map<ChannelKind, int64_t> delivered_;
        std::map<ChannelKind, int64_t> failed_;
        std::map<ChannelKind, int64_t> skipped_;
    };
}
