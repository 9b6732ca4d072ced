#pragma once

#include <alarm/alarm_engine.hpp>
#include <common/config.hpp>
#include <inference/model_pool.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/post_processor.hpp>
#include <pipeline/region_filter.hpp>
#include <pipeline/stream_config.hpp>
#include <storage/artifact_layout.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace sg {
    // Decides whether a session may process frames right now. Must be cheap
    // and free of I/O.
    struct ISessionGate {
        virtual ~ISessionGate() = default;
        virtual bool is_permitted(const std::string& session_id, TimePoint now) const = 0;
    };

    struct FrameReport {
        int64_t frame_id = 0;
        size_t detections = 0;
        double processing_ms = 0.0;
        TimePoint at{};
    };

    // Progress reports from a worker. generation identifies the worker run so
    // reports from an abandoned run can be told apart.
    struct IWorkerListener {
        virtual ~IWorkerListener() = default;
        virtual void on_connected(const std::string& id, uint64_t generation) = 0;
        virtual void on_frame(const std::string& id, uint64_t generation, const FrameReport& report) = 0;
        virtual void on_idle(const std::string& id, uint64_t generation) = 0;
        virtual void on_error(const std::string& id, uint64_t generation, const std::string& message) = 0;
        virtual void on_inference_error(const std::string& id, uint64_t generation, const std::string& message) = 0;
        virtual void on_reconnecting(const std::string& id, uint64_t generation, int attempt) = 0;
        virtual void on_disconnected(const std::string& id, uint64_t generation,
                                     const std::string& reason, bool requested) = 0;
    };

    struct WorkerDeps {
        WorkerConfig cfg;
        DetectorHandle detector;
        AlarmEngine* alarms = nullptr;
        PostProcessRegistry* post = nullptr;
        const ISessionGate* gate = nullptr;
        const ArtifactLayout* artifacts = nullptr;
        IWorkerListener* listener = nullptr;
    };

    class SessionWorker {
    public:
        // Throws ConfigError when the detection region cannot be parsed.
        SessionWorker(StreamConfig cfg, uint64_t generation, std::unique_ptr<IFrameSource> source, WorkerDeps deps);

        // Frame loop; returns once stopped or out of reconnect attempts.
        void run();
        void request_stop();
        bool stop_requested() const { return stop_.load(); }

        const std::string& id() const { return cfg_.id; }

    private:
        bool permitted_(TimePoint now) const;
        bool reconnect_();
        void process_frame_(const FramePacket& fp);
        // False when interrupted by a stop request.
        bool sleep_for_(std::chrono::milliseconds d);

        StreamConfig cfg_;
        uint64_t generation_;
        std::unique_ptr<IFrameSource> source_;
        WorkerDeps deps_;
        RegionFilter region_;

        std::atomic<bool> stop_{false};
        std::mutex sleep_mtx_;
        std::condition_variable sleep_cv_;

        bool gated_ = false;
        int64_t processed_ = 0;
        int64_t corrupt_ = 0;
        bool rate_armed_ = false;
        std::chrono::steady_clock::time_point last_processed_{};
        std::chrono::steady_clock::time_point window_start_{};
        int64_t window_frame_ = 0;
    };
}
