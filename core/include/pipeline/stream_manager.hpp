#pragma once

#include <alarm/alarm_engine.hpp>
#include <common/config.hpp>
#include <common/errors.hpp>
#include <inference/model_pool.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/post_processor.hpp>
#include <pipeline/session_worker.hpp>
#include <storage/artifact_layout.hpp>

#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sg {
    struct SessionSnapshot {
        StreamConfig config;
        SessionStatus status = SessionStatus::Inactive;
        TimePoint created_at{};
        TimePoint last_active_at{};
        TimePoint status_changed_at{};
        int64_t frames = 0;
        int64_t detections = 0;
        int64_t errors = 0;
        std::string last_error;
        double avg_processing_ms = 0.0;
        double avg_fps = 0.0;
    };

    struct ManagerStats {
        size_t sessions = 0;
        size_t running = 0;
        int max_sessions = 0;
        std::map<SessionStatus, size_t> by_status;
        int64_t frames = 0;
        int64_t detections = 0;
    };

    bool transition_allowed(SessionStatus from, SessionStatus to);

    // Session registry, admission control and state machine. Control calls
    // are serialised; worker reports go through the listener interface.
    class StreamManager : private IWorkerListener {
    public:
        StreamManager(EngineConfig engine,
                      WorkerConfig worker,
                      SourceFactory sources,
                      ModelPool& models,
                      AlarmEngine* alarms,
                      PostProcessRegistry& post,
                      ArtifactLayout artifacts);
        ~StreamManager() override;

        StreamManager(const StreamManager&) = delete;
        StreamManager& operator=(const StreamManager&) = delete;

        // Consulted by workers started afterwards.
        void set_gate(const ISessionGate* gate);

        // Every registered session, started or not, counts toward max_sessions.
        Status register_stream(const StreamConfig& cfg);
        Status start(const std::string& id);
        Status stop(const std::string& id);
        Status unregister(const std::string& id);

        std::optional<SessionSnapshot> status(const std::string& id) const;
        std::vector<SessionSnapshot> list() const;
        ManagerStats stats() const;

        // One health scan: stalled Active and overdue Reconnecting sessions
        // are flagged Error. Returns how many were flagged.
        size_t check_health(TimePoint now);
        void start_monitor();
        void stop_monitor();

        // Stops the monitor and every session.
        void shutdown();

    private:
        struct Session {
            StreamConfig config;
            SessionStatus status = SessionStatus::Inactive;
            TimePoint created_at{};
            TimePoint last_active_at{};
            TimePoint status_changed_at{};
            int64_t frames = 0;
            int64_t detections = 0;
            int64_t errors = 0;
            std::string last_error;
            double avg_processing_ms = 0.0;
            double avg_fps = 0.0;
            TimePoint last_frame_at{};

            uint64_t generation = 0;
            std::shared_ptr<SessionWorker> worker;
            std::thread thread;
            std::shared_future<void> done;
        };

        struct Retired {
            std::shared_ptr<SessionWorker> worker;
            std::thread thread;
            std::shared_future<void> done;
        };

        // IWorkerListener
        void on_connected(const std::string& id, uint64_t generation) override;
        void on_frame(const std::string& id, uint64_t generation, const FrameReport& report) override;
        void on_idle(const std::string& id, uint64_t generation) override;
        void on_error(const std::string& id, uint64_t generation, const std::string& message) override;
        void on_inference_error(const std::string& id, uint64_t generation, const std::string& message) override;
        void on_reconnecting(const std::string& id, uint64_t generation, int attempt) override;
        void on_disconnected(const std::string& id, uint64_t generation,
                             const std::string& reason, bool requested) override;

        Session* live_(const std::string& id, uint64_t generation);
        void set_status_(Session& s, SessionStatus to, const std::string& message);
        // Debounce, cooldown and post-processing state of the session's last run.
        void reset_session_state_(const std::string& id);
        static bool occupies_slot_(const Session& s);
        size_t occupied_() const;
        Status stop_locked_(const std::string& id);
        void reap_retired_(bool wait);
        static SessionSnapshot snapshot_(const Session& s);

        EngineConfig engine_;
        WorkerConfig worker_cfg_;
        SourceFactory sources_;
        ModelPool& models_;
        AlarmEngine* alarms_;
        PostProcessRegistry& post_;
        ArtifactLayout artifacts_;
        const ISessionGate* gate_ = nullptr;

        std::mutex ops_mtx_;
        mutable std::mutex sessions_mtx_;
        std::unordered_map<std::string, std::unique_ptr<Session>> sessions_;
        std::vector<Retired> retired_;

        std::mutex monitor_mtx_;
        std::condition_variable monitor_cv_;
        bool monitor_stop_ = false;
        std::thread monitor_;
    };
}
