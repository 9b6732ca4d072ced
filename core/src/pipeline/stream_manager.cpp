#include <pipeline/stream_manager.hpp>
#include <pipeline/region_filter.hpp>

#include <iostream>

namespace sg {
    bool transition_allowed(SessionStatus from, SessionStatus to) {
        if (to == SessionStatus::Inactive) return true;
        switch (from) {
            case SessionStatus::Inactive:
                return to == SessionStatus::Connecting;
            case SessionStatus::Connecting:
                return to == SessionStatus::Active || to == SessionStatus::Error;
            case SessionStatus::Active:
                return to == SessionStatus::Error;
            case SessionStatus::Error:
                return to == SessionStatus::Reconnecting || to == SessionStatus::Active;
            case SessionStatus::Reconnecting:
                return to == SessionStatus::Active || to == SessionStatus::Error;
        }
        return false;
    }

    StreamManager::StreamManager(EngineConfig engine,
                                 WorkerConfig worker,
                                 SourceFactory sources,
                                 ModelPool& models,
                                 AlarmEngine* alarms,
                                 PostProcessRegistry& post,
                                 ArtifactLayout artifacts)
        : engine_(engine),
          worker_cfg_(worker),
          sources_(std::move(sources)),
          models_(models),
          alarms_(alarms),
          post_(post),
          artifacts_(std::move(artifacts)) {}

    StreamManager::~StreamManager() {
        shutdown();
        std::lock_guard ops(ops_mtx_);
        reap_retired_(true);
    }

    void StreamManager::set_gate(const ISessionGate* gate) {
        std::lock_guard ops(ops_mtx_);
        gate_ = gate;
    }

    bool StreamManager::occupies_slot_(const Session& s) {
        return s.thread.joinable() && s.done.valid() &&
               s.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
    }

    size_t StreamManager::occupied_() const {
        size_t n = 0;
        for (const auto& kv : sessions_) {
            if (occupies_slot_(*kv.second)) ++n;
        }
        return n;
    }

    void StreamManager::set_status_(Session& s, SessionStatus to, const std::string& message) {
        if (s.status == to) return;
        if (!transition_allowed(s.status, to)) {
            std::cerr << "[StreamManager](status) " << s.config.id << " ignoring "
                      << to_string(s.status) << " -> " << to_string(to) << "\n";
            return;
        }
        std::cout << "[StreamManager](status) " << s.config.id << ": " << to_string(s.status)
                  << " -> " << to_string(to);
        if (!message.empty()) std::cout << " (" << message << ")";
        std::cout << "\n";
        s.status = to;
        s.status_changed_at = Clock::now();
    }

    Status StreamManager::register_stream(const StreamConfig& cfg) {
        try {
            validate_stream_config(cfg);
            (void)RegionFilter::parse(cfg.region);
        } catch (const ConfigError& e) {
            return Status::error(ErrorCode::ConfigError, e.what());
        }

        std::lock_guard ops(ops_mtx_);
        std::lock_guard lk(sessions_mtx_);
        if (sessions_.count(cfg.id)) {
            return Status::error(ErrorCode::DuplicateId, "session " + cfg.id + " already registered");
        }
        // registered but not yet started sessions hold a slot too
        if (sessions_.size() >= static_cast<size_t>(engine_.max_sessions)) {
            return Status::error(ErrorCode::CapacityExceeded,
                                 "session limit " + std::to_string(engine_.max_sessions) + " reached");
        }

        auto s = std::make_unique<Session>();
        s->config = cfg;
        s->created_at = Clock::now();
        s->status_changed_at = s->created_at;
        s->last_active_at = s->created_at;
        sessions_[cfg.id] = std::move(s);
        std::cout << "[StreamManager](register) " << cfg.id << " source=" << cfg.source << "\n";
        return Status::success();
    }

    Status StreamManager::start(const std::string& id) {
        std::lock_guard ops(ops_mtx_);
        reap_retired_(false);

        StreamConfig cfg;
        std::thread finished;
        {
            std::lock_guard lk(sessions_mtx_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) return Status::error(ErrorCode::NotFound, "session " + id + " not found");
            Session& s = *it->second;
            if (occupies_slot_(s)) return Status::error(ErrorCode::AlreadyActive, "session " + id + " is running");
            if (occupied_() >= static_cast<size_t>(engine_.max_sessions)) {
                return Status::error(ErrorCode::CapacityExceeded,
                                     "session limit " + std::to_string(engine_.max_sessions) + " reached");
            }
            cfg = s.config;
            if (s.thread.joinable()) {
                finished = std::move(s.thread);
                s.worker.reset();
                s.done = {};
            }
        }
        if (finished.joinable()) finished.join();

        DetectorHandle detector;
        try {
            detector = models_.get_detector(cfg.model_id, cfg.id);
        } catch (const ModelLoadError& e) {
            std::lock_guard lk(sessions_mtx_);
            Session& s = *sessions_.at(id);
            ++s.errors;
            s.last_error = e.what();
            return Status::error(ErrorCode::ModelLoadError, e.what());
        }

        std::unique_ptr<IFrameSource> source;
        try {
            source = sources_(cfg.id, cfg.source);
        } catch (const std::exception& e) {
            return Status::error(ErrorCode::ConnectivityError, e.what());
        }
        if (!source) return Status::error(ErrorCode::ConnectivityError, "no source for " + cfg.source);

        std::lock_guard lk(sessions_mtx_);
        Session& s = *sessions_.at(id);

        WorkerDeps deps;
        deps.cfg = worker_cfg_;
        deps.detector = std::move(detector);
        deps.alarms = alarms_;
        deps.post = &post_;
        deps.gate = gate_;
        deps.artifacts = &artifacts_;
        deps.listener = this;

        const uint64_t generation = ++s.generation;
        std::shared_ptr<SessionWorker> worker;
        try {
            worker = std::make_shared<SessionWorker>(cfg, generation, std::move(source), std::move(deps));
        } catch (const ConfigError& e) {
            return Status::error(ErrorCode::ConfigError, e.what());
        }

        if (s.status != SessionStatus::Inactive) set_status_(s, SessionStatus::Inactive, "restart");
        set_status_(s, SessionStatus::Connecting, "start requested");
        s.last_active_at = Clock::now();

        std::promise<void> done;
        s.done = done.get_future().share();
        s.worker = worker;
        s.thread = std::thread([worker, done = std::move(done)]() mutable {
            try {
                worker->run();
            } catch (const std::exception& e) {
                std::cerr << "[StreamManager](worker) " << worker->id() << " terminated: " << e.what() << "\n";
            }
            done.set_value();
        });
        return Status::success();
    }

    Status StreamManager::stop_locked_(const std::string& id) {
        std::shared_ptr<SessionWorker> worker;
        std::thread thread;
        std::shared_future<void> done;
        {
            std::lock_guard lk(sessions_mtx_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) return Status::error(ErrorCode::NotFound, "session " + id + " not found");
            Session& s = *it->second;
            if (!s.thread.joinable()) {
                set_status_(s, SessionStatus::Inactive, "stopped");
                return Status::success();
            }
            worker = std::move(s.worker);
            thread = std::move(s.thread);
            done = std::move(s.done);
            s.done = {};
            ++s.generation; // late reports from this run are ignored
            worker->request_stop();
        }

        if (done.wait_for(engine_.stop_timeout) == std::future_status::ready) {
            thread.join();
        } else {
            std::cerr << "[StreamManager](stop) " << id << " worker did not exit within "
                      << engine_.stop_timeout.count() << " ms, abandoning it\n";
            retired_.push_back({std::move(worker), std::move(thread), std::move(done)});
        }
        reset_session_state_(id);

        std::lock_guard lk(sessions_mtx_);
        auto it = sessions_.find(id);
        if (it != sessions_.end()) set_status_(*it->second, SessionStatus::Inactive, "stopped");
        return Status::success();
    }

    Status StreamManager::stop(const std::string& id) {
        std::lock_guard ops(ops_mtx_);
        return stop_locked_(id);
    }

    Status StreamManager::unregister(const std::string& id) {
        std::lock_guard ops(ops_mtx_);
        Status st = stop_locked_(id);
        if (!st.ok()) return st;
        {
            std::lock_guard lk(sessions_mtx_);
            sessions_.erase(id);
        }
        models_.release_session(id);
        std::cout << "[StreamManager](unregister) " << id << "\n";
        return Status::success();
    }

    void StreamManager::reset_session_state_(const std::string& id) {
        if (alarms_) alarms_->reset_session(id);
        post_.forget(id);
    }

    void StreamManager::reap_retired_(bool wait) {
        for (auto it = retired_.begin(); it != retired_.end();) {
            if (wait || it->done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                if (it->thread.joinable()) it->thread.join();
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }

    SessionSnapshot StreamManager::snapshot_(const Session& s) {
        SessionSnapshot snap;
        snap.config = s.config;
        snap.status = s.status;
        snap.created_at = s.created_at;
        snap.last_active_at = s.last_active_at;
        snap.status_changed_at = s.status_changed_at;
        snap.frames = s.frames;
        snap.detections = s.detections;
        snap.errors = s.errors;
        snap.last_error = s.last_error;
        snap.avg_processing_ms = s.avg_processing_ms;
        snap.avg_fps = s.avg_fps;
        return snap;
    }

    std::optional<SessionSnapshot> StreamManager::status(const std::string& id) const {
        std::lock_guard lk(sessions_mtx_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return std::nullopt;
        return snapshot_(*it->second);
    }

    std::vector<SessionSnapshot> StreamManager::list() const {
        std::lock_guard lk(sessions_mtx_);
        std::vector<SessionSnapshot> out;
        out.reserve(sessions_.size());
        for (const auto& kv : sessions_) out.push_back(snapshot_(*kv.second));
        return out;
    }

    ManagerStats StreamManager::stats() const {
        std::lock_guard lk(sessions_mtx_);
        ManagerStats st;
        st.sessions = sessions_.size();
        st.running = occupied_();
        st.max_sessions = engine_.max_sessions;
        for (const auto& kv : sessions_) {
            ++st.by_status[kv.second->status];
            st.frames += kv.second->frames;
            st.detections += kv.second->detections;
        }
        return st;
    }

    size_t StreamManager::check_health(TimePoint now) {
        std::lock_guard lk(sessions_mtx_);
        size_t flagged = 0;
        for (auto& kv : sessions_) {
            Session& s = *kv.second;
            std::string reason;
            if (s.status == SessionStatus::Active && now - s.last_active_at > engine_.stall_timeout) {
                reason = "stalled";
            } else if (s.status == SessionStatus::Reconnecting &&
                       now - s.status_changed_at > engine_.reconnect_timeout) {
                reason = "reconnect timeout";
            }
            if (reason.empty()) continue;
            ++s.errors;
            s.last_error = reason;
            set_status_(s, SessionStatus::Error, reason);
            ++flagged;
        }
        return flagged;
    }

    void StreamManager::start_monitor() {
        if (monitor_.joinable()) return;
        {
            std::lock_guard lk(monitor_mtx_);
            monitor_stop_ = false;
        }
        monitor_ = std::thread([this] {
            while (true) {
                {
                    std::unique_lock lk(monitor_mtx_);
                    if (monitor_cv_.wait_for(lk, engine_.health_interval, [this] { return monitor_stop_; })) break;
                }
                const size_t flagged = check_health(Clock::now());
                if (flagged > 0) {
                    std::cerr << "[StreamManager](monitor) flagged " << flagged << " unhealthy sessions\n";
                }
            }
        });
    }

    void StreamManager::stop_monitor() {
        {
            std::lock_guard lk(monitor_mtx_);
            monitor_stop_ = true;
        }
        monitor_cv_.notify_all();
        if (monitor_.joinable()) monitor_.join();
    }

    void StreamManager::shutdown() {
        stop_monitor();
        std::lock_guard ops(ops_mtx_);
        std::vector<std::string> ids;
        {
            std::lock_guard lk(sessions_mtx_);
            for (const auto& kv : sessions_) ids.push_back(kv.first);
        }
        for (const auto& id : ids) {
            Status st = stop_locked_(id);
            if (!st.ok()) {
                std::cerr << "[StreamManager](shutdown) " << id << ": " << st.message << "\n";
            }
        }
    }

    // worker reports

    StreamManager::Session* StreamManager::live_(const std::string& id, uint64_t generation) {
        auto it = sessions_.find(id);
        if (it == sessions_.end() || it->second->generation != generation) return nullptr;
        return it->second.get();
    }

    void StreamManager::on_connected(const std::string& id, uint64_t generation) {
        std::lock_guard lk(sessions_mtx_);
        Session* s = live_(id, generation);
        if (!s) return;
        s->last_active_at = Clock::now();
        set_status_(*s, SessionStatus::Active, "connected");
    }

    void StreamManager::on_frame(const std::string& id, uint64_t generation, const FrameReport& report) {
        std::lock_guard lk(sessions_mtx_);
        Session* s = live_(id, generation);
        if (!s) return;

        ++s->frames;
        s->detections += static_cast<int64_t>(report.detections);
        s->avg_processing_ms += (report.processing_ms - s->avg_processing_ms) / static_cast<double>(s->frames);
        if (s->frames > 1 && report.at > s->last_frame_at) {
            const double dt = std::chrono::duration<double>(report.at - s->last_frame_at).count();
            const double inst = dt > 0.0 ? 1.0 / dt : 0.0;
            s->avg_fps = s->avg_fps == 0.0 ? inst : 0.9 * s->avg_fps + 0.1 * inst;
        }
        s->last_frame_at = report.at;
        s->last_active_at = report.at;
        if (s->status != SessionStatus::Active) set_status_(*s, SessionStatus::Active, "recovered");
    }

    void StreamManager::on_idle(const std::string& id, uint64_t generation) {
        std::lock_guard lk(sessions_mtx_);
        Session* s = live_(id, generation);
        if (s) s->last_active_at = Clock::now();
    }

    void StreamManager::on_error(const std::string& id, uint64_t generation, const std::string& message) {
        std::lock_guard lk(sessions_mtx_);
        Session* s = live_(id, generation);
        if (!s) return;
        ++s->errors;
        s->last_error = message;
        set_status_(*s, SessionStatus::Error, message);
    }

    void StreamManager::on_inference_error(const std::string& id, uint64_t generation, const std::string& message) {
        std::lock_guard lk(sessions_mtx_);
        Session* s = live_(id, generation);
        if (!s) return;
        ++s->errors;
        s->last_error = "inference: " + message;
        s->last_active_at = Clock::now();
        std::cerr << "[StreamManager](inference) " << id << ": " << message << "\n";
    }

    void StreamManager::on_reconnecting(const std::string& id, uint64_t generation, int attempt) {
        std::lock_guard lk(sessions_mtx_);
        Session* s = live_(id, generation);
        if (!s) return;
        set_status_(*s, SessionStatus::Reconnecting, "attempt " + std::to_string(attempt));
    }

    void StreamManager::on_disconnected(const std::string& id, uint64_t generation,
                                        const std::string& reason, bool requested) {
        if (requested) return;
        std::lock_guard lk(sessions_mtx_);
        Session* s = live_(id, generation);
        if (!s) return;
        s->last_error = reason;
        set_status_(*s, SessionStatus::Error, reason);
        // still under sessions_mtx_, so no newer run can have started
        reset_session_state_(id);
    }
}
