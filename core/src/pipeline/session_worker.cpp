#include <pipeline/session_worker.hpp>
#include <common/resize.hpp>

#include <algorithm>
#include <cstdio>
#include <iostream>

namespace sg {
    using steady = std::chrono::steady_clock;

    SessionWorker::SessionWorker(StreamConfig cfg, uint64_t generation,
                                 std::unique_ptr<IFrameSource> source, WorkerDeps deps)
        : cfg_(std::move(cfg)),
          generation_(generation),
          source_(std::move(source)),
          deps_(std::move(deps)),
          region_(RegionFilter::parse(cfg_.region)) {}

    void SessionWorker::request_stop() {
        {
            std::lock_guard lk(sleep_mtx_);
            stop_ = true;
        }
        sleep_cv_.notify_all();
    }

    bool SessionWorker::sleep_for_(std::chrono::milliseconds d) {
        std::unique_lock lk(sleep_mtx_);
        return !sleep_cv_.wait_for(lk, d, [this] { return stop_.load(); });
    }

    bool SessionWorker::permitted_(TimePoint now) const {
        if (deps_.gate && !deps_.gate->is_permitted(cfg_.id, now)) return false;
        if (cfg_.time_policy && !cfg_.time_policy->permits(now)) return false;
        return true;
    }

    bool SessionWorker::reconnect_() {
        const int attempts = std::max(1, deps_.cfg.reconnect_attempts);
        for (int attempt = 1; attempt <= attempts; ++attempt) {
            deps_.listener->on_reconnecting(cfg_.id, generation_, attempt);
            std::cerr << "[Worker](reconnect) " << cfg_.id << " attempt " << attempt << "/" << attempts
                      << " in " << deps_.cfg.reconnect_interval.count() << " ms\n";
            if (!sleep_for_(deps_.cfg.reconnect_interval)) return false;

            source_->close();
            if (source_->open()) {
                std::cout << "[Worker](reconnect) " << cfg_.id << " source reopened\n";
                return true;
            }
        }
        return false;
    }

    void SessionWorker::run() {
        std::cout << "[Worker](run) " << cfg_.id << " starting on " << cfg_.source
                  << " fps_limit=" << cfg_.fps_limit << "\n";

        std::string reason = "stopped";
        bool connected = false;
        bool opened = source_->open();
        if (!opened && !stop_requested()) {
            deps_.listener->on_error(cfg_.id, generation_, "failed to open source " + cfg_.source);
            opened = reconnect_();
            if (!opened && !stop_requested()) reason = "could not open source";
        }

        const auto min_interval = std::chrono::duration_cast<steady::duration>(
            std::chrono::duration<double>(1.0 / cfg_.fps_limit));
        int transient = 0;

        while (opened && !stop_requested()) {
            try {
                if (!permitted_(Clock::now())) {
                    if (!gated_) {
                        std::cout << "[Worker](run) " << cfg_.id << " outside permitted window, pausing\n";
                        gated_ = true;
                    }
                    deps_.listener->on_idle(cfg_.id, generation_);
                    sleep_for_(deps_.cfg.gate_poll);
                    continue;
                }
                if (gated_) {
                    std::cout << "[Worker](run) " << cfg_.id << " window open, resuming\n";
                    gated_ = false;
                }

                FramePacket fp;
                ReadStatus rs = source_->read(fp, deps_.cfg.read_timeout_ms);
                if (rs == ReadStatus::Timeout) {
                    if (++transient < deps_.cfg.max_transient_reads) continue;
                    rs = ReadStatus::Lost;
                }
                if (rs == ReadStatus::Lost) {
                    transient = 0;
                    connected = false;
                    deps_.listener->on_error(cfg_.id, generation_, "connection lost");
                    if (!reconnect_()) {
                        if (!stop_requested()) reason = "reconnect attempts exhausted";
                        break;
                    }
                    continue;
                }
                transient = 0;

                if (!connected) {
                    connected = true;
                    deps_.listener->on_connected(cfg_.id, generation_);
                }

                if (!fp.usable(deps_.cfg.min_frame_size)) {
                    if (corrupt_++ % 100 == 0) {
                        std::cerr << "[Worker](run) " << cfg_.id << " dropping corrupt frame "
                                  << fp.frame_id << " (" << fp.bgr.cols << "x" << fp.bgr.rows << ")\n";
                    }
                    continue;
                }

                const auto now = steady::now();
                if (rate_armed_ && now - last_processed_ < min_interval) continue;
                last_processed_ = now;
                rate_armed_ = true;

                process_frame_(fp);
            } catch (const std::exception& e) {
                deps_.listener->on_error(cfg_.id, generation_, std::string("iteration failed: ") + e.what());
                connected = false;
                sleep_for_(std::chrono::milliseconds(100));
            }
        }

        source_->close();
        std::cout << "[Worker](run) " << cfg_.id << " exiting after " << processed_
                  << " frames: " << reason << "\n";
        deps_.listener->on_disconnected(cfg_.id, generation_, reason, stop_requested());
    }

    void SessionWorker::process_frame_(const FramePacket& fp) {
        const auto t0 = steady::now();
        const TimePoint wall = fp.captured_at == TimePoint{} ? Clock::now() : fp.captured_at;

        ScaledFrame scaled = downscale_for_inference(fp.bgr, deps_.cfg.max_resolution);

        std::vector<Detection> dets;
        try {
            dets = deps_.detector.infer(scaled.image, cfg_.conf_threshold, cfg_.iou_threshold, cfg_.img_size);
        } catch (const std::exception& e) {
            deps_.listener->on_inference_error(cfg_.id, generation_, e.what());
            return;
        }
        // a worker abandoned during inference must not touch the next run's state
        if (stop_requested()) return;
        if (scaled.scale != 1.0f) map_to_original(dets, scaled.scale, fp.bgr.cols, fp.bgr.rows);

        if (!cfg_.target_classes.empty()) {
            dets.erase(std::remove_if(dets.begin(), dets.end(), [this](const Detection& d) {
                           return std::find(cfg_.target_classes.begin(), cfg_.target_classes.end(),
                                            d.class_name) == cfg_.target_classes.end();
                       }),
                       dets.end());
        }
        dets = region_.filter(std::move(dets));

        DetectionResult result;
        result.session_id = cfg_.id;
        result.timestamp = wall;
        result.frame_id = fp.frame_id;
        result.detections = std::move(dets);
        result.frame_w = fp.bgr.cols;
        result.frame_h = fp.bgr.rows;
        result.target = cfg_.target;
        if (deps_.artifacts && !result.detections.empty()) {
            result.media_url = deps_.artifacts->media_url(cfg_.id, wall, fp.frame_id);
        }

        result.processing_ms = std::chrono::duration<double, std::milli>(steady::now() - t0).count();

        const bool proceed = deps_.post ? deps_.post->apply(cfg_.post_process, result) : true;
        if (proceed && deps_.alarms) deps_.alarms->evaluate(result);

        FrameReport rep;
        rep.frame_id = result.frame_id;
        rep.detections = result.detections.size();
        rep.processing_ms = result.processing_ms;
        rep.at = wall;
        deps_.listener->on_frame(cfg_.id, generation_, rep);

        ++processed_;
        if (processed_ == 1) {
            window_start_ = t0;
            window_frame_ = 1;
        }
        if (processed_ % std::max(1, deps_.cfg.log_every) == 0 && processed_ > window_frame_) {
            const double span_s = std::chrono::duration<double>(t0 - window_start_).count();
            char buf[64];
            std::snprintf(buf, sizeof(buf), "avg_interval=%.2fs target=%.2fs",
                          span_s / static_cast<double>(processed_ - window_frame_), 1.0 / cfg_.fps_limit);
            std::cout << "[Worker](process) " << cfg_.id << " frames=" << processed_
                      << " detections=" << rep.detections << " " << buf << "\n";
            window_start_ = t0;
            window_frame_ = processed_;
        }
    }
}
