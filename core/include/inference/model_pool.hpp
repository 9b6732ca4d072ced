#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <common/config.hpp>
#include <inference/detector.hpp>

namespace sg {
    enum class PoolMode {
        Shared,   // one detector per model, calls serialised
        Dedicated // one detector per (model, session), calls in parallel
    };

    PoolMode pool_mode_from_str(const std::string& s);

    // Builds a detector for a catalog entry. Throws on failure.
    using DetectorFactory = std::function<std::unique_ptr<IDetector>(const ModelSpec&)>;

    class DetectorHandle {
    public:
        struct Slot {
            std::unique_ptr<IDetector> detector;
            std::mutex mtx;
            bool serialize = true;
        };

        DetectorHandle() = default;
        explicit DetectorHandle(std::shared_ptr<Slot> slot) : slot_(std::move(slot)) {}

        explicit operator bool() const { return slot_ && slot_->detector; }

        std::vector<Detection> infer(const cv::Mat& bgr, float conf, float iou, int img_size) const;
        std::map<int, std::string> class_names() const;

    private:
        std::shared_ptr<Slot> slot_;
    };

    class ModelPool {
    public:
        ModelPool(PoolMode mode, ModelsConfig models, DetectorFactory factory);

        // Loads on first use; concurrent first requests for the same key load
        // once. Throws ModelLoadError.
        DetectorHandle get_detector(const std::string& model_id, const std::string& session_id);

        // Drops dedicated instances owned by the session.
        void release_session(const std::string& session_id);

        size_t loaded_count() const;
        PoolMode mode() const { return mode_; }

    private:
        struct Entry {
            std::mutex load_mtx;
            std::shared_ptr<DetectorHandle::Slot> slot;
        };

        std::string key_for_(const std::string& model_id, const std::string& session_id) const;

        PoolMode mode_;
        ModelsConfig models_;
        DetectorFactory factory_;

        mutable std::mutex entries_mtx_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    };

    // Factory producing NcnnYoloDetector instances.
    DetectorFactory make_ncnn_detector_factory();
}
