#include <inference/model_pool.hpp>
#include <inference/ncnn_yolo_detector.hpp>
#include <common/errors.hpp>

#include <iostream>

namespace sg {
    PoolMode pool_mode_from_str(const std::string& s) {
        if (s == "shared") return PoolMode::Shared;
        if (s == "dedicated") return PoolMode::Dedicated;
        throw ConfigError("[Config] unknown model pool mode '" + s + "'");
    }

    std::vector<Detection> DetectorHandle::infer(const cv::Mat& bgr, float conf, float iou, int img_size) const {
        if (!slot_ || !slot_->detector) throw InferenceError("detector handle is empty");
        if (!slot_->serialize) return slot_->detector->infer(bgr, conf, iou, img_size);
        std::lock_guard lk(slot_->mtx);
        return slot_->detector->infer(bgr, conf, iou, img_size);
    }

    std::map<int, std::string> DetectorHandle::class_names() const {
        if (!slot_ || !slot_->detector) return {};
        return slot_->detector->class_names();
    }

    ModelPool::ModelPool(PoolMode mode, ModelsConfig models, DetectorFactory factory)
        : mode_(mode), models_(std::move(models)), factory_(std::move(factory)) {}

    std::string ModelPool::key_for_(const std::string& model_id, const std::string& session_id) const {
        if (mode_ == PoolMode::Shared) return model_id;
        return model_id + "#" + session_id;
    }

    DetectorHandle ModelPool::get_detector(const std::string& model_id, const std::string& session_id) {
        const std::string id = model_id.empty() ? models_.default_model : model_id;
        if (id.empty()) {
            throw ModelLoadError("no model requested and no default model configured");
        }
        auto spec_it = models_.catalog.find(id);
        if (spec_it == models_.catalog.end()) {
            throw ModelLoadError("unknown model '" + id + "'");
        }

        std::shared_ptr<Entry> entry;
        {
            std::lock_guard lk(entries_mtx_);
            auto& e = entries_[key_for_(id, session_id)];
            if (!e) e = std::make_shared<Entry>();
            entry = e;
        }

        std::lock_guard load_lk(entry->load_mtx);
        if (entry->slot) return DetectorHandle(entry->slot);

        std::unique_ptr<IDetector> det;
        try {
            det = factory_(spec_it->second);
        } catch (const ModelLoadError&) {
            throw;
        } catch (const std::exception& e) {
            throw ModelLoadError("loading '" + id + "' failed: " + e.what());
        }
        if (!det) throw ModelLoadError("factory returned no detector for '" + id + "'");

        auto slot = std::make_shared<DetectorHandle::Slot>();
        slot->detector = std::move(det);
        slot->serialize = (mode_ == PoolMode::Shared);
        entry->slot = slot;

        std::cout << "[ModelPool](get_detector) loaded " << id
                  << (mode_ == PoolMode::Dedicated ? " for " + session_id : std::string(" (shared)")) << "\n";
        return DetectorHandle(std::move(slot));
    }

    void ModelPool::release_session(const std::string& session_id) {
        if (mode_ != PoolMode::Dedicated) return;
        const std::string suffix = "#" + session_id;
        std::lock_guard lk(entries_mtx_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            const std::string& k = it->first;
            if (k.size() > suffix.size() && k.compare(k.size() - suffix.size(), suffix.size(), suffix) == 0) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t ModelPool::loaded_count() const {
        std::lock_guard lk(entries_mtx_);
        size_t n = 0;
        for (const auto& kv : entries_) {
            std::lock_guard load_lk(kv.second->load_mtx);
            if (kv.second->slot) ++n;
        }
        return n;
    }

    DetectorFactory make_ncnn_detector_factory() {
        return [](const ModelSpec& spec) -> std::unique_ptr<IDetector> {
            return std::make_unique<NcnnYoloDetector>(spec);
        };
    }
}
