#include <pipeline/post_processor.hpp>

#include <chrono>

namespace sg {
    namespace {
        bool inside(const BBox& b, float x, float y) {
            return x >= b.x1 && x <= b.x2 && y >= b.y1 && y <= b.y2;
        }
    } // namespace

    bool MissingEquipmentPolicy::apply(const PostProcessConfig& cfg, DetectionResult& result) {
        std::vector<const Detection*> subjects;
        std::vector<const Detection*> gear;
        for (const auto& d : result.detections) {
            if (d.confidence < cfg.min_confidence) continue;
            if (d.class_name == cfg.subject_class) subjects.push_back(&d);
            else if (d.class_name == cfg.required_class) gear.push_back(&d);
        }

        std::vector<Detection> violations;
        for (const Detection* s : subjects) {
            bool equipped = false;
            for (const Detection* g : gear) {
                if (inside(s->bbox, g->center_x, g->center_y)) {
                    equipped = true;
                    break;
                }
            }
            if (!equipped) violations.push_back(make_detection(cfg.violation_label, -1, s->confidence, s->bbox));
        }

        if (!violations.empty()) {
            std::lock_guard lk(mtx_);
            violations_[result.session_id] += static_cast<int64_t>(violations.size());
        }
        result.detections = std::move(violations);
        return true;
    }

    void MissingEquipmentPolicy::forget(const std::string& session_id) {
        std::lock_guard lk(mtx_);
        violations_.erase(session_id);
    }

    int64_t MissingEquipmentPolicy::violations(const std::string& session_id) const {
        std::lock_guard lk(mtx_);
        auto it = violations_.find(session_id);
        return it == violations_.end() ? 0 : it->second;
    }

    bool PresenceDurationPolicy::apply(const PostProcessConfig& cfg, DetectionResult& result) {
        bool present = false;
        for (const auto& d : result.detections) {
            if (d.confidence >= cfg.min_confidence) {
                present = true;
                break;
            }
        }

        std::lock_guard lk(mtx_);
        if (!present) {
            first_seen_.erase(result.session_id);
            result.detections.clear();
            return true;
        }

        auto it = first_seen_.find(result.session_id);
        if (it == first_seen_.end()) {
            it = first_seen_.emplace(result.session_id, result.timestamp).first;
        }
        const double held_s = std::chrono::duration<double>(result.timestamp - it->second).count();
        return held_s >= cfg.presence_s;
    }

    void PresenceDurationPolicy::forget(const std::string& session_id) {
        std::lock_guard lk(mtx_);
        first_seen_.erase(session_id);
    }

    PostProcessRegistry::PostProcessRegistry()
        : missing_equipment_(std::make_unique<MissingEquipmentPolicy>()),
          presence_(std::make_unique<PresenceDurationPolicy>()) {}

    IPostProcessPolicy* PostProcessRegistry::policy(PostProcessKind kind) {
        switch (kind) {
            case PostProcessKind::MissingEquipment: return missing_equipment_.get();
            case PostProcessKind::PresenceDuration: return presence_.get();
            case PostProcessKind::None: return nullptr;
        }
        return nullptr;
    }

    bool PostProcessRegistry::apply(const PostProcessConfig& cfg, DetectionResult& result) {
        IPostProcessPolicy* p = policy(cfg.kind);
        if (!p) return true;
        return p->apply(cfg, result);
    }

    void PostProcessRegistry::forget(const std::string& session_id) {
        missing_equipment_->forget(session_id);
        presence_->forget(session_id);
    }
}
