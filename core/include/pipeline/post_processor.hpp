#pragma once

#include <pipeline/stream_config.hpp>
#include <pipeline/types.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sg {
    // A post-processing variant. State is kept per session id inside the
    // policy; apply() returns false when the result must not reach the
    // alarm engine.
    struct IPostProcessPolicy {
        virtual ~IPostProcessPolicy() = default;
        virtual PostProcessKind kind() const = 0;
        virtual bool apply(const PostProcessConfig& cfg, DetectionResult& result) = 0;
        virtual void forget(const std::string& session_id) = 0;
    };

    // Replaces detections with one synthetic detection per subject that has
    // no required item overlapping it. Always continues so that compliant
    // frames reset alarm debounce.
    class MissingEquipmentPolicy : public IPostProcessPolicy {
    public:
        PostProcessKind kind() const override { return PostProcessKind::MissingEquipment; }
        bool apply(const PostProcessConfig& cfg, DetectionResult& result) override;
        void forget(const std::string& session_id) override;

        int64_t violations(const std::string& session_id) const;

    private:
        mutable std::mutex mtx_;
        std::unordered_map<std::string, int64_t> violations_;
    };

    // Holds results back until targets have been continuously present for
    // presence_s. A frame without targets clears the timer and continues
    // with no detections.
    class PresenceDurationPolicy : public IPostProcessPolicy {
    public:
        PostProcessKind kind() const override { return PostProcessKind::PresenceDuration; }
        bool apply(const PostProcessConfig& cfg, DetectionResult& result) override;
        void forget(const std::string& session_id) override;

    private:
        std::mutex mtx_;
        std::unordered_map<std::string, TimePoint> first_seen_;
    };

    class PostProcessRegistry {
    public:
        PostProcessRegistry();

        // Dispatches on cfg.kind; None always continues untouched.
        bool apply(const PostProcessConfig& cfg, DetectionResult& result);
        void forget(const std::string& session_id);

        IPostProcessPolicy* policy(PostProcessKind kind);

    private:
        std::unique_ptr<MissingEquipmentPolicy> missing_equipment_;
        std::unique_ptr<PresenceDurationPolicy> presence_;
    };
}
