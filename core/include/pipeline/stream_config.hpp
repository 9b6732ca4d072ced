#pragma once

#include <pipeline/types.hpp>
#include <scheduler/time_policy.hpp>

#include <optional>
#include <string>
#include <vector>

namespace sg {
    enum class PostProcessKind {
        None,
        MissingEquipment, // subject present without required gear
        PresenceDuration  // target continuously present for a minimum time
    };

    const char* to_string(PostProcessKind k);
    // Accepts none|missing_equipment|helmet_detection_alert|presence_duration.
    // Throws ConfigError for anything else.
    PostProcessKind post_process_from_str(const std::string& s);

    struct PostProcessConfig {
        PostProcessKind kind = PostProcessKind::None;
        std::string subject_class = "person";
        std::string required_class = "helmet";
        std::string violation_label = "no_helmet";
        float min_confidence = 0.25f;
        double presence_s = 10.0;
    };

    struct StreamConfig {
        std::string id;
        std::string source;
        std::string name;

        float conf_threshold = 0.25f;
        float iou_threshold = 0.45f;
        int img_size = 640;
        double fps_limit = 1.0;
        std::string model_id;

        std::vector<std::string> target_classes; // empty = all
        std::string region;                      // "(x,y),(x,y),...;(...)", empty = whole frame

        PostProcessConfig post_process;
        std::optional<TimePolicy> time_policy;
        NotificationTarget target;
    };
}
