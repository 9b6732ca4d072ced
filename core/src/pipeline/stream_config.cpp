#include <pipeline/stream_config.hpp>
#include <common/errors.hpp>

namespace sg {
    const char* to_string(PostProcessKind k) {
        switch (k) {
            case PostProcessKind::None: return "none";
            case PostProcessKind::MissingEquipment: return "missing_equipment";
            case PostProcessKind::PresenceDuration: return "presence_duration";
        }
        return "none";
    }

    PostProcessKind post_process_from_str(const std::string& s) {
        if (s.empty() || s == "none") return PostProcessKind::None;
        if (s == "missing_equipment" || s == "helmet_detection_alert") return PostProcessKind::MissingEquipment;
        if (s == "presence_duration") return PostProcessKind::PresenceDuration;
        throw ConfigError("[Config] unknown post_process type '" + s + "'");
    }
}
