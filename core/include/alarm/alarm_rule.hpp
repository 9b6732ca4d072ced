#pragma once

#include <common/time_util.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sg {
    enum class ChannelKind { Log, Callback, Bus };

    const char* to_string(ChannelKind k);
    // log|callback|webhook|bus|mqtt. Throws ConfigError.
    ChannelKind channel_from_str(const std::string& s);

    struct AlarmRule {
        std::string id;
        std::string name;
        std::vector<std::string> session_ids; // empty = every session
        std::vector<std::string> class_names; // empty = every class
        float min_confidence = 0.5f;
        int consecutive_frames = 3;
        std::chrono::milliseconds cooldown{30000};
        std::optional<DailyWindow> time_range;
        bool enabled = true;
        std::vector<ChannelKind> channels{ChannelKind::Log};
    };

    struct AlarmLevels {
        float high = 0.7f;
        float medium = 0.5f;
    };

    AlarmRule default_alarm_rule();
}
