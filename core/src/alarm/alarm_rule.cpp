#include <alarm/alarm_rule.hpp>
#include <common/errors.hpp>

namespace sg {
    const char* to_string(ChannelKind k) {
        switch (k) {
            case ChannelKind::Log: return "log";
            case ChannelKind::Callback: return "callback";
            case ChannelKind::Bus: return "bus";
        }
        return "log";
    }

    ChannelKind channel_from_str(const std::string& s) {
        if (s == "log") return ChannelKind::Log;
        if (s == "callback" || s == "webhook") return ChannelKind::Callback;
        if (s == "bus" || s == "mqtt") return ChannelKind::Bus;
        throw ConfigError("[Config] unknown notification channel '" + s + "'");
    }

    AlarmRule default_alarm_rule() {
        AlarmRule r;
        r.id = "default";
        r.name = "default detection alarm";
        r.channels = {ChannelKind::Log, ChannelKind::Callback};
        return r;
    }
}
