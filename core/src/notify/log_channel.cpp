#include <notify/log_channel.hpp>

#include <cstdio>

namespace sg {
    bool LogChannel::deliver(const NotificationTask& task) {
        const AlarmEvent& ev = task.event;
        char conf[16];
        std::snprintf(conf, sizeof(conf), "%.2f", static_cast<double>(ev.confidence));

        std::lock_guard lk(mtx_);
        out_ << "[ALARM] " << format_datetime(ev.timestamp)
             << " rule=" << task.rule.id
             << " session=" << ev.session_id
             << " class=" << ev.class_name
             << " conf=" << conf
             << " level=" << to_string(ev.severity)
             << " consecutive=" << ev.consecutive_count;
        if (!ev.media_url.empty()) out_ << " pic=" << ev.media_url;
        out_ << "\n";
        out_.flush();
        ++written_;
        return true;
    }
}
