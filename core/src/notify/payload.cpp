#include <notify/payload.hpp>

#include <cstdio>

namespace sg {
    std::string json_escape(const std::string& s) {
        std::string out;
        out.reserve(s.size() + 8);
        for (char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }
        return out;
    }

    static std::string fmt_float(float v) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.4f", static_cast<double>(v));
        return buf;
    }

    std::string callback_payload(const NotificationTask& task) {
        const AlarmEvent& ev = task.event;
        return std::string("{") +
               R"("type":"alarm",)" +
               R"("rule":{"id":")" + json_escape(task.rule.id) + R"(","name":")" + json_escape(task.rule.name) + "\"}," +
               R"("event":{)" +
               R"("session_id":")" + json_escape(ev.session_id) + "\"," +
               R"("scene":")" + json_escape(ev.target.scene_id) + "\"," +
               R"("deviceGbCode":")" + json_escape(ev.target.device_id) + "\"," +
               R"("alarmTime":")" + format_datetime(ev.timestamp) + "\"," +
               R"("level":")" + to_string(ev.severity) + "\"," +
               R"("class_name":")" + json_escape(ev.class_name) + "\"," +
               R"("confidence":)" + fmt_float(ev.confidence) + "," +
               R"("bbox":[)" + fmt_float(ev.bbox.x1) + "," + fmt_float(ev.bbox.y1) + "," +
               fmt_float(ev.bbox.x2) + "," + fmt_float(ev.bbox.y2) + "]," +
               R"("consecutive":)" + std::to_string(ev.consecutive_count) + "," +
               R"("frame_id":)" + std::to_string(ev.frame_id) + "," +
               R"("pic":")" + json_escape(ev.media_url) + "\"" +
               "}}";
    }

    std::string bus_payload(const AlarmEvent& event) {
        return std::string("{") +
               R"("scene":")" + json_escape(event.target.scene_id) + "\"," +
               R"("deviceGbCode":")" + json_escape(event.target.device_id) + "\"," +
               R"("alarmTime":")" + format_datetime(event.timestamp) + "\"," +
               R"("pic":")" + json_escape(event.media_url) + "\"," +
               R"("record":"")" +
               "}";
    }
}
