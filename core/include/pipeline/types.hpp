#pragma once

#include <common/time_util.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sg {
    struct BBox {
        float x1 = 0.0f;
        float y1 = 0.0f;
        float x2 = 0.0f;
        float y2 = 0.0f;

        float width() const { return x2 > x1 ? x2 - x1 : 0.0f; }
        float height() const { return y2 > y1 ? y2 - y1 : 0.0f; }
        float area() const { return width() * height(); }
        float cx() const { return 0.5f * (x1 + x2); }
        float cy() const { return 0.5f * (y1 + y2); }
    };

    struct Detection {
        std::string class_name;
        int class_id = -1;
        float confidence = 0.0f;
        BBox bbox;
        float center_x = 0.0f;
        float center_y = 0.0f;
        float area = 0.0f;
    };

    // Fills center and area from the box.
    inline Detection make_detection(std::string class_name, int class_id, float confidence, BBox box) {
        Detection d;
        d.class_name = std::move(class_name);
        d.class_id = class_id;
        d.confidence = confidence;
        d.bbox = box;
        d.center_x = box.cx();
        d.center_y = box.cy();
        d.area = box.area();
        return d;
    }

    // Where alarms raised for a session are delivered.
    struct NotificationTarget {
        std::string callback_url;
        std::string scene_id;
        std::string device_id;
    };

    struct DetectionResult {
        std::string session_id;
        TimePoint timestamp{};
        int64_t frame_id = 0;
        std::vector<Detection> detections;
        double processing_ms = 0.0;
        int frame_w = 0;
        int frame_h = 0;
        std::string media_url;
        NotificationTarget target;
    };

    enum class Severity { Low, Medium, High };

    inline const char* to_string(Severity s) {
        switch (s) {
            case Severity::High: return "high";
            case Severity::Medium: return "medium";
            case Severity::Low: return "low";
        }
        return "low";
    }

    struct AlarmEvent {
        std::string rule_id;
        std::string session_id;
        TimePoint timestamp{};
        Severity severity = Severity::Low;
        float confidence = 0.0f;
        std::string class_name;
        BBox bbox;
        int consecutive_count = 0;
        int64_t frame_id = 0;
        std::string media_url;
        NotificationTarget target;
    };

    enum class SessionStatus { Inactive, Connecting, Active, Error, Reconnecting };

    inline const char* to_string(SessionStatus s) {
        switch (s) {
            case SessionStatus::Inactive: return "inactive";
            case SessionStatus::Connecting: return "connecting";
            case SessionStatus::Active: return "active";
            case SessionStatus::Error: return "error";
            case SessionStatus::Reconnecting: return "reconnecting";
        }
        return "inactive";
    }

    inline bool is_running(SessionStatus s) {
        return s == SessionStatus::Connecting || s == SessionStatus::Active ||
               s == SessionStatus::Reconnecting;
    }
}
