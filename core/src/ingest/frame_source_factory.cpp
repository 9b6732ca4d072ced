#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_frame_source.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sg {
    static bool starts_with(const std::string& s, const char* prefix) {
        return s.rfind(prefix, 0) == 0;
    }

    static std::string appsink_tail(const std::string& sink_name) {
        return "videoconvert ! video/x-raw,format=BGR ! "
               "appsink name=" + sink_name + " max-buffers=2 drop=true sync=false";
    }

    std::string pipeline_for_locator(const std::string& locator, const std::string& sink_name) {
        if (locator.empty()) {
            throw std::runtime_error("[Ingest] empty source locator");
        }

        if (starts_with(locator, "rtsp://")) {
            return "rtspsrc location=\"" + locator + "\" latency=200 protocols=tcp drop-on-latency=true ! "
                   "decodebin ! " + appsink_tail(sink_name);
        }
        if (starts_with(locator, "rtmp://")) {
            return "rtmpsrc location=\"" + locator + " live=1\" ! flvdemux ! "
                   "decodebin ! " + appsink_tail(sink_name);
        }
        if (starts_with(locator, "http://") || starts_with(locator, "https://")) {
            return "uridecodebin uri=\"" + locator + "\" ! " + appsink_tail(sink_name);
        }
        if (starts_with(locator, "/dev/video")) {
            return "v4l2src device=" + locator + " ! decodebin ! " + appsink_tail(sink_name);
        }
        return "filesrc location=\"" + locator + "\" ! decodebin ! " + appsink_tail(sink_name);
    }

    std::unique_ptr<IFrameSource> make_frame_source(const std::string& session_id, const std::string& locator) {
        std::string sink_name = "sink_" + session_id;
        std::replace_if(sink_name.begin(), sink_name.end(),
                        [](char c) { return !(std::isalnum(static_cast<unsigned char>(c)) || c == '_'); }, '_');
        return std::make_unique<GstFrameSource>(session_id, pipeline_for_locator(locator, sink_name), sink_name);
    }
}
