#pragma once

#include <ingest/frame_source.hpp>

#include <cstdint>
#include <string>

struct _GstElement;
using GstElement = _GstElement;

namespace sg {
    // Frames pulled from an appsink at the end of a gst-launch description.
    // EOS and bus errors surface as ReadStatus::Lost so the worker reconnects.
    class GstFrameSource : public IFrameSource {
    public:
        GstFrameSource(std::string session_id, std::string launch, std::string sink_name);
        ~GstFrameSource() override;

        bool open() override;
        void close() override;
        ReadStatus read(FramePacket& out, int timeout_ms = 1000) override;
        const std::string& id() const override { return session_id_; }

        const std::string& launch() const { return launch_; }
        int64_t frames_read() const { return next_frame_id_; }

    private:
        bool drain_bus_();

        std::string session_id_;
        std::string launch_;
        std::string sink_name_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;

        int64_t next_frame_id_ = 0;
    };
}
