#include <ingest/gst_frame_source.hpp>

#include <common/time_util.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>
#include <iostream>
#include <mutex>

namespace sg {
    GstFrameSource::GstFrameSource(std::string session_id, std::string launch, std::string sink_name)
        : session_id_(std::move(session_id)), launch_(std::move(launch)), sink_name_(std::move(sink_name)) {}

    bool GstFrameSource::open() {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        close();

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(launch_.c_str(), &err);
        if (err) {
            std::cerr << "[GStreamer](open) " << session_id_ << " parse_launch error: " << err->message << "\n";
            g_error_free(err);
            if (pipeline_) {
                gst_object_unref(pipeline_);
                pipeline_ = nullptr;
            }
            return false;
        }
        if (!pipeline_) {
            std::cerr << "[GStreamer](open) " << session_id_ << " parse_launch failed (unk error)\n";
            return false;
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_) {
            std::cerr << "[GStreamer](open) appsink named " << sink_name_ << " not found.\n";
            close();
            return false;
        }

        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, TRUE);
        gst_app_sink_set_max_buffers(appsink, 2);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer](open) " << session_id_ << " failed to set pipeline to PLAYING\n";
            close();
            return false;
        }

        return true;
    }

    bool GstFrameSource::drain_bus_() {
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return false;
        bool failed = false;
        while (GstMessage* msg = gst_bus_pop_filtered(
                   bus, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS))) {
            if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
                GError* err = nullptr;
                gchar* dbg = nullptr;
                gst_message_parse_error(msg, &err, &dbg);
                std::cerr << "[GStreamer](read) " << session_id_ << " pipeline error: "
                          << (err ? err->message : "unknown") << "\n";
                if (err) g_error_free(err);
                g_free(dbg);
            }
            failed = true;
            gst_message_unref(msg);
        }
        gst_object_unref(bus);
        return failed;
    }

    ReadStatus GstFrameSource::read(FramePacket& out, int timeout_ms) {
        if (!sink_) return ReadStatus::Lost;

        GstSample* sample = gst_app_sink_try_pull_sample(
            GST_APP_SINK(sink_), static_cast<GstClockTime>(timeout_ms) * GST_MSECOND);

        if (!sample) {
            if (gst_app_sink_is_eos(GST_APP_SINK(sink_)) || drain_bus_()) return ReadStatus::Lost;
            return ReadStatus::Timeout;
        }

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) {
            gst_sample_unref(sample);
            return ReadStatus::Timeout;
        }

        GstStructure* st = gst_caps_get_structure(caps, 0);
        int width = 0, height = 0;
        gst_structure_get_int(st, "width", &width);
        gst_structure_get_int(st, "height", &height);

        out.bgr.release();
        out.pts_ns = (buffer->pts == GST_CLOCK_TIME_NONE) ? 0 : static_cast<int64_t>(buffer->pts);
        out.frame_id = next_frame_id_++;
        out.captured_at = Clock::now();

        // A sample that cannot be mapped still counts as a frame; the caller
        // sees an empty image and rejects it as corrupt.
        GstMapInfo map;
        if (width <= 0 || height <= 0 || !gst_buffer_map(buffer, &map, GST_MAP_READ)) {
            gst_sample_unref(sample);
            return ReadStatus::Ok;
        }

        GstVideoInfo vinfo;
        int stride = width * 3;
        if (gst_video_info_from_caps(&vinfo, caps)) {
            int s0 = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
            if (s0 > 0) stride = s0;
        }

        const size_t min_bytes = static_cast<size_t>(stride) * static_cast<size_t>(height);
        if (map.data && map.size >= min_bytes) {
            cv::Mat tmp(height, width, CV_8UC3, (void*)map.data, stride);
            out.bgr = tmp.clone();
        }

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return ReadStatus::Ok;
    }

    void GstFrameSource::close() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }

    GstFrameSource::~GstFrameSource() {
        close();
    }
}
