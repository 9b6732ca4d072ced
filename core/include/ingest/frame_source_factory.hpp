#pragma once

#include <memory>
#include <string>

#include <ingest/frame_source.hpp>

namespace sg {
    // GStreamer launch line for a locator: rtsp://, rtmp://, http(s)://,
    // /dev/videoN or a file path. Throws std::runtime_error on empty input.
    std::string pipeline_for_locator(const std::string& locator, const std::string& sink_name);

    std::unique_ptr<IFrameSource> make_frame_source(const std::string& session_id, const std::string& locator);
}
