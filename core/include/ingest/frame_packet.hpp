#pragma once

#include <common/time_util.hpp>

#include <cstdint>
#include <opencv2/core.hpp>

namespace sg {
    // One decoded frame. captured_at is wall time at acquisition; when left
    // unset the worker stamps the frame itself.
    struct FramePacket {
        cv::Mat bgr;
        int64_t frame_id = 0;
        int64_t pts_ns = 0;
        TimePoint captured_at{};

        bool usable(int min_side) const {
            return !bgr.empty() && bgr.cols >= min_side && bgr.rows >= min_side;
        }
    };
}
