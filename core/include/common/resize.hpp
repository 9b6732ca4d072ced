#pragma once

#include <pipeline/types.hpp>

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <vector>

namespace sg {
    struct ScaledFrame {
        cv::Mat image;
        float scale = 1.0f; // image = original * scale
    };

    // Shrinks the frame so its long side fits max_side. Frames already small
    // enough are passed through with scale 1.
    inline ScaledFrame downscale_for_inference(const cv::Mat& src, int max_side) {
        ScaledFrame out;
        const int long_side = std::max(src.cols, src.rows);
        if (max_side <= 0 || long_side <= max_side) {
            out.image = src;
            return out;
        }

        out.scale = static_cast<float>(max_side) / static_cast<float>(long_side);
        const int new_w = std::max(1, static_cast<int>(src.cols * out.scale));
        const int new_h = std::max(1, static_cast<int>(src.rows * out.scale));
        cv::resize(src, out.image, {new_w, new_h}, 0, 0, cv::INTER_AREA);
        return out;
    }

    // Maps boxes found on a scaled frame back into original coordinates,
    // clamped to the original frame, and refreshes center and area.
    inline void map_to_original(std::vector<Detection>& dets, float scale, int orig_w, int orig_h) {
        if (scale <= 0.0f) return;
        const float inv = 1.0f / scale;
        const float w = static_cast<float>(orig_w);
        const float h = static_cast<float>(orig_h);
        for (auto& d : dets) {
            BBox b = d.bbox;
            b.x1 = std::clamp(b.x1 * inv, 0.0f, w);
            b.y1 = std::clamp(b.y1 * inv, 0.0f, h);
            b.x2 = std::clamp(b.x2 * inv, 0.0f, w);
            b.y2 = std::clamp(b.y2 * inv, 0.0f, h);
            d = make_detection(std::move(d.class_name), d.class_id, d.confidence, b);
        }
    }
}
