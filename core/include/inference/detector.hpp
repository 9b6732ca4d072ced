#pragma once

#include <map>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace sg {
    struct IDetector {
        virtual ~IDetector() = default;
        // Boxes in frame coordinates. Throws InferenceError.
        virtual std::vector<Detection> infer(const cv::Mat& bgr, float conf, float iou, int img_size) = 0;
        virtual std::map<int, std::string> class_names() const = 0;
    };
}
