#pragma once

#include <memory>
#include <string>
#include <vector>

#include <common/config.hpp>
#include <inference/detector.hpp>

namespace sg {
    // YOLOv8-style ncnn export: one output blob shaped [4 + classes] x anchors,
    // boxes as (cx, cy, w, h) in letterboxed input pixels.
    class NcnnYoloDetector : public IDetector {
    public:
        // Throws ModelLoadError when files are missing or unreadable.
        explicit NcnnYoloDetector(ModelSpec spec);
        ~NcnnYoloDetector() override;

        NcnnYoloDetector(const NcnnYoloDetector&) = delete;
        NcnnYoloDetector& operator=(const NcnnYoloDetector&) = delete;

        std::vector<Detection> infer(const cv::Mat& bgr, float conf, float iou, int img_size) override;
        std::map<int, std::string> class_names() const override;

    private:
        ModelSpec spec_;
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

    // Greedy per-class NMS, highest confidence first.
    std::vector<Detection> non_max_suppression(std::vector<Detection> candidates, float iou_threshold);
    float iou_of(const BBox& a, const BBox& b);
}
