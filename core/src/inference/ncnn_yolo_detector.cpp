#include <inference/ncnn_yolo_detector.hpp>
#include <common/errors.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <ncnn/allocator.h>
#include <ncnn/net.h>

namespace sg {
    namespace {
        std::string resolve_path_or_throw(const std::string& p) {
            namespace fs = std::filesystem;
            if (fs::exists(fs::path(p))) return p;
            throw ModelLoadError("Model path not found: " + p);
        }

        std::vector<std::string> read_names_file(const std::string& path) {
            std::ifstream in(resolve_path_or_throw(path));
            std::vector<std::string> names;
            std::string line;
            while (std::getline(in, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) names.push_back(line);
            }
            return names;
        }
    } // namespace

    float iou_of(const BBox& a, const BBox& b) {
        const float xx1 = std::max(a.x1, b.x1);
        const float yy1 = std::max(a.y1, b.y1);
        const float xx2 = std::min(a.x2, b.x2);
        const float yy2 = std::min(a.y2, b.y2);

        const float iw = std::max(0.0f, xx2 - xx1);
        const float ih = std::max(0.0f, yy2 - yy1);
        const float inter = iw * ih;
        if (inter <= 0.0f) return 0.0f;

        const float uni = a.area() + b.area() - inter;
        if (uni <= 0.0f) return 0.0f;
        return inter / uni;
    }

    std::vector<Detection> non_max_suppression(std::vector<Detection> candidates, float iou_threshold) {
        std::sort(candidates.begin(), candidates.end(),
                  [](const Detection& a, const Detection& b) { return a.confidence > b.confidence; });

        std::vector<Detection> kept;
        kept.reserve(candidates.size());
        for (auto& cand : candidates) {
            bool keep = true;
            for (const auto& k : kept) {
                if (k.class_id == cand.class_id && iou_of(cand.bbox, k.bbox) > iou_threshold) {
                    keep = false;
                    break;
                }
            }
            if (keep) kept.push_back(std::move(cand));
        }
        return kept;
    }

    class NcnnYoloDetector::Impl {
    public:
        explicit Impl(const ModelSpec& spec) {
            net_.opt.use_vulkan_compute = false;
            net_.opt.num_threads = std::max(1, spec.threads);
            workspace_pool_allocator_.set_size_compare_ratio(0.0f);

            const std::string param = resolve_path_or_throw(spec.param_path);
            const std::string bin = resolve_path_or_throw(spec.bin_path);

            if (net_.load_param(param.c_str()) != 0) {
                throw ModelLoadError("Failed to load model param: " + param);
            }
            if (net_.load_model(bin.c_str()) != 0) {
                throw ModelLoadError("Failed to load model weights: " + bin);
            }

            names_ = spec.class_names;
            if (names_.empty() && !spec.names_path.empty()) names_ = read_names_file(spec.names_path);
        }

        std::vector<Detection> infer(const cv::Mat& bgr, float conf, float iou, int img_size,
                                     const ModelSpec& spec) {
            if (bgr.empty()) return {};
            if (img_size <= 0) throw InferenceError("image size must be positive");

            // letterbox into img_size x img_size, padded with gray
            const float scale = std::min(static_cast<float>(img_size) / static_cast<float>(bgr.cols),
                                         static_cast<float>(img_size) / static_cast<float>(bgr.rows));
            const int new_w = std::max(1, static_cast<int>(bgr.cols * scale));
            const int new_h = std::max(1, static_cast<int>(bgr.rows * scale));
            const int pad_w = img_size - new_w;
            const int pad_h = img_size - new_h;

            ncnn::Mat resized = ncnn::Mat::from_pixels_resize(
                bgr.data,
                ncnn::Mat::PIXEL_BGR2RGB,
                bgr.cols,
                bgr.rows,
                static_cast<int>(bgr.step[0]),
                new_w,
                new_h);

            ncnn::Mat in;
            ncnn::copy_make_border(resized, in,
                                   pad_h / 2, pad_h - pad_h / 2,
                                   pad_w / 2, pad_w - pad_w / 2,
                                   ncnn::BORDER_CONSTANT, 114.0f);

            const float norm[3] = {1.0f / 255.0f, 1.0f / 255.0f, 1.0f / 255.0f};
            in.substract_mean_normalize(nullptr, norm);

            ncnn::Extractor ex = net_.create_extractor();
            ex.set_light_mode(true);
            thread_local ncnn::UnlockedPoolAllocator blob_pool_allocator;
            thread_local bool blob_pool_initialized = false;
            if (!blob_pool_initialized) {
                blob_pool_allocator.set_size_compare_ratio(0.0f);
                blob_pool_initialized = true;
            }
            ex.set_blob_allocator(&blob_pool_allocator);
            ex.set_workspace_allocator(&workspace_pool_allocator_);

            if (ex.input(spec.input_blob.c_str(), in) != 0) {
                throw InferenceError("input blob '" + spec.input_blob + "' rejected");
            }
            ncnn::Mat out;
            if (ex.extract(spec.output_blob.c_str(), out) != 0) {
                throw InferenceError("output blob '" + spec.output_blob + "' not produced");
            }

            // rows = 4 + classes, cols = anchors
            const int num_classes = out.h - 4;
            const int anchors = out.w;
            if (num_classes <= 0 || anchors <= 0) {
                throw InferenceError("unexpected output shape " + std::to_string(out.h) + "x" +
                                     std::to_string(out.w));
            }

            const float off_x = static_cast<float>(pad_w / 2);
            const float off_y = static_cast<float>(pad_h / 2);
            const float fw = static_cast<float>(bgr.cols);
            const float fh = static_cast<float>(bgr.rows);

            std::vector<Detection> candidates;
            candidates.reserve(256);
            for (int a = 0; a < anchors; ++a) {
                int best = -1;
                float best_score = conf;
                for (int c = 0; c < num_classes; ++c) {
                    const float s = out.row(4 + c)[a];
                    if (s >= best_score) {
                        best_score = s;
                        best = c;
                    }
                }
                if (best < 0) continue;

                const float cx = out.row(0)[a];
                const float cy = out.row(1)[a];
                const float w = out.row(2)[a];
                const float h = out.row(3)[a];

                BBox b;
                b.x1 = std::clamp((cx - w * 0.5f - off_x) / scale, 0.0f, fw);
                b.y1 = std::clamp((cy - h * 0.5f - off_y) / scale, 0.0f, fh);
                b.x2 = std::clamp((cx + w * 0.5f - off_x) / scale, 0.0f, fw);
                b.y2 = std::clamp((cy + h * 0.5f - off_y) / scale, 0.0f, fh);
                if (b.x2 <= b.x1 || b.y2 <= b.y1) continue;

                candidates.push_back(make_detection(name_of(best), best, best_score, b));
            }

            return non_max_suppression(std::move(candidates), iou);
        }

        std::string name_of(int id) const {
            if (id >= 0 && id < static_cast<int>(names_.size())) return names_[static_cast<size_t>(id)];
            return "class_" + std::to_string(id);
        }

        std::map<int, std::string> class_names() const {
            std::map<int, std::string> out;
            for (size_t i = 0; i < names_.size(); ++i) out[static_cast<int>(i)] = names_[i];
            return out;
        }

    private:
        ncnn::Net net_;
        ncnn::PoolAllocator workspace_pool_allocator_;
        std::vector<std::string> names_;
    };

    NcnnYoloDetector::NcnnYoloDetector(ModelSpec spec)
        : spec_(std::move(spec)),
          impl_(std::make_unique<Impl>(spec_)) {}

    NcnnYoloDetector::~NcnnYoloDetector() = default;

    std::vector<Detection> NcnnYoloDetector::infer(const cv::Mat& bgr, float conf, float iou, int img_size) {
        return impl_->infer(bgr, conf, iou, img_size, spec_);
    }

    std::map<int, std::string> NcnnYoloDetector::class_names() const {
        return impl_->class_names();
    }
}
