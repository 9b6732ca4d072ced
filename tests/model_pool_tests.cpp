#include <common/errors.hpp>
#include <inference/model_pool.hpp>
#include <inference/ncnn_yolo_detector.hpp>

#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using sgtest::check;

namespace {
    sg::ModelsConfig catalog() {
        sg::ModelsConfig m;
        sg::ModelSpec a;
        a.id = "yolo";
        a.param_path = "/models/yolo.param";
        a.bin_path = "/models/yolo.bin";
        sg::ModelSpec b = a;
        b.id = "fire";
        m.catalog[a.id] = a;
        m.catalog[b.id] = b;
        m.default_model = "yolo";
        return m;
    }

    sg::DetectorFactory counting_factory(std::atomic<int>& loads, std::chrono::milliseconds delay = {}) {
        return [&loads, delay](const sg::ModelSpec&) -> std::unique_ptr<sg::IDetector> {
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
            ++loads;
            return std::make_unique<sgtest::FakeDetector>();
        };
    }

    bool throws_model_load(sg::ModelPool& pool, const std::string& model, const std::string& session) {
        try {
            (void)pool.get_detector(model, session);
            return false;
        } catch (const sg::ModelLoadError&) {
            return true;
        }
    }

    void test_concurrent_first_use_loads_once() {
        std::atomic<int> loads{0};
        sg::ModelPool pool(sg::PoolMode::Shared, catalog(), counting_factory(loads, std::chrono::milliseconds(50)));

        std::vector<std::thread> threads;
        std::atomic<int> ok{0};
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&, i] {
                auto h = pool.get_detector("yolo", "cam" + std::to_string(i));
                if (h) ++ok;
            });
        }
        for (auto& t : threads) t.join();

        check(loads == 1, "shared model loaded exactly once under concurrent first use");
        check(ok == 8, "every caller got a usable handle");
        check(pool.loaded_count() == 1, "one loaded entry");
    }

    void test_dedicated_mode_loads_per_session() {
        std::atomic<int> loads{0};
        sg::ModelPool pool(sg::PoolMode::Dedicated, catalog(), counting_factory(loads));

        (void)pool.get_detector("yolo", "cam0");
        (void)pool.get_detector("yolo", "cam1");
        (void)pool.get_detector("yolo", "cam0");
        check(loads == 2, "one instance per session in dedicated mode");
        check(pool.loaded_count() == 2, "two loaded entries");

        pool.release_session("cam0");
        check(pool.loaded_count() == 1, "release drops the session's instance");
        (void)pool.get_detector("yolo", "cam0");
        check(loads == 3, "reload after release");
    }

    void test_shared_release_is_noop() {
        std::atomic<int> loads{0};
        sg::ModelPool pool(sg::PoolMode::Shared, catalog(), counting_factory(loads));
        (void)pool.get_detector("yolo", "cam0");
        pool.release_session("cam0");
        check(pool.loaded_count() == 1, "shared instances survive session release");
    }

    void test_empty_id_uses_default() {
        std::atomic<int> loads{0};
        sg::ModelPool pool(sg::PoolMode::Shared, catalog(), counting_factory(loads));
        (void)pool.get_detector("", "cam0");
        (void)pool.get_detector("yolo", "cam1");
        check(loads == 1, "empty model id resolves to the default model");
    }

    void test_unknown_model_fails() {
        std::atomic<int> loads{0};
        sg::ModelPool pool(sg::PoolMode::Shared, catalog(), counting_factory(loads));
        check(throws_model_load(pool, "nope", "cam0"), "unknown model raises ModelLoadError");
        check(loads == 0, "factory not called for unknown model");

        sg::ModelsConfig no_default = catalog();
        no_default.default_model.clear();
        sg::ModelPool pool2(sg::PoolMode::Shared, no_default, counting_factory(loads));
        check(throws_model_load(pool2, "", "cam0"), "empty id without default raises ModelLoadError");
    }

    void test_failed_load_can_be_retried() {
        std::atomic<int> attempts{0};
        sg::ModelPool pool(sg::PoolMode::Shared, catalog(),
                           [&](const sg::ModelSpec&) -> std::unique_ptr<sg::IDetector> {
                               if (++attempts == 1) throw std::runtime_error("param file missing");
                               return std::make_unique<sgtest::FakeDetector>();
                           });
        check(throws_model_load(pool, "yolo", "cam0"), "factory failure becomes ModelLoadError");
        check(pool.loaded_count() == 0, "failed load leaves nothing cached");
        check(static_cast<bool>(pool.get_detector("yolo", "cam0")), "second attempt loads");
        check(attempts == 2, "factory retried");
    }

    void test_handle_forwards_inference() {
        auto fake = std::make_unique<sgtest::FakeDetector>(
            std::vector<sg::Detection>{sgtest::det("person", 0.9f, 0, 0, 10, 10)});
        sgtest::FakeDetector* raw = fake.get();
        std::unique_ptr<sg::IDetector> owned = std::move(fake);

        sg::ModelPool pool(sg::PoolMode::Shared, catalog(),
                           [&](const sg::ModelSpec&) -> std::unique_ptr<sg::IDetector> { return std::move(owned); });
        auto h = pool.get_detector("yolo", "cam0");
        const cv::Mat frame(64, 64, CV_8UC3, cv::Scalar(0, 0, 0));
        const auto dets = h.infer(frame, 0.25f, 0.45f, 640);
        check(dets.size() == 1 && raw->calls == 1, "handle forwards to the detector");

        raw->fail = true;
        bool threw = false;
        try {
            (void)h.infer(frame, 0.25f, 0.45f, 640);
        } catch (const sg::InferenceError&) {
            threw = true;
        }
        check(threw, "inference errors propagate through the handle");

        sg::DetectorHandle empty;
        check(!empty, "default handle is empty");
    }

    void test_missing_model_files_fail_to_load() {
        sg::ModelSpec spec;
        spec.id = "ghost";
        spec.param_path = "/nonexistent/ghost.param";
        spec.bin_path = "/nonexistent/ghost.bin";
        spec.class_names = {"person"};
        bool threw = false;
        try {
            sg::NcnnYoloDetector d(spec);
        } catch (const sg::ModelLoadError&) {
            threw = true;
        }
        check(threw, "missing ncnn files raise ModelLoadError");
    }

    void test_nms_per_class() {
        std::vector<sg::Detection> dets = {
            sg::make_detection("person", 0, 0.9f, {0, 0, 100, 100}),
            sg::make_detection("person", 0, 0.8f, {5, 5, 100, 100}),
            sg::make_detection("helmet", 1, 0.7f, {5, 5, 100, 100}),
            sg::make_detection("person", 0, 0.6f, {300, 300, 400, 400}),
        };
        const auto kept = sg::non_max_suppression(dets, 0.45f);
        check(kept.size() == 3, "overlapping same-class box suppressed, other class kept");
        check(sg::iou_of({0, 0, 10, 10}, {0, 0, 10, 10}) > 0.99f, "identical boxes iou 1");
        check(sg::iou_of({0, 0, 10, 10}, {20, 20, 30, 30}) == 0.0f, "disjoint boxes iou 0");
    }

    void test_pool_mode_parsing() {
        check(sg::pool_mode_from_str("shared") == sg::PoolMode::Shared, "shared mode");
        check(sg::pool_mode_from_str("dedicated") == sg::PoolMode::Dedicated, "dedicated mode");
        bool threw = false;
        try {
            (void)sg::pool_mode_from_str("pooled");
        } catch (const sg::ConfigError&) {
            threw = true;
        }
        check(threw, "unknown mode rejected");
    }
}

int main() {
    test_concurrent_first_use_loads_once();
    test_dedicated_mode_loads_per_session();
    test_shared_release_is_noop();
    test_empty_id_uses_default();
    test_unknown_model_fails();
    test_failed_load_can_be_retried();
    test_handle_forwards_inference();
    test_missing_model_files_fail_to_load();
    test_nms_per_class();
    test_pool_mode_parsing();

    return sgtest::finish("model pool");
}
