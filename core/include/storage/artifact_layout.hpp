#pragma once

#include <common/time_util.hpp>

#include <cstdint>
#include <string>

namespace sg {
    // Deterministic naming of per-detection artifacts:
    //   <root>/<YYYY-MM-DD>/<session>/<HH-MM-SS-mmm>_frame_<id>/
    // holding detection_info.json, original.jpg and annotated.jpg.
    class ArtifactLayout {
    public:
        ArtifactLayout(std::string results_root, std::string media_base_url);

        std::string relative_dir(const std::string& session_id, TimePoint ts, int64_t frame_id) const;
        std::string directory(const std::string& session_id, TimePoint ts, int64_t frame_id) const;
        std::string info_path(const std::string& session_id, TimePoint ts, int64_t frame_id) const;

        // Empty when no base url is configured.
        std::string media_url(const std::string& session_id, TimePoint ts, int64_t frame_id) const;

    private:
        std::string root_;
        std::string base_url_;
    };
}
