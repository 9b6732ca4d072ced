#include <storage/artifact_layout.hpp>

namespace sg {
    static std::string strip_trailing_slash(std::string s) {
        while (s.size() > 1 && s.back() == '/') s.pop_back();
        return s;
    }

    ArtifactLayout::ArtifactLayout(std::string results_root, std::string media_base_url)
        : root_(strip_trailing_slash(std::move(results_root))),
          base_url_(strip_trailing_slash(std::move(media_base_url))) {}

    std::string ArtifactLayout::relative_dir(const std::string& session_id, TimePoint ts, int64_t frame_id) const {
        return format_date(ts) + "/" + session_id + "/" + format_clock_ms(ts) + "_frame_" + std::to_string(frame_id);
    }

    std::string ArtifactLayout::directory(const std::string& session_id, TimePoint ts, int64_t frame_id) const {
        return root_ + "/" + relative_dir(session_id, ts, frame_id);
    }

    std::string ArtifactLayout::info_path(const std::string& session_id, TimePoint ts, int64_t frame_id) const {
        return directory(session_id, ts, frame_id) + "/detection_info.json";
    }

    std::string ArtifactLayout::media_url(const std::string& session_id, TimePoint ts, int64_t frame_id) const {
        if (base_url_.empty()) return {};
        return base_url_ + "/" + relative_dir(session_id, ts, frame_id) + "/annotated.jpg";
    }
}
