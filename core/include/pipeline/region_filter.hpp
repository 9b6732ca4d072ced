#pragma once

#include <pipeline/types.hpp>

#include <string>
#include <vector>

namespace sg {
    struct Point2f {
        float x = 0.0f;
        float y = 0.0f;
    };

    using Polygon = std::vector<Point2f>;

    // Keeps detections whose center lies inside any configured polygon.
    class RegionFilter {
    public:
        RegionFilter() = default;

        // "(x1,y1),(x2,y2),(x3,y3);(...)". Polygons with fewer than three
        // points are dropped. Throws ConfigError on malformed text.
        static RegionFilter parse(const std::string& area);

        bool empty() const { return polygons_.empty(); }
        const std::vector<Polygon>& polygons() const { return polygons_; }

        bool contains(float x, float y) const;
        std::vector<Detection> filter(std::vector<Detection> dets) const;

    private:
        std::vector<Polygon> polygons_;
    };

    bool point_in_polygon(const Polygon& poly, float x, float y);
}
