#include <pipeline/region_filter.hpp>
#include <common/errors.hpp>

#include <cstdlib>
#include <iostream>

namespace sg {
    namespace {
        std::string trim(const std::string& s) {
            const auto b = s.find_first_not_of(" \t\r\n");
            if (b == std::string::npos) return {};
            const auto e = s.find_last_not_of(" \t\r\n");
            return s.substr(b, e - b + 1);
        }

        float to_float(const std::string& s, const std::string& area) {
            const std::string t = trim(s);
            char* end = nullptr;
            const float v = std::strtof(t.c_str(), &end);
            if (t.empty() || end == t.c_str() || *end != '\0') {
                throw ConfigError("[Region] bad coordinate '" + t + "' in '" + area + "'");
            }
            return v;
        }

        Polygon parse_polygon(const std::string& text, const std::string& area) {
            Polygon poly;
            size_t pos = 0;
            while (true) {
                const size_t open = text.find('(', pos);
                if (open == std::string::npos) break;
                const size_t close = text.find(')', open);
                if (close == std::string::npos) {
                    throw ConfigError("[Region] unbalanced parenthesis in '" + area + "'");
                }
                const std::string inner = text.substr(open + 1, close - open - 1);
                const size_t comma = inner.find(',');
                if (comma == std::string::npos) {
                    throw ConfigError("[Region] point without comma in '" + area + "'");
                }
                poly.push_back({to_float(inner.substr(0, comma), area), to_float(inner.substr(comma + 1), area)});
                pos = close + 1;
            }
            return poly;
        }
    } // namespace

    RegionFilter RegionFilter::parse(const std::string& area) {
        RegionFilter rf;
        size_t start = 0;
        while (start <= area.size()) {
            size_t semi = area.find(';', start);
            if (semi == std::string::npos) semi = area.size();
            const std::string part = trim(area.substr(start, semi - start));
            if (!part.empty()) {
                Polygon poly = parse_polygon(part, area);
                if (poly.size() >= 3) {
                    rf.polygons_.push_back(std::move(poly));
                } else {
                    std::cerr << "[Region](parse) ignoring polygon with " << poly.size() << " points\n";
                }
            }
            start = semi + 1;
        }
        return rf;
    }

    // Ray casting: count crossings of a horizontal ray to the right.
    bool point_in_polygon(const Polygon& poly, float x, float y) {
        bool inside = false;
        const size_t n = poly.size();
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            const Point2f& a = poly[i];
            const Point2f& b = poly[j];
            if ((a.y > y) != (b.y > y)) {
                const float x_cross = (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x;
                if (x < x_cross) inside = !inside;
            }
        }
        return inside;
    }

    bool RegionFilter::contains(float x, float y) const {
        for (const auto& poly : polygons_) {
            if (point_in_polygon(poly, x, y)) return true;
        }
        return false;
    }

    std::vector<Detection> RegionFilter::filter(std::vector<Detection> dets) const {
        if (polygons_.empty()) return dets;
        std::vector<Detection> out;
        out.reserve(dets.size());
        for (auto& d : dets) {
            if (contains(d.center_x, d.center_y)) out.push_back(std::move(d));
        }
        return out;
    }
}
