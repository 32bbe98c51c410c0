#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief WGS84 经纬度点（lon/lat，单位：度）
 */
struct GeoPoint {
    double lon = 0.0;
    double lat = 0.0;

    bool operator==(const GeoPoint&) const = default;
};

/**
 * @brief 经纬度包围盒
 */
struct BoundingBox {
    double minLon = 0.0;
    double minLat = 0.0;
    double maxLon = 0.0;
    double maxLat = 0.0;

    bool contains(const GeoPoint& p) const {
        return p.lon >= minLon && p.lon <= maxLon && p.lat >= minLat && p.lat <= maxLat;
    }

    bool intersects(const BoundingBox& other) const {
        return minLon <= other.maxLon && maxLon >= other.minLon
            && minLat <= other.maxLat && maxLat >= other.minLat;
    }

    /**
     * @brief 解析 "minLon,minLat,maxLon,maxLat"
     * @throws ValidationException 格式错误或范围颠倒
     */
    static BoundingBox parse(const std::string& text) {
        std::vector<double> values;
        std::stringstream ss(text);
        std::string part;
        while (std::getline(ss, part, ',')) {
            try {
                values.push_back(std::stod(part));
            } catch (const std::exception&) {
                throw ValidationException("bbox 参数格式错误: " + text);
            }
        }
        if (values.size() != 4) {
            throw ValidationException("bbox 需要 4 个数值: minLon,minLat,maxLon,maxLat");
        }
        BoundingBox box{values[0], values[1], values[2], values[3]};
        if (box.minLon > box.maxLon || box.minLat > box.maxLat) {
            throw ValidationException("bbox 范围无效");
        }
        return box;
    }
};

/**
 * @brief 简单多边形（单外环，不含洞），存储时不重复首点
 */
struct GeoPolygon {
    std::vector<GeoPoint> ring;

    bool empty() const { return ring.size() < 3; }

    BoundingBox bbox() const {
        BoundingBox box{180.0, 90.0, -180.0, -90.0};
        for (const auto& p : ring) {
            box.minLon = (std::min)(box.minLon, p.lon);
            box.minLat = (std::min)(box.minLat, p.lat);
            box.maxLon = (std::max)(box.maxLon, p.lon);
            box.maxLat = (std::max)(box.maxLat, p.lat);
        }
        return box;
    }

    GeoPoint centroid() const {
        GeoPoint c;
        if (ring.empty()) return c;
        for (const auto& p : ring) {
            c.lon += p.lon;
            c.lat += p.lat;
        }
        c.lon /= static_cast<double>(ring.size());
        c.lat /= static_cast<double>(ring.size());
        return c;
    }

    static GeoPolygon fromBox(const BoundingBox& box) {
        return GeoPolygon{{
            {box.minLon, box.minLat}, {box.maxLon, box.minLat},
            {box.maxLon, box.maxLat}, {box.minLon, box.maxLat}
        }};
    }
};

/**
 * @brief 几何计算与格式转换
 *
 * 面积和距离基于球面近似（地球半径 6371008.8 m），
 * 适用于泥石流流域尺度（数公里内）的相对比较。
 */
namespace Geo {

inline constexpr double EARTH_RADIUS_M = 6371008.8;
inline constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

/**
 * @brief 两点大圆距离（米）
 */
inline double haversineMeters(const GeoPoint& a, const GeoPoint& b) {
    double dLat = (b.lat - a.lat) * DEG_TO_RAD;
    double dLon = (b.lon - a.lon) * DEG_TO_RAD;
    double h = std::sin(dLat / 2) * std::sin(dLat / 2)
             + std::cos(a.lat * DEG_TO_RAD) * std::cos(b.lat * DEG_TO_RAD)
             * std::sin(dLon / 2) * std::sin(dLon / 2);
    return 2.0 * EARTH_RADIUS_M * std::asin((std::min)(1.0, std::sqrt(h)));
}

/**
 * @brief 多边形面积（平方米），以质心纬度做等距圆柱投影
 */
inline double areaM2(const GeoPolygon& poly) {
    if (poly.empty()) return 0.0;
    double cosLat = std::cos(poly.centroid().lat * DEG_TO_RAD);
    double sum = 0.0;
    for (size_t i = 0, n = poly.ring.size(); i < n; ++i) {
        const auto& p = poly.ring[i];
        const auto& q = poly.ring[(i + 1) % n];
        sum += (p.lon * cosLat) * q.lat - (q.lon * cosLat) * p.lat;
    }
    double degArea = std::abs(sum) / 2.0;
    return degArea * (EARTH_RADIUS_M * DEG_TO_RAD) * (EARTH_RADIUS_M * DEG_TO_RAD);
}

/**
 * @brief 射线法判断点是否在多边形内
 */
inline bool contains(const GeoPolygon& poly, const GeoPoint& pt) {
    bool inside = false;
    for (size_t i = 0, j = poly.ring.size() - 1; i < poly.ring.size(); j = i++) {
        const auto& a = poly.ring[i];
        const auto& b = poly.ring[j];
        if ((a.lat > pt.lat) != (b.lat > pt.lat)) {
            double x = (b.lon - a.lon) * (pt.lat - a.lat) / (b.lat - a.lat) + a.lon;
            if (pt.lon < x) inside = !inside;
        }
    }
    return inside;
}

inline double cross(const GeoPoint& o, const GeoPoint& a, const GeoPoint& b) {
    return (a.lon - o.lon) * (b.lat - o.lat) - (a.lat - o.lat) * (b.lon - o.lon);
}

inline bool isConvex(const GeoPolygon& poly) {
    if (poly.empty()) return false;
    int sign = 0;
    size_t n = poly.ring.size();
    for (size_t i = 0; i < n; ++i) {
        double c = cross(poly.ring[i], poly.ring[(i + 1) % n], poly.ring[(i + 2) % n]);
        if (std::abs(c) < 1e-15) continue;
        int s = c > 0 ? 1 : -1;
        if (sign == 0) sign = s;
        else if (s != sign) return false;
    }
    return sign != 0;
}

/**
 * @brief Sutherland–Hodgman 裁剪（clip 必须为凸多边形）
 */
inline GeoPolygon clipConvex(const GeoPolygon& subject, const GeoPolygon& clip) {
    // 统一裁剪多边形为逆时针方向
    std::vector<GeoPoint> clipRing = clip.ring;
    double orient = 0.0;
    for (size_t i = 0; i < clipRing.size(); ++i) {
        orient += cross({0, 0}, clipRing[i], clipRing[(i + 1) % clipRing.size()]);
    }
    if (orient < 0) std::reverse(clipRing.begin(), clipRing.end());

    std::vector<GeoPoint> output = subject.ring;
    for (size_t i = 0; i < clipRing.size() && !output.empty(); ++i) {
        const auto& a = clipRing[i];
        const auto& b = clipRing[(i + 1) % clipRing.size()];
        std::vector<GeoPoint> input = std::move(output);
        output.clear();

        auto inside = [&](const GeoPoint& p) { return cross(a, b, p) >= 0; };
        auto intersect = [&](const GeoPoint& p, const GeoPoint& q) {
            double a1 = b.lat - a.lat, b1 = a.lon - b.lon;
            double c1 = a1 * a.lon + b1 * a.lat;
            double a2 = q.lat - p.lat, b2 = p.lon - q.lon;
            double c2 = a2 * p.lon + b2 * p.lat;
            double det = a1 * b2 - a2 * b1;
            if (std::abs(det) < 1e-18) return q;
            return GeoPoint{(b2 * c1 - b1 * c2) / det, (a1 * c2 - a2 * c1) / det};
        };

        for (size_t k = 0; k < input.size(); ++k) {
            const auto& cur = input[k];
            const auto& prev = input[(k + input.size() - 1) % input.size()];
            bool curIn = inside(cur);
            bool prevIn = inside(prev);
            if (curIn) {
                if (!prevIn) output.push_back(intersect(prev, cur));
                output.push_back(cur);
            } else if (prevIn) {
                output.push_back(intersect(prev, cur));
            }
        }
    }
    return GeoPolygon{std::move(output)};
}

/**
 * @brief 两多边形相交面积（平方米）
 *
 * 任一方为凸多边形时精确裁剪，否则在公共包围盒内做 64x64 网格采样估算。
 */
inline double intersectionAreaM2(const GeoPolygon& a, const GeoPolygon& b) {
    if (a.empty() || b.empty() || !a.bbox().intersects(b.bbox())) return 0.0;

    if (isConvex(b)) return areaM2(clipConvex(a, b));
    if (isConvex(a)) return areaM2(clipConvex(b, a));

    auto ba = a.bbox();
    auto bb = b.bbox();
    BoundingBox common{(std::max)(ba.minLon, bb.minLon), (std::max)(ba.minLat, bb.minLat),
                       (std::min)(ba.maxLon, bb.maxLon), (std::min)(ba.maxLat, bb.maxLat)};
    constexpr int N = 64;
    int hits = 0;
    double dx = (common.maxLon - common.minLon) / N;
    double dy = (common.maxLat - common.minLat) / N;
    for (int i = 0; i < N; ++i) {
        for (int j = 0; j < N; ++j) {
            GeoPoint p{common.minLon + (i + 0.5) * dx, common.minLat + (j + 0.5) * dy};
            if (contains(a, p) && contains(b, p)) ++hits;
        }
    }
    double cellFraction = static_cast<double>(hits) / (N * N);
    return cellFraction * areaM2(GeoPolygon::fromBox(common));
}

// ==================== WKT / GeoJSON ====================

inline std::string formatCoord(double v) {
    std::ostringstream oss;
    oss << std::setprecision(10) << v;
    return oss.str();
}

inline std::string toWkt(const GeoPoint& p) {
    return "POINT(" + formatCoord(p.lon) + " " + formatCoord(p.lat) + ")";
}

inline std::string toWkt(const GeoPolygon& poly) {
    std::string wkt = "POLYGON((";
    for (const auto& p : poly.ring) {
        wkt += formatCoord(p.lon) + " " + formatCoord(p.lat) + ", ";
    }
    // 闭合外环
    wkt += formatCoord(poly.ring.front().lon) + " " + formatCoord(poly.ring.front().lat) + "))";
    return wkt;
}

inline Json::Value toGeoJson(const GeoPolygon& poly) {
    Json::Value ring(Json::arrayValue);
    auto append = [&ring](const GeoPoint& p) {
        Json::Value coord(Json::arrayValue);
        coord.append(p.lon);
        coord.append(p.lat);
        ring.append(coord);
    };
    for (const auto& p : poly.ring) append(p);
    if (!poly.ring.empty()) append(poly.ring.front());

    Json::Value geo;
    geo["type"] = "Polygon";
    geo["coordinates"].append(ring);
    return geo;
}

inline Json::Value toGeoJson(const GeoPoint& p) {
    Json::Value geo;
    geo["type"] = "Point";
    geo["coordinates"].append(p.lon);
    geo["coordinates"].append(p.lat);
    return geo;
}

inline void validatePoint(const GeoPoint& p, const std::string& field) {
    if (!std::isfinite(p.lon) || !std::isfinite(p.lat)
        || p.lon < -180.0 || p.lon > 180.0 || p.lat < -90.0 || p.lat > 90.0) {
        throw ValidationException(field + " 经纬度超出 WGS84 范围");
    }
}

/**
 * @brief 解析 GeoJSON Polygon（取外环，去掉重复的闭合点）
 * @throws ValidationException 结构错误或顶点不足
 */
inline GeoPolygon polygonFromGeoJson(const Json::Value& geo, const std::string& field = "geometry") {
    if (!geo.isObject() || geo.get("type", "").asString() != "Polygon"
        || !geo["coordinates"].isArray() || geo["coordinates"].empty()) {
        throw ValidationException(field + " 必须是 GeoJSON Polygon");
    }

    GeoPolygon poly;
    for (const auto& coord : geo["coordinates"][0]) {
        if (!coord.isArray() || coord.size() < 2 || !coord[0].isNumeric() || !coord[1].isNumeric()) {
            throw ValidationException(field + " 坐标格式错误");
        }
        GeoPoint p{coord[0].asDouble(), coord[1].asDouble()};
        validatePoint(p, field);
        poly.ring.push_back(p);
    }
    if (poly.ring.size() > 1 && poly.ring.front() == poly.ring.back()) {
        poly.ring.pop_back();
    }
    if (poly.empty()) {
        throw ValidationException(field + " 至少需要 3 个不同顶点");
    }
    return poly;
}

/**
 * @brief 解析 PostGIS ST_AsGeoJSON 输出文本
 */
inline GeoPolygon polygonFromGeoJsonText(const std::string& text) {
    std::string errs;
    auto geo = JsonHelper::tryParse(text, &errs);
    if (!geo) throw ValidationException("GeoJSON 解析失败: " + errs);
    return polygonFromGeoJson(*geo);
}

}  // namespace Geo
