#pragma once

#include "common/geo/Geometry.hpp"

/**
 * @brief 监测点（拥有独立的降雨窗口和事件状态）
 */
struct MonitoredLocation {
    std::string id;
    std::string name;
    GeoPoint point;
    double radiusM = 5000.0;
    std::vector<int64_t> sourceAreaIds;    // 为空时按半径匹配易发区

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["name"] = name;
        json["lon"] = point.lon;
        json["lat"] = point.lat;
        json["radius_m"] = radiusM;
        Json::Value areas(Json::arrayValue);
        for (auto areaId : sourceAreaIds) areas.append(static_cast<Json::Int64>(areaId));
        json["source_area_ids"] = areas;
        return json;
    }
};

/**
 * @brief 监测点注册表（启动时由配置构建，运行期只读）
 */
class LocationRegistry {
public:
    LocationRegistry() = default;

    explicit LocationRegistry(std::vector<MonitoredLocation> locations)
        : locations_(std::move(locations)) {}

    const std::vector<MonitoredLocation>& all() const { return locations_; }

    const MonitoredLocation* find(const std::string& id) const {
        for (const auto& loc : locations_) {
            if (loc.id == id) return &loc;
        }
        return nullptr;
    }

    /**
     * @brief 将观测映射到监测点
     *
     * 显式 locationId 优先；否则取半径范围内最近的监测点。
     * @throws ValidationException 未知 ID 或不在任何监测范围内
     */
    const MonitoredLocation& resolve(const std::string& locationId, const GeoPoint& point) const {
        if (!locationId.empty()) {
            if (const auto* loc = find(locationId)) return *loc;
            throw ValidationException("未知监测点: " + locationId);
        }

        const MonitoredLocation* nearest = nullptr;
        double best = std::numeric_limits<double>::max();
        for (const auto& loc : locations_) {
            double d = Geo::haversineMeters(loc.point, point);
            if (d <= loc.radiusM && d < best) {
                best = d;
                nearest = &loc;
            }
        }
        if (!nearest) {
            throw ValidationException("观测位置不在任何监测点范围内");
        }
        return *nearest;
    }

private:
    std::vector<MonitoredLocation> locations_;
};
