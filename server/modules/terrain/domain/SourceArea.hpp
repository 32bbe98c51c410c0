#pragma once

#include "common/geo/Geometry.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 物源贡献（一次变化检测对某个易发区的作用）
 */
struct MaterialContribution {
    int64_t changeDetectionId = 0;
    double magnitude = 0.0;                  // 衰减前的贡献值
    std::chrono::system_clock::time_point observedAt;
};

/**
 * @brief 泥石流起动区（易发性分析输出）
 *
 * materialAvailability 只由 ChangeDetectionIntegrator 写入：
 * base + Σ magnitude·exp(-age/τ)，截断到 [0, 1]。
 */
struct SourceArea {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t id = 0;
    TimePoint timestamp;
    std::optional<int64_t> terrainSnapshotId;
    GeoPolygon geometry;
    std::optional<double> susceptibility;            // 缺失时风险评估降级
    std::optional<double> slopeDeg;
    std::optional<double> contributingAreaM2;
    std::optional<double> baseMaterialAvailability;  // 分析给出的基准值
    std::optional<double> materialAvailability;      // 叠加变化检测后的当前值
    std::vector<MaterialContribution> contributions;
    Json::Value metadata;
    TimePoint updatedAt;
    int64_t revision = 0;

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = static_cast<Json::Int64>(id);
        json["timestamp"] = TimestampHelper::toIso(timestamp);
        json["terrain_snapshot_id"] = terrainSnapshotId
            ? Json::Value(static_cast<Json::Int64>(*terrainSnapshotId)) : Json::Value();
        json["geometry"] = Geo::toGeoJson(geometry);
        json["susceptibility"] = susceptibility ? Json::Value(*susceptibility) : Json::Value();
        json["slope_deg"] = slopeDeg ? Json::Value(*slopeDeg) : Json::Value();
        json["contributing_area_m2"] = contributingAreaM2 ? Json::Value(*contributingAreaM2) : Json::Value();
        json["base_material_availability"] = baseMaterialAvailability
            ? Json::Value(*baseMaterialAvailability) : Json::Value();
        json["material_availability"] = materialAvailability ? Json::Value(*materialAvailability) : Json::Value();
        json["contribution_count"] = static_cast<Json::UInt>(contributions.size());
        json["updated_at"] = TimestampHelper::toIso(updatedAt);
        if (!metadata.isNull()) json["metadata"] = metadata;
        return json;
    }

    /**
     * @throws ValidationException 几何缺失或评分超出 [0, 1]
     */
    static SourceArea fromJson(const Json::Value& json) {
        SourceArea area;
        if (json.isMember("id") && json["id"].isIntegral()) area.id = json["id"].asInt64();
        if (json.isMember("terrain_snapshot_id") && json["terrain_snapshot_id"].isIntegral()) {
            area.terrainSnapshotId = json["terrain_snapshot_id"].asInt64();
        }
        area.geometry = Geo::polygonFromGeoJson(json["geometry"], "geometry");
        area.susceptibility = unitScore(json, "susceptibility");
        area.baseMaterialAvailability = unitScore(json, "material_availability");
        area.materialAvailability = area.baseMaterialAvailability;
        if (json.isMember("slope_deg") && json["slope_deg"].isNumeric()) area.slopeDeg = json["slope_deg"].asDouble();
        if (json.isMember("contributing_area_m2") && json["contributing_area_m2"].isNumeric()) {
            area.contributingAreaM2 = json["contributing_area_m2"].asDouble();
        }
        area.timestamp = std::chrono::system_clock::now();
        area.updatedAt = area.timestamp;
        if (json.isMember("metadata")) area.metadata = json["metadata"];
        return area;
    }

private:
    static std::optional<double> unitScore(const Json::Value& json, const char* field) {
        if (!json.isMember(field) || json[field].isNull()) return std::nullopt;
        if (!json[field].isNumeric()) throw ValidationException(std::string(field) + " 必须为数值");
        double v = json[field].asDouble();
        if (v < 0.0 || v > 1.0) throw ValidationException(std::string(field) + " 必须位于 [0, 1]");
        return v;
    }
};
