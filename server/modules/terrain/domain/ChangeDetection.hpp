#pragma once

#include "common/geo/Geometry.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 两期地形快照的体积差分结果（DoD，由外部变化检测服务产生，不可变）
 */
struct ChangeDetection {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t id = 0;
    TimePoint timestamp;
    int64_t baselineSnapshotId = 0;
    int64_t comparisonSnapshotId = 0;
    std::string dodRasterPath;
    double erosionVolumeM3 = 0.0;
    double depositionVolumeM3 = 0.0;
    double netChangeM3 = 0.0;
    double changeAreaM2 = 0.0;
    double lodThresholdM = 0.0;
    std::optional<GeoPolygon> footprint;    // 变化范围，缺省时使用对比快照范围
    Json::Value metadata;

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = static_cast<Json::Int64>(id);
        json["timestamp"] = TimestampHelper::toIso(timestamp);
        json["baseline_snapshot_id"] = static_cast<Json::Int64>(baselineSnapshotId);
        json["comparison_snapshot_id"] = static_cast<Json::Int64>(comparisonSnapshotId);
        json["dod_raster_path"] = dodRasterPath;
        json["erosion_volume_m3"] = erosionVolumeM3;
        json["deposition_volume_m3"] = depositionVolumeM3;
        json["net_change_m3"] = netChangeM3;
        json["change_area_m2"] = changeAreaM2;
        json["lod_threshold_m"] = lodThresholdM;
        json["footprint"] = footprint ? Geo::toGeoJson(*footprint) : Json::Value();
        if (!metadata.isNull()) json["metadata"] = metadata;
        return json;
    }

    /**
     * @brief 解析变化检测记录
     *
     * net_change_m3 缺省时取 deposition - erosion。
     * 快照是否存在由调用方在 SpatialStore 中校验。
     *
     * @throws ValidationException 字段缺失或取值非法
     */
    static ChangeDetection fromJson(const Json::Value& json) {
        ChangeDetection cd;
        if (!json["baseline_snapshot_id"].isIntegral() || !json["comparison_snapshot_id"].isIntegral()) {
            throw ValidationException("baseline_snapshot_id / comparison_snapshot_id 必须为整数");
        }
        cd.baselineSnapshotId = json["baseline_snapshot_id"].asInt64();
        cd.comparisonSnapshotId = json["comparison_snapshot_id"].asInt64();
        if (cd.baselineSnapshotId == cd.comparisonSnapshotId) {
            throw ValidationException("基准快照与对比快照不能相同");
        }

        cd.dodRasterPath = json.get("dod_raster_path", "").asString();
        if (cd.dodRasterPath.empty()) throw ValidationException("dod_raster_path 不能为空");

        cd.erosionVolumeM3 = nonNegative(json, "erosion_volume_m3");
        cd.depositionVolumeM3 = nonNegative(json, "deposition_volume_m3");
        cd.changeAreaM2 = nonNegative(json, "change_area_m2");

        if (json.isMember("net_change_m3") && !json["net_change_m3"].isNull()) {
            if (!json["net_change_m3"].isNumeric()) throw ValidationException("net_change_m3 必须为数值");
            cd.netChangeM3 = json["net_change_m3"].asDouble();
        } else {
            cd.netChangeM3 = cd.depositionVolumeM3 - cd.erosionVolumeM3;
        }

        if (!json["lod_threshold_m"].isNumeric() || json["lod_threshold_m"].asDouble() <= 0) {
            throw ValidationException("lod_threshold_m 必须为正数");
        }
        cd.lodThresholdM = json["lod_threshold_m"].asDouble();

        if (json.isMember("footprint") && !json["footprint"].isNull()) {
            cd.footprint = Geo::polygonFromGeoJson(json["footprint"], "footprint");
        }

        if (json.isMember("timestamp")) {
            auto ts = TimestampHelper::parse(json["timestamp"].asString());
            if (!ts) throw ValidationException("timestamp 格式错误");
            cd.timestamp = *ts;
        } else {
            cd.timestamp = std::chrono::system_clock::now();
        }
        if (json.isMember("metadata")) cd.metadata = json["metadata"];
        return cd;
    }

private:
    static double nonNegative(const Json::Value& json, const char* field) {
        if (!json.isMember(field) || json[field].isNull()) return 0.0;
        if (!json[field].isNumeric() || json[field].asDouble() < 0) {
            throw ValidationException(std::string(field) + " 必须为非负数值");
        }
        return json[field].asDouble();
    }
};
