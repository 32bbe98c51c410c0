#pragma once

#include "common/geo/Geometry.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 地形快照（DEM/正射影像采集，创建后不可变）
 */
struct TerrainSnapshot {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t id = 0;
    TimePoint timestamp;
    std::string versionName;
    std::string demPath;
    std::optional<std::string> dtmPath;
    std::optional<std::string> orthoPath;
    double resolutionM = 0.0;
    int epsgCode = 4326;
    GeoPolygon extent;
    std::string source;                  // baseline / sentinel2 / lidar / uav / synthetic
    Json::Value metadata;

    static const std::vector<std::string>& allowedSources() {
        static const std::vector<std::string> sources = {
            "baseline", "sentinel2", "lidar", "uav", "synthetic"
        };
        return sources;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = static_cast<Json::Int64>(id);
        json["timestamp"] = TimestampHelper::toIso(timestamp);
        json["version_name"] = versionName;
        json["dem_path"] = demPath;
        json["dtm_path"] = dtmPath ? Json::Value(*dtmPath) : Json::Value();
        json["ortho_path"] = orthoPath ? Json::Value(*orthoPath) : Json::Value();
        json["resolution_m"] = resolutionM;
        json["epsg_code"] = epsgCode;
        json["extent"] = Geo::toGeoJson(extent);
        json["source"] = source;
        if (!metadata.isNull()) json["metadata"] = metadata;
        return json;
    }

    /**
     * @throws ValidationException 必填字段缺失或取值非法
     */
    static TerrainSnapshot fromJson(const Json::Value& json) {
        TerrainSnapshot s;
        s.versionName = json.get("version_name", "").asString();
        s.demPath = json.get("dem_path", "").asString();
        if (s.versionName.empty()) throw ValidationException("version_name 不能为空");
        if (s.demPath.empty()) throw ValidationException("dem_path 不能为空");

        if (json.isMember("dtm_path") && json["dtm_path"].isString()) s.dtmPath = json["dtm_path"].asString();
        if (json.isMember("ortho_path") && json["ortho_path"].isString()) s.orthoPath = json["ortho_path"].asString();

        if (!json["resolution_m"].isNumeric() || json["resolution_m"].asDouble() <= 0) {
            throw ValidationException("resolution_m 必须为正数");
        }
        s.resolutionM = json["resolution_m"].asDouble();
        s.epsgCode = json.get("epsg_code", 4326).asInt();
        s.extent = Geo::polygonFromGeoJson(json["extent"], "extent");

        s.source = json.get("source", "").asString();
        const auto& allowed = allowedSources();
        if (std::find(allowed.begin(), allowed.end(), s.source) == allowed.end()) {
            throw ValidationException("source 只能是 baseline/sentinel2/lidar/uav/synthetic");
        }

        if (json.isMember("timestamp")) {
            auto ts = TimestampHelper::parse(json["timestamp"].asString());
            if (!ts) throw ValidationException("timestamp 格式错误");
            s.timestamp = *ts;
        } else {
            s.timestamp = std::chrono::system_clock::now();
        }
        if (json.isMember("metadata")) s.metadata = json["metadata"];
        return s;
    }
};
