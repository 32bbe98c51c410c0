#pragma once

#include "common/geo/Geometry.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 气象观测（追加写入，不可变）
 */
struct WeatherObservation {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t id = 0;
    std::string locationId;              // 归属监测点（入库前解析）
    TimePoint timestamp;
    GeoPoint location;
    double rainfallMm = 0.0;
    double intensityMmHr = 0.0;
    std::optional<double> temperatureC;
    std::optional<double> humidityPct;
    std::optional<double> windSpeedMs;
    std::string source;
    Json::Value metadata;

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = static_cast<Json::Int64>(id);
        json["location_id"] = locationId;
        json["timestamp"] = TimestampHelper::toIso(timestamp);
        json["location"] = Geo::toGeoJson(location);
        json["rainfall_mm"] = rainfallMm;
        json["intensity_mm_hr"] = intensityMmHr;
        json["temperature_c"] = temperatureC ? Json::Value(*temperatureC) : Json::Value();
        json["humidity_pct"] = humidityPct ? Json::Value(*humidityPct) : Json::Value();
        json["wind_speed_ms"] = windSpeedMs ? Json::Value(*windSpeedMs) : Json::Value();
        json["source"] = source;
        if (!metadata.isNull()) json["metadata"] = metadata;
        return json;
    }

    /**
     * @brief 从采集端 JSON 解析
     *
     * 接受 location 为 {lon, lat} 对象或 GeoJSON Point，
     * 可选 location_id 直接指定监测点。
     *
     * @throws ValidationException 字段缺失、类型错误、降雨为负等
     */
    static WeatherObservation fromJson(const Json::Value& json) {
        if (!json.isObject()) {
            throw ValidationException("观测记录必须是 JSON 对象");
        }

        WeatherObservation obs;

        if (!json["timestamp"].isString()) {
            throw ValidationException("timestamp 缺失");
        }
        auto ts = TimestampHelper::parse(json["timestamp"].asString());
        if (!ts) {
            throw ValidationException("timestamp 格式错误: " + json["timestamp"].asString());
        }
        obs.timestamp = *ts;

        const auto& loc = json["location"];
        if (loc.isObject() && loc.isMember("coordinates") && loc["coordinates"].isArray()
            && loc["coordinates"].size() >= 2) {
            obs.location = {loc["coordinates"][0].asDouble(), loc["coordinates"][1].asDouble()};
        } else if (loc.isObject() && loc["lon"].isNumeric() && loc["lat"].isNumeric()) {
            obs.location = {loc["lon"].asDouble(), loc["lat"].asDouble()};
        } else {
            throw ValidationException("location 缺失或格式错误");
        }
        Geo::validatePoint(obs.location, "location");

        obs.rainfallMm = requireNumber(json, "rainfall_mm");
        obs.intensityMmHr = requireNumber(json, "intensity_mm_hr");
        if (obs.rainfallMm < 0 || obs.intensityMmHr < 0) {
            throw ValidationException("降雨量/雨强不能为负");
        }

        obs.temperatureC = optionalNumber(json, "temperature_c");
        obs.humidityPct = optionalNumber(json, "humidity_pct");
        obs.windSpeedMs = optionalNumber(json, "wind_speed_ms");
        if (obs.humidityPct && (*obs.humidityPct < 0 || *obs.humidityPct > 100)) {
            throw ValidationException("humidity_pct 超出 0-100 范围");
        }
        if (obs.windSpeedMs && *obs.windSpeedMs < 0) {
            throw ValidationException("wind_speed_ms 不能为负");
        }

        obs.source = json.get("source", "").asString();
        if (obs.source.empty()) {
            throw ValidationException("source 不能为空");
        }
        obs.locationId = json.get("location_id", "").asString();
        if (json.isMember("metadata")) obs.metadata = json["metadata"];
        return obs;
    }

private:
    static double requireNumber(const Json::Value& json, const char* field) {
        if (!json[field].isNumeric()) {
            throw ValidationException(std::string(field) + " 缺失或不是数值");
        }
        double v = json[field].asDouble();
        if (!std::isfinite(v)) {
            throw ValidationException(std::string(field) + " 不是有限数值");
        }
        return v;
    }

    static std::optional<double> optionalNumber(const Json::Value& json, const char* field) {
        if (!json.isMember(field) || json[field].isNull()) return std::nullopt;
        return requireNumber(json, field);
    }
};
