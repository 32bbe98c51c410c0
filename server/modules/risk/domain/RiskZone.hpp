#pragma once

#include "RiskLevel.hpp"
#include "common/geo/Geometry.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 一次风险评估结果（针对某个降雨事件）
 */
struct RiskAssessment {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t eventId = 0;
    std::string locationId;
    std::optional<int64_t> sourceAreaId;   // 决定最终风险的易发区
    double thresholdIntensityMmHr = 0.0;   // I-D 阈值雨强
    double exceedance = 0.0;               // 雨强/阈值（含前期降雨修正）
    double antecedentMm = 0.0;             // 7 天前期降雨（不含本事件）
    double antecedent14dMm = 0.0;
    double effectiveAntecedentMm = 0.0;    // 逐日衰减加权的前期降雨
    double triggerProbability = 0.0;
    double saturation = 0.0;
    double criticalSlopeDeg = 0.0;         // 随饱和度降低的临界坡度
    int gatedSourceAreas = 0;              // 坡度低于临界坡度的易发区数
    double susceptibility = 0.0;
    double materialAvailability = 0.0;
    double riskValue = 0.0;
    RiskLevel level = RiskLevel::Low;
    bool thresholdExceeded = false;
    bool simulationRecommended = false;
    bool degraded = false;                 // 使用了默认易发性/物源
    std::string degradedReason;
    std::string triggerReason;
    TimePoint assessedAt;

    Json::Value toJson() const {
        Json::Value json;
        json["event_id"] = static_cast<Json::Int64>(eventId);
        json["location_id"] = locationId;
        json["source_area_id"] = sourceAreaId ? Json::Value(static_cast<Json::Int64>(*sourceAreaId)) : Json::Value();
        json["threshold_intensity_mm_hr"] = thresholdIntensityMmHr;
        json["exceedance"] = exceedance;
        json["antecedent_mm"] = antecedentMm;
        json["antecedent_14d_mm"] = antecedent14dMm;
        json["effective_antecedent_mm"] = effectiveAntecedentMm;
        json["trigger_probability"] = triggerProbability;
        json["saturation"] = saturation;
        json["critical_slope_deg"] = criticalSlopeDeg;
        json["gated_source_areas"] = gatedSourceAreas;
        json["susceptibility"] = susceptibility;
        json["material_availability"] = materialAvailability;
        json["risk_value"] = riskValue;
        json["risk_level"] = riskLevelToString(level);
        json["threshold_exceeded"] = thresholdExceeded;
        json["simulation_recommended"] = simulationRecommended;
        json["trigger_reason"] = triggerReason;
        json["degraded"] = degraded;
        if (degraded) json["degraded_reason"] = degradedReason;
        json["assessed_at"] = TimestampHelper::toIso(assessedAt);
        return json;
    }
};

/**
 * @brief 风险区（由已完成的模拟生成，不可变）
 */
struct RiskZone {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t id = 0;
    int64_t simulationRunId = 0;
    std::string locationId;
    TimePoint timestamp;
    GeoPolygon geometry;
    RiskLevel level = RiskLevel::Low;
    double riskValue = 0.0;
    double triggerProbability = 0.0;
    double runoutProbability = 0.0;
    double flowIntensity = 0.0;
    double affectedAreaM2 = 0.0;
    Json::Value metadata;

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = static_cast<Json::Int64>(id);
        json["simulation_run_id"] = static_cast<Json::Int64>(simulationRunId);
        json["location_id"] = locationId;
        json["timestamp"] = TimestampHelper::toIso(timestamp);
        json["geometry"] = Geo::toGeoJson(geometry);
        json["risk_level"] = riskLevelToString(level);
        json["risk_value"] = riskValue;
        json["trigger_probability"] = triggerProbability;
        json["runout_probability"] = runoutProbability;
        json["flow_intensity"] = flowIntensity;
        json["affected_area_m2"] = affectedAreaM2;
        if (!metadata.isNull()) json["metadata"] = metadata;
        return json;
    }
};
