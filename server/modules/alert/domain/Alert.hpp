#pragma once

#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 告警类型
 */
enum class AlertType {
    ThresholdExceeded,
    HighRisk,
    SimulationFailed,
    DegradedConfidence,
    TerrainChange
};

inline std::string alertTypeToString(AlertType type) {
    switch (type) {
        case AlertType::ThresholdExceeded:  return "threshold_exceeded";
        case AlertType::HighRisk:           return "high_risk";
        case AlertType::SimulationFailed:   return "simulation_failed";
        case AlertType::DegradedConfidence: return "degraded_confidence";
        case AlertType::TerrainChange:      return "terrain_change";
    }
    return "high_risk";
}

inline std::optional<AlertType> alertTypeFromString(const std::string& s) {
    if (s == "threshold_exceeded") return AlertType::ThresholdExceeded;
    if (s == "high_risk") return AlertType::HighRisk;
    if (s == "simulation_failed") return AlertType::SimulationFailed;
    if (s == "degraded_confidence") return AlertType::DegradedConfidence;
    if (s == "terrain_change") return AlertType::TerrainChange;
    return std::nullopt;
}

/**
 * @brief 告警级别（有序，刷新时只升不降）
 */
enum class AlertSeverity {
    Info = 0,
    Warning = 1,
    Critical = 2
};

inline std::string alertSeverityToString(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::Info:     return "info";
        case AlertSeverity::Warning:  return "warning";
        case AlertSeverity::Critical: return "critical";
    }
    return "info";
}

inline std::optional<AlertSeverity> alertSeverityFromString(const std::string& s) {
    if (s == "info") return AlertSeverity::Info;
    if (s == "warning") return AlertSeverity::Warning;
    if (s == "critical") return AlertSeverity::Critical;
    return std::nullopt;
}

/**
 * @brief 告警关联的实体（去重键的一部分）
 */
struct AlertSubject {
    std::optional<int64_t> simulationId;
    std::optional<int64_t> eventId;
    std::optional<int64_t> changeId;

    /** 去重用的实体键，例如 "sim:12" */
    std::string key() const {
        if (simulationId) return "sim:" + std::to_string(*simulationId);
        if (eventId) return "event:" + std::to_string(*eventId);
        if (changeId) return "change:" + std::to_string(*changeId);
        return "none";
    }
};

/**
 * @brief 操作员告警
 *
 * 只有确认操作会修改确认状态；已确认的告警不会被自动重新打开。
 */
struct Alert {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t id = 0;
    TimePoint timestamp;
    TimePoint updatedAt;
    AlertType type = AlertType::HighRisk;
    AlertSeverity severity = AlertSeverity::Info;
    std::string title;
    std::string message;
    AlertSubject subject;
    bool acknowledged = false;
    std::optional<TimePoint> acknowledgedAt;
    std::string acknowledgedBy;
    int occurrences = 1;
    Json::Value metadata;
    int64_t revision = 0;

    std::string dedupKey() const {
        return alertTypeToString(type) + "|" + subject.key();
    }

    Json::Value toJson() const {
        auto idOrNull = [](const std::optional<int64_t>& v) {
            return v ? Json::Value(static_cast<Json::Int64>(*v)) : Json::Value();
        };
        Json::Value json;
        json["id"] = static_cast<Json::Int64>(id);
        json["timestamp"] = TimestampHelper::toIso(timestamp);
        json["updated_at"] = TimestampHelper::toIso(updatedAt);
        json["alert_type"] = alertTypeToString(type);
        json["severity"] = alertSeverityToString(severity);
        json["title"] = title;
        json["message"] = message;
        json["related_simulation_id"] = idOrNull(subject.simulationId);
        json["related_event_id"] = idOrNull(subject.eventId);
        json["related_change_id"] = idOrNull(subject.changeId);
        json["is_acknowledged"] = acknowledged;
        json["acknowledged_at"] = acknowledgedAt ? Json::Value(TimestampHelper::toIso(*acknowledgedAt)) : Json::Value();
        json["acknowledged_by"] = acknowledgedBy.empty() ? Json::Value() : Json::Value(acknowledgedBy);
        json["occurrences"] = occurrences;
        json["metadata"] = metadata;
        return json;
    }
};
