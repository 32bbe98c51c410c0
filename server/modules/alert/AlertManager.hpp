#pragma once

#include "common/store/SpatialStore.hpp"

/**
 * @brief 告警派生参数
 */
struct AlertConfig {
    double terrainChangeAlertM3 = 500.0;
};

/**
 * @brief 告警管理器
 *
 * 无状态派生：由风险评估、模拟调度、事件关闭和变化检测的状态转换触发。
 * 去重由 SpatialStore::raiseOrRefresh 在同一临界区内完成，
 * 并发触发同一 (类型, 实体) 时只会产生一条未确认告警。
 *
 *   threshold_exceeded   事件关闭且超过触发阈值
 *   high_risk            风险等级升至 MODERATE 以上（事件评估或风险区）
 *   simulation_failed    模拟失败、超时或取消
 *   degraded_confidence  评估使用了默认易发性/物源
 *   terrain_change       净体积变化超过阈值
 */
class AlertManager {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    AlertManager(SpatialStore& store, AlertConfig config)
        : store_(store), config_(config) {}

    /**
     * @brief 事件关闭
     */
    std::optional<AlertUpsert> onEventClosed(const RainfallEvent& event, TimePoint now) {
        if (!event.thresholdExceeded) return std::nullopt;

        auto assessment = store_.assessmentForEvent(event.id);
        auto level = assessment ? assessment->level : RiskLevel::Moderate;

        Alert alert;
        alert.type = AlertType::ThresholdExceeded;
        alert.severity = severityFor(level);
        alert.subject.eventId = event.id;
        alert.title = "降雨超过触发阈值";
        alert.message = "监测点 " + event.locationId + " 降雨事件 #" + std::to_string(event.id)
            + " 已结束，累计 " + formatNumber(event.totalRainfallMm) + " mm，最大雨强 "
            + formatNumber(event.maxIntensityMmHr) + " mm/h";
        alert.metadata["location_id"] = event.locationId;
        alert.metadata["total_rainfall_mm"] = event.totalRainfallMm;
        alert.metadata["max_intensity_mm_hr"] = event.maxIntensityMmHr;
        alert.metadata["duration_minutes"] = event.durationMinutes;
        return raise(std::move(alert), now);
    }

    /**
     * @brief 风险评估完成
     *
     * 等级高于 MODERATE 且高于同一事件上一次评估时产生 high_risk；
     * 首次进入降级状态时产生 degraded_confidence。
     */
    std::vector<AlertUpsert> onRiskAssessed(const RiskAssessment& current,
                                            const std::optional<RiskAssessment>& previous,
                                            TimePoint now) {
        std::vector<AlertUpsert> result;

        bool rose = current.level > RiskLevel::Moderate && (!previous || current.level > previous->level);
        if (rose) {
            Alert alert;
            alert.type = AlertType::HighRisk;
            alert.severity = severityFor(current.level);
            alert.subject.eventId = current.eventId;
            alert.title = "风险等级升至 " + riskLevelToString(current.level);
            alert.message = "监测点 " + current.locationId + " 风险值 " + formatNumber(current.riskValue)
                + "（触发概率 " + formatNumber(current.triggerProbability) + "）";
            alert.metadata = current.toJson();
            result.push_back(raise(std::move(alert), now));
        }

        if (current.degraded && (!previous || !previous->degraded)) {
            Alert alert;
            alert.type = AlertType::DegradedConfidence;
            alert.severity = AlertSeverity::Info;
            alert.subject.eventId = current.eventId;
            alert.title = "风险评估置信度降低";
            alert.message = "监测点 " + current.locationId + ": " + current.degradedReason;
            alert.metadata["location_id"] = current.locationId;
            alert.metadata["reason"] = current.degradedReason;
            result.push_back(raise(std::move(alert), now));
        }
        return result;
    }

    /**
     * @brief 模拟完成并生成风险区
     */
    std::optional<AlertUpsert> onZoneCreated(const SimulationRun& run, const RiskZone& zone, TimePoint now) {
        if (zone.level <= RiskLevel::Moderate) return std::nullopt;

        Alert alert;
        alert.type = AlertType::HighRisk;
        alert.severity = severityFor(zone.level);
        alert.subject.simulationId = run.id;
        alert.title = "模拟风险区等级 " + riskLevelToString(zone.level);
        alert.message = "模拟 #" + std::to_string(run.id) + " 生成风险区 #" + std::to_string(zone.id)
            + "，影响面积 " + formatNumber(zone.affectedAreaM2) + " m²";
        alert.metadata["zone_id"] = static_cast<Json::Int64>(zone.id);
        alert.metadata["risk_value"] = zone.riskValue;
        alert.metadata["location_id"] = zone.locationId;
        return raise(std::move(alert), now);
    }

    AlertUpsert onRunFailed(const SimulationRun& run, TimePoint now) {
        Alert alert;
        alert.type = AlertType::SimulationFailed;
        alert.severity = AlertSeverity::Warning;
        alert.subject.simulationId = run.id;
        alert.title = "模拟运行失败";
        alert.message = "模拟 #" + std::to_string(run.id) + " (" + triggerTypeName(run.trigger) + ") 失败: "
            + run.errorMessage.value_or("unknown error");
        alert.metadata["error_message"] = run.errorMessage.value_or("");
        alert.metadata["trigger_type"] = triggerTypeName(run.trigger);
        if (run.rainfallEventId) alert.metadata["rainfall_event_id"] = static_cast<Json::Int64>(*run.rainfallEventId);
        return raise(std::move(alert), now);
    }

    std::optional<AlertUpsert> onChangeDetection(const ChangeDetection& change, TimePoint now) {
        if (std::abs(change.netChangeM3) < config_.terrainChangeAlertM3) return std::nullopt;

        Alert alert;
        alert.type = AlertType::TerrainChange;
        alert.severity = AlertSeverity::Warning;
        alert.subject.changeId = change.id;
        alert.title = "地形显著变化";
        alert.message = "快照 #" + std::to_string(change.baselineSnapshotId) + " → #"
            + std::to_string(change.comparisonSnapshotId) + " 净变化 " + formatNumber(change.netChangeM3) + " m³";
        alert.metadata["erosion_volume_m3"] = change.erosionVolumeM3;
        alert.metadata["deposition_volume_m3"] = change.depositionVolumeM3;
        alert.metadata["net_change_m3"] = change.netChangeM3;
        return raise(std::move(alert), now);
    }

    /**
     * @brief 操作员确认（单向，已确认的告警不会被重新打开）
     * @throws NotFoundException
     * @throws ConflictException 已确认
     */
    Alert acknowledge(int64_t alertId, const std::string& username, TimePoint now) {
        auto alert = store_.acknowledge(alertId, username, now);
        LOG_INFO << "[AlertManager] Alert #" << alertId << " acknowledged by " << username;
        return alert;
    }

    static AlertSeverity severityFor(RiskLevel level) {
        return level == RiskLevel::Critical ? AlertSeverity::Critical : AlertSeverity::Warning;
    }

private:
    SpatialStore& store_;
    AlertConfig config_;

    AlertUpsert raise(Alert alert, TimePoint now) {
        auto upsert = store_.raiseOrRefresh(std::move(alert), now);
        if (upsert.created) {
            LOG_INFO << "[AlertManager] Alert #" << upsert.alert.id << " raised: "
                     << alertTypeToString(upsert.alert.type) << " " << upsert.alert.subject.key()
                     << " (" << alertSeverityToString(upsert.alert.severity) << ")";
        } else {
            LOG_DEBUG << "[AlertManager] Alert #" << upsert.alert.id << " refreshed ("
                      << upsert.alert.occurrences << " occurrences"
                      << (upsert.escalated ? ", escalated" : "") << ")";
        }
        return upsert;
    }

    static std::string formatNumber(double v) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << v;
        return oss.str();
    }
};
