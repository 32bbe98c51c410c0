#pragma once

#include "common/geo/Geometry.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 模拟运行状态
 *
 *   Pending →[submitted]→ Running →[completed]→ Completed
 *   Pending/Running →[failed|timeout|cancelled]→ Failed
 *
 * Completed / Failed 为终态，任何运行都不会重新进入 Running。
 */
enum class RunStatus {
    Pending,
    Running,
    Completed,
    Failed
};

inline std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::Pending:   return "pending";
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed:    return "failed";
    }
    return "pending";
}

inline std::optional<RunStatus> runStatusFromString(const std::string& s) {
    if (s == "pending") return RunStatus::Pending;
    if (s == "running") return RunStatus::Running;
    if (s == "completed") return RunStatus::Completed;
    if (s == "failed") return RunStatus::Failed;
    return std::nullopt;
}

// ==================== 触发方式（封闭变体） ====================

struct ManualTrigger {
    std::string requestedBy;
};

struct ThresholdTrigger {
    int64_t rainfallEventId = 0;
};

struct ScheduledTrigger {
    std::chrono::system_clock::time_point tickAt;
};

using SimulationTrigger = std::variant<ManualTrigger, ThresholdTrigger, ScheduledTrigger>;

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

inline std::string triggerTypeName(const SimulationTrigger& trigger) {
    return std::visit(Overloaded{
        [](const ManualTrigger&) { return std::string("manual"); },
        [](const ThresholdTrigger&) { return std::string("threshold_exceeded"); },
        [](const ScheduledTrigger&) { return std::string("scheduled"); },
    }, trigger);
}

inline Json::Value triggerToJson(const SimulationTrigger& trigger) {
    Json::Value json;
    json["type"] = triggerTypeName(trigger);
    std::visit(Overloaded{
        [&json](const ManualTrigger& t) { json["requested_by"] = t.requestedBy; },
        [&json](const ThresholdTrigger& t) {
            json["rainfall_event_id"] = static_cast<Json::Int64>(t.rainfallEventId);
        },
        [&json](const ScheduledTrigger& t) { json["tick_at"] = TimestampHelper::toIso(t.tickAt); },
    }, trigger);
    return json;
}

/**
 * @brief 从持久化字段还原触发方式
 */
inline SimulationTrigger triggerFromJson(const Json::Value& json) {
    auto type = json.get("type", "manual").asString();
    if (type == "threshold_exceeded") {
        return ThresholdTrigger{json.get("rainfall_event_id", 0).asInt64()};
    }
    if (type == "scheduled") {
        auto tick = TimestampHelper::parse(json.get("tick_at", "").asString());
        return ScheduledTrigger{tick.value_or(std::chrono::system_clock::time_point{})};
    }
    return ManualTrigger{json.get("requested_by", "").asString()};
}

// ==================== 输出指标 ====================

/**
 * @brief 执行器回报的模拟指标
 */
struct SimulationMetrics {
    std::optional<double> runoutAreaM2;
    std::optional<double> maxRunoutDistanceM;
    std::optional<double> affectedVolumeM3;
    std::optional<double> maxVelocityMs;
    std::optional<double> computationTimeS;
    std::optional<double> runoutProbability;
    std::optional<double> flowIntensity;
    std::optional<GeoPolygon> footprint;   // 堆积/影响范围

    Json::Value toJson() const {
        Json::Value json;
        auto put = [&json](const char* key, const std::optional<double>& v) {
            json[key] = v ? Json::Value(*v) : Json::Value();
        };
        put("runout_area_m2", runoutAreaM2);
        put("max_runout_distance_m", maxRunoutDistanceM);
        put("affected_volume_m3", affectedVolumeM3);
        put("max_velocity_ms", maxVelocityMs);
        put("computation_time_s", computationTimeS);
        put("runout_probability", runoutProbability);
        put("flow_intensity", flowIntensity);
        if (footprint) json["footprint"] = Geo::toGeoJson(*footprint);
        return json;
    }

    static SimulationMetrics fromJson(const Json::Value& json) {
        SimulationMetrics m;
        if (!json.isObject()) return m;
        auto get = [&json](const char* key) -> std::optional<double> {
            if (json.isMember(key) && json[key].isNumeric()) return json[key].asDouble();
            return std::nullopt;
        };
        m.runoutAreaM2 = get("runout_area_m2");
        m.maxRunoutDistanceM = get("max_runout_distance_m");
        m.affectedVolumeM3 = get("affected_volume_m3");
        m.maxVelocityMs = get("max_velocity_ms");
        m.computationTimeS = get("computation_time_s");
        m.runoutProbability = get("runout_probability");
        m.flowIntensity = get("flow_intensity");
        if (json.isMember("footprint") && json["footprint"].isObject()) {
            m.footprint = Geo::polygonFromGeoJson(json["footprint"], "footprint");
        }
        return m;
    }
};

// ==================== 模拟运行 ====================

/**
 * @brief 一次外部模型调用
 */
struct SimulationRun {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t id = 0;
    TimePoint timestamp;
    int64_t terrainSnapshotId = 0;
    std::optional<int64_t> rainfallEventId;
    std::string locationId;              // 来自降雨事件，可为空
    SimulationTrigger trigger = ManualTrigger{};
    std::string modelName;
    std::string modelVersion;
    Json::Value parameters;
    RunStatus status = RunStatus::Pending;
    std::string externalRunId;
    std::optional<std::string> outputPath;
    SimulationMetrics metrics;
    std::optional<std::string> errorMessage;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    bool cancelRequested = false;
    int64_t revision = 0;

    bool isOpen() const { return status == RunStatus::Pending || status == RunStatus::Running; }
    bool isTerminal() const { return !isOpen(); }

    static bool canTransition(RunStatus from, RunStatus to) {
        switch (from) {
            case RunStatus::Pending:
                return to == RunStatus::Running || to == RunStatus::Failed;
            case RunStatus::Running:
                return to == RunStatus::Completed || to == RunStatus::Failed;
            case RunStatus::Completed:
            case RunStatus::Failed:
                return false;
        }
        return false;
    }

    void markRunning(const std::string& externalId, TimePoint now) {
        transition(RunStatus::Running, "submitted");
        externalRunId = externalId;
        startedAt = now;
    }

    void complete(std::optional<std::string> output, SimulationMetrics result, TimePoint now) {
        transition(RunStatus::Completed, "completed");
        outputPath = std::move(output);
        metrics = std::move(result);
        completedAt = now;
    }

    void fail(const std::string& error, TimePoint now) {
        transition(RunStatus::Failed, "failed");
        errorMessage = error;
        completedAt = now;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = static_cast<Json::Int64>(id);
        json["timestamp"] = TimestampHelper::toIso(timestamp);
        json["terrain_snapshot_id"] = static_cast<Json::Int64>(terrainSnapshotId);
        json["rainfall_event_id"] = rainfallEventId
            ? Json::Value(static_cast<Json::Int64>(*rainfallEventId)) : Json::Value();
        json["location_id"] = locationId;
        json["trigger_type"] = triggerTypeName(trigger);
        json["trigger"] = triggerToJson(trigger);
        json["model_name"] = modelName;
        json["model_version"] = modelVersion;
        json["parameters"] = parameters;
        json["status"] = runStatusToString(status);
        json["external_run_id"] = externalRunId;
        json["output_path"] = outputPath ? Json::Value(*outputPath) : Json::Value();
        json["metrics"] = metrics.toJson();
        json["error_message"] = errorMessage ? Json::Value(*errorMessage) : Json::Value();
        json["started_at"] = startedAt ? Json::Value(TimestampHelper::toIso(*startedAt)) : Json::Value();
        json["completed_at"] = completedAt ? Json::Value(TimestampHelper::toIso(*completedAt)) : Json::Value();
        json["cancel_requested"] = cancelRequested;
        return json;
    }

private:
    void transition(RunStatus to, const char* event) {
        if (!canTransition(status, to)) {
            throw IllegalTransitionException("模拟 #" + std::to_string(id) + " 不能从 "
                + runStatusToString(status) + " 转换到 " + runStatusToString(to));
        }
        LOG_DEBUG << "SimulationFSM #" << id << ": " << runStatusToString(status)
                  << " →[" << event << "]→ " << runStatusToString(to);
        status = to;
    }
};
