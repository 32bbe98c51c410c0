#pragma once

#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 降雨事件（一段连续的降雨过程）
 *
 * 活跃期间随合格观测累计；关闭后 endTime 与 durationMinutes 定稿，不再变更。
 */
struct RainfallEvent {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t id = 0;
    std::string locationId;
    TimePoint startTime;
    std::optional<TimePoint> endTime;
    TimePoint lastObservationAt;         // 最近一条合格观测的时间
    int durationMinutes = 0;
    double totalRainfallMm = 0.0;
    double maxIntensityMmHr = 0.0;
    double avgIntensityMmHr = 0.0;
    int observationCount = 0;
    bool thresholdExceeded = false;
    std::optional<double> triggerProbability;
    bool isActive = true;
    int64_t revision = 0;                // 每次变更递增，持久化时防止旧值覆盖新值

    /**
     * @brief 计入一条合格观测
     */
    void absorb(TimePoint t, double rainfallMm, double intensityMmHr) {
        totalRainfallMm += rainfallMm;
        maxIntensityMmHr = (std::max)(maxIntensityMmHr, intensityMmHr);
        avgIntensityMmHr = (avgIntensityMmHr * observationCount + intensityMmHr) / (observationCount + 1);
        ++observationCount;
        lastObservationAt = t;
        durationMinutes = minutesBetween(startTime, t);
    }

    /**
     * @brief 关闭事件，结束时间为最后一条合格观测的时间
     */
    void close() {
        endTime = lastObservationAt;
        durationMinutes = minutesBetween(startTime, lastObservationAt);
        isActive = false;
    }

    /** 当前持续时长（小时），活跃事件以最近合格观测为准 */
    double durationHours() const {
        auto end = endTime.value_or(lastObservationAt);
        return std::chrono::duration<double, std::ratio<3600>>(end - startTime).count();
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = static_cast<Json::Int64>(id);
        json["location_id"] = locationId;
        json["start_time"] = TimestampHelper::toIso(startTime);
        json["end_time"] = endTime ? Json::Value(TimestampHelper::toIso(*endTime)) : Json::Value();
        json["last_observation_at"] = TimestampHelper::toIso(lastObservationAt);
        json["duration_minutes"] = durationMinutes;
        json["total_rainfall_mm"] = totalRainfallMm;
        json["max_intensity_mm_hr"] = maxIntensityMmHr;
        json["avg_intensity_mm_hr"] = avgIntensityMmHr;
        json["observation_count"] = observationCount;
        json["threshold_exceeded"] = thresholdExceeded;
        json["trigger_probability"] = triggerProbability ? Json::Value(*triggerProbability) : Json::Value();
        json["is_active"] = isActive;
        return json;
    }

private:
    static int minutesBetween(TimePoint a, TimePoint b) {
        return static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(b - a).count());
    }
};
