#pragma once

#include "RainfallEvent.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/utils/FieldHelper.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/Pagination.hpp"

/**
 * @brief 降雨事件数据访问
 */
class RainfallEventRepository {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    /**
     * @brief 按 revision 写入：库中 revision 不低于传入值时不覆盖
     */
    static Task<void> save(const RainfallEvent& e) {
        DatabaseService dbService;
        co_await dbService.execSqlCoro(R"(
            INSERT INTO rainfall_events (id, location_id, start_time, end_time, last_observation_at,
                duration_minutes, total_rainfall_mm, max_intensity_mm_hr, avg_intensity_mm_hr,
                observation_count, threshold_exceeded, trigger_probability, is_active, revision, updated_at)
            VALUES (?, ?, ?::timestamptz, NULLIF(?, '')::timestamptz, ?::timestamptz,
                ?, ?, ?, ?, ?, ?::boolean, NULLIF(?, '')::float8, ?::boolean, ?, NOW())
            ON CONFLICT (id) DO UPDATE SET
                end_time = EXCLUDED.end_time,
                last_observation_at = EXCLUDED.last_observation_at,
                duration_minutes = EXCLUDED.duration_minutes,
                total_rainfall_mm = EXCLUDED.total_rainfall_mm,
                max_intensity_mm_hr = EXCLUDED.max_intensity_mm_hr,
                avg_intensity_mm_hr = EXCLUDED.avg_intensity_mm_hr,
                observation_count = EXCLUDED.observation_count,
                threshold_exceeded = EXCLUDED.threshold_exceeded,
                trigger_probability = EXCLUDED.trigger_probability,
                is_active = EXCLUDED.is_active,
                revision = EXCLUDED.revision,
                updated_at = NOW()
            WHERE rainfall_events.revision < EXCLUDED.revision
        )", {
            std::to_string(e.id),
            e.locationId,
            TimestampHelper::toIso(e.startTime),
            e.endTime ? TimestampHelper::toIso(*e.endTime) : "",
            TimestampHelper::toIso(e.lastObservationAt),
            std::to_string(e.durationMinutes),
            std::to_string(e.totalRainfallMm),
            std::to_string(e.maxIntensityMmHr),
            std::to_string(e.avgIntensityMmHr),
            std::to_string(e.observationCount),
            e.thresholdExceeded ? "true" : "false",
            e.triggerProbability ? std::to_string(*e.triggerProbability) : "",
            e.isActive ? "true" : "false",
            std::to_string(e.revision)
        });
        LOG_TRACE << "[RainfallEventRepository] Saved event #" << e.id << " rev " << e.revision;
    }

    /**
     * @brief 活跃事件，以及某时刻之后仍有观测的已关闭事件（启动恢复用）
     */
    static Task<std::vector<RainfallEvent>> findActiveOrSince(std::chrono::system_clock::time_point since) {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(std::string(SELECT_COLUMNS)
            + " WHERE is_active OR last_observation_at > ?::timestamptz ORDER BY id",
            {TimestampHelper::toIso(since)});
        std::vector<RainfallEvent> items;
        for (const auto& row : result) items.push_back(fromRow(row));
        co_return items;
    }

    /**
     * @brief 事件历史（新的在前）
     * @return {当前页, 总数}
     */
    static Task<std::pair<std::vector<RainfallEvent>, int>> findPage(const std::string& locationId,
                                                                     const Pagination& page) {
        QueryBuilder qb;
        qb.eq("location_id", locationId);

        DatabaseService dbService;
        auto countResult = co_await dbService.execSqlCoro(
            "SELECT COUNT(*) AS count FROM rainfall_events" + qb.whereClause(), qb.params());
        int total = countResult[0]["count"].as<int>();

        auto result = co_await dbService.execSqlCoro(
            std::string(SELECT_COLUMNS) + qb.whereClause() + " ORDER BY start_time DESC, id DESC" + page.limitClause(),
            qb.params());

        std::vector<RainfallEvent> items;
        for (const auto& row : result) items.push_back(fromRow(row));
        co_return std::make_pair(std::move(items), total);
    }

    static Task<int64_t> maxId() {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro("SELECT COALESCE(MAX(id), 0) AS max_id FROM rainfall_events");
        co_return result[0]["max_id"].as<int64_t>();
    }

private:
    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT id, location_id, start_time, end_time, last_observation_at, duration_minutes,
               total_rainfall_mm, max_intensity_mm_hr, avg_intensity_mm_hr, observation_count,
               threshold_exceeded, trigger_probability, is_active, revision
        FROM rainfall_events
    )";

    static RainfallEvent fromRow(const drogon::orm::Row& row) {
        RainfallEvent e;
        e.id = FieldHelper::getInt64(row["id"]);
        e.locationId = FieldHelper::getString(row["location_id"]);
        e.startTime = FieldHelper::getTimestamp(row["start_time"]);
        e.endTime = FieldHelper::getOptionalTimestamp(row["end_time"]);
        e.lastObservationAt = FieldHelper::getTimestamp(row["last_observation_at"]);
        e.durationMinutes = FieldHelper::getInt(row["duration_minutes"]);
        e.totalRainfallMm = FieldHelper::getDouble(row["total_rainfall_mm"]);
        e.maxIntensityMmHr = FieldHelper::getDouble(row["max_intensity_mm_hr"]);
        e.avgIntensityMmHr = FieldHelper::getDouble(row["avg_intensity_mm_hr"]);
        e.observationCount = FieldHelper::getInt(row["observation_count"]);
        e.thresholdExceeded = FieldHelper::getBool(row["threshold_exceeded"]);
        e.triggerProbability = FieldHelper::getOptionalDouble(row["trigger_probability"]);
        e.isActive = FieldHelper::getBool(row["is_active"]);
        e.revision = FieldHelper::getInt64(row["revision"]);
        return e;
    }
};
