#pragma once

#include "WeatherObservation.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/utils/FieldHelper.hpp"
#include "common/utils/RetryPolicy.hpp"

/**
 * @brief 气象观测数据访问（weather_observations 追加写入）
 */
class ObservationRepository {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief 批量写入（多值 INSERT，单次 DB 往返）
     *
     * 整批失败时带退避重试；重试耗尽后逐条写入，只丢弃真正写不进去的记录。
     * @return 成功写入的条数
     */
    static Task<size_t> saveBatch(const std::vector<WeatherObservation>& items, int maxAttempts) {
        if (items.empty()) co_return 0;

        bool batchFailed = false;
        try {
            co_await RetryPolicy::run("observation batch insert", maxAttempts, [&items]() {
                return insertRows(items);
            });
        } catch (const drogon::orm::DrogonDbException& e) {
            LOG_ERROR << "[Ingest] Batch insert of " << items.size() << " observations failed: "
                      << e.base().what() << ", falling back to per-row insert";
            batchFailed = true;
        }
        if (!batchFailed) co_return items.size();

        // MSVC 不支持 catch 中 co_await，用标志位重构
        size_t saved = 0;
        for (const auto& obs : items) {
            try {
                co_await insertRows({obs});
                ++saved;
            } catch (const drogon::orm::DrogonDbException& e) {
                LOG_ERROR << "[Ingest] Observation #" << obs.id << " (" << obs.locationId << " @ "
                          << TimestampHelper::toIso(obs.timestamp) << ") not persisted: " << e.base().what();
            }
        }
        co_return saved;
    }

    /**
     * @brief 读取某时刻之后的观测（按时间升序，用于重建滚动窗口）
     */
    static Task<std::vector<WeatherObservation>> findSince(TimePoint since) {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(std::string(SELECT_COLUMNS) + R"(
            WHERE timestamp > ?::timestamptz
            ORDER BY timestamp ASC, id ASC
        )", {TimestampHelper::toIso(since)});

        std::vector<WeatherObservation> items;
        items.reserve(result.size());
        for (const auto& row : result) items.push_back(fromRow(row));
        co_return items;
    }

    /**
     * @brief 按监测点和时间范围查询（超出内存保留期的历史查询）
     */
    static Task<std::vector<WeatherObservation>> find(const std::string& locationId,
                                                      std::optional<TimePoint> from,
                                                      std::optional<TimePoint> to,
                                                      size_t limit) {
        std::string sql = std::string(SELECT_COLUMNS) + " WHERE location_id = ?";
        std::vector<std::string> params = {locationId};
        if (from) {
            sql += " AND timestamp >= ?::timestamptz";
            params.push_back(TimestampHelper::toIso(*from));
        }
        if (to) {
            sql += " AND timestamp <= ?::timestamptz";
            params.push_back(TimestampHelper::toIso(*to));
        }
        sql += " ORDER BY timestamp ASC LIMIT " + std::to_string(limit);

        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(sql, params);
        std::vector<WeatherObservation> items;
        items.reserve(result.size());
        for (const auto& row : result) items.push_back(fromRow(row));
        co_return items;
    }

    static Task<int64_t> maxId() {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro("SELECT COALESCE(MAX(id), 0) AS max_id FROM weather_observations");
        co_return result[0]["max_id"].as<int64_t>();
    }

private:
    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT id, location_id, timestamp, ST_X(location) AS lon, ST_Y(location) AS lat,
               rainfall_mm, intensity_mm_hr, temperature_c, humidity_pct, wind_speed_ms,
               source, metadata
        FROM weather_observations
    )";

    static Task<void> insertRows(const std::vector<WeatherObservation>& items) {
        DatabaseService dbService;

        std::ostringstream sql;
        sql << "INSERT INTO weather_observations (id, location_id, timestamp, location, rainfall_mm, "
               "intensity_mm_hr, temperature_c, humidity_pct, wind_speed_ms, source, metadata) VALUES ";

        std::vector<std::string> params;
        params.reserve(items.size() * 11);

        auto optional = [](const std::optional<double>& v) { return v ? std::to_string(*v) : std::string(); };

        for (size_t i = 0; i < items.size(); ++i) {
            const auto& obs = items[i];
            if (i > 0) sql << ", ";
            sql << "(?, ?, ?::timestamptz, ST_SetSRID(ST_MakePoint(?::float8, ?::float8), 4326), ?, ?, "
                   "NULLIF(?, '')::float8, NULLIF(?, '')::float8, NULLIF(?, '')::float8, ?, NULLIF(?, '')::jsonb)";

            params.push_back(std::to_string(obs.id));
            params.push_back(obs.locationId);
            params.push_back(TimestampHelper::toIso(obs.timestamp));
            params.push_back(Geo::formatCoord(obs.location.lon));
            params.push_back(Geo::formatCoord(obs.location.lat));
            params.push_back(std::to_string(obs.rainfallMm));
            params.push_back(std::to_string(obs.intensityMmHr));
            params.push_back(optional(obs.temperatureC));
            params.push_back(optional(obs.humidityPct));
            params.push_back(optional(obs.windSpeedMs));
            params.push_back(obs.source);
            params.push_back(JsonHelper::serializeNullable(obs.metadata));
        }
        sql << " ON CONFLICT DO NOTHING";

        co_await dbService.execSqlCoro(sql.str(), params);
        LOG_TRACE << "[ObservationRepository] Batch saved: " << items.size() << " records";
    }

    static WeatherObservation fromRow(const drogon::orm::Row& row) {
        WeatherObservation obs;
        obs.id = FieldHelper::getInt64(row["id"]);
        obs.locationId = FieldHelper::getString(row["location_id"]);
        obs.timestamp = FieldHelper::getTimestamp(row["timestamp"]);
        obs.location = {FieldHelper::getDouble(row["lon"]), FieldHelper::getDouble(row["lat"])};
        obs.rainfallMm = FieldHelper::getDouble(row["rainfall_mm"]);
        obs.intensityMmHr = FieldHelper::getDouble(row["intensity_mm_hr"]);
        obs.temperatureC = FieldHelper::getOptionalDouble(row["temperature_c"]);
        obs.humidityPct = FieldHelper::getOptionalDouble(row["humidity_pct"]);
        obs.windSpeedMs = FieldHelper::getOptionalDouble(row["wind_speed_ms"]);
        obs.source = FieldHelper::getString(row["source"]);
        obs.metadata = FieldHelper::getJson(row["metadata"]);
        return obs;
    }
};
