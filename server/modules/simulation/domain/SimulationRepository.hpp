#pragma once

#include "SimulationRun.hpp"
#include "modules/risk/domain/RiskZone.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/database/TransactionGuard.hpp"
#include "common/utils/FieldHelper.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/Pagination.hpp"

/**
 * @brief 模拟运行与风险区数据访问
 */
class SimulationRepository {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    /**
     * @brief 按 revision 写入运行记录
     */
    static Task<void> saveRun(const SimulationRun& run) {
        DatabaseService dbService;
        co_await dbService.execSqlCoro(UPSERT_RUN_SQL, runParams(run));
        LOG_TRACE << "[SimulationRepository] Saved run #" << run.id << " ("
                  << runStatusToString(run.status) << ", rev " << run.revision << ")";
    }

    /**
     * @brief 完成状态与风险区在同一事务内写入
     */
    static Task<void> saveCompletion(const SimulationRun& run, const RiskZone& zone) {
        DatabaseService dbService;
        auto guard = co_await TransactionGuard::create(dbService);

        co_await guard.execSqlCoro(UPSERT_RUN_SQL, runParams(run));
        co_await guard.execSqlCoro(R"(
            INSERT INTO risk_zones (id, simulation_run_id, location_id, timestamp, geometry, risk_level,
                risk_value, trigger_probability, runout_probability, flow_intensity, affected_area_m2, metadata)
            VALUES (?, ?, NULLIF(?, ''), ?::timestamptz, ST_GeomFromText(?, 4326), ?::risk_level_enum,
                ?, ?, ?, ?, ?, NULLIF(?, '')::jsonb)
            ON CONFLICT (simulation_run_id) DO NOTHING
        )", {
            std::to_string(zone.id),
            std::to_string(zone.simulationRunId),
            zone.locationId,
            TimestampHelper::toIso(zone.timestamp),
            Geo::toWkt(zone.geometry),
            riskLevelToString(zone.level),
            std::to_string(zone.riskValue),
            std::to_string(zone.triggerProbability),
            std::to_string(zone.runoutProbability),
            std::to_string(zone.flowIntensity),
            std::to_string(zone.affectedAreaM2),
            JsonHelper::serializeNullable(zone.metadata)
        });

        co_await guard.commit();
        LOG_DEBUG << "[SimulationRepository] Run #" << run.id << " completed with zone #" << zone.id;
    }

    /**
     * @brief 启动恢复用：未结束的运行、since 之后结束的运行，以及各监测点最新风险区所属的运行
     */
    static Task<std::vector<SimulationRun>> findRetainedRuns(std::chrono::system_clock::time_point since) {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(std::string(SELECT_RUN_COLUMNS) + R"(
            WHERE status IN ('pending', 'running')
               OR COALESCE(completed_at, timestamp) > ?::timestamptz
               OR id IN (SELECT DISTINCT ON (location_id) simulation_run_id FROM risk_zones
                         ORDER BY location_id, id DESC)
            ORDER BY id)", {TimestampHelper::toIso(since)});
        std::vector<SimulationRun> items;
        for (const auto& row : result) items.push_back(runFromRow(row));
        co_return items;
    }

    /**
     * @brief 运行列表（新的在前，可按状态过滤）
     * @return {当前页, 总数}
     */
    static Task<std::pair<std::vector<SimulationRun>, int>> findPage(const std::string& status,
                                                                     const Pagination& page) {
        QueryBuilder qb;
        qb.eq("status", status, "::run_status_enum");

        DatabaseService dbService;
        auto countResult = co_await dbService.execSqlCoro(
            "SELECT COUNT(*) AS count FROM simulation_runs" + qb.whereClause(), qb.params());
        int total = countResult[0]["count"].as<int>();

        auto result = co_await dbService.execSqlCoro(
            std::string(SELECT_RUN_COLUMNS) + qb.whereClause() + " ORDER BY id DESC" + page.limitClause(), qb.params());

        std::vector<SimulationRun> items;
        for (const auto& row : result) items.push_back(runFromRow(row));
        co_return std::make_pair(std::move(items), total);
    }

    /**
     * @brief 与 findRetainedRuns 对应的风险区
     */
    static Task<std::vector<RiskZone>> findRetainedZones(std::chrono::system_clock::time_point since) {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(R"(
            SELECT id, simulation_run_id, location_id, timestamp, ST_AsGeoJSON(geometry) AS geometry,
                   risk_level::text AS risk_level, risk_value, trigger_probability, runout_probability,
                   flow_intensity, affected_area_m2, metadata
            FROM risk_zones
            WHERE timestamp > ?::timestamptz
               OR id IN (SELECT DISTINCT ON (location_id) id FROM risk_zones ORDER BY location_id, id DESC)
            ORDER BY id
        )", {TimestampHelper::toIso(since)});

        std::vector<RiskZone> items;
        for (const auto& row : result) {
            RiskZone z;
            z.id = FieldHelper::getInt64(row["id"]);
            z.simulationRunId = FieldHelper::getInt64(row["simulation_run_id"]);
            z.locationId = FieldHelper::getString(row["location_id"]);
            z.timestamp = FieldHelper::getTimestamp(row["timestamp"]);
            z.geometry = Geo::polygonFromGeoJsonText(FieldHelper::getString(row["geometry"]));
            z.level = riskLevelFromString(FieldHelper::getString(row["risk_level"])).value_or(RiskLevel::Low);
            z.riskValue = FieldHelper::getDouble(row["risk_value"]);
            z.triggerProbability = FieldHelper::getDouble(row["trigger_probability"]);
            z.runoutProbability = FieldHelper::getDouble(row["runout_probability"]);
            z.flowIntensity = FieldHelper::getDouble(row["flow_intensity"]);
            z.affectedAreaM2 = FieldHelper::getDouble(row["affected_area_m2"]);
            z.metadata = FieldHelper::getJson(row["metadata"]);
            items.push_back(std::move(z));
        }
        co_return items;
    }

    /**
     * @return {最大运行 ID, 最大风险区 ID}
     */
    static Task<std::pair<int64_t, int64_t>> maxIds() {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(R"(
            SELECT (SELECT COALESCE(MAX(id), 0) FROM simulation_runs) AS max_run,
                   (SELECT COALESCE(MAX(id), 0) FROM risk_zones) AS max_zone
        )");
        co_return std::make_pair(result[0]["max_run"].as<int64_t>(), result[0]["max_zone"].as<int64_t>());
    }

private:
    static constexpr const char* UPSERT_RUN_SQL = R"(
        INSERT INTO simulation_runs (id, timestamp, terrain_snapshot_id, rainfall_event_id, location_id,
            trigger_type, trigger_data, model_name, model_version, parameters, status, external_run_id,
            output_path, runout_area_m2, max_runout_distance_m, affected_volume_m3, max_velocity_ms,
            computation_time_s, metrics, error_message, cancel_requested, started_at, completed_at, revision)
        VALUES (?, ?::timestamptz, ?, NULLIF(?, '')::bigint, NULLIF(?, ''),
            ?, ?::jsonb, ?, ?, ?::jsonb, ?::run_status_enum, NULLIF(?, ''),
            NULLIF(?, ''), NULLIF(?, '')::float8, NULLIF(?, '')::float8, NULLIF(?, '')::float8,
            NULLIF(?, '')::float8, NULLIF(?, '')::float8, ?::jsonb, NULLIF(?, ''), ?::boolean,
            NULLIF(?, '')::timestamptz, NULLIF(?, '')::timestamptz, ?)
        ON CONFLICT (id) DO UPDATE SET
            status = EXCLUDED.status,
            external_run_id = EXCLUDED.external_run_id,
            output_path = EXCLUDED.output_path,
            runout_area_m2 = EXCLUDED.runout_area_m2,
            max_runout_distance_m = EXCLUDED.max_runout_distance_m,
            affected_volume_m3 = EXCLUDED.affected_volume_m3,
            max_velocity_ms = EXCLUDED.max_velocity_ms,
            computation_time_s = EXCLUDED.computation_time_s,
            metrics = EXCLUDED.metrics,
            error_message = EXCLUDED.error_message,
            cancel_requested = EXCLUDED.cancel_requested,
            started_at = EXCLUDED.started_at,
            completed_at = EXCLUDED.completed_at,
            revision = EXCLUDED.revision
        WHERE simulation_runs.revision < EXCLUDED.revision
    )";

    static constexpr const char* SELECT_RUN_COLUMNS = R"(
        SELECT id, timestamp, terrain_snapshot_id, rainfall_event_id, location_id, trigger_data,
               model_name, model_version, parameters, status::text AS status, external_run_id,
               output_path, metrics, error_message, cancel_requested, started_at, completed_at, revision
        FROM simulation_runs
    )";

    static std::vector<std::string> runParams(const SimulationRun& run) {
        auto optional = [](const std::optional<double>& v) { return v ? std::to_string(*v) : std::string(); };
        auto time = [](const std::optional<SimulationRun::TimePoint>& t) {
            return t ? TimestampHelper::toIso(*t) : std::string();
        };
        return {
            std::to_string(run.id),
            TimestampHelper::toIso(run.timestamp),
            std::to_string(run.terrainSnapshotId),
            run.rainfallEventId ? std::to_string(*run.rainfallEventId) : "",
            run.locationId,
            triggerTypeName(run.trigger),
            JsonHelper::serialize(triggerToJson(run.trigger)),
            run.modelName,
            run.modelVersion,
            JsonHelper::serialize(run.parameters.isNull() ? Json::Value(Json::objectValue) : run.parameters),
            runStatusToString(run.status),
            run.externalRunId,
            run.outputPath.value_or(""),
            optional(run.metrics.runoutAreaM2),
            optional(run.metrics.maxRunoutDistanceM),
            optional(run.metrics.affectedVolumeM3),
            optional(run.metrics.maxVelocityMs),
            optional(run.metrics.computationTimeS),
            JsonHelper::serialize(run.metrics.toJson()),
            run.errorMessage.value_or(""),
            run.cancelRequested ? "true" : "false",
            time(run.startedAt),
            time(run.completedAt),
            std::to_string(run.revision)
        };
    }

    static SimulationRun runFromRow(const drogon::orm::Row& row) {
        SimulationRun run;
        run.id = FieldHelper::getInt64(row["id"]);
        run.timestamp = FieldHelper::getTimestamp(row["timestamp"]);
        run.terrainSnapshotId = FieldHelper::getInt64(row["terrain_snapshot_id"]);
        run.rainfallEventId = FieldHelper::getOptionalInt64(row["rainfall_event_id"]);
        run.locationId = FieldHelper::getString(row["location_id"]);
        run.trigger = triggerFromJson(FieldHelper::getJson(row["trigger_data"]));
        run.modelName = FieldHelper::getString(row["model_name"]);
        run.modelVersion = FieldHelper::getString(row["model_version"]);
        run.parameters = FieldHelper::getJson(row["parameters"]);
        run.status = runStatusFromString(FieldHelper::getString(row["status"])).value_or(RunStatus::Failed);
        run.externalRunId = FieldHelper::getString(row["external_run_id"]);
        run.outputPath = FieldHelper::getOptionalString(row["output_path"]);
        run.metrics = SimulationMetrics::fromJson(FieldHelper::getJson(row["metrics"]));
        run.errorMessage = FieldHelper::getOptionalString(row["error_message"]);
        run.cancelRequested = FieldHelper::getBool(row["cancel_requested"]);
        run.startedAt = FieldHelper::getOptionalTimestamp(row["started_at"]);
        run.completedAt = FieldHelper::getOptionalTimestamp(row["completed_at"]);
        run.revision = FieldHelper::getInt64(row["revision"]);
        return run;
    }
};
