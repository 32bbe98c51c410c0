#pragma once

#include "DatabaseService.hpp"

/**
 * @brief 数据库结构初始化
 *
 * 所有空间列使用 WGS84（SRID 4326），需要投影坐标的消费者在查询时再转换。
 * 实体 ID 由应用分配（BIGINT），可变实体带 revision 列，
 * 写入时只接受更新的 revision，乱序到达的旧状态不会覆盖新状态。
 */
class DatabaseInitializer {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    template<typename T = void> using Task = drogon::Task<T>;

    static Task<> initialize() {
        auto db = DatabaseService::client();

        LOG_INFO << "Checking database initialization...";

        // 抑制 IF NOT EXISTS 产生的 NOTICE（"relation already exists, skipping"）
        co_await db->execSqlCoro("SET client_min_messages = WARNING");

        // 数据库级别固定 UTC 时区（所有连接生效，无需每个连接 SET timezone）
        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                EXECUTE format('ALTER DATABASE %I SET timezone = ''UTC''', current_database());
            END $$
        )");

        // PostGIS 是必需的，缺失时启动失败
        co_await db->execSqlCoro("CREATE EXTENSION IF NOT EXISTS postgis");

        co_await createEnumTypes(db);
        co_await createTables(db);
        co_await initializeTimescaleDB(db);

        LOG_INFO << "Database initialization completed";
    }

private:
    static Task<> createEnumTypes(const DbClientPtr& db) {
        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                CREATE TYPE run_status_enum AS ENUM ('pending', 'running', 'completed', 'failed');
            EXCEPTION
                WHEN duplicate_object THEN null;
            END $$
        )");

        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                CREATE TYPE risk_level_enum AS ENUM ('low', 'moderate', 'high', 'critical');
            EXCEPTION
                WHEN duplicate_object THEN null;
            END $$
        )");

        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                CREATE TYPE alert_severity_enum AS ENUM ('info', 'warning', 'critical');
            EXCEPTION
                WHEN duplicate_object THEN null;
            END $$
        )");

        LOG_INFO << "Enum types created/verified";
    }

    static Task<> createTables(const DbClientPtr& db) {
        // 地形快照（栅格文件只保存路径引用，不可变）
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS terrain_snapshots (
                id BIGINT PRIMARY KEY,
                timestamp TIMESTAMPTZ NOT NULL,
                version_name TEXT NOT NULL,
                dem_path TEXT NOT NULL,
                dtm_path TEXT,
                ortho_path TEXT,
                resolution_m DOUBLE PRECISION NOT NULL CHECK (resolution_m > 0),
                epsg_code INT NOT NULL DEFAULT 4326,
                extent geometry(Polygon, 4326) NOT NULL,
                source TEXT NOT NULL,
                metadata JSONB NOT NULL DEFAULT '{}',
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_terrain_snapshots_time ON terrain_snapshots (timestamp DESC))");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_terrain_snapshots_extent ON terrain_snapshots USING GIST (extent))");

        // 气象观测（追加写入，TimescaleDB 超表要求主键包含分区列 timestamp）
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS weather_observations (
                id BIGINT NOT NULL,
                location_id TEXT NOT NULL,
                timestamp TIMESTAMPTZ NOT NULL,
                location geometry(Point, 4326) NOT NULL,
                rainfall_mm DOUBLE PRECISION NOT NULL CHECK (rainfall_mm >= 0),
                intensity_mm_hr DOUBLE PRECISION NOT NULL CHECK (intensity_mm_hr >= 0),
                temperature_c DOUBLE PRECISION,
                humidity_pct DOUBLE PRECISION,
                wind_speed_ms DOUBLE PRECISION,
                source TEXT NOT NULL,
                metadata JSONB,
                PRIMARY KEY (id, timestamp)
            )
        )");
        co_await db->execSqlCoro(R"(CREATE UNIQUE INDEX IF NOT EXISTS idx_weather_observations_location_time ON weather_observations (location_id, timestamp))");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_weather_observations_geom ON weather_observations USING GIST (location))");

        // 降雨事件
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS rainfall_events (
                id BIGINT PRIMARY KEY,
                location_id TEXT NOT NULL,
                start_time TIMESTAMPTZ NOT NULL,
                end_time TIMESTAMPTZ,
                last_observation_at TIMESTAMPTZ NOT NULL,
                duration_minutes INT NOT NULL DEFAULT 0,
                total_rainfall_mm DOUBLE PRECISION NOT NULL DEFAULT 0,
                max_intensity_mm_hr DOUBLE PRECISION NOT NULL DEFAULT 0,
                avg_intensity_mm_hr DOUBLE PRECISION NOT NULL DEFAULT 0,
                observation_count INT NOT NULL DEFAULT 0,
                threshold_exceeded BOOLEAN NOT NULL DEFAULT FALSE,
                trigger_probability DOUBLE PRECISION CHECK (trigger_probability BETWEEN 0 AND 1),
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                revision BIGINT NOT NULL DEFAULT 0,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_rainfall_events_location ON rainfall_events (location_id, start_time DESC))");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_rainfall_events_active ON rainfall_events (location_id) WHERE is_active)");

        // 变化检测（每个快照对一条）
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS change_detections (
                id BIGINT PRIMARY KEY,
                timestamp TIMESTAMPTZ NOT NULL,
                baseline_snapshot_id BIGINT NOT NULL REFERENCES terrain_snapshots (id),
                comparison_snapshot_id BIGINT NOT NULL REFERENCES terrain_snapshots (id),
                dod_raster_path TEXT NOT NULL,
                erosion_volume_m3 DOUBLE PRECISION NOT NULL DEFAULT 0,
                deposition_volume_m3 DOUBLE PRECISION NOT NULL DEFAULT 0,
                net_change_m3 DOUBLE PRECISION NOT NULL DEFAULT 0,
                change_area_m2 DOUBLE PRECISION NOT NULL DEFAULT 0,
                lod_threshold_m DOUBLE PRECISION NOT NULL,
                footprint geometry(Polygon, 4326),
                metadata JSONB,
                UNIQUE (baseline_snapshot_id, comparison_snapshot_id)
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_change_detections_footprint ON change_detections USING GIST (footprint))");

        // 易发区
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS source_areas (
                id BIGINT PRIMARY KEY,
                timestamp TIMESTAMPTZ NOT NULL,
                terrain_snapshot_id BIGINT REFERENCES terrain_snapshots (id),
                geometry geometry(Polygon, 4326) NOT NULL,
                susceptibility DOUBLE PRECISION CHECK (susceptibility BETWEEN 0 AND 1),
                slope_deg DOUBLE PRECISION,
                contributing_area_m2 DOUBLE PRECISION,
                base_material_availability DOUBLE PRECISION CHECK (base_material_availability BETWEEN 0 AND 1),
                material_availability DOUBLE PRECISION CHECK (material_availability BETWEEN 0 AND 1),
                metadata JSONB,
                revision BIGINT NOT NULL DEFAULT 0,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_source_areas_geom ON source_areas USING GIST (geometry))");

        // 变化检测对易发区的物源贡献（衰减在读取时计算）
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS material_contributions (
                source_area_id BIGINT NOT NULL REFERENCES source_areas (id) ON DELETE CASCADE,
                change_detection_id BIGINT NOT NULL REFERENCES change_detections (id),
                magnitude DOUBLE PRECISION NOT NULL,
                observed_at TIMESTAMPTZ NOT NULL,
                PRIMARY KEY (source_area_id, change_detection_id)
            )
        )");

        // 模拟运行
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS simulation_runs (
                id BIGINT PRIMARY KEY,
                timestamp TIMESTAMPTZ NOT NULL,
                terrain_snapshot_id BIGINT NOT NULL REFERENCES terrain_snapshots (id),
                rainfall_event_id BIGINT REFERENCES rainfall_events (id),
                location_id TEXT,
                trigger_type TEXT NOT NULL,
                trigger_data JSONB NOT NULL DEFAULT '{}',
                model_name TEXT NOT NULL,
                model_version TEXT NOT NULL,
                parameters JSONB NOT NULL DEFAULT '{}',
                status run_status_enum NOT NULL DEFAULT 'pending',
                external_run_id TEXT,
                output_path TEXT,
                runout_area_m2 DOUBLE PRECISION,
                max_runout_distance_m DOUBLE PRECISION,
                affected_volume_m3 DOUBLE PRECISION,
                max_velocity_ms DOUBLE PRECISION,
                computation_time_s DOUBLE PRECISION,
                metrics JSONB,
                error_message TEXT,
                cancel_requested BOOLEAN NOT NULL DEFAULT FALSE,
                started_at TIMESTAMPTZ,
                completed_at TIMESTAMPTZ,
                revision BIGINT NOT NULL DEFAULT 0
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_simulation_runs_status ON simulation_runs (status) WHERE status IN ('pending', 'running'))");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_simulation_runs_event ON simulation_runs (rainfall_event_id))");

        // 风险区（每个已完成模拟一个）
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS risk_zones (
                id BIGINT PRIMARY KEY,
                simulation_run_id BIGINT NOT NULL UNIQUE REFERENCES simulation_runs (id),
                location_id TEXT,
                timestamp TIMESTAMPTZ NOT NULL,
                geometry geometry(Polygon, 4326) NOT NULL,
                risk_level risk_level_enum NOT NULL,
                risk_value DOUBLE PRECISION NOT NULL CHECK (risk_value BETWEEN 0 AND 1),
                trigger_probability DOUBLE PRECISION,
                runout_probability DOUBLE PRECISION,
                flow_intensity DOUBLE PRECISION,
                affected_area_m2 DOUBLE PRECISION,
                metadata JSONB
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_risk_zones_geom ON risk_zones USING GIST (geometry))");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_risk_zones_location ON risk_zones (location_id, timestamp DESC))");

        // 告警
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS alerts (
                id BIGINT PRIMARY KEY,
                timestamp TIMESTAMPTZ NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL,
                alert_type TEXT NOT NULL,
                severity alert_severity_enum NOT NULL,
                title TEXT NOT NULL,
                message TEXT NOT NULL,
                related_simulation_id BIGINT,
                related_event_id BIGINT,
                related_change_id BIGINT,
                is_acknowledged BOOLEAN NOT NULL DEFAULT FALSE,
                acknowledged_at TIMESTAMPTZ,
                acknowledged_by TEXT,
                occurrences INT NOT NULL DEFAULT 1,
                metadata JSONB,
                revision BIGINT NOT NULL DEFAULT 0
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_alerts_unack ON alerts (timestamp DESC) WHERE NOT is_acknowledged)");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_alerts_time ON alerts (timestamp DESC))");

        LOG_INFO << "Tables created/verified";
    }

    static Task<> initializeTimescaleDB(const DbClientPtr& db) {
        // 检查 TimescaleDB 扩展是否可用
        try {
            auto extResult = co_await db->execSqlCoro(R"(
                SELECT EXISTS (
                    SELECT 1 FROM pg_extension WHERE extname = 'timescaledb'
                ) as installed
            )");

            bool isInstalled = extResult[0]["installed"].as<bool>();

            if (!isInstalled) {
                // 尝试创建扩展
                try {
                    co_await db->execSqlCoro("CREATE EXTENSION IF NOT EXISTS timescaledb CASCADE");
                    LOG_INFO << "TimescaleDB extension created";
                } catch (const std::exception&) {
                    LOG_WARN << "TimescaleDB extension not available, using standard PostgreSQL table";
                    co_return;
                }
            }

            auto hyperResult = co_await db->execSqlCoro(R"(
                SELECT EXISTS (
                    SELECT 1 FROM timescaledb_information.hypertables
                    WHERE hypertable_name = 'weather_observations'
                ) as is_hypertable
            )");

            bool isHypertable = hyperResult[0]["is_hypertable"].as<bool>();

            if (!isHypertable) {
                // 每周一个分区
                co_await db->execSqlCoro(R"(
                    SELECT create_hypertable(
                        'weather_observations',
                        'timestamp',
                        chunk_time_interval => INTERVAL '7 days',
                        if_not_exists => TRUE,
                        migrate_data => TRUE
                    )
                )");
                LOG_INFO << "weather_observations converted to TimescaleDB hypertable";

                // 按监测点分段压缩，超出 7 天滚动窗口的数据不再参与计算
                co_await db->execSqlCoro(R"(
                    ALTER TABLE weather_observations SET (
                        timescaledb.compress,
                        timescaledb.compress_segmentby = 'location_id',
                        timescaledb.compress_orderby = 'timestamp DESC, id DESC'
                    )
                )");

                co_await db->execSqlCoro(R"(
                    SELECT add_compression_policy('weather_observations', INTERVAL '14 days', if_not_exists => TRUE)
                )");
                LOG_INFO << "TimescaleDB compression policy configured";
            } else {
                LOG_INFO << "weather_observations is already a TimescaleDB hypertable";
            }
        } catch (const std::exception& e) {
            LOG_WARN << "TimescaleDB initialization skipped: " << e.what();
        }
    }
};
