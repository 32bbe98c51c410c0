#pragma once

#include "TerrainSnapshot.hpp"
#include "ChangeDetection.hpp"
#include "SourceArea.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/database/TransactionGuard.hpp"
#include "common/utils/FieldHelper.hpp"

/**
 * @brief 地形数据访问（快照、变化检测、易发区及其物源贡献）
 */
class TerrainRepository {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    // ==================== 快照 ====================

    static Task<void> saveSnapshot(const TerrainSnapshot& s) {
        DatabaseService dbService;
        co_await dbService.execSqlCoro(R"(
            INSERT INTO terrain_snapshots (id, timestamp, version_name, dem_path, dtm_path, ortho_path,
                resolution_m, epsg_code, extent, source, metadata)
            VALUES (?, ?::timestamptz, ?, ?, NULLIF(?, ''), NULLIF(?, ''), ?, ?,
                ST_GeomFromText(?, 4326), ?, ?::jsonb)
            ON CONFLICT (id) DO NOTHING
        )", {
            std::to_string(s.id),
            TimestampHelper::toIso(s.timestamp),
            s.versionName,
            s.demPath,
            s.dtmPath.value_or(""),
            s.orthoPath.value_or(""),
            std::to_string(s.resolutionM),
            std::to_string(s.epsgCode),
            Geo::toWkt(s.extent),
            s.source,
            JsonHelper::serialize(s.metadata.isNull() ? Json::Value(Json::objectValue) : s.metadata)
        });
    }

    static Task<std::vector<TerrainSnapshot>> findSnapshots() {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(R"(
            SELECT id, timestamp, version_name, dem_path, dtm_path, ortho_path, resolution_m,
                   epsg_code, ST_AsGeoJSON(extent) AS extent, source, metadata
            FROM terrain_snapshots ORDER BY id
        )");

        std::vector<TerrainSnapshot> items;
        for (const auto& row : result) {
            TerrainSnapshot s;
            s.id = FieldHelper::getInt64(row["id"]);
            s.timestamp = FieldHelper::getTimestamp(row["timestamp"]);
            s.versionName = FieldHelper::getString(row["version_name"]);
            s.demPath = FieldHelper::getString(row["dem_path"]);
            s.dtmPath = FieldHelper::getOptionalString(row["dtm_path"]);
            s.orthoPath = FieldHelper::getOptionalString(row["ortho_path"]);
            s.resolutionM = FieldHelper::getDouble(row["resolution_m"]);
            s.epsgCode = FieldHelper::getInt(row["epsg_code"], 4326);
            s.extent = Geo::polygonFromGeoJsonText(FieldHelper::getString(row["extent"]));
            s.source = FieldHelper::getString(row["source"]);
            s.metadata = FieldHelper::getJson(row["metadata"]);
            items.push_back(std::move(s));
        }
        co_return items;
    }

    // ==================== 变化检测 ====================

    static Task<void> saveChangeDetection(const ChangeDetection& cd) {
        DatabaseService dbService;
        co_await dbService.execSqlCoro(R"(
            INSERT INTO change_detections (id, timestamp, baseline_snapshot_id, comparison_snapshot_id,
                dod_raster_path, erosion_volume_m3, deposition_volume_m3, net_change_m3, change_area_m2,
                lod_threshold_m, footprint, metadata)
            VALUES (?, ?::timestamptz, ?, ?, ?, ?, ?, ?, ?, ?,
                CASE WHEN ? = '' THEN NULL ELSE ST_GeomFromText(?, 4326) END, NULLIF(?, '')::jsonb)
            ON CONFLICT (id) DO NOTHING
        )", {
            std::to_string(cd.id),
            TimestampHelper::toIso(cd.timestamp),
            std::to_string(cd.baselineSnapshotId),
            std::to_string(cd.comparisonSnapshotId),
            cd.dodRasterPath,
            std::to_string(cd.erosionVolumeM3),
            std::to_string(cd.depositionVolumeM3),
            std::to_string(cd.netChangeM3),
            std::to_string(cd.changeAreaM2),
            std::to_string(cd.lodThresholdM),
            cd.footprint ? Geo::toWkt(*cd.footprint) : "",
            cd.footprint ? Geo::toWkt(*cd.footprint) : "",
            JsonHelper::serializeNullable(cd.metadata)
        });
    }

    static Task<std::vector<ChangeDetection>> findChangeDetections() {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(R"(
            SELECT id, timestamp, baseline_snapshot_id, comparison_snapshot_id, dod_raster_path,
                   erosion_volume_m3, deposition_volume_m3, net_change_m3, change_area_m2,
                   lod_threshold_m, ST_AsGeoJSON(footprint) AS footprint, metadata
            FROM change_detections ORDER BY id
        )");

        std::vector<ChangeDetection> items;
        for (const auto& row : result) {
            ChangeDetection cd;
            cd.id = FieldHelper::getInt64(row["id"]);
            cd.timestamp = FieldHelper::getTimestamp(row["timestamp"]);
            cd.baselineSnapshotId = FieldHelper::getInt64(row["baseline_snapshot_id"]);
            cd.comparisonSnapshotId = FieldHelper::getInt64(row["comparison_snapshot_id"]);
            cd.dodRasterPath = FieldHelper::getString(row["dod_raster_path"]);
            cd.erosionVolumeM3 = FieldHelper::getDouble(row["erosion_volume_m3"]);
            cd.depositionVolumeM3 = FieldHelper::getDouble(row["deposition_volume_m3"]);
            cd.netChangeM3 = FieldHelper::getDouble(row["net_change_m3"]);
            cd.changeAreaM2 = FieldHelper::getDouble(row["change_area_m2"]);
            cd.lodThresholdM = FieldHelper::getDouble(row["lod_threshold_m"]);
            if (!row["footprint"].isNull()) {
                cd.footprint = Geo::polygonFromGeoJsonText(row["footprint"].as<std::string>());
            }
            cd.metadata = FieldHelper::getJson(row["metadata"]);
            items.push_back(std::move(cd));
        }
        co_return items;
    }

    // ==================== 易发区 ====================

    /**
     * @brief 按 revision 写入易发区，并补写新增的物源贡献（同一事务）
     */
    static Task<void> saveSourceArea(const SourceArea& a) {
        DatabaseService dbService;
        auto guard = co_await TransactionGuard::create(dbService);

        auto optional = [](const std::optional<double>& v) { return v ? std::to_string(*v) : std::string(); };

        co_await guard.execSqlCoro(R"(
            INSERT INTO source_areas (id, timestamp, terrain_snapshot_id, geometry, susceptibility, slope_deg,
                contributing_area_m2, base_material_availability, material_availability, metadata,
                revision, updated_at)
            VALUES (?, ?::timestamptz, NULLIF(?, '')::bigint, ST_GeomFromText(?, 4326),
                NULLIF(?, '')::float8, NULLIF(?, '')::float8, NULLIF(?, '')::float8,
                NULLIF(?, '')::float8, NULLIF(?, '')::float8, NULLIF(?, '')::jsonb, ?, ?::timestamptz)
            ON CONFLICT (id) DO UPDATE SET
                terrain_snapshot_id = EXCLUDED.terrain_snapshot_id,
                geometry = EXCLUDED.geometry,
                susceptibility = EXCLUDED.susceptibility,
                slope_deg = EXCLUDED.slope_deg,
                contributing_area_m2 = EXCLUDED.contributing_area_m2,
                base_material_availability = EXCLUDED.base_material_availability,
                material_availability = EXCLUDED.material_availability,
                metadata = EXCLUDED.metadata,
                revision = EXCLUDED.revision,
                updated_at = EXCLUDED.updated_at
            WHERE source_areas.revision < EXCLUDED.revision
        )", {
            std::to_string(a.id),
            TimestampHelper::toIso(a.timestamp),
            a.terrainSnapshotId ? std::to_string(*a.terrainSnapshotId) : "",
            Geo::toWkt(a.geometry),
            optional(a.susceptibility),
            optional(a.slopeDeg),
            optional(a.contributingAreaM2),
            optional(a.baseMaterialAvailability),
            optional(a.materialAvailability),
            JsonHelper::serializeNullable(a.metadata),
            std::to_string(a.revision),
            TimestampHelper::toIso(a.updatedAt)
        });

        for (const auto& c : a.contributions) {
            co_await guard.execSqlCoro(R"(
                INSERT INTO material_contributions (source_area_id, change_detection_id, magnitude, observed_at)
                VALUES (?, ?, ?, ?::timestamptz)
                ON CONFLICT (source_area_id, change_detection_id) DO NOTHING
            )", {
                std::to_string(a.id),
                std::to_string(c.changeDetectionId),
                std::to_string(c.magnitude),
                TimestampHelper::toIso(c.observedAt)
            });
        }

        co_await guard.commit();
    }

    static Task<std::vector<SourceArea>> findSourceAreas() {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(R"(
            SELECT id, timestamp, terrain_snapshot_id, ST_AsGeoJSON(geometry) AS geometry, susceptibility,
                   slope_deg, contributing_area_m2, base_material_availability, material_availability,
                   metadata, revision, updated_at
            FROM source_areas ORDER BY id
        )");
        auto contributions = co_await dbService.execSqlCoro(R"(
            SELECT source_area_id, change_detection_id, magnitude, observed_at
            FROM material_contributions ORDER BY source_area_id, observed_at
        )");

        std::map<int64_t, std::vector<MaterialContribution>> byArea;
        for (const auto& row : contributions) {
            byArea[FieldHelper::getInt64(row["source_area_id"])].push_back({
                FieldHelper::getInt64(row["change_detection_id"]),
                FieldHelper::getDouble(row["magnitude"]),
                FieldHelper::getTimestamp(row["observed_at"])
            });
        }

        std::vector<SourceArea> items;
        for (const auto& row : result) {
            SourceArea a;
            a.id = FieldHelper::getInt64(row["id"]);
            a.timestamp = FieldHelper::getTimestamp(row["timestamp"]);
            a.terrainSnapshotId = FieldHelper::getOptionalInt64(row["terrain_snapshot_id"]);
            a.geometry = Geo::polygonFromGeoJsonText(FieldHelper::getString(row["geometry"]));
            a.susceptibility = FieldHelper::getOptionalDouble(row["susceptibility"]);
            a.slopeDeg = FieldHelper::getOptionalDouble(row["slope_deg"]);
            a.contributingAreaM2 = FieldHelper::getOptionalDouble(row["contributing_area_m2"]);
            a.baseMaterialAvailability = FieldHelper::getOptionalDouble(row["base_material_availability"]);
            a.materialAvailability = FieldHelper::getOptionalDouble(row["material_availability"]);
            a.metadata = FieldHelper::getJson(row["metadata"]);
            a.revision = FieldHelper::getInt64(row["revision"]);
            a.updatedAt = FieldHelper::getOptionalTimestamp(row["updated_at"]).value_or(a.timestamp);
            if (auto it = byArea.find(a.id); it != byArea.end()) a.contributions = std::move(it->second);
            items.push_back(std::move(a));
        }
        co_return items;
    }

    struct MaxIds {
        int64_t snapshot = 0;
        int64_t changeDetection = 0;
        int64_t sourceArea = 0;
    };

    static Task<MaxIds> maxIds() {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(R"(
            SELECT (SELECT COALESCE(MAX(id), 0) FROM terrain_snapshots) AS max_snapshot,
                   (SELECT COALESCE(MAX(id), 0) FROM change_detections) AS max_change,
                   (SELECT COALESCE(MAX(id), 0) FROM source_areas) AS max_area
        )");
        co_return MaxIds{
            result[0]["max_snapshot"].as<int64_t>(),
            result[0]["max_change"].as<int64_t>(),
            result[0]["max_area"].as<int64_t>()
        };
    }
};
