#pragma once

#include "Alert.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/utils/FieldHelper.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/Pagination.hpp"

/**
 * @brief 告警数据访问
 */
class AlertRepository {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    /**
     * @brief 按 revision 写入（刷新与确认都会提升 revision）
     */
    static Task<void> save(const Alert& a) {
        auto idOrEmpty = [](const std::optional<int64_t>& v) { return v ? std::to_string(*v) : std::string(); };

        DatabaseService dbService;
        co_await dbService.execSqlCoro(R"(
            INSERT INTO alerts (id, timestamp, updated_at, alert_type, severity, title, message,
                related_simulation_id, related_event_id, related_change_id, is_acknowledged,
                acknowledged_at, acknowledged_by, occurrences, metadata, revision)
            VALUES (?, ?::timestamptz, ?::timestamptz, ?, ?::alert_severity_enum, ?, ?,
                NULLIF(?, '')::bigint, NULLIF(?, '')::bigint, NULLIF(?, '')::bigint, ?::boolean,
                NULLIF(?, '')::timestamptz, NULLIF(?, ''), ?, NULLIF(?, '')::jsonb, ?)
            ON CONFLICT (id) DO UPDATE SET
                updated_at = EXCLUDED.updated_at,
                severity = EXCLUDED.severity,
                title = EXCLUDED.title,
                message = EXCLUDED.message,
                is_acknowledged = EXCLUDED.is_acknowledged,
                acknowledged_at = EXCLUDED.acknowledged_at,
                acknowledged_by = EXCLUDED.acknowledged_by,
                occurrences = EXCLUDED.occurrences,
                metadata = EXCLUDED.metadata,
                revision = EXCLUDED.revision
            WHERE alerts.revision < EXCLUDED.revision
        )", {
            std::to_string(a.id),
            TimestampHelper::toIso(a.timestamp),
            TimestampHelper::toIso(a.updatedAt),
            alertTypeToString(a.type),
            alertSeverityToString(a.severity),
            a.title,
            a.message,
            idOrEmpty(a.subject.simulationId),
            idOrEmpty(a.subject.eventId),
            idOrEmpty(a.subject.changeId),
            a.acknowledged ? "true" : "false",
            a.acknowledgedAt ? TimestampHelper::toIso(*a.acknowledgedAt) : "",
            a.acknowledgedBy,
            std::to_string(a.occurrences),
            JsonHelper::serializeNullable(a.metadata),
            std::to_string(a.revision)
        });
    }

    static Task<std::vector<Alert>> findUnacknowledged() {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro(
            std::string(SELECT_COLUMNS) + " WHERE NOT is_acknowledged ORDER BY id");
        std::vector<Alert> items;
        for (const auto& row : result) items.push_back(fromRow(row));
        co_return items;
    }

    /**
     * @brief 告警列表（新的在前）
     * @return {当前页, 总数}
     */
    static Task<std::pair<std::vector<Alert>, int>> findPage(bool unacknowledgedOnly, const Pagination& page) {
        QueryBuilder qb;
        qb.when(unacknowledgedOnly, "NOT is_acknowledged");

        DatabaseService dbService;
        auto countResult = co_await dbService.execSqlCoro("SELECT COUNT(*) AS count FROM alerts" + qb.whereClause());
        int total = countResult[0]["count"].as<int>();

        auto result = co_await dbService.execSqlCoro(
            std::string(SELECT_COLUMNS) + qb.whereClause() + " ORDER BY timestamp DESC, id DESC" + page.limitClause());

        std::vector<Alert> items;
        for (const auto& row : result) items.push_back(fromRow(row));
        co_return std::make_pair(std::move(items), total);
    }

    static Task<int64_t> maxId() {
        DatabaseService dbService;
        auto result = co_await dbService.execSqlCoro("SELECT COALESCE(MAX(id), 0) AS max_id FROM alerts");
        co_return result[0]["max_id"].as<int64_t>();
    }

private:
    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT id, timestamp, updated_at, alert_type, severity::text AS severity, title, message,
               related_simulation_id, related_event_id, related_change_id, is_acknowledged,
               acknowledged_at, acknowledged_by, occurrences, metadata, revision
        FROM alerts
    )";

    static Alert fromRow(const drogon::orm::Row& row) {
        Alert a;
        a.id = FieldHelper::getInt64(row["id"]);
        a.timestamp = FieldHelper::getTimestamp(row["timestamp"]);
        a.updatedAt = FieldHelper::getTimestamp(row["updated_at"]);
        a.type = alertTypeFromString(FieldHelper::getString(row["alert_type"])).value_or(AlertType::HighRisk);
        a.severity = alertSeverityFromString(FieldHelper::getString(row["severity"])).value_or(AlertSeverity::Info);
        a.title = FieldHelper::getString(row["title"]);
        a.message = FieldHelper::getString(row["message"]);
        a.subject.simulationId = FieldHelper::getOptionalInt64(row["related_simulation_id"]);
        a.subject.eventId = FieldHelper::getOptionalInt64(row["related_event_id"]);
        a.subject.changeId = FieldHelper::getOptionalInt64(row["related_change_id"]);
        a.acknowledged = FieldHelper::getBool(row["is_acknowledged"]);
        a.acknowledgedAt = FieldHelper::getOptionalTimestamp(row["acknowledged_at"]);
        a.acknowledgedBy = FieldHelper::getString(row["acknowledged_by"]);
        a.occurrences = FieldHelper::getInt(row["occurrences"], 1);
        a.metadata = FieldHelper::getJson(row["metadata"]);
        a.revision = FieldHelper::getInt64(row["revision"]);
        return a;
    }
};
