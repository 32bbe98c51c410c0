#pragma once

#include "common/utils/JsonHelper.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief drogon::orm::Field 读取辅助
 *
 * 可空列统一两种读法：带默认值的 getXxx 与返回 std::optional 的 getOptionalXxx。
 */
class FieldHelper {
public:
    using Field = drogon::orm::Field;
    using TimePoint = std::chrono::system_clock::time_point;

    template<typename T>
    static std::optional<T> optional(const Field& field) {
        if (field.isNull()) return std::nullopt;
        return field.as<T>();
    }

    static std::string getString(const Field& field, const std::string& fallback = "") {
        return optional<std::string>(field).value_or(fallback);
    }

    static int getInt(const Field& field, int fallback = 0) {
        return optional<int>(field).value_or(fallback);
    }

    static int64_t getInt64(const Field& field, int64_t fallback = 0) {
        return optional<int64_t>(field).value_or(fallback);
    }

    static bool getBool(const Field& field, bool fallback = false) {
        return optional<bool>(field).value_or(fallback);
    }

    static double getDouble(const Field& field, double fallback = 0.0) {
        return optional<double>(field).value_or(fallback);
    }

    static std::optional<double> getOptionalDouble(const Field& field) { return optional<double>(field); }
    static std::optional<int64_t> getOptionalInt64(const Field& field) { return optional<int64_t>(field); }
    static std::optional<std::string> getOptionalString(const Field& field) { return optional<std::string>(field); }

    /**
     * @brief TIMESTAMPTZ 列（连接时区为 UTC）
     * @throws std::runtime_error 无法解析
     */
    static TimePoint getTimestamp(const Field& field) {
        auto text = field.as<std::string>();
        auto tp = TimestampHelper::parse(text);
        if (!tp) throw std::runtime_error("Invalid timestamp from database: " + text);
        return *tp;
    }

    static std::optional<TimePoint> getOptionalTimestamp(const Field& field) {
        if (field.isNull()) return std::nullopt;
        return getTimestamp(field);
    }

    /** JSONB 列，NULL 返回 null 值 */
    static Json::Value getJson(const Field& field) {
        if (field.isNull()) return Json::Value();
        return JsonHelper::parse(field.as<std::string>());
    }
};
