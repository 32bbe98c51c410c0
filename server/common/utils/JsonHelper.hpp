#pragma once

#include <json/json.h>

#include <optional>
#include <sstream>
#include <stdexcept>

/**
 * @brief JSON 序列化/反序列化辅助工具
 */
namespace JsonHelper {

/**
 * @brief 紧凑序列化（无换行、无缩进，保留 UTF-8）
 */
inline std::string serialize(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, value);
}

/**
 * @brief 可空 jsonb 列的绑定值：null 序列化为空串，配合 SQL 中 NULLIF(?, '')::jsonb
 */
inline std::string serializeNullable(const Json::Value& value) {
    return value.isNull() ? std::string() : serialize(value);
}

/**
 * @brief 解析外部输入，失败时返回 nullopt 并写入 errors
 */
inline std::optional<Json::Value> tryParse(const std::string& text, std::string* errors = nullptr) {
    Json::CharReaderBuilder reader;
    Json::Value result;
    std::string errs;
    std::istringstream iss(text);
    if (!Json::parseFromStream(reader, iss, &result, &errs)) {
        if (errors) *errors = errs;
        return std::nullopt;
    }
    return result;
}

/**
 * @brief 解析数据库中保存的 JSON（内容由本服务写入，失败视为数据损坏）
 * @throws std::runtime_error
 */
inline Json::Value parse(const std::string& text) {
    std::string errs;
    auto result = tryParse(text, &errs);
    if (!result) throw std::runtime_error("Stored JSON is corrupt: " + errs);
    return std::move(*result);
}

template<typename Range>
inline Json::Value toArray(const Range& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& item : items) arr.append(item.toJson());
    return arr;
}

}  // namespace JsonHelper
