#pragma once

#include "AppException.hpp"
#include "common/geo/Geometry.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief Controller 请求解析辅助
 */
namespace ControllerUtils {

/** 当前操作员（AuthFilter 写入的 username 属性） */
inline std::string getUsername(const drogon::HttpRequestPtr& req) {
    return req->attributes()->get<std::string>("username");
}

/**
 * @brief JSON 请求体，必须是对象
 * @throws ValidationException 缺失或不是 JSON 对象
 */
inline std::shared_ptr<Json::Value> getJson(const drogon::HttpRequestPtr& req) {
    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        throw ValidationException("请求体必须是 JSON 对象" + (req->getJsonError().empty() ? std::string() : ": " + req->getJsonError()));
    }
    return json;
}

/**
 * @throws ValidationException 不是 ISO-8601 时间
 */
inline std::optional<std::chrono::system_clock::time_point> getTimeParam(const drogon::HttpRequestPtr& req,
                                                                         const std::string& name) {
    auto text = req->getParameter(name);
    if (text.empty()) return std::nullopt;
    auto tp = TimestampHelper::parse(text);
    if (!tp) throw ValidationException(name + " 时间格式错误: " + text);
    return tp;
}

/** bbox=minLon,minLat,maxLon,maxLat */
inline std::optional<BoundingBox> getBboxParam(const drogon::HttpRequestPtr& req) {
    auto text = req->getParameter("bbox");
    if (text.empty()) return std::nullopt;
    return BoundingBox::parse(text);
}

}  // namespace ControllerUtils
