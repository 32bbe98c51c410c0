#pragma once

#include "AppException.hpp"
#include "Pagination.hpp"

/**
 * @brief 统一响应体 { code, message, data? }
 *
 * 分页列表的 data 为 { list, total, page?, pageSize?, totalPages? }。
 */
class Response {
public:
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static HttpResponsePtr ok(const Json::Value& data = Json::Value::null, const std::string& message = "Success") {
        return build(ErrorCodes::SUCCESS, message, k200OK, data);
    }

    static HttpResponsePtr page(const Json::Value& items, int total, const Pagination& pagination) {
        Json::Value data;
        data["list"] = items.isNull() ? Json::Value(Json::arrayValue) : items;
        data["total"] = total;
        if (pagination.isPaged()) {
            data["page"] = pagination.page;
            data["pageSize"] = pagination.pageSize;
            data["totalPages"] = (total + pagination.pageSize - 1) / pagination.pageSize;
        }
        return ok(data);
    }

    static HttpResponsePtr error(int code, const std::string& message, HttpStatusCode status = k400BadRequest) {
        return build(code, message, status, Json::Value::null);
    }

    static HttpResponsePtr error(const AppException& e) {
        return error(e.getCode(), e.getMessage(), e.getStatus());
    }

    static HttpResponsePtr unauthorized(const std::string& message = "未授权访问") {
        return error(ErrorCodes::UNAUTHORIZED, message, k401Unauthorized);
    }

    static HttpResponsePtr badRequest(const std::string& message = "请求参数错误") {
        return error(ErrorCodes::BAD_REQUEST, message);
    }

private:
    static HttpResponsePtr build(int code, const std::string& message, HttpStatusCode status, const Json::Value& data) {
        Json::Value body;
        body["code"] = code;
        body["message"] = message;
        if (!data.isNull()) body["data"] = data;
        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(status);
        return resp;
    }
};
