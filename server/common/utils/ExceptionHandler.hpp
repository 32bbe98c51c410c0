#pragma once

#include "AppException.hpp"

/**
 * @brief 全局异常处理器
 *
 * AppException 按自身状态码返回；数据库异常视为依赖不可用（503），
 * 其余异常 500 且不向客户端暴露内部信息。响应体附带 requestId 便于对照日志。
 */
class AppExceptionHandler {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static void setup() {
        drogon::app().setExceptionHandler([](const std::exception& e, const HttpRequestPtr& req,
                                             std::function<void(const HttpResponsePtr&)>&& callback) {
            callback(toResponse(e, req));
        });
    }

    static HttpResponsePtr toResponse(const std::exception& e, const HttpRequestPtr& req) {
        auto requestId = req->attributes()->find("requestId")
            ? req->attributes()->get<std::string>("requestId") : std::string("-");

        int code = ErrorCodes::INTERNAL_ERROR;
        std::string message = "服务器内部错误";
        HttpStatusCode status = k500InternalServerError;

        if (const auto* appEx = dynamic_cast<const AppException*>(&e)) {
            code = appEx->getCode();
            message = appEx->getMessage();
            status = appEx->getStatus();
            if (status >= k500InternalServerError) {
                LOG_ERROR << "[" << requestId << "] " << req->path() << ": " << message;
            }
        } else if (dynamic_cast<const drogon::orm::DrogonDbException*>(&e)) {
            LOG_ERROR << "[" << requestId << "] [DB] " << req->path() << ": " << e.what();
            code = ErrorCodes::DATABASE_ERROR;
            message = "数据库暂不可用";
            status = k503ServiceUnavailable;
        } else {
            LOG_ERROR << "[" << requestId << "] Unhandled exception on " << req->path() << ": " << e.what();
        }

        Json::Value json;
        json["code"] = code;
        json["message"] = message;
        json["status"] = static_cast<int>(status);
        json["requestId"] = requestId;
        auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(status);
        return resp;
    }
};
