#pragma once

#include "Risk.Service.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ControllerMacros.hpp"

/**
 * @brief 风险控制器
 */
class RiskController : public drogon::HttpController<RiskController> {
private:
    RiskService service_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(RiskController::current, "/api/risk/current", Get, "AuthFilter");
    ADD_METHOD_TO(RiskController::zones, "/api/risk/zones", Get, "AuthFilter");
    METHOD_LIST_END

    Task<HttpResponsePtr> current(HttpRequestPtr) {
        co_return Response::ok(service_.current());
    }

    Task<HttpResponsePtr> zones(HttpRequestPtr req) {
        co_return Response::ok(service_.zones(ControllerUtils::getBboxParam(req)));
    }
};
