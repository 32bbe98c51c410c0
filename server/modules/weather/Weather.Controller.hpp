#pragma once

#include "Weather.Service.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ControllerMacros.hpp"

/**
 * @brief 气象观测控制器
 */
class WeatherController : public drogon::HttpController<WeatherController> {
private:
    WeatherService service_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(WeatherController::ingest, "/api/weather/observations", Post, "AuthFilter");
    ADD_METHOD_TO(WeatherController::observations, "/api/weather/observations", Get, "AuthFilter");
    ADD_METHOD_TO(WeatherController::aggregates, "/api/weather/aggregates", Get, "AuthFilter");
    METHOD_LIST_END

    Task<HttpResponsePtr> ingest(HttpRequestPtr req) {
        auto json = ControllerUtils::getJson(req);
        if (!(*json)["observations"].isArray()) {
            co_return Response::badRequest("请提供 observations 数组");
        }
        const auto& observations = (*json)["observations"];
        if (observations.size() > Constants::OBSERVATION_BATCH_MAX) {
            co_return Response::badRequest("单批观测不能超过 " + std::to_string(Constants::OBSERVATION_BATCH_MAX) + " 条");
        }

        auto data = co_await service_.ingest(observations);
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> observations(HttpRequestPtr req) {
        auto locationId = req->getParameter("locationId");
        if (locationId.empty()) co_return Response::badRequest("缺少 locationId 参数");

        auto from = ControllerUtils::getTimeParam(req, "from");
        auto to = ControllerUtils::getTimeParam(req, "to");
        if (from && to && *from > *to) co_return Response::badRequest("from 不能晚于 to");

        auto data = co_await service_.observations(locationId, from, to);
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> aggregates(HttpRequestPtr) {
        co_return Response::ok(service_.aggregates());
    }
};
