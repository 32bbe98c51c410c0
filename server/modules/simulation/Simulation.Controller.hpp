#pragma once

#include "Simulation.Service.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ControllerMacros.hpp"

/**
 * @brief 模拟运行控制器
 */
class SimulationController : public drogon::HttpController<SimulationController> {
private:
    SimulationService service_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(SimulationController::trigger, "/api/simulations", Post, "AuthFilter");
    ADD_METHOD_TO(SimulationController::list, "/api/simulations", Get, "AuthFilter");
    ADD_METHOD_TO(SimulationController::detail, "/api/simulations/{id}", Get, "AuthFilter");
    ADD_METHOD_TO(SimulationController::cancel, "/api/simulations/{id}/cancel", Post, "AuthFilter");
    METHOD_LIST_END

    Task<HttpResponsePtr> trigger(HttpRequestPtr req) {
        // 空请求体等同于 {}
        Json::Value body = req->body().empty() ? Json::Value(Json::objectValue) : *ControllerUtils::getJson(req);

        auto username = ControllerUtils::getUsername(req);
        auto data = co_await service_.trigger(body, username);
        LOG_INFO << "[Dispatcher] Manual simulation #" << data["id"].asInt64() << " requested by " << username;

        auto resp = Response::ok(data, "已提交");
        resp->setStatusCode(drogon::k202Accepted);
        co_return resp;
    }

    Task<HttpResponsePtr> cancel(HttpRequestPtr, int64_t id) {
        if (id <= 0) co_return Response::badRequest("无效的运行ID");

        auto data = co_await service_.cancel(id);
        co_return Response::ok(data, "已请求取消");
    }

    Task<HttpResponsePtr> list(HttpRequestPtr req) {
        auto page = Pagination::fromRequest(req);
        auto [items, total] = co_await service_.list(req->getParameter("status"), page);
        co_return Response::page(items, total, page);
    }

    Task<HttpResponsePtr> detail(HttpRequestPtr, int64_t id) {
        if (id <= 0) co_return Response::badRequest("无效的运行ID");
        co_return Response::ok(service_.detail(id));
    }
};
