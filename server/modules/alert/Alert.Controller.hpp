#pragma once

#include "Alert.Service.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ControllerMacros.hpp"

/**
 * @brief 告警控制器
 */
class AlertController : public drogon::HttpController<AlertController> {
private:
    AlertService service_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(AlertController::list, "/api/alerts", Get, "AuthFilter");
    ADD_METHOD_TO(AlertController::acknowledge, "/api/alerts/{id}/ack", Post, "AuthFilter");
    METHOD_LIST_END

    Task<HttpResponsePtr> list(HttpRequestPtr req) {
        auto page = Pagination::fromRequest(req);
        auto flag = req->getParameter("unacknowledged");
        bool unacknowledgedOnly = flag == "1" || flag == "true";

        auto [items, total] = co_await service_.list(unacknowledgedOnly, page);
        co_return Response::page(items, total, page);
    }

    Task<HttpResponsePtr> acknowledge(HttpRequestPtr req, int64_t id) {
        if (id <= 0) co_return Response::badRequest("无效的告警ID");

        auto data = co_await service_.acknowledge(id, ControllerUtils::getUsername(req));
        co_return Response::ok(data, "确认成功");
    }
};
