#pragma once

#include "Event.Service.hpp"
#include "common/utils/Response.hpp"

/**
 * @brief 降雨事件控制器
 */
class EventController : public drogon::HttpController<EventController> {
private:
    EventService service_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(EventController::active, "/api/events/active", Get, "AuthFilter");
    ADD_METHOD_TO(EventController::list, "/api/events", Get, "AuthFilter");
    METHOD_LIST_END

    Task<HttpResponsePtr> active(HttpRequestPtr) {
        co_return Response::ok(service_.active());
    }

    Task<HttpResponsePtr> list(HttpRequestPtr req) {
        auto page = Pagination::fromRequest(req);
        auto [items, total] = co_await service_.history(req->getParameter("locationId"), page);
        co_return Response::page(items, total, page);
    }
};
