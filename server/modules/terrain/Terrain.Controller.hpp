#pragma once

#include "Terrain.Service.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ControllerMacros.hpp"

/**
 * @brief 地形控制器
 */
class TerrainController : public drogon::HttpController<TerrainController> {
private:
    TerrainService service_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(TerrainController::ingestSnapshot, "/api/terrain/snapshots", Post, "AuthFilter");
    ADD_METHOD_TO(TerrainController::snapshots, "/api/terrain/snapshots", Get, "AuthFilter");
    ADD_METHOD_TO(TerrainController::upsertSourceArea, "/api/terrain/source-areas", Post, "AuthFilter");
    ADD_METHOD_TO(TerrainController::sourceAreas, "/api/terrain/source-areas", Get, "AuthFilter");
    ADD_METHOD_TO(TerrainController::ingestChangeDetection, "/api/terrain/change-detections", Post, "AuthFilter");
    ADD_METHOD_TO(TerrainController::changeDetections, "/api/terrain/change-detections", Get, "AuthFilter");
    METHOD_LIST_END

    Task<HttpResponsePtr> ingestSnapshot(HttpRequestPtr req) {
        auto json = ControllerUtils::getJson(req);

        auto data = co_await service_.ingestSnapshot(*json);
        auto resp = Response::ok(data, "创建成功");
        resp->setStatusCode(drogon::k201Created);
        co_return resp;
    }

    Task<HttpResponsePtr> snapshots(HttpRequestPtr) {
        co_return Response::ok(service_.snapshots());
    }

    Task<HttpResponsePtr> upsertSourceArea(HttpRequestPtr req) {
        auto json = ControllerUtils::getJson(req);

        auto data = co_await service_.upsertSourceArea(*json);
        co_return Response::ok(data, "保存成功");
    }

    Task<HttpResponsePtr> sourceAreas(HttpRequestPtr req) {
        co_return Response::ok(service_.sourceAreas(ControllerUtils::getBboxParam(req)));
    }

    Task<HttpResponsePtr> ingestChangeDetection(HttpRequestPtr req) {
        auto json = ControllerUtils::getJson(req);

        auto data = co_await service_.ingestChangeDetection(*json);
        auto resp = Response::ok(data, "创建成功");
        resp->setStatusCode(drogon::k201Created);
        co_return resp;
    }

    Task<HttpResponsePtr> changeDetections(HttpRequestPtr) {
        co_return Response::ok(service_.changeDetections());
    }
};
