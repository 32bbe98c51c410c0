#pragma once

#include "domain/SimulationRepository.hpp"
#include "modules/pipeline/HazardPipeline.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief 模拟运行服务
 */
class SimulationService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    /**
     * @brief 手动触发
     * @param username 发起的操作员，记录在运行的 trigger.requested_by
     * @throws ValidationException 引用的快照或事件不存在、无可用快照
     * @throws DuplicateDispatchException 同一事件已有进行中的运行
     */
    Task<Json::Value> trigger(const Json::Value& body, const std::string& username) {
        DispatchRequest request;
        request.trigger = ManualTrigger{username};
        if (body.isMember("terrain_snapshot_id") && !body["terrain_snapshot_id"].isNull()) {
            if (!body["terrain_snapshot_id"].isIntegral()) throw ValidationException("terrain_snapshot_id 必须为整数");
            request.terrainSnapshotId = body["terrain_snapshot_id"].asInt64();
        }
        if (body.isMember("rainfall_event_id") && !body["rainfall_event_id"].isNull()) {
            if (!body["rainfall_event_id"].isIntegral()) throw ValidationException("rainfall_event_id 必须为整数");
            request.rainfallEventId = body["rainfall_event_id"].asInt64();
        }
        if (body.isMember("parameters")) {
            if (!body["parameters"].isObject()) throw ValidationException("parameters 必须为对象");
            request.parameters = body["parameters"];
        }

        auto run = co_await HazardPipeline::instance().triggerSimulation(std::move(request));
        co_return run.toJson();
    }

    /**
     * @throws NotFoundException / IllegalTransitionException
     */
    Task<Json::Value> cancel(int64_t id) {
        auto run = co_await HazardPipeline::instance().cancelSimulation(id);
        co_return run.toJson();
    }

    Task<std::pair<Json::Value, int>> list(const std::string& status, const Pagination& page) {
        if (!status.empty() && !runStatusFromString(status)) {
            throw ValidationException("未知的运行状态: " + status);
        }
        auto [items, total] = co_await SimulationRepository::findPage(status, page);
        co_return std::make_pair(JsonHelper::toArray(items), total);
    }

    /**
     * @brief 运行详情（附带完成后生成的风险区）
     * @throws NotFoundException
     */
    Json::Value detail(int64_t id) const {
        const auto& store = HazardPipeline::instance().store();
        auto run = store.run(id);
        if (!run) throw NotFoundException("模拟运行不存在: " + std::to_string(id));

        Json::Value data = run->toJson();
        auto zone = store.zoneForRun(id);
        data["risk_zone"] = zone ? zone->toJson() : Json::Value();
        return data;
    }
};
