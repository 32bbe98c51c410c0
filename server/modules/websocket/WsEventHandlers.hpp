#pragma once

#include "common/domain/EventBus.hpp"
#include "common/network/WebSocketManager.hpp"
#include "modules/event/domain/Events.hpp"
#include "modules/risk/domain/Events.hpp"
#include "modules/simulation/domain/Events.hpp"
#include "modules/terrain/domain/Events.hpp"
#include "modules/alert/domain/Events.hpp"

/**
 * @brief WebSocket 事件广播处理器
 *
 * 订阅流水线事件，通过 WebSocket 推送给已连接的操作员。
 * 在应用启动时调用 registerAll() 注册。
 *
 * 推送事件类型：
 * - event:opened / event:updated / event:closed
 * - risk:assessed
 * - simulation:dispatched / simulation:updated / simulation:completed / simulation:failed
 * - zone:created
 * - alert:raised / alert:refreshed / alert:acknowledged
 * - source-area:updated
 */
class WsEventHandlers {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    static void registerAll() {
        auto& bus = EventBus::instance();

        // ==================== 降雨事件 ====================
        bus.subscribe<RainfallEventOpened>([](const RainfallEventOpened& e) -> Task<void> {
            WebSocketManager::instance().broadcast("event:opened", e.event.toJson());
            co_return;
        });

        bus.subscribe<RainfallEventUpdated>([](const RainfallEventUpdated& e) -> Task<void> {
            WebSocketManager::instance().broadcast("event:updated", e.event.toJson());
            co_return;
        });

        bus.subscribe<RainfallEventClosed>([](const RainfallEventClosed& e) -> Task<void> {
            WebSocketManager::instance().broadcast("event:closed", e.event.toJson());
            co_return;
        });

        // ==================== 风险评估 ====================
        bus.subscribe<RiskAssessed>([](const RiskAssessed& e) -> Task<void> {
            Json::Value data = e.assessment.toJson();
            data["previous_level"] = e.previousLevel ? Json::Value(riskLevelToString(*e.previousLevel)) : Json::Value();
            WebSocketManager::instance().broadcast("risk:assessed", data);
            co_return;
        });

        // ==================== 模拟运行 ====================
        bus.subscribe<SimulationDispatched>([](const SimulationDispatched& e) -> Task<void> {
            WebSocketManager::instance().broadcast("simulation:dispatched", e.run.toJson());
            co_return;
        });

        bus.subscribe<SimulationUpdated>([](const SimulationUpdated& e) -> Task<void> {
            WebSocketManager::instance().broadcast("simulation:updated", e.run.toJson());
            co_return;
        });

        bus.subscribe<SimulationCompleted>([](const SimulationCompleted& e) -> Task<void> {
            auto& ws = WebSocketManager::instance();
            ws.broadcast("simulation:completed", e.run.toJson());
            ws.broadcast("zone:created", e.zone.toJson());
            co_return;
        });

        bus.subscribe<SimulationFailed>([](const SimulationFailed& e) -> Task<void> {
            WebSocketManager::instance().broadcast("simulation:failed", e.run.toJson());
            co_return;
        });

        // ==================== 易发区 ====================
        bus.subscribe<SourceAreaUpdated>([](const SourceAreaUpdated& e) -> Task<void> {
            Json::Value data;
            data["id"] = static_cast<Json::Int64>(e.area.id);
            data["material_availability"] = e.area.materialAvailability
                ? Json::Value(*e.area.materialAvailability) : Json::Value();
            data["revision"] = static_cast<Json::Int64>(e.area.revision);
            WebSocketManager::instance().broadcast("source-area:updated", data);
            co_return;
        });

        // ==================== 告警 ====================
        bus.subscribe<AlertRaised>([](const AlertRaised& e) -> Task<void> {
            WebSocketManager::instance().broadcast("alert:raised", e.alert.toJson());
            co_return;
        });

        bus.subscribe<AlertRefreshed>([](const AlertRefreshed& e) -> Task<void> {
            Json::Value data = e.alert.toJson();
            data["escalated"] = e.escalated;
            WebSocketManager::instance().broadcast("alert:refreshed", data);
            co_return;
        });

        bus.subscribe<AlertAcknowledged>([](const AlertAcknowledged& e) -> Task<void> {
            WebSocketManager::instance().broadcast("alert:acknowledged", e.alert.toJson());
            co_return;
        });

        LOG_INFO << "[WS] Event handlers registered";
    }
};
