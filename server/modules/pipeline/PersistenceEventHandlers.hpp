#pragma once

#include "common/domain/EventBus.hpp"
#include "modules/weather/domain/Events.hpp"
#include "modules/weather/domain/ObservationRepository.hpp"
#include "modules/event/domain/Events.hpp"
#include "modules/event/domain/RainfallEventRepository.hpp"
#include "modules/simulation/domain/Events.hpp"
#include "modules/simulation/domain/SimulationRepository.hpp"
#include "modules/terrain/domain/Events.hpp"
#include "modules/terrain/domain/TerrainRepository.hpp"
#include "modules/alert/domain/Events.hpp"
#include "modules/alert/domain/AlertRepository.hpp"

/**
 * @brief 持久化事件处理器
 *
 * 数据库是 SpatialStore 的镜像：每个状态转换事件写入对应表。
 * 只有观测批量写入（接收边界）带退避重试；其余写入失败只记录日志，
 * 同一实体的下一个 revision 会覆盖写入，不做盲目重试。
 */
class PersistenceEventHandlers {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    /**
     * @brief 注册所有持久化处理器（应用启动时调用）
     * @param retryMaxAttempts 观测批量写入的最大尝试次数
     */
    static void registerAll(int retryMaxAttempts) {
        auto& bus = EventBus::instance();

        bus.subscribe<ObservationsAccepted>([retryMaxAttempts](const ObservationsAccepted& e) -> Task<void> {
            auto saved = co_await ObservationRepository::saveBatch(e.observations, retryMaxAttempts);
            if (saved < e.observations.size()) {
                LOG_ERROR << "[Persistence] " << (e.observations.size() - saved) << " of "
                          << e.observations.size() << " observations not persisted";
            }
        });

        // ==================== 降雨事件 ====================
        bus.subscribe<RainfallEventOpened>([](const RainfallEventOpened& e) -> Task<void> {
            co_await persist("rainfall event #" + std::to_string(e.event.id),
                             [&e]() { return RainfallEventRepository::save(e.event); });
        });

        bus.subscribe<RainfallEventUpdated>([](const RainfallEventUpdated& e) -> Task<void> {
            co_await persist("rainfall event #" + std::to_string(e.event.id),
                             [&e]() { return RainfallEventRepository::save(e.event); });
        });

        bus.subscribe<RainfallEventClosed>([](const RainfallEventClosed& e) -> Task<void> {
            co_await persist("rainfall event #" + std::to_string(e.event.id),
                             [&e]() { return RainfallEventRepository::save(e.event); });
        });

        // ==================== 模拟运行 ====================
        bus.subscribe<SimulationDispatched>([](const SimulationDispatched& e) -> Task<void> {
            co_await persist("simulation run #" + std::to_string(e.run.id),
                             [&e]() { return SimulationRepository::saveRun(e.run); });
        });

        bus.subscribe<SimulationUpdated>([](const SimulationUpdated& e) -> Task<void> {
            co_await persist("simulation run #" + std::to_string(e.run.id),
                             [&e]() { return SimulationRepository::saveRun(e.run); });
        });

        bus.subscribe<SimulationCompleted>([](const SimulationCompleted& e) -> Task<void> {
            co_await persist("simulation run #" + std::to_string(e.run.id) + " with zone #" + std::to_string(e.zone.id),
                             [&e]() { return SimulationRepository::saveCompletion(e.run, e.zone); });
        });

        bus.subscribe<SimulationFailed>([](const SimulationFailed& e) -> Task<void> {
            co_await persist("simulation run #" + std::to_string(e.run.id),
                             [&e]() { return SimulationRepository::saveRun(e.run); });
        });

        // ==================== 地形 ====================
        bus.subscribe<SnapshotIngested>([](const SnapshotIngested& e) -> Task<void> {
            co_await persist("terrain snapshot #" + std::to_string(e.snapshot.id),
                             [&e]() { return TerrainRepository::saveSnapshot(e.snapshot); });
        });

        bus.subscribe<ChangeDetectionIngested>([](const ChangeDetectionIngested& e) -> Task<void> {
            co_await persist("change detection #" + std::to_string(e.change.id),
                             [&e]() { return TerrainRepository::saveChangeDetection(e.change); });
        });

        bus.subscribe<SourceAreaUpdated>([](const SourceAreaUpdated& e) -> Task<void> {
            co_await persist("source area #" + std::to_string(e.area.id),
                             [&e]() { return TerrainRepository::saveSourceArea(e.area); });
        });

        // ==================== 告警 ====================
        bus.subscribe<AlertRaised>([](const AlertRaised& e) -> Task<void> {
            co_await persist("alert #" + std::to_string(e.alert.id),
                             [&e]() { return AlertRepository::save(e.alert); });
        });

        bus.subscribe<AlertRefreshed>([](const AlertRefreshed& e) -> Task<void> {
            co_await persist("alert #" + std::to_string(e.alert.id),
                             [&e]() { return AlertRepository::save(e.alert); });
        });

        bus.subscribe<AlertAcknowledged>([](const AlertAcknowledged& e) -> Task<void> {
            co_await persist("alert #" + std::to_string(e.alert.id),
                             [&e]() { return AlertRepository::save(e.alert); });
        });

        LOG_INFO << "[Persistence] Event handlers registered";
    }

private:
    template<typename Write>
    static Task<void> persist(std::string what, Write write) {
        try {
            co_await write();
        } catch (const drogon::orm::DrogonDbException& e) {
            LOG_ERROR << "[Persistence] " << what << " not persisted: " << e.base().what();
        } catch (const std::exception& e) {
            LOG_ERROR << "[Persistence] " << what << " not persisted: " << e.what();
        }
    }
};
