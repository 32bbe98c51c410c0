#pragma once

#include "HazardPipeline.hpp"
#include "modules/weather/domain/ObservationRepository.hpp"
#include "modules/event/domain/RainfallEventRepository.hpp"
#include "modules/simulation/domain/SimulationRepository.hpp"
#include "modules/terrain/domain/TerrainRepository.hpp"
#include "modules/alert/domain/AlertRepository.hpp"

/**
 * @brief 启动恢复：从数据库重建流水线的内存状态
 *
 * 顺序：ID 序列 → 快照/变化检测/易发区 → 降雨事件 → 模拟运行/风险区
 * → 未确认告警 → 最近 7 天观测（重建滚动窗口），最后对齐状态机。
 * 历史事件与模拟只恢复保留期内的部分，与运行期的保留期清理一致。
 */
class StateLoader {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    static Task<void> load(HazardPipeline& pipeline) {
        auto now = std::chrono::system_clock::now();
        auto& store = pipeline.store();

        IdSeeds seeds;
        seeds.observation = co_await ObservationRepository::maxId();
        seeds.event = co_await RainfallEventRepository::maxId();
        auto terrainIds = co_await TerrainRepository::maxIds();
        seeds.snapshot = terrainIds.snapshot;
        seeds.changeDetection = terrainIds.changeDetection;
        seeds.sourceArea = terrainIds.sourceArea;
        auto [maxRun, maxZone] = co_await SimulationRepository::maxIds();
        seeds.run = maxRun;
        seeds.zone = maxZone;
        seeds.alert = co_await AlertRepository::maxId();
        store.seedSequences(seeds);

        auto snapshots = co_await TerrainRepository::findSnapshots();
        for (const auto& s : snapshots) store.restoreSnapshot(s);
        auto changes = co_await TerrainRepository::findChangeDetections();
        for (const auto& cd : changes) store.restoreChangeDetection(cd);
        auto areas = co_await TerrainRepository::findSourceAreas();
        for (const auto& a : areas) store.restoreSourceArea(a);
        LOG_INFO << "[Startup] Terrain: " << snapshots.size() << " snapshots, " << changes.size()
                 << " change detections, " << areas.size() << " source areas";

        auto retainedFrom = now - pipeline.config().retentionWindow;
        auto events = co_await RainfallEventRepository::findActiveOrSince(retainedFrom);
        for (const auto& e : events) store.restoreEvent(e);

        auto runs = co_await SimulationRepository::findRetainedRuns(retainedFrom);
        for (const auto& r : runs) store.restoreRun(r);
        auto zones = co_await SimulationRepository::findRetainedZones(retainedFrom);
        size_t restoredZones = 0;
        for (const auto& z : zones) {
            try {
                store.restoreZone(z);
                ++restoredZones;
            } catch (const IllegalTransitionException& e) {
                LOG_WARN << "[Startup] Risk zone #" << z.id << " skipped: " << e.getMessage();
            }
        }
        LOG_INFO << "[Startup] Pipeline: " << events.size() << " rainfall events, " << runs.size()
                 << " simulation runs, " << restoredZones << " risk zones";

        auto alerts = co_await AlertRepository::findUnacknowledged();
        for (const auto& a : alerts) store.restoreAlert(a);

        auto since = now - SpatialStore::OBSERVATION_RETENTION;
        auto observations = co_await ObservationRepository::findSince(since);
        for (const auto& obs : observations) pipeline.restoreObservation(obs);
        LOG_INFO << "[Startup] Replayed " << observations.size() << " observations, "
                 << alerts.size() << " open alerts restored";

        co_await pipeline.completeRecovery(now);
    }
};
