#pragma once

#include "modules/weather/domain/WeatherObservation.hpp"
#include "modules/event/domain/RainfallEvent.hpp"
#include "modules/terrain/domain/TerrainSnapshot.hpp"
#include "modules/terrain/domain/ChangeDetection.hpp"
#include "modules/terrain/domain/SourceArea.hpp"
#include "modules/simulation/domain/SimulationRun.hpp"
#include "modules/risk/domain/RiskZone.hpp"
#include "modules/alert/domain/Alert.hpp"

/**
 * @brief 各实体 ID 序列的起点（启动时由数据库 MAX(id) 恢复）
 */
struct IdSeeds {
    int64_t observation = 0;
    int64_t event = 0;
    int64_t snapshot = 0;
    int64_t changeDetection = 0;
    int64_t sourceArea = 0;
    int64_t run = 0;
    int64_t zone = 0;
    int64_t alert = 0;
};

/**
 * @brief 告警去重写入结果
 */
struct AlertUpsert {
    Alert alert;
    bool created = false;
    bool escalated = false;     // 刷新时级别上升
};

/**
 * @brief 一次保留期清理的结果
 */
struct RetentionReport {
    size_t events = 0;
    size_t runs = 0;
    size_t zones = 0;
    size_t alerts = 0;

    size_t total() const { return events + runs + zones + alerts; }
};

/**
 * @brief 空间存储 - 流水线的内存权威状态
 *
 * 持有全部实体（含几何与时间索引），对外只返回副本。
 * 所有跨实体的不变量在同一把锁内检查并写入：
 * - 每个监测点至多一个活跃降雨事件
 * - 同一 (快照, 降雨事件) 至多一个 Pending/Running 模拟
 * - 模拟终态只写一次，风险区只挂在 Completed 模拟上且每个模拟一个
 * - 同类型、同关联实体的未确认告警只有一条
 *
 * 数据库只是它的持久化镜像（见 PersistenceEventHandlers）。
 */
class SpatialStore {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /** 观测在内存中保留的时长，与 7 天降雨窗口一致 */
    static constexpr std::chrono::hours OBSERVATION_RETENTION{24 * 7};

    SpatialStore() = default;
    SpatialStore(const SpatialStore&) = delete;
    SpatialStore& operator=(const SpatialStore&) = delete;

    void seedSequences(const IdSeeds& seeds) {
        std::unique_lock lock(mutex_);
        seeds_ = seeds;
    }

    // ==================== 气象观测 ====================

    WeatherObservation addObservation(WeatherObservation obs) {
        std::unique_lock lock(mutex_);
        obs.id = ++seeds_.observation;
        auto& series = observations_[obs.locationId];
        series.push_back(obs);
        auto cutoff = obs.timestamp - OBSERVATION_RETENTION;
        while (!series.empty() && series.front().timestamp <= cutoff) {
            series.pop_front();
        }
        return obs;
    }

    /**
     * @brief 恢复历史观测（保留原 ID，按时间顺序调用）
     */
    void restoreObservation(const WeatherObservation& obs) {
        std::unique_lock lock(mutex_);
        observations_[obs.locationId].push_back(obs);
        seeds_.observation = (std::max)(seeds_.observation, obs.id);
    }

    std::vector<WeatherObservation> observations(const std::string& locationId,
                                                 std::optional<TimePoint> from,
                                                 std::optional<TimePoint> to) const {
        std::shared_lock lock(mutex_);
        std::vector<WeatherObservation> result;
        auto it = observations_.find(locationId);
        if (it == observations_.end()) return result;
        for (const auto& obs : it->second) {
            if (from && obs.timestamp < *from) continue;
            if (to && obs.timestamp > *to) continue;
            result.push_back(obs);
        }
        return result;
    }

    // ==================== 降雨事件 ====================

    /**
     * @brief 创建活跃事件
     * @throws IllegalTransitionException 该监测点已有活跃事件
     */
    RainfallEvent openEvent(RainfallEvent event) {
        std::unique_lock lock(mutex_);
        if (auto it = activeEventByLocation_.find(event.locationId); it != activeEventByLocation_.end()) {
            throw IllegalTransitionException("监测点 " + event.locationId
                + " 已有活跃降雨事件 #" + std::to_string(it->second));
        }
        event.id = ++seeds_.event;
        event.isActive = true;
        event.revision = 1;
        events_[event.id] = event;
        activeEventByLocation_[event.locationId] = event.id;
        return event;
    }

    /**
     * @brief 保存事件的新状态（累计或关闭）
     * @throws NotFoundException 事件不存在
     * @throws IllegalTransitionException 事件已关闭
     */
    RainfallEvent saveEvent(RainfallEvent event) {
        std::unique_lock lock(mutex_);
        auto it = events_.find(event.id);
        if (it == events_.end()) {
            throw NotFoundException("降雨事件不存在: " + std::to_string(event.id));
        }
        if (!it->second.isActive) {
            throw IllegalTransitionException("降雨事件 #" + std::to_string(event.id) + " 已关闭");
        }
        event.revision = it->second.revision + 1;
        it->second = event;
        if (!event.isActive) activeEventByLocation_.erase(event.locationId);
        return event;
    }

    void restoreEvent(const RainfallEvent& event) {
        std::unique_lock lock(mutex_);
        events_[event.id] = event;
        if (event.isActive) activeEventByLocation_[event.locationId] = event.id;
        seeds_.event = (std::max)(seeds_.event, event.id);
    }

    std::optional<RainfallEvent> event(int64_t id) const {
        std::shared_lock lock(mutex_);
        auto it = events_.find(id);
        if (it == events_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<RainfallEvent> activeEvent(const std::string& locationId) const {
        std::shared_lock lock(mutex_);
        auto it = activeEventByLocation_.find(locationId);
        if (it == activeEventByLocation_.end()) return std::nullopt;
        return events_.at(it->second);
    }

    std::vector<RainfallEvent> activeEvents() const {
        std::shared_lock lock(mutex_);
        std::vector<RainfallEvent> result;
        for (const auto& [loc, id] : activeEventByLocation_) {
            result.push_back(events_.at(id));
        }
        return result;
    }

    /**
     * @brief 事件历史（新的在前），locationId 为空时返回全部
     */
    std::vector<RainfallEvent> events(const std::string& locationId = "") const {
        std::shared_lock lock(mutex_);
        std::vector<RainfallEvent> result;
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (locationId.empty() || it->second.locationId == locationId) {
                result.push_back(it->second);
            }
        }
        return result;
    }

    // ==================== 地形快照 ====================

    TerrainSnapshot addSnapshot(TerrainSnapshot snapshot) {
        std::unique_lock lock(mutex_);
        snapshot.id = ++seeds_.snapshot;
        snapshots_[snapshot.id] = snapshot;
        return snapshot;
    }

    void restoreSnapshot(const TerrainSnapshot& snapshot) {
        std::unique_lock lock(mutex_);
        snapshots_[snapshot.id] = snapshot;
        seeds_.snapshot = (std::max)(seeds_.snapshot, snapshot.id);
    }

    std::optional<TerrainSnapshot> snapshot(int64_t id) const {
        std::shared_lock lock(mutex_);
        auto it = snapshots_.find(id);
        if (it == snapshots_.end()) return std::nullopt;
        return it->second;
    }

    /**
     * @brief 采集时间最新的快照（同时间取 ID 较大者）
     */
    std::optional<TerrainSnapshot> latestSnapshot() const {
        std::shared_lock lock(mutex_);
        const TerrainSnapshot* latest = nullptr;
        for (const auto& [id, s] : snapshots_) {
            if (!latest || s.timestamp >= latest->timestamp) latest = &s;
        }
        if (!latest) return std::nullopt;
        return *latest;
    }

    std::vector<TerrainSnapshot> snapshots() const {
        std::shared_lock lock(mutex_);
        std::vector<TerrainSnapshot> result;
        for (auto it = snapshots_.rbegin(); it != snapshots_.rend(); ++it) result.push_back(it->second);
        return result;
    }

    // ==================== 变化检测 ====================

    /**
     * @throws ValidationException 引用的快照不存在
     * @throws ConflictException 同一快照对已有变化检测
     */
    ChangeDetection addChangeDetection(ChangeDetection cd) {
        std::unique_lock lock(mutex_);
        if (!snapshots_.contains(cd.baselineSnapshotId)) {
            throw ValidationException("基准快照不存在: " + std::to_string(cd.baselineSnapshotId));
        }
        if (!snapshots_.contains(cd.comparisonSnapshotId)) {
            throw ValidationException("对比快照不存在: " + std::to_string(cd.comparisonSnapshotId));
        }
        for (const auto& [id, existing] : changeDetections_) {
            if (existing.baselineSnapshotId == cd.baselineSnapshotId
                && existing.comparisonSnapshotId == cd.comparisonSnapshotId) {
                throw ConflictException("快照 #" + std::to_string(cd.baselineSnapshotId) + " → #"
                    + std::to_string(cd.comparisonSnapshotId) + " 的变化检测已存在 (#" + std::to_string(id) + ")");
            }
        }
        cd.id = ++seeds_.changeDetection;
        changeDetections_[cd.id] = cd;
        return cd;
    }

    void restoreChangeDetection(const ChangeDetection& cd) {
        std::unique_lock lock(mutex_);
        changeDetections_[cd.id] = cd;
        seeds_.changeDetection = (std::max)(seeds_.changeDetection, cd.id);
    }

    std::optional<ChangeDetection> changeDetection(int64_t id) const {
        std::shared_lock lock(mutex_);
        auto it = changeDetections_.find(id);
        if (it == changeDetections_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<ChangeDetection> changeDetections() const {
        std::shared_lock lock(mutex_);
        std::vector<ChangeDetection> result;
        for (auto it = changeDetections_.rbegin(); it != changeDetections_.rend(); ++it) {
            result.push_back(it->second);
        }
        return result;
    }

    // ==================== 易发区 ====================

    /**
     * @brief 新增或刷新易发区
     *
     * 刷新时保留已累积的物源贡献，物源可用性由调用方重新计算。
     */
    SourceArea upsertSourceArea(SourceArea area) {
        std::unique_lock lock(mutex_);
        auto it = area.id > 0 ? sourceAreas_.find(area.id) : sourceAreas_.end();
        if (it != sourceAreas_.end()) {
            area.contributions = it->second.contributions;
            area.timestamp = it->second.timestamp;
            area.revision = it->second.revision + 1;
            it->second = area;
        } else {
            if (area.id <= 0) area.id = ++seeds_.sourceArea;
            seeds_.sourceArea = (std::max)(seeds_.sourceArea, area.id);
            area.revision = 1;
            sourceAreas_[area.id] = area;
        }
        return area;
    }

    void restoreSourceArea(const SourceArea& area) {
        std::unique_lock lock(mutex_);
        sourceAreas_[area.id] = area;
        seeds_.sourceArea = (std::max)(seeds_.sourceArea, area.id);
    }

    /**
     * @brief 原子修改易发区（单写者，读者只会看到修改前或修改后的完整副本）
     * @throws NotFoundException 易发区不存在
     */
    SourceArea updateSourceArea(int64_t id, const std::function<void(SourceArea&)>& mutate) {
        std::unique_lock lock(mutex_);
        auto it = sourceAreas_.find(id);
        if (it == sourceAreas_.end()) {
            throw NotFoundException("易发区不存在: " + std::to_string(id));
        }
        SourceArea updated = it->second;
        mutate(updated);
        updated.revision = it->second.revision + 1;
        it->second = updated;
        return updated;
    }

    std::optional<SourceArea> sourceArea(int64_t id) const {
        std::shared_lock lock(mutex_);
        auto it = sourceAreas_.find(id);
        if (it == sourceAreas_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<SourceArea> sourceAreas(std::optional<BoundingBox> bbox = std::nullopt) const {
        std::shared_lock lock(mutex_);
        std::vector<SourceArea> result;
        for (const auto& [id, area] : sourceAreas_) {
            if (bbox && !bbox->intersects(area.geometry.bbox())) continue;
            result.push_back(area);
        }
        return result;
    }

    // ==================== 模拟运行 ====================

    /**
     * @brief 创建 Pending 模拟
     *
     * 检查与插入在同一把锁内完成，并发的重复调度只有一个成功。
     * @throws DuplicateDispatchException 同一 (快照, 降雨事件) 已有未结束的模拟
     */
    SimulationRun createRun(SimulationRun run) {
        std::unique_lock lock(mutex_);
        for (const auto& [id, existing] : runs_) {
            if (existing.isOpen()
                && existing.terrainSnapshotId == run.terrainSnapshotId
                && existing.rainfallEventId == run.rainfallEventId) {
                throw DuplicateDispatchException("快照 #" + std::to_string(run.terrainSnapshotId)
                    + (run.rainfallEventId ? " 与降雨事件 #" + std::to_string(*run.rainfallEventId) : std::string())
                    + " 已有进行中的模拟 #" + std::to_string(id));
            }
        }
        run.id = ++seeds_.run;
        run.status = RunStatus::Pending;
        run.revision = 1;
        runs_[run.id] = run;
        return run;
    }

    void restoreRun(const SimulationRun& run) {
        std::unique_lock lock(mutex_);
        runs_[run.id] = run;
        seeds_.run = (std::max)(seeds_.run, run.id);
    }

    /**
     * @brief 原子修改模拟（比较并交换语义）
     *
     * mutate 内的状态转换非法时抛出异常，存储中的记录保持不变，
     * 因此终态只会被写入一次。
     * @throws NotFoundException 模拟不存在
     * @throws IllegalTransitionException 状态转换非法
     */
    SimulationRun updateRun(int64_t id, const std::function<void(SimulationRun&)>& mutate) {
        std::unique_lock lock(mutex_);
        auto& stored = findRunLocked(id);
        SimulationRun updated = stored;
        mutate(updated);
        updated.revision = stored.revision + 1;
        stored = updated;
        return updated;
    }

    /**
     * @brief 完成模拟并生成风险区（同一临界区内，不存在无风险区的 Completed 模拟）
     *
     * buildZone 在锁内调用，不得访问 SpatialStore。
     */
    std::pair<SimulationRun, RiskZone> completeRun(int64_t id,
                                                   std::optional<std::string> outputPath,
                                                   SimulationMetrics metrics,
                                                   TimePoint now,
                                                   const std::function<RiskZone(const SimulationRun&)>& buildZone) {
        std::unique_lock lock(mutex_);
        auto& stored = findRunLocked(id);
        if (zoneByRun_.contains(id)) {
            throw IllegalTransitionException("模拟 #" + std::to_string(id) + " 已生成风险区");
        }
        SimulationRun updated = stored;
        updated.complete(std::move(outputPath), std::move(metrics), now);

        RiskZone zone = buildZone(updated);
        zone.id = ++seeds_.zone;
        zone.simulationRunId = id;
        zone.riskValue = std::clamp(zone.riskValue, 0.0, 1.0);

        updated.revision = stored.revision + 1;
        stored = updated;
        zones_[zone.id] = zone;
        zoneByRun_[id] = zone.id;
        return {updated, zone};
    }

    std::optional<SimulationRun> run(int64_t id) const {
        std::shared_lock lock(mutex_);
        auto it = runs_.find(id);
        if (it == runs_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<SimulationRun> runs(std::optional<RunStatus> status = std::nullopt) const {
        std::shared_lock lock(mutex_);
        std::vector<SimulationRun> result;
        for (auto it = runs_.rbegin(); it != runs_.rend(); ++it) {
            if (status && it->second.status != *status) continue;
            result.push_back(it->second);
        }
        return result;
    }

    std::vector<SimulationRun> openRuns() const {
        std::shared_lock lock(mutex_);
        std::vector<SimulationRun> result;
        for (const auto& [id, run] : runs_) {
            if (run.isOpen()) result.push_back(run);
        }
        return result;
    }

    /**
     * @brief 该降雨事件是否已有模拟（任意状态）
     */
    bool hasRunForEvent(int64_t eventId) const {
        std::shared_lock lock(mutex_);
        for (const auto& [id, run] : runs_) {
            if (run.rainfallEventId && *run.rainfallEventId == eventId) return true;
        }
        return false;
    }

    // ==================== 风险区 ====================

    /**
     * @brief 恢复风险区
     * @throws IllegalTransitionException 引用的模拟未完成
     */
    void restoreZone(const RiskZone& zone) {
        std::unique_lock lock(mutex_);
        auto it = runs_.find(zone.simulationRunId);
        if (it == runs_.end() || it->second.status != RunStatus::Completed) {
            throw IllegalTransitionException("风险区 #" + std::to_string(zone.id)
                + " 引用的模拟 #" + std::to_string(zone.simulationRunId) + " 未完成");
        }
        zones_[zone.id] = zone;
        zoneByRun_[zone.simulationRunId] = zone.id;
        seeds_.zone = (std::max)(seeds_.zone, zone.id);
    }

    std::vector<RiskZone> zones(std::optional<BoundingBox> bbox = std::nullopt) const {
        std::shared_lock lock(mutex_);
        std::vector<RiskZone> result;
        for (auto it = zones_.rbegin(); it != zones_.rend(); ++it) {
            if (bbox && !bbox->intersects(it->second.geometry.bbox())) continue;
            result.push_back(it->second);
        }
        return result;
    }

    std::optional<RiskZone> zoneForRun(int64_t runId) const {
        std::shared_lock lock(mutex_);
        auto it = zoneByRun_.find(runId);
        if (it == zoneByRun_.end()) return std::nullopt;
        return zones_.at(it->second);
    }

    std::optional<RiskZone> latestZone(const std::string& locationId) const {
        std::shared_lock lock(mutex_);
        for (auto it = zones_.rbegin(); it != zones_.rend(); ++it) {
            if (it->second.locationId == locationId) return it->second;
        }
        return std::nullopt;
    }

    // ==================== 风险评估 ====================

    void recordAssessment(const RiskAssessment& assessment) {
        std::unique_lock lock(mutex_);
        assessmentsByEvent_[assessment.eventId] = assessment;
        assessmentsByLocation_[assessment.locationId] = assessment;
    }

    std::optional<RiskAssessment> assessmentForEvent(int64_t eventId) const {
        std::shared_lock lock(mutex_);
        auto it = assessmentsByEvent_.find(eventId);
        if (it == assessmentsByEvent_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<RiskAssessment> latestAssessment(const std::string& locationId) const {
        std::shared_lock lock(mutex_);
        auto it = assessmentsByLocation_.find(locationId);
        if (it == assessmentsByLocation_.end()) return std::nullopt;
        return it->second;
    }

    // ==================== 告警 ====================

    /**
     * @brief 创建告警，或刷新同类型同实体的未确认告警
     *
     * 刷新时更新消息与元数据、累加次数，级别只升不降。
     */
    AlertUpsert raiseOrRefresh(Alert candidate, TimePoint now) {
        std::unique_lock lock(mutex_);
        auto key = candidate.dedupKey();
        if (auto it = openAlertByKey_.find(key); it != openAlertByKey_.end()) {
            auto& existing = alerts_.at(it->second);
            bool escalated = candidate.severity > existing.severity;
            if (escalated) existing.severity = candidate.severity;
            existing.title = candidate.title;
            existing.message = candidate.message;
            existing.metadata = candidate.metadata;
            existing.updatedAt = now;
            existing.occurrences += 1;
            existing.revision += 1;
            return {existing, false, escalated};
        }

        candidate.id = ++seeds_.alert;
        candidate.timestamp = now;
        candidate.updatedAt = now;
        candidate.acknowledged = false;
        candidate.occurrences = 1;
        candidate.revision = 1;
        alerts_[candidate.id] = candidate;
        openAlertByKey_[key] = candidate.id;
        return {candidate, true, false};
    }

    /**
     * @brief 确认告警（单向）
     * @throws NotFoundException 告警不存在
     * @throws ConflictException 已确认
     */
    Alert acknowledge(int64_t id, const std::string& username, TimePoint now) {
        std::unique_lock lock(mutex_);
        auto it = alerts_.find(id);
        if (it == alerts_.end()) {
            throw NotFoundException("告警不存在: " + std::to_string(id));
        }
        auto& alert = it->second;
        if (alert.acknowledged) {
            throw ConflictException("告警 #" + std::to_string(id) + " 已被 " + alert.acknowledgedBy + " 确认");
        }
        alert.acknowledged = true;
        alert.acknowledgedAt = now;
        alert.acknowledgedBy = username;
        alert.updatedAt = now;
        alert.revision += 1;
        openAlertByKey_.erase(alert.dedupKey());
        return alert;
    }

    void restoreAlert(const Alert& alert) {
        std::unique_lock lock(mutex_);
        alerts_[alert.id] = alert;
        if (!alert.acknowledged) openAlertByKey_[alert.dedupKey()] = alert.id;
        seeds_.alert = (std::max)(seeds_.alert, alert.id);
    }

    std::optional<Alert> alert(int64_t id) const {
        std::shared_lock lock(mutex_);
        auto it = alerts_.find(id);
        if (it == alerts_.end()) return std::nullopt;
        return it->second;
    }

    /**
     * @brief 告警列表（新的在前）
     */
    std::vector<Alert> alerts(bool unacknowledgedOnly = false) const {
        std::shared_lock lock(mutex_);
        std::vector<Alert> result;
        for (auto it = alerts_.rbegin(); it != alerts_.rend(); ++it) {
            if (unacknowledgedOnly && it->second.acknowledged) continue;
            result.push_back(it->second);
        }
        return result;
    }

    // ==================== 保留期清理 ====================

    /**
     * @brief 淘汰 cutoff 之前结束的历史实体（数据库中的记录不受影响）
     *
     * - 已关闭的降雨事件及其评估
     * - 已结束的模拟及其风险区；仍是监测点最新风险区的、关联活跃事件的保留
     * - 已确认的告警
     * 未结束的模拟、活跃事件与未确认告警从不淘汰。
     */
    RetentionReport evictBefore(TimePoint cutoff) {
        std::unique_lock lock(mutex_);
        RetentionReport report;

        std::set<int64_t> activeEventIds;
        for (const auto& [loc, id] : activeEventByLocation_) activeEventIds.insert(id);

        for (auto it = events_.begin(); it != events_.end();) {
            const auto& e = it->second;
            if (!e.isActive && e.endTime.value_or(e.lastObservationAt) <= cutoff) {
                assessmentsByEvent_.erase(it->first);
                it = events_.erase(it);
                ++report.events;
            } else {
                ++it;
            }
        }

        std::set<int64_t> latestZoneIds;
        std::set<std::string> seenLocations;
        for (auto it = zones_.rbegin(); it != zones_.rend(); ++it) {
            if (seenLocations.insert(it->second.locationId).second) latestZoneIds.insert(it->first);
        }

        for (auto it = runs_.begin(); it != runs_.end();) {
            const auto& run = it->second;
            bool expired = run.isTerminal() && run.completedAt.value_or(run.timestamp) <= cutoff;
            bool pinnedByEvent = run.rainfallEventId && activeEventIds.contains(*run.rainfallEventId);
            auto zoneIt = zoneByRun_.find(it->first);
            bool pinnedByZone = zoneIt != zoneByRun_.end() && latestZoneIds.contains(zoneIt->second);
            if (!expired || pinnedByEvent || pinnedByZone) {
                ++it;
                continue;
            }
            if (zoneIt != zoneByRun_.end()) {
                zones_.erase(zoneIt->second);
                zoneByRun_.erase(zoneIt);
                ++report.zones;
            }
            it = runs_.erase(it);
            ++report.runs;
        }

        for (auto it = alerts_.begin(); it != alerts_.end();) {
            const auto& alert = it->second;
            if (alert.acknowledged && alert.acknowledgedAt.value_or(alert.updatedAt) <= cutoff) {
                it = alerts_.erase(it);
                ++report.alerts;
            } else {
                ++it;
            }
        }
        return report;
    }

    /**
     * @brief 各类实体在内存中的数量（运行状况与测试用）
     */
    std::map<std::string, size_t> sizes() const {
        std::shared_lock lock(mutex_);
        size_t observations = 0;
        for (const auto& [loc, series] : observations_) observations += series.size();
        return {
            {"observations", observations},
            {"events", events_.size()},
            {"assessments", assessmentsByEvent_.size()},
            {"runs", runs_.size()},
            {"zones", zones_.size()},
            {"alerts", alerts_.size()},
            {"change_detections", changeDetections_.size()},
        };
    }

private:
    mutable std::shared_mutex mutex_;
    IdSeeds seeds_;

    std::map<std::string, std::deque<WeatherObservation>> observations_;
    std::map<int64_t, RainfallEvent> events_;
    std::map<std::string, int64_t> activeEventByLocation_;
    std::map<int64_t, TerrainSnapshot> snapshots_;
    std::map<int64_t, ChangeDetection> changeDetections_;
    std::map<int64_t, SourceArea> sourceAreas_;
    std::map<int64_t, SimulationRun> runs_;
    std::map<int64_t, RiskZone> zones_;
    std::map<int64_t, int64_t> zoneByRun_;
    std::map<int64_t, RiskAssessment> assessmentsByEvent_;
    std::map<std::string, RiskAssessment> assessmentsByLocation_;
    std::map<int64_t, Alert> alerts_;
    std::map<std::string, int64_t> openAlertByKey_;

    SimulationRun& findRunLocked(int64_t id) {
        auto it = runs_.find(id);
        if (it == runs_.end()) {
            throw NotFoundException("模拟不存在: " + std::to_string(id));
        }
        return it->second;
    }
};
