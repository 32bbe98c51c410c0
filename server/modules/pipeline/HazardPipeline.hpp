#pragma once

#include "PipelineConfig.hpp"
#include "IngestWorkerPool.hpp"
#include "common/domain/EventBus.hpp"
#include "modules/alert/AlertManager.hpp"
#include "modules/weather/domain/Events.hpp"
#include "modules/event/domain/Events.hpp"
#include "modules/risk/domain/Events.hpp"
#include "modules/simulation/domain/Events.hpp"
#include "modules/terrain/domain/Events.hpp"
#include "modules/alert/domain/Events.hpp"

/**
 * @brief 一批观测的接收结果
 */
struct IngestReport {
    int accepted = 0;
    int rejected = 0;
    Json::Value errors{Json::arrayValue};

    void reject(Json::ArrayIndex index, const std::string& error) {
        ++rejected;
        Json::Value item;
        item["index"] = index;
        item["error"] = error;
        errors.append(item);
    }

    Json::Value toJson() const {
        Json::Value json;
        json["accepted"] = accepted;
        json["rejected"] = rejected;
        json["errors"] = errors;
        return json;
    }
};

/**
 * @brief 单条观测在流水线中产生的全部状态变化
 */
struct ObservationOutcome {
    WeatherObservation observation;
    DetectionOutcome detection;
    std::optional<RainfallEvent> assessedEvent;     // 回写评估结果后的活跃事件
    std::optional<RiskAssessment> assessment;
    std::optional<RiskLevel> previousLevel;
    std::vector<AlertUpsert> alerts;
    std::optional<SimulationRun> dispatched;
};

/**
 * @brief 灾害监测流水线
 *
 * 观测 → 聚合器 → 事件检测 → 风险评估 → {模拟调度, 告警}
 * 模拟完成 → 风险区 → 告警；变化检测 → 物源可用性（独立路径）
 *
 * 各组件只在内存中完成状态转换并返回结果，由流水线统一发布领域事件，
 * 持久化与 WebSocket 推送作为 EventBus 订阅者执行。
 *
 * 定时任务（均在主 EventLoop 上触发，以协程执行）：
 * - 事件巡检：关闭超过不活跃间隔的事件
 * - 模拟巡检：取消、超时、轮询执行器（同一时刻只有一轮）
 * - 定时模拟：scheduled_interval_s > 0 时启用
 * - 物源衰减刷新
 * - 保留期清理：内存只保留未结束的实体与保留期内的历史
 */
class HazardPipeline {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;
    using TimePoint = std::chrono::system_clock::time_point;

    static HazardPipeline& instance() {
        static HazardPipeline pipeline;
        return pipeline;
    }

    /**
     * @brief 按配置构建组件（启动前调用，重复调用会丢弃已有的内存状态）
     */
    void configure(const PipelineConfig& config, std::shared_ptr<SimulationExecutor> executor) {
        stop();
        resetComponents();

        config_ = config;
        registry_ = LocationRegistry(config.locations);
        store_ = std::make_unique<SpatialStore>();
        aggregator_ = std::make_unique<RainfallAggregator>();
        detector_ = std::make_unique<RainfallEventDetector>(*store_, config.detector);
        evaluator_ = std::make_unique<RiskEvaluator>(*store_, config.risk, config.detector);
        dispatcher_ = std::make_unique<SimulationDispatcher>(*store_, *evaluator_, std::move(executor),
                                                             config.simulation);
        integrator_ = std::make_unique<ChangeDetectionIntegrator>(*store_, config.changeDetection);
        alertManager_ = std::make_unique<AlertManager>(*store_, AlertConfig{config.changeDetection.terrainChangeAlertM3});

        LOG_INFO << "[Pipeline] Configured with " << config.locations.size() << " monitored locations";
    }

    /**
     * @brief 启动处理线程池与定时任务
     */
    void start() {
        if (!store_) {
            throw std::runtime_error("HazardPipeline not configured");
        }
        if (started_) return;

        workers_.start(config_.ingestWorkerThreads);
        timerLoop_ = drogon::app().getLoop();

        timers_.push_back(every(config_.sweepInterval, "sweep", [this]() -> Task<void> {
            co_await sweepInactive(std::chrono::system_clock::now());
        }));
        timers_.push_back(every(config_.simulation.pollInterval, "supervise", [this]() -> Task<void> {
            co_await superviseSimulations(std::chrono::system_clock::now());
        }));
        if (config_.simulation.scheduledInterval.count() > 0) {
            timers_.push_back(every(config_.simulation.scheduledInterval, "scheduled", [this]() -> Task<void> {
                co_await dispatchScheduled(std::chrono::system_clock::now());
            }));
        }
        timers_.push_back(every(config_.changeDetection.refreshInterval, "refresh", [this]() -> Task<void> {
            co_await refreshMaterial(std::chrono::system_clock::now());
        }));
        timers_.push_back(every(config_.retentionInterval, "retention", [this]() -> Task<void> {
            evictExpired(std::chrono::system_clock::now());
            co_return;
        }));

        started_ = true;
        LOG_INFO << "[Pipeline] Started (sweep " << config_.sweepInterval.count() << "s, poll "
                 << config_.simulation.pollInterval.count() << "s)";
    }

    void stop() {
        if (!started_) return;
        for (auto id : timers_) timerLoop_->invalidateTimer(id);
        timers_.clear();
        workers_.stop();
        started_ = false;
        LOG_INFO << "[Pipeline] Stopped";
    }

    // ==================== 组件访问 ====================

    const PipelineConfig& config() const { return config_; }
    const LocationRegistry& locations() const { return registry_; }
    SpatialStore& store() { return *store_; }
    const SpatialStore& store() const { return *store_; }

    RainfallTotals totals(const std::string& locationId, TimePoint now) const {
        return aggregator_->totals(locationId, now);
    }

    // ==================== 观测接收 ====================

    /**
     * @brief 接收一批观测
     *
     * 每条观测切换到其监测点的处理线程，同步完成聚合、检测、评估与调度决策，
     * 再发布状态变化。格式错误、乱序、重复时间戳的记录计入 rejected。
     */
    Task<IngestReport> ingest(const Json::Value& observations) {
        IngestReport report;
        std::vector<WeatherObservation> accepted;

        for (Json::ArrayIndex i = 0; i < observations.size(); ++i) {
            WeatherObservation obs;
            bool parsed = false;
            try {
                obs = WeatherObservation::fromJson(observations[i]);
                obs.locationId = registry_.resolve(obs.locationId, obs.location).id;
                parsed = true;
            } catch (const AppException& e) {
                report.reject(i, e.getMessage());
            }
            if (!parsed) continue;

            if (auto* loop = workers_.loopFor(obs.locationId)) {
                co_await drogon::switchThreadCoro(loop);
            }

            std::optional<ObservationOutcome> outcome;
            try {
                outcome = processObservation(std::move(obs));
            } catch (const ValidationException& e) {
                LOG_DEBUG << "[Ingest] Observation #" << i << " rejected: " << e.getMessage();
                report.reject(i, e.getMessage());
            } catch (const std::exception& e) {
                LOG_ERROR << "[Ingest] Observation #" << i << " failed in pipeline: " << e.what();
                report.reject(i, e.what());
            }
            if (!outcome) continue;

            ++report.accepted;
            accepted.push_back(outcome->observation);
            co_await publishOutcome(*outcome);
        }

        if (!accepted.empty()) {
            co_await EventBus::instance().publish(ObservationsAccepted{std::move(accepted)});
        }
        if (report.rejected > 0) {
            LOG_INFO << "[Ingest] Batch: " << report.accepted << " accepted, " << report.rejected << " rejected";
        }
        co_return report;
    }

    /**
     * @brief 单条观测的同步处理段（调用方保证同一监测点串行）
     * @throws ValidationException 未知监测点、降雨为负或时间乱序
     */
    ObservationOutcome processObservation(WeatherObservation obs) {
        const auto* location = registry_.find(obs.locationId);
        if (!location) {
            throw ValidationException("未知监测点: " + obs.locationId);
        }
        auto now = std::chrono::system_clock::now();

        auto totals = aggregator_->accept(obs);

        ObservationOutcome out;
        out.observation = store_->addObservation(std::move(obs));
        out.detection = detector_->process(out.observation, totals);

        if (out.detection.closed) {
            if (auto alert = alertManager_->onEventClosed(*out.detection.closed, now)) {
                out.alerts.push_back(std::move(*alert));
            }
        }

        if (const auto* active = out.detection.active()) {
            auto previous = store_->assessmentForEvent(active->id);
            auto assessment = evaluator_->assess(*active, totals, *location, now);
            store_->recordAssessment(assessment);
            if (previous) out.previousLevel = previous->level;

            for (auto& alert : alertManager_->onRiskAssessed(assessment, previous, now)) {
                out.alerts.push_back(std::move(alert));
            }

            out.assessedEvent = detector_->recordAssessment(active->locationId, active->id,
                                                            assessment.triggerProbability,
                                                            assessment.thresholdExceeded);
            if (out.assessedEvent) {
                out.dispatched = dispatcher_->dispatchForThreshold(*out.assessedEvent, now);
            }
            out.assessment = std::move(assessment);
        }
        return out;
    }

    // ==================== 定时任务 ====================

    Task<void> sweepInactive(TimePoint now) {
        for (const auto& event : detector_->closeIfInactive(now)) {
            co_await EventBus::instance().publish(RainfallEventClosed{event});
            if (auto alert = alertManager_->onEventClosed(event, now)) {
                co_await publishAlert(*alert);
            }
        }
    }

    /**
     * @brief 一轮模拟巡检（已有一轮在进行时直接返回）
     */
    Task<void> superviseSimulations(TimePoint now) {
        if (supervising_.exchange(true)) co_return;

        SupervisionOutcome outcome;
        try {
            outcome = co_await dispatcher_->superviseOnce(now);
        } catch (const std::exception& e) {
            LOG_ERROR << "[Dispatcher] Supervision round failed: " << e.what();
        }
        supervising_ = false;

        co_await publishSupervision(outcome);
    }

    Task<void> dispatchScheduled(TimePoint now) {
        if (auto run = dispatcher_->dispatchScheduled(now)) {
            co_await publishDispatched(*run);
        }
    }

    Task<void> refreshMaterial(TimePoint now) {
        for (auto& area : integrator_->refresh(now)) {
            co_await EventBus::instance().publish(SourceAreaUpdated{std::move(area)});
        }
    }

    /**
     * @brief 淘汰超过保留期的已结束事件、模拟与已确认告警
     */
    RetentionReport evictExpired(TimePoint now) {
        auto report = store_->evictBefore(now - config_.retentionWindow);
        if (report.total() > 0) {
            LOG_INFO << "[Pipeline] Retention: evicted " << report.events << " events, " << report.runs
                     << " runs, " << report.zones << " zones, " << report.alerts << " alerts";
        }
        return report;
    }

    // ==================== 操作员操作 ====================

    /**
     * @brief 手动触发模拟（立即返回 Pending 运行，提交在后台进行）
     * @throws ValidationException / DuplicateDispatchException
     */
    Task<SimulationRun> triggerSimulation(DispatchRequest request) {
        auto run = dispatcher_->dispatch(request, std::chrono::system_clock::now());
        co_await publishDispatched(run);
        co_return run;
    }

    /**
     * @brief 协作式取消，并立即发起一轮巡检完成取消
     * @throws NotFoundException / IllegalTransitionException
     */
    Task<SimulationRun> cancelSimulation(int64_t runId) {
        auto run = dispatcher_->requestCancel(runId);
        LOG_INFO << "[Dispatcher] Cancellation requested for run #" << runId;
        co_await EventBus::instance().publish(SimulationUpdated{run});
        drogon::async_run([this]() -> Task<> {
            co_await superviseSimulations(std::chrono::system_clock::now());
        });
        co_return run;
    }

    /**
     * @throws NotFoundException / ConflictException
     */
    Task<Alert> acknowledgeAlert(int64_t alertId, const std::string& username) {
        auto alert = alertManager_->acknowledge(alertId, username, std::chrono::system_clock::now());
        co_await EventBus::instance().publish(AlertAcknowledged{alert});
        co_return alert;
    }

    Task<TerrainSnapshot> ingestSnapshot(TerrainSnapshot snapshot) {
        auto stored = store_->addSnapshot(std::move(snapshot));
        LOG_INFO << "[Integrator] Terrain snapshot #" << stored.id << " (" << stored.versionName << ") ingested";
        co_await EventBus::instance().publish(SnapshotIngested{stored});
        co_return stored;
    }

    /**
     * @throws ValidationException 引用的快照不存在
     */
    Task<SourceArea> upsertSourceArea(SourceArea area) {
        if (area.terrainSnapshotId && !store_->snapshot(*area.terrainSnapshotId)) {
            throw ValidationException("地形快照不存在: " + std::to_string(*area.terrainSnapshotId));
        }
        auto stored = integrator_->upsertSourceArea(std::move(area), std::chrono::system_clock::now());
        co_await EventBus::instance().publish(SourceAreaUpdated{stored});
        co_return stored;
    }

    /**
     * @throws ValidationException 引用的快照不存在
     * @throws ConflictException 同一快照对已有变化检测
     */
    Task<IntegrationOutcome> ingestChangeDetection(ChangeDetection change) {
        auto now = std::chrono::system_clock::now();
        auto outcome = integrator_->ingest(std::move(change), now);

        auto& bus = EventBus::instance();
        co_await bus.publish(ChangeDetectionIngested{outcome.change});
        for (const auto& area : outcome.updatedAreas) {
            co_await bus.publish(SourceAreaUpdated{area});
        }
        if (auto alert = alertManager_->onChangeDetection(outcome.change, now)) {
            co_await publishAlert(*alert);
        }
        co_return outcome;
    }

    // ==================== 当前风险投影 ====================

    /**
     * @brief 每个监测点的当前风险（只读派生：活跃事件评估与最新风险区取较高者）
     */
    Json::Value currentRisk(TimePoint now) const {
        Json::Value items(Json::arrayValue);
        for (const auto& location : registry_.all()) {
            Json::Value item;
            item["location"] = location.toJson();
            item["rainfall"] = aggregator_->totals(location.id, now).toJson();

            RiskLevel level = RiskLevel::Low;
            double value = 0.0;

            auto active = store_->activeEvent(location.id);
            item["active_event"] = active ? active->toJson() : Json::Value();

            auto assessment = store_->latestAssessment(location.id);
            if (assessment && active && assessment->eventId == active->id) {
                item["assessment"] = assessment->toJson();
                level = assessment->level;
                value = assessment->riskValue;
            } else {
                item["assessment"] = Json::Value();
            }

            auto zone = store_->latestZone(location.id);
            item["latest_zone"] = zone ? zone->toJson() : Json::Value();
            if (zone && zone->level > level) {
                level = zone->level;
                value = zone->riskValue;
            }

            item["risk_level"] = riskLevelToString(level);
            item["risk_value"] = value;
            items.append(item);
        }
        return items;
    }

    // ==================== 启动恢复 ====================

    /**
     * @brief 回放历史观测以重建滚动窗口（按时间升序调用）
     */
    void restoreObservation(const WeatherObservation& obs) {
        try {
            aggregator_->accept(obs);
        } catch (const ValidationException& e) {
            LOG_WARN << "[Startup] Observation #" << obs.id << " skipped during replay: " << e.getMessage();
            return;
        }
        store_->restoreObservation(obs);
    }

    /**
     * @brief 恢复完成后对齐状态机，并终结重启前未提交的运行
     */
    Task<void> completeRecovery(TimePoint now) {
        detector_->syncWithStore();
        auto failed = dispatcher_->recoverAfterRestart(now);
        for (const auto& run : failed) {
            co_await EventBus::instance().publish(SimulationFailed{run});
            co_await publishAlert(alertManager_->onRunFailed(run, now));
        }
        LOG_INFO << "[Startup] Recovery complete: " << store_->activeEvents().size() << " active events, "
                 << store_->openRuns().size() << " open runs, " << failed.size() << " interrupted runs failed";
    }

private:
    HazardPipeline() = default;
    ~HazardPipeline() = default;
    HazardPipeline(const HazardPipeline&) = delete;
    HazardPipeline& operator=(const HazardPipeline&) = delete;

    PipelineConfig config_;
    LocationRegistry registry_;
    std::unique_ptr<SpatialStore> store_;
    std::unique_ptr<RainfallAggregator> aggregator_;
    std::unique_ptr<RainfallEventDetector> detector_;
    std::unique_ptr<RiskEvaluator> evaluator_;
    std::unique_ptr<SimulationDispatcher> dispatcher_;
    std::unique_ptr<ChangeDetectionIntegrator> integrator_;
    std::unique_ptr<AlertManager> alertManager_;

    IngestWorkerPool workers_;
    trantor::EventLoop* timerLoop_ = nullptr;
    std::vector<trantor::TimerId> timers_;
    std::atomic<bool> supervising_{false};
    bool started_ = false;

    void resetComponents() {
        alertManager_.reset();
        integrator_.reset();
        dispatcher_.reset();
        evaluator_.reset();
        detector_.reset();
        aggregator_.reset();
        store_.reset();
    }

    trantor::TimerId every(std::chrono::seconds interval, const char* name, std::function<Task<void>()> tick) {
        return timerLoop_->runEvery(static_cast<double>(interval.count()), [name, tick]() {
            drogon::async_run([name, tick]() -> Task<> {
                try {
                    co_await tick();
                } catch (const std::exception& e) {
                    LOG_ERROR << "[Pipeline] Timer task '" << name << "' failed: " << e.what();
                }
            });
        });
    }

    Task<void> publishOutcome(const ObservationOutcome& out) {
        auto& bus = EventBus::instance();
        const auto& d = out.detection;

        if (d.closed) co_await bus.publish(RainfallEventClosed{*d.closed});
        if (d.opened) {
            co_await bus.publish(RainfallEventOpened{out.assessedEvent.value_or(*d.opened)});
        } else if (d.updated) {
            co_await bus.publish(RainfallEventUpdated{out.assessedEvent.value_or(*d.updated)});
        }
        if (out.assessment) co_await bus.publish(RiskAssessed{*out.assessment, out.previousLevel});
        for (const auto& alert : out.alerts) co_await publishAlert(alert);
        if (out.dispatched) co_await publishDispatched(*out.dispatched);
    }

    Task<void> publishDispatched(const SimulationRun& run) {
        co_await EventBus::instance().publish(SimulationDispatched{run});

        int64_t runId = run.id;
        drogon::async_run([this, runId]() -> Task<> {
            SupervisionOutcome outcome;
            try {
                outcome = co_await dispatcher_->launch(runId);
            } catch (const std::exception& e) {
                LOG_ERROR << "[Dispatcher] Launch of run #" << runId << " failed: " << e.what();
            }
            co_await publishSupervision(outcome);
        });
    }

    Task<void> publishSupervision(const SupervisionOutcome& outcome) {
        auto& bus = EventBus::instance();
        auto now = std::chrono::system_clock::now();

        for (const auto& run : outcome.updated) {
            co_await bus.publish(SimulationUpdated{run});
        }
        for (const auto& [run, zone] : outcome.completed) {
            co_await bus.publish(SimulationCompleted{run, zone});
            if (auto alert = alertManager_->onZoneCreated(run, zone, now)) {
                co_await publishAlert(*alert);
            }
        }
        for (const auto& run : outcome.failed) {
            co_await bus.publish(SimulationFailed{run});
            co_await publishAlert(alertManager_->onRunFailed(run, now));
        }
    }

    Task<void> publishAlert(const AlertUpsert& upsert) {
        if (upsert.created) {
            co_await EventBus::instance().publish(AlertRaised{upsert.alert});
        } else {
            co_await EventBus::instance().publish(AlertRefreshed{upsert.alert, upsert.escalated});
        }
    }
};
