#pragma once

#include "SimulationExecutor.hpp"
#include "common/store/SpatialStore.hpp"
#include "modules/risk/domain/RiskEvaluator.hpp"

/**
 * @brief 模拟调度参数
 */
struct SimulationConfig {
    std::string executorUrl;
    std::string modelName = "gpp";
    std::string modelVersion = "1.0";
    std::chrono::seconds timeout{3600};
    std::chrono::seconds pollInterval{15};
    std::chrono::seconds scheduledInterval{0};     // 0 表示不启用定时模拟
    Json::Value defaultParameters{Json::objectValue};
};

/**
 * @brief 调度请求
 */
struct DispatchRequest {
    SimulationTrigger trigger = ManualTrigger{};
    std::optional<int64_t> terrainSnapshotId;      // 缺省使用最新快照
    std::optional<int64_t> rainfallEventId;
    Json::Value parameters{Json::objectValue};
};

/**
 * @brief 一次提交或巡检产生的状态变化
 */
struct SupervisionOutcome {
    std::vector<SimulationRun> updated;            // 非终态变化（已提交）
    std::vector<std::pair<SimulationRun, RiskZone>> completed;
    std::vector<SimulationRun> failed;

    void merge(SupervisionOutcome other) {
        for (auto& r : other.updated) updated.push_back(std::move(r));
        for (auto& c : other.completed) completed.push_back(std::move(c));
        for (auto& f : other.failed) failed.push_back(std::move(f));
    }

    bool empty() const { return updated.empty() && completed.empty() && failed.empty(); }
};

/**
 * @brief 模拟调度器
 *
 * dispatch 只在存储中创建 Pending 运行并立即返回；提交与轮询在协程中进行，
 * 不阻塞观测处理。终态写入走 SpatialStore 的比较并交换，
 * 并发的巡检/取消/完成中只有第一个生效，其余记录日志后忽略。
 *
 * 超时与失败的运行不会自动重试，重新模拟需要操作员手动触发。
 */
class SimulationDispatcher {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;
    using TimePoint = std::chrono::system_clock::time_point;

    SimulationDispatcher(SpatialStore& store, const RiskEvaluator& evaluator,
                         std::shared_ptr<SimulationExecutor> executor, SimulationConfig config)
        : store_(store), evaluator_(evaluator)
        , executor_(std::move(executor)), config_(std::move(config)) {}

    const SimulationConfig& config() const { return config_; }

    /**
     * @brief 创建 Pending 运行
     * @throws ValidationException 快照/事件不存在，或没有任何快照
     * @throws DuplicateDispatchException 同一 (快照, 事件) 已有未结束的运行
     */
    SimulationRun dispatch(const DispatchRequest& request, TimePoint now) {
        SimulationRun run;
        run.timestamp = now;
        run.trigger = request.trigger;
        run.modelName = config_.modelName;
        run.modelVersion = config_.modelVersion;

        std::optional<TerrainSnapshot> snapshot;
        if (request.terrainSnapshotId) {
            snapshot = store_.snapshot(*request.terrainSnapshotId);
            if (!snapshot) {
                throw ValidationException("地形快照不存在: " + std::to_string(*request.terrainSnapshotId));
            }
        } else {
            snapshot = store_.latestSnapshot();
            if (!snapshot) throw ValidationException("没有可用的地形快照");
        }
        run.terrainSnapshotId = snapshot->id;

        Json::Value parameters = config_.defaultParameters.isObject()
            ? config_.defaultParameters : Json::Value(Json::objectValue);
        for (const auto& key : request.parameters.getMemberNames()) {
            parameters[key] = request.parameters[key];
        }
        parameters["dem_path"] = snapshot->demPath;
        parameters["resolution_m"] = snapshot->resolutionM;

        if (request.rainfallEventId) {
            auto event = store_.event(*request.rainfallEventId);
            if (!event) {
                throw ValidationException("降雨事件不存在: " + std::to_string(*request.rainfallEventId));
            }
            run.rainfallEventId = event->id;
            run.locationId = event->locationId;
            parameters["rainfall_total_mm"] = event->totalRainfallMm;
            parameters["rainfall_max_intensity_mm_hr"] = event->maxIntensityMmHr;
            parameters["rainfall_duration_minutes"] = event->durationMinutes;
        }
        run.parameters = parameters;

        auto created = store_.createRun(std::move(run));
        LOG_INFO << "[Dispatcher] Run #" << created.id << " dispatched (" << triggerTypeName(created.trigger)
                 << ", snapshot #" << created.terrainSnapshotId
                 << (created.rainfallEventId ? ", event #" + std::to_string(*created.rainfallEventId) : std::string())
                 << ")";
        return created;
    }

    /**
     * @brief 活跃事件超过阈值且尚无模拟时自动调度
     */
    std::optional<SimulationRun> dispatchForThreshold(const RainfallEvent& event, TimePoint now) {
        if (!event.isActive || !event.thresholdExceeded || store_.hasRunForEvent(event.id)) {
            return std::nullopt;
        }
        DispatchRequest request;
        request.trigger = ThresholdTrigger{event.id};
        request.rainfallEventId = event.id;
        try {
            return dispatch(request, now);
        } catch (const DuplicateDispatchException& e) {
            LOG_DEBUG << "[Dispatcher] Threshold dispatch for event #" << event.id << " skipped: " << e.what();
        } catch (const ValidationException& e) {
            LOG_WARN << "[Dispatcher] Threshold dispatch for event #" << event.id << " not possible: " << e.what();
        }
        return std::nullopt;
    }

    /**
     * @brief 定时调度（最新快照，不关联降雨事件）
     */
    std::optional<SimulationRun> dispatchScheduled(TimePoint now) {
        DispatchRequest request;
        request.trigger = ScheduledTrigger{now};
        try {
            return dispatch(request, now);
        } catch (const DuplicateDispatchException& e) {
            LOG_DEBUG << "[Dispatcher] Scheduled dispatch skipped: " << e.what();
        } catch (const ValidationException& e) {
            LOG_WARN << "[Dispatcher] Scheduled dispatch not possible: " << e.what();
        }
        return std::nullopt;
    }

    /**
     * @brief 向执行器提交 Pending 运行
     */
    Task<SupervisionOutcome> launch(int64_t runId) {
        SupervisionOutcome outcome;
        auto run = store_.run(runId);
        if (!run || run->status != RunStatus::Pending) co_return outcome;

        std::string externalId;
        try {
            externalId = co_await executor_->submit(run->parameters, run->modelName, run->modelVersion);
        } catch (const std::exception& e) {
            LOG_ERROR << "[Dispatcher] Run #" << runId << " submit failed: " << e.what();
            if (auto failed = tryFail(runId, std::string("submit failed: ") + e.what(),
                                      std::chrono::system_clock::now())) {
                outcome.failed.push_back(std::move(*failed));
            }
            co_return outcome;
        }

        bool endedWhileSubmitting = false;
        try {
            auto now = std::chrono::system_clock::now();
            outcome.updated.push_back(store_.updateRun(runId, [&](SimulationRun& r) {
                r.markRunning(externalId, now);
            }));
            LOG_INFO << "[Dispatcher] Run #" << runId << " submitted as " << externalId;
        } catch (const IllegalTransitionException& e) {
            LOG_WARN << "[Dispatcher] Run #" << runId << " ended while submitting: " << e.what();
            endedWhileSubmitting = true;
        }
        // 提交期间已被取消或判定超时，通知执行器停止
        if (endedWhileSubmitting) co_await cancelQuietly(runId, externalId);
        co_return outcome;
    }

    /**
     * @brief 巡检所有未结束的运行：取消、超时、轮询
     */
    Task<SupervisionOutcome> superviseOnce(TimePoint now) {
        SupervisionOutcome outcome;
        for (const auto& run : store_.openRuns()) {
            if (run.cancelRequested) {
                if (run.status == RunStatus::Running) co_await cancelQuietly(run.id, run.externalRunId);
                if (auto failed = tryFail(run.id, "cancelled by operator", now)) {
                    outcome.failed.push_back(std::move(*failed));
                }
                continue;
            }

            auto startedAt = run.startedAt.value_or(run.timestamp);
            if (now - startedAt > config_.timeout) {
                LOG_WARN << "[Dispatcher] Run #" << run.id << " exceeded timeout of "
                         << config_.timeout.count() << "s";
                if (run.status == RunStatus::Running) co_await cancelQuietly(run.id, run.externalRunId);
                if (auto failed = tryFail(run.id, "timeout after " + std::to_string(config_.timeout.count()) + "s", now)) {
                    outcome.failed.push_back(std::move(*failed));
                }
                continue;
            }

            if (run.status != RunStatus::Running) continue;

            ExecutorStatus status;
            try {
                status = co_await executor_->poll(run.externalRunId);
            } catch (const std::exception& e) {
                // 轮询失败不改变运行状态，等待下次巡检或超时
                LOG_WARN << "[Dispatcher] Poll failed for run #" << run.id << ": " << e.what();
                continue;
            }

            if (status.status == RunStatus::Completed) {
                if (auto done = tryComplete(run, std::move(status), now)) {
                    outcome.completed.push_back(std::move(*done));
                }
            } else if (status.status == RunStatus::Failed) {
                auto message = status.errorMessage.value_or("executor reported failure");
                if (auto failed = tryFail(run.id, message, now)) outcome.failed.push_back(std::move(*failed));
            }
        }
        co_return outcome;
    }

    /**
     * @brief 请求取消（协作式，由下一次巡检完成）
     * @throws NotFoundException 运行不存在
     * @throws IllegalTransitionException 运行已结束
     */
    SimulationRun requestCancel(int64_t runId) {
        return store_.updateRun(runId, [](SimulationRun& r) {
            if (r.isTerminal()) {
                throw IllegalTransitionException("模拟 #" + std::to_string(r.id) + " 已结束，无法取消");
            }
            r.cancelRequested = true;
        });
    }

    /**
     * @brief 重启恢复：从未提交的 Pending 运行判定失败，Running 运行继续巡检
     */
    std::vector<SimulationRun> recoverAfterRestart(TimePoint now) {
        std::vector<SimulationRun> failed;
        for (const auto& run : store_.openRuns()) {
            if (run.status != RunStatus::Pending) continue;
            if (auto f = tryFail(run.id, "dispatch interrupted by restart", now)) failed.push_back(std::move(*f));
        }
        return failed;
    }

private:
    SpatialStore& store_;
    const RiskEvaluator& evaluator_;
    std::shared_ptr<SimulationExecutor> executor_;
    SimulationConfig config_;

    std::optional<SimulationRun> tryFail(int64_t runId, const std::string& error, TimePoint now) {
        try {
            auto failed = store_.updateRun(runId, [&](SimulationRun& r) { r.fail(error, now); });
            LOG_WARN << "[Dispatcher] Run #" << runId << " failed: " << error;
            return failed;
        } catch (const IllegalTransitionException& e) {
            LOG_DEBUG << "[Dispatcher] Run #" << runId << " already terminal: " << e.what();
        }
        return std::nullopt;
    }

    std::optional<std::pair<SimulationRun, RiskZone>> tryComplete(const SimulationRun& run,
                                                                  ExecutorStatus status, TimePoint now) {
        std::optional<RiskAssessment> assessment;
        if (run.rainfallEventId) assessment = store_.assessmentForEvent(*run.rainfallEventId);

        GeoPolygon extent;
        if (auto snapshot = store_.snapshot(run.terrainSnapshotId)) extent = snapshot->extent;

        try {
            auto result = store_.completeRun(run.id, std::move(status.outputPath), std::move(status.metrics), now,
                [&](const SimulationRun& completed) {
                    return evaluator_.materializeZone(completed, assessment, extent, now);
                });
            LOG_INFO << "[Dispatcher] Run #" << run.id << " completed, risk zone #" << result.second.id
                     << " (" << riskLevelToString(result.second.level) << ")";
            return result;
        } catch (const IllegalTransitionException& e) {
            LOG_DEBUG << "[Dispatcher] Run #" << run.id << " completion ignored: " << e.what();
        }
        return std::nullopt;
    }

    Task<void> cancelQuietly(int64_t runId, const std::string& externalId) {
        if (externalId.empty()) co_return;
        try {
            co_await executor_->cancel(externalId);
        } catch (const std::exception& e) {
            LOG_WARN << "[Dispatcher] Cancel signal for run #" << runId << " failed: " << e.what();
        }
    }
};
