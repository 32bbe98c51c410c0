#pragma once

#include "common/store/SpatialStore.hpp"
#include "modules/weather/domain/RainfallAggregator.hpp"

/**
 * @brief 降雨事件检测参数
 */
struct DetectorConfig {
    double qualifyingRainfallMm = 0.1;       // 合格观测：降雨量或雨强达到其一
    double qualifyingIntensityMmHr = 0.5;
    double onsetIntensityMmHr = 10.0;        // 起始：瞬时雨强或滚动降雨量达到其一
    double onsetRainfallMm = 10.0;
    RainWindow onsetWindow = RainWindow::OneDay;
    std::chrono::seconds inactivityGap{7200};
    double triggerRainfallMm = 10.0;         // 触发阈值（滚动降雨量），缺省与起始累计阈值相同
    RainWindow triggerWindow = RainWindow::OneDay;
    double idAlpha = 14.0;                   // I-D 曲线 I = alpha * D^-beta
    double idBeta = 0.4;

    /**
     * @brief 持续 durationHours 小时的降雨对应的临界雨强（D 不小于 1 小时）
     */
    double idThreshold(double durationHours) const {
        return idAlpha * std::pow((std::max)(durationHours, 1.0), -idBeta);
    }
};

enum class DetectorState {
    Idle,
    Active
};

inline std::string detectorStateToString(DetectorState state) {
    switch (state) {
        case DetectorState::Idle:   return "idle";
        case DetectorState::Active: return "active";
    }
    return "idle";
}

/**
 * @brief 一次检测的结果
 *
 * 同一条观测可能先因间隔超时关闭旧事件，再开启新事件。
 */
struct DetectionOutcome {
    bool qualifying = false;
    std::optional<RainfallEvent> closed;
    std::optional<RainfallEvent> opened;
    std::optional<RainfallEvent> updated;

    /** 本条观测之后该监测点的活跃事件 */
    const RainfallEvent* active() const {
        if (opened) return &*opened;
        if (updated) return &*updated;
        return nullptr;
    }
};

/**
 * @brief 降雨事件检测器
 *
 * 每个监测点一个 Idle/Active 状态机：
 *   Idle   →[onset]→ Active     开启新事件，start_time 为触发观测时间
 *   Active →[extend]→ Active    合格观测累计到当前事件
 *   Active →[gap]→ Idle         超过不活跃间隔，end_time 为最后一条合格观测时间
 *
 * 间隔判定按 (t - 最后合格观测) > gap，恰好等于 gap 仍视为延续。
 * 同一监测点的观测处理与定时巡检由监测点锁串行化。
 */
class RainfallEventDetector {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    RainfallEventDetector(SpatialStore& store, DetectorConfig config)
        : store_(store), config_(std::move(config)) {}

    const DetectorConfig& config() const { return config_; }

    /**
     * @brief 处理一条已被聚合器接收的观测
     * @param totals 以观测时间为基准的滚动降雨量（含该观测）
     */
    DetectionOutcome process(const WeatherObservation& obs, const RainfallTotals& totals) {
        auto& state = stateFor(obs.locationId);
        std::lock_guard lock(state.mutex);

        DetectionOutcome outcome;
        outcome.qualifying = isQualifying(obs);

        auto active = store_.activeEvent(obs.locationId);
        if (active && obs.timestamp - active->lastObservationAt > config_.inactivityGap) {
            outcome.closed = closeLocked(state, *active, "gap");
            active.reset();
        }

        if (!outcome.qualifying) return outcome;

        bool exceeded = exceedsTrigger(obs, totals, active ? active->startTime : obs.timestamp);

        if (active) {
            active->absorb(obs.timestamp, obs.rainfallMm, obs.intensityMmHr);
            active->thresholdExceeded = active->thresholdExceeded || exceeded;
            outcome.updated = store_.saveEvent(*active);
            return outcome;
        }

        if (obs.intensityMmHr >= config_.onsetIntensityMmHr
            || totals.of(config_.onsetWindow) >= config_.onsetRainfallMm) {
            RainfallEvent event;
            event.locationId = obs.locationId;
            event.startTime = obs.timestamp;
            event.lastObservationAt = obs.timestamp;
            event.absorb(obs.timestamp, obs.rainfallMm, obs.intensityMmHr);
            event.thresholdExceeded = exceeded;
            outcome.opened = store_.openEvent(event);
            transition(state, obs.locationId, DetectorState::Active, "onset");
            LOG_INFO << "[Detector] Rainfall event #" << outcome.opened->id << " opened at "
                     << obs.locationId << " (" << TimestampHelper::toIso(obs.timestamp) << ")";
        }
        return outcome;
    }

    /**
     * @brief 关闭超过不活跃间隔的事件（按墙钟时间，与观测到达顺序无关）
     * @return 被关闭的事件
     */
    std::vector<RainfallEvent> closeIfInactive(TimePoint now) {
        std::vector<RainfallEvent> closed;
        for (const auto& candidate : store_.activeEvents()) {
            auto& state = stateFor(candidate.locationId);
            std::lock_guard lock(state.mutex);

            // 加锁后重新读取，期间可能已被观测延续或关闭
            auto active = store_.activeEvent(candidate.locationId);
            if (!active || now - active->lastObservationAt <= config_.inactivityGap) continue;
            closed.push_back(closeLocked(state, *active, "timeout"));
        }
        return closed;
    }

    /**
     * @brief 回写风险评估结果（触发概率；I-D 超越只置位不清除）
     * @return 事件仍为活跃时返回更新后的事件
     */
    std::optional<RainfallEvent> recordAssessment(const std::string& locationId, int64_t eventId,
                                                  double probability, bool thresholdExceeded) {
        auto& state = stateFor(locationId);
        std::lock_guard lock(state.mutex);
        auto active = store_.activeEvent(locationId);
        if (!active || active->id != eventId) return std::nullopt;
        active->triggerProbability = probability;
        active->thresholdExceeded = active->thresholdExceeded || thresholdExceeded;
        return store_.saveEvent(*active);
    }

    DetectorState state(const std::string& locationId) {
        auto& state = stateFor(locationId);
        std::lock_guard lock(state.mutex);
        return state.current;
    }

    /**
     * @brief 启动恢复后与存储中的活跃事件对齐状态机
     */
    void syncWithStore() {
        for (const auto& event : store_.activeEvents()) {
            auto& state = stateFor(event.locationId);
            std::lock_guard lock(state.mutex);
            state.current = DetectorState::Active;
        }
    }

private:
    struct LocationState {
        std::mutex mutex;
        DetectorState current = DetectorState::Idle;
    };

    SpatialStore& store_;
    DetectorConfig config_;
    std::map<std::string, std::unique_ptr<LocationState>> states_;
    std::shared_mutex statesMutex_;

    bool isQualifying(const WeatherObservation& obs) const {
        return obs.rainfallMm >= config_.qualifyingRainfallMm
            || obs.intensityMmHr >= config_.qualifyingIntensityMmHr;
    }

    bool exceedsTrigger(const WeatherObservation& obs, const RainfallTotals& totals, TimePoint eventStart) const {
        if (totals.of(config_.triggerWindow) >= config_.triggerRainfallMm) return true;
        double hours = std::chrono::duration<double, std::ratio<3600>>(obs.timestamp - eventStart).count();
        return obs.intensityMmHr >= config_.idThreshold(hours);
    }

    RainfallEvent closeLocked(LocationState& state, RainfallEvent event, const char* reason) {
        event.close();
        auto saved = store_.saveEvent(event);
        transition(state, event.locationId, DetectorState::Idle, reason);
        LOG_INFO << "[Detector] Rainfall event #" << saved.id << " closed at " << saved.locationId
                 << ": " << saved.totalRainfallMm << " mm in " << saved.durationMinutes << " min"
                 << (saved.thresholdExceeded ? ", threshold exceeded" : "");
        return saved;
    }

    static void transition(LocationState& state, const std::string& locationId,
                           DetectorState to, const char* event) {
        LOG_DEBUG << "RainfallEventFSM[" << locationId << "]: " << detectorStateToString(state.current)
                  << " →[" << event << "]→ " << detectorStateToString(to);
        state.current = to;
    }

    LocationState& stateFor(const std::string& locationId) {
        {
            std::shared_lock lock(statesMutex_);
            auto it = states_.find(locationId);
            if (it != states_.end()) return *it->second;
        }
        std::unique_lock lock(statesMutex_);
        auto& slot = states_[locationId];
        if (!slot) slot = std::make_unique<LocationState>();
        return *slot;
    }
};
