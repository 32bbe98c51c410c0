#pragma once

#include "RiskZone.hpp"
#include "common/store/SpatialStore.hpp"
#include "common/utils/Constants.hpp"
#include "modules/event/domain/RainfallEventDetector.hpp"
#include "modules/weather/domain/MonitoredLocation.hpp"

/**
 * @brief 风险评估参数
 */
struct RiskConfig {
    RiskThresholds thresholds;
    double fieldCapacityMm = 100.0;          // 7 天降雨达到该值视为饱和
    double antecedentGain = 0.4;             // 前期降雨对超越比的放大系数
    double logisticSteepness = 4.0;
    double weightTrigger = 1.0;
    double weightSusceptibility = 0.5;
    double weightMaterial = 0.5;
    double defaultSusceptibility = 0.5;
    double defaultMaterialAvailability = 0.5;
    double recommendSaturation = Constants::SATURATION_RECOMMEND_SIMULATION;
    double baseCriticalSlopeDeg = 35.0;      // 干燥条件下的临界坡度
    double slopeSaturationReduction = 0.2;   // 完全饱和时临界坡度降低的比例
    double antecedentDecay = 0.84;           // 有效前期降雨的逐日衰减系数 k
};

/**
 * @brief 风险评估器
 *
 * 纯计算：只读取 SpatialStore 中易发区的一致副本，不修改任何状态。
 *
 *   I_thr = alpha * max(D, 1h)^-beta
 *   E     = I_max / I_thr * (1 + gain * min(前期降雨 / 田间持水量, 1))
 *   p     = 1 / (1 + exp(-k * (E - 1)))
 *   risk  = clamp(p^wt * susceptibility^ws * material^wm, 0, 1)
 *
 *   θc    = θ0 * (1 - r * saturation)
 *   EA    = Σ k^i * P_i  (i = 1..13，P_i 为往前第 i 天的降雨)
 *
 * 多个易发区时取风险最大者。坡度已知且低于 θc 的易发区不会起动，其触发概率按 0 计。
 * 易发性或物源缺失时使用默认值并标记为降级。
 */
class RiskEvaluator {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    RiskEvaluator(const SpatialStore& store, RiskConfig config, DetectorConfig idCurve)
        : store_(store), config_(std::move(config)), idCurve_(std::move(idCurve)) {}

    const RiskConfig& config() const { return config_; }

    RiskAssessment assess(const RainfallEvent& event, const RainfallTotals& totals,
                          const MonitoredLocation& location, TimePoint now) const {
        RiskAssessment a;
        a.eventId = event.id;
        a.locationId = event.locationId;
        a.assessedAt = now;

        a.thresholdIntensityMmHr = idCurve_.idThreshold(event.durationHours());
        a.antecedentMm = (std::max)(totals.last7dMm - event.totalRainfallMm, 0.0);
        a.antecedent14dMm = (std::max)(totals.last14dMm - event.totalRainfallMm, 0.0);
        a.effectiveAntecedentMm = effectiveAntecedent(totals);
        double moisture = (std::min)(a.antecedentMm / config_.fieldCapacityMm, 1.0);
        a.exceedance = event.maxIntensityMmHr / a.thresholdIntensityMmHr
                       * (1.0 + config_.antecedentGain * moisture);
        a.triggerProbability = logistic(a.exceedance);
        a.saturation = std::clamp(totals.last7dMm / config_.fieldCapacityMm, 0.0, 1.0);
        a.criticalSlopeDeg = config_.baseCriticalSlopeDeg * (1.0 - config_.slopeSaturationReduction * a.saturation);

        auto candidates = candidateAreas(location);
        if (candidates.areas.empty()) {
            a.susceptibility = config_.defaultSusceptibility;
            a.materialAvailability = config_.defaultMaterialAvailability;
            a.riskValue = combine(a.triggerProbability, a.susceptibility, a.materialAvailability);
            a.degraded = true;
            a.degradedReason = candidates.gap.empty() ? "监测点范围内没有易发区" : candidates.gap;
        } else {
            bool first = true;
            for (const auto& area : candidates.areas) {
                std::string gap;
                double s = inputOrDefault(area.susceptibility, config_.defaultSusceptibility,
                                          "易发区 #" + std::to_string(area.id) + " 缺少易发性评分", gap);
                double m = inputOrDefault(area.materialAvailability, config_.defaultMaterialAvailability,
                                          "易发区 #" + std::to_string(area.id) + " 缺少物源数据", gap);
                bool belowCritical = area.slopeDeg && *area.slopeDeg < a.criticalSlopeDeg;
                if (belowCritical) ++a.gatedSourceAreas;
                double risk = combine(belowCritical ? 0.0 : a.triggerProbability, s, m);
                if (first || risk > a.riskValue) {
                    first = false;
                    a.sourceAreaId = area.id;
                    a.susceptibility = s;
                    a.materialAvailability = m;
                    a.riskValue = risk;
                    a.degraded = !gap.empty();
                    a.degradedReason = gap;
                }
            }
            if (!candidates.gap.empty() && !a.degraded) {
                a.degraded = true;
                a.degradedReason = candidates.gap;
            }
        }

        a.level = config_.thresholds.classify(a.riskValue);
        a.thresholdExceeded = event.thresholdExceeded
                              || event.maxIntensityMmHr >= a.thresholdIntensityMmHr;
        a.simulationRecommended = a.level >= RiskLevel::High || a.thresholdExceeded
                                  || a.saturation >= config_.recommendSaturation;
        a.triggerReason = triggerReason(a, candidates.areas.size());
        return a;
    }

    /**
     * @brief 由完成的模拟输出生成风险区
     *
     * 几何取模拟足迹，缺省时取地形快照范围；无评估（手动/定时运行）时
     * 按"已触发"情景使用默认易发性与物源。不访问 SpatialStore。
     */
    RiskZone materializeZone(const SimulationRun& run,
                             const std::optional<RiskAssessment>& assessment,
                             const GeoPolygon& fallbackExtent,
                             TimePoint now) const {
        RiskZone zone;
        zone.simulationRunId = run.id;
        zone.locationId = run.locationId;
        zone.timestamp = now;
        zone.geometry = run.metrics.footprint.value_or(fallbackExtent);

        double baseRisk;
        if (assessment) {
            zone.triggerProbability = assessment->triggerProbability;
            baseRisk = assessment->riskValue;
        } else {
            zone.triggerProbability = 1.0;
            baseRisk = combine(1.0, config_.defaultSusceptibility, config_.defaultMaterialAvailability);
        }

        zone.runoutProbability = std::clamp(run.metrics.runoutProbability.value_or(1.0), 0.0, 1.0);
        zone.riskValue = std::clamp(baseRisk * zone.runoutProbability, 0.0, 1.0);
        zone.level = config_.thresholds.classify(zone.riskValue);
        zone.flowIntensity = run.metrics.flowIntensity.value_or(run.metrics.maxVelocityMs.value_or(0.0));
        zone.affectedAreaM2 = run.metrics.runoutAreaM2.value_or(
            zone.geometry.empty() ? 0.0 : Geo::areaM2(zone.geometry));

        zone.metadata["model_name"] = run.modelName;
        zone.metadata["model_version"] = run.modelVersion;
        zone.metadata["conditional_on_trigger"] = !assessment.has_value();
        if (assessment && assessment->degraded) zone.metadata["degraded"] = true;
        return zone;
    }

    double combine(double triggerProbability, double susceptibility, double material) const {
        double v = std::pow(std::clamp(triggerProbability, 0.0, 1.0), config_.weightTrigger)
                 * std::pow(std::clamp(susceptibility, 0.0, 1.0), config_.weightSusceptibility)
                 * std::pow(std::clamp(material, 0.0, 1.0), config_.weightMaterial);
        if (!std::isfinite(v)) return 0.0;
        return std::clamp(v, 0.0, 1.0);
    }

    /**
     * @brief 有效前期降雨：当天之前 13 天的逐日降雨按 k^i 衰减求和
     */
    double effectiveAntecedent(const RainfallTotals& totals) const {
        double sum = 0.0;
        double weight = 1.0;
        for (size_t i = 1; i < totals.dailyMm.size(); ++i) {
            weight *= config_.antecedentDecay;
            sum += weight * totals.dailyMm[i];
        }
        return sum;
    }

private:
    struct Candidates {
        std::vector<SourceArea> areas;
        std::string gap;
    };

    const SpatialStore& store_;
    RiskConfig config_;
    DetectorConfig idCurve_;

    double logistic(double exceedance) const {
        return 1.0 / (1.0 + std::exp(-config_.logisticSteepness * (exceedance - 1.0)));
    }

    Candidates candidateAreas(const MonitoredLocation& location) const {
        Candidates result;
        if (!location.sourceAreaIds.empty()) {
            for (auto id : location.sourceAreaIds) {
                try {
                    result.areas.push_back(requireArea(id));
                } catch (const IntegrationGapException& e) {
                    LOG_WARN << "[Risk] " << location.id << ": " << e.what();
                    result.gap = e.what();
                }
            }
            return result;
        }
        for (auto& area : store_.sourceAreas()) {
            if (area.geometry.empty()) continue;
            if (Geo::haversineMeters(area.geometry.centroid(), location.point) <= location.radiusM) {
                result.areas.push_back(std::move(area));
            }
        }
        return result;
    }

    SourceArea requireArea(int64_t id) const {
        auto area = store_.sourceArea(id);
        if (!area) throw IntegrationGapException("易发区 #" + std::to_string(id) + " 不存在");
        return *area;
    }

    /**
     * @brief 建议模拟的依据（不建议时说明原因）
     */
    std::string triggerReason(const RiskAssessment& a, size_t areaCount) const {
        auto fixed2 = [](double v) {
            std::ostringstream os;
            os << std::fixed << std::setprecision(2) << v;
            return os.str();
        };
        std::vector<std::string> reasons;
        if (a.level >= RiskLevel::High) reasons.push_back("风险等级 " + riskLevelToString(a.level));
        if (a.thresholdExceeded) reasons.push_back("超过 I-D 阈值 (" + fixed2(a.exceedance) + ")");
        if (a.saturation >= config_.recommendSaturation) {
            reasons.push_back("土壤饱和度高 (" + fixed2(a.saturation) + ")");
        }
        if (reasons.empty()) {
            if (areaCount > 0 && a.gatedSourceAreas == static_cast<int>(areaCount)) {
                return "易发区坡度均低于临界坡度 " + fixed2(a.criticalSlopeDeg) + "°";
            }
            return "风险低于模拟阈值";
        }
        std::string joined;
        for (const auto& r : reasons) {
            if (!joined.empty()) joined += "; ";
            joined += r;
        }
        return joined;
    }

    /**
     * @brief 读取评估输入，缺失时回退到默认值并记录缺口
     */
    static double inputOrDefault(const std::optional<double>& value, double fallback,
                                 const std::string& gapMessage, std::string& gap) {
        if (value) return *value;
        if (gap.empty()) gap = gapMessage;
        return fallback;
    }
};
