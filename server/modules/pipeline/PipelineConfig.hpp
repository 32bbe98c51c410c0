#pragma once

#include "modules/weather/domain/MonitoredLocation.hpp"
#include "modules/event/domain/RainfallEventDetector.hpp"
#include "modules/risk/domain/RiskEvaluator.hpp"
#include "modules/simulation/SimulationDispatcher.hpp"
#include "modules/terrain/ChangeDetectionIntegrator.hpp"

/**
 * @brief 流水线配置（custom_config.hazard）
 *
 * 所有阈值均可配置，缺省值见各字段初始值。
 */
struct PipelineConfig {
    std::vector<MonitoredLocation> locations;
    DetectorConfig detector;
    std::chrono::seconds sweepInterval{60};
    RiskConfig risk;
    SimulationConfig simulation;
    ChangeDetectionConfig changeDetection;
    std::chrono::seconds retentionWindow{7 * 24 * 3600};  // 已结束实体在内存中的保留时长
    std::chrono::seconds retentionInterval{3600};
    size_t ingestWorkerThreads = 0;           // 0 表示 CPU 核心数
    int retryMaxAttempts = Constants::RETRY_MAX_ATTEMPTS;

    /**
     * @brief 解析配置，错误追加到 errors，全部通过时返回值才可用
     */
    static PipelineConfig fromJson(const Json::Value& hazard, std::vector<std::string>& errors) {
        PipelineConfig cfg;
        if (!hazard.isObject()) {
            errors.emplace_back("[hazard] 缺少流水线配置节");
            return cfg;
        }

        parseLocations(hazard["locations"], cfg, errors);

        const auto& det = hazard["detector"];
        auto& d = cfg.detector;
        d.qualifyingRainfallMm = number(det, "qualifying_rainfall_mm", d.qualifyingRainfallMm, errors, "detector", 0.0);
        d.qualifyingIntensityMmHr = number(det, "qualifying_intensity_mm_hr", d.qualifyingIntensityMmHr, errors, "detector", 0.0);
        d.onsetIntensityMmHr = number(det, "onset_intensity_mm_hr", d.onsetIntensityMmHr, errors, "detector", 0.0);
        d.onsetRainfallMm = number(det, "onset_rainfall_mm", d.onsetRainfallMm, errors, "detector", 0.0);
        d.onsetWindow = window(det, "onset_window", d.onsetWindow, errors);
        d.inactivityGap = seconds(det, "inactivity_gap_s", d.inactivityGap, errors, "detector", 1);
        d.triggerRainfallMm = number(det, "trigger_rainfall_mm", d.triggerRainfallMm, errors, "detector", 0.0);
        d.triggerWindow = window(det, "trigger_window", d.triggerWindow, errors);
        d.idAlpha = number(det, "id_alpha", d.idAlpha, errors, "detector", 1e-9);
        d.idBeta = number(det, "id_beta", d.idBeta, errors, "detector", 0.0);
        cfg.sweepInterval = seconds(det, "sweep_interval_s", cfg.sweepInterval, errors, "detector", 1);

        const auto& risk = hazard["risk"];
        auto& r = cfg.risk;
        if (risk.isObject() && risk.isMember("thresholds")) {
            const auto& t = risk["thresholds"];
            if (!t.isArray() || t.size() != 3 || !t[0].isNumeric() || !t[1].isNumeric() || !t[2].isNumeric()) {
                errors.emplace_back("[hazard.risk] thresholds 需要 3 个数值 [moderate, high, critical]");
            } else {
                r.thresholds = {t[0].asDouble(), t[1].asDouble(), t[2].asDouble()};
            }
        }
        if (auto err = r.thresholds.validate()) errors.push_back("[hazard.risk] " + *err);
        r.fieldCapacityMm = number(risk, "field_capacity_mm", r.fieldCapacityMm, errors, "risk", 1e-9);
        r.antecedentGain = number(risk, "antecedent_gain", r.antecedentGain, errors, "risk", 0.0);
        r.logisticSteepness = number(risk, "logistic_steepness", r.logisticSteepness, errors, "risk", 1e-9);
        const auto& w = risk.isObject() ? risk["weights"] : Json::Value();
        r.weightTrigger = number(w, "trigger", r.weightTrigger, errors, "risk.weights", 0.0);
        r.weightSusceptibility = number(w, "susceptibility", r.weightSusceptibility, errors, "risk.weights", 0.0);
        r.weightMaterial = number(w, "material", r.weightMaterial, errors, "risk.weights", 0.0);
        r.defaultSusceptibility = unit(risk, "default_susceptibility", r.defaultSusceptibility, errors, "risk");
        r.defaultMaterialAvailability = unit(risk, "default_material_availability", r.defaultMaterialAvailability, errors, "risk");
        r.baseCriticalSlopeDeg = number(risk, "base_critical_slope_deg", r.baseCriticalSlopeDeg, errors, "risk", 0.0);
        if (r.baseCriticalSlopeDeg > 90.0) {
            errors.emplace_back("[hazard.risk] base_critical_slope_deg 不能超过 90");
            r.baseCriticalSlopeDeg = RiskConfig{}.baseCriticalSlopeDeg;
        }
        r.slopeSaturationReduction = unit(risk, "slope_saturation_reduction", r.slopeSaturationReduction, errors, "risk");
        r.antecedentDecay = unit(risk, "antecedent_decay", r.antecedentDecay, errors, "risk");

        const auto& sim = hazard["simulation"];
        auto& s = cfg.simulation;
        if (sim.isObject()) {
            s.executorUrl = sim.get("executor_url", "").asString();
            s.modelName = sim.get("model_name", s.modelName).asString();
            s.modelVersion = sim.get("model_version", s.modelVersion).asString();
            if (sim.isMember("default_parameters")) {
                if (!sim["default_parameters"].isObject()) {
                    errors.emplace_back("[hazard.simulation] default_parameters 必须是对象");
                } else {
                    s.defaultParameters = sim["default_parameters"];
                }
            }
        }
        if (s.executorUrl.empty()) {
            errors.emplace_back("[hazard.simulation] 缺少 executor_url");
        } else if (!s.executorUrl.starts_with("http://") && !s.executorUrl.starts_with("https://")) {
            errors.push_back("[hazard.simulation] executor_url 必须以 http:// 或 https:// 开头: " + s.executorUrl);
        }
        s.timeout = seconds(sim, "timeout_s", s.timeout, errors, "simulation", 1);
        s.pollInterval = seconds(sim, "poll_interval_s", s.pollInterval, errors, "simulation", 1);
        s.scheduledInterval = seconds(sim, "scheduled_interval_s", s.scheduledInterval, errors, "simulation", 0);

        const auto& cd = hazard["change_detection"];
        auto& c = cfg.changeDetection;
        c.volumeNormM3 = number(cd, "volume_norm_m3", c.volumeNormM3, errors, "change_detection", 1e-9);
        c.decayTauDays = number(cd, "decay_tau_days", c.decayTauDays, errors, "change_detection", 1e-9);
        c.terrainChangeAlertM3 = number(cd, "terrain_change_alert_m3", c.terrainChangeAlertM3, errors, "change_detection", 0.0);
        c.refreshInterval = seconds(cd, "refresh_interval_s", c.refreshInterval, errors, "change_detection", 1);

        const auto& retention = hazard["retention"];
        cfg.retentionWindow = seconds(retention, "window_s", cfg.retentionWindow, errors, "retention", 3600);
        cfg.retentionInterval = seconds(retention, "interval_s", cfg.retentionInterval, errors, "retention", 1);

        const auto& ingest = hazard["ingest"];
        cfg.ingestWorkerThreads = static_cast<size_t>(number(ingest, "worker_threads", 0.0, errors, "ingest", 0.0));
        cfg.retryMaxAttempts = static_cast<int>(number(ingest, "retry_max_attempts",
            static_cast<double>(cfg.retryMaxAttempts), errors, "ingest", 1.0));
        return cfg;
    }

private:
    static void parseLocations(const Json::Value& locations, PipelineConfig& cfg, std::vector<std::string>& errors) {
        if (!locations.isArray() || locations.empty()) {
            errors.emplace_back("[hazard.locations] 需要至少一个监测点");
            return;
        }
        std::set<std::string> ids;
        for (Json::ArrayIndex i = 0; i < locations.size(); ++i) {
            const auto& item = locations[i];
            auto prefix = "[hazard.locations[" + std::to_string(i) + "]] ";
            if (!item.isObject()) {
                errors.push_back(prefix + "必须是对象");
                continue;
            }
            MonitoredLocation loc;
            loc.id = item.get("id", "").asString();
            loc.name = item.get("name", loc.id).asString();
            if (loc.id.empty()) {
                errors.push_back(prefix + "缺少 id");
                continue;
            }
            if (!ids.insert(loc.id).second) {
                errors.push_back(prefix + "id 重复: " + loc.id);
            }
            if (!item["lon"].isNumeric() || !item["lat"].isNumeric()) {
                errors.push_back(prefix + "缺少 lon/lat");
                continue;
            }
            loc.point = {item["lon"].asDouble(), item["lat"].asDouble()};
            if (std::abs(loc.point.lon) > 180.0 || std::abs(loc.point.lat) > 90.0) {
                errors.push_back(prefix + "经纬度超出范围");
            }
            loc.radiusM = item.get("radius_m", loc.radiusM).asDouble();
            if (loc.radiusM <= 0) errors.push_back(prefix + "radius_m 必须为正数");
            for (const auto& areaId : item["source_area_ids"]) {
                if (!areaId.isIntegral()) {
                    errors.push_back(prefix + "source_area_ids 只能包含整数");
                    break;
                }
                loc.sourceAreaIds.push_back(areaId.asInt64());
            }
            cfg.locations.push_back(std::move(loc));
        }
    }

    static double number(const Json::Value& section, const char* key, double fallback,
                         std::vector<std::string>& errors, const char* sectionName, double min) {
        if (!section.isObject() || !section.isMember(key)) return fallback;
        const auto& v = section[key];
        if (!v.isNumeric()) {
            errors.push_back(std::string("[hazard.") + sectionName + "] " + key + " 必须为数值");
            return fallback;
        }
        if (v.asDouble() < min) {
            errors.push_back(std::string("[hazard.") + sectionName + "] " + key + " 不能小于 " + std::to_string(min));
            return fallback;
        }
        return v.asDouble();
    }

    static double unit(const Json::Value& section, const char* key, double fallback,
                       std::vector<std::string>& errors, const char* sectionName) {
        double v = number(section, key, fallback, errors, sectionName, 0.0);
        if (v > 1.0) {
            errors.push_back(std::string("[hazard.") + sectionName + "] " + key + " 必须位于 [0, 1]");
            return fallback;
        }
        return v;
    }

    static std::chrono::seconds seconds(const Json::Value& section, const char* key, std::chrono::seconds fallback,
                                        std::vector<std::string>& errors, const char* sectionName, int64_t min) {
        double v = number(section, key, static_cast<double>(fallback.count()), errors, sectionName,
                          static_cast<double>(min));
        return std::chrono::seconds(static_cast<int64_t>(v));
    }

    static RainWindow window(const Json::Value& section, const char* key, RainWindow fallback,
                             std::vector<std::string>& errors) {
        if (!section.isObject() || !section.isMember(key)) return fallback;
        auto w = section[key].isString() ? rainWindowFromString(section[key].asString()) : std::nullopt;
        if (!w) {
            errors.push_back(std::string("[hazard.detector] ") + key + " 只能是 1h / 24h / 7d");
            return fallback;
        }
        return *w;
    }
};
