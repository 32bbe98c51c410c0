#pragma once

#include "common/store/SpatialStore.hpp"

/**
 * @brief 变化检测融合参数
 */
struct ChangeDetectionConfig {
    double volumeNormM3 = 1000.0;            // 该净堆积量在完全覆盖时贡献 1.0
    double decayTauDays = 30.0;              // 贡献按 exp(-age/τ) 衰减
    double terrainChangeAlertM3 = 500.0;
    std::chrono::seconds refreshInterval{3600};
};

/**
 * @brief 一次变化检测融合的结果
 */
struct IntegrationOutcome {
    ChangeDetection change;
    std::vector<SourceArea> updatedAreas;
};

/**
 * @brief 变化检测融合器
 *
 * 地形变化影响风险评估的唯一途径：正的净变化量按与易发区的重叠面积比例
 * 计入物源贡献，随时间指数衰减。
 *
 *   contribution = max(net, 0) / volumeNorm * overlap / area(source)
 *   material     = clamp(base + Σ contribution * exp(-age / τ), 0, 1)
 *
 * 所有写入通过 SpatialStore::updateSourceArea 原子完成，评估器不会读到半更新的值。
 */
class ChangeDetectionIntegrator {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    ChangeDetectionIntegrator(SpatialStore& store, ChangeDetectionConfig config)
        : store_(store), config_(std::move(config)) {}

    const ChangeDetectionConfig& config() const { return config_; }

    /**
     * @brief 接收变化检测并更新重叠易发区的物源可用性
     * @throws ValidationException 引用的快照不存在
     */
    IntegrationOutcome ingest(ChangeDetection change, TimePoint now) {
        IntegrationOutcome outcome;
        outcome.change = store_.addChangeDetection(std::move(change));
        const auto& cd = outcome.change;

        GeoPolygon footprint;
        if (cd.footprint) {
            footprint = *cd.footprint;
        } else if (auto snapshot = store_.snapshot(cd.comparisonSnapshotId)) {
            footprint = snapshot->extent;
        }

        if (cd.netChangeM3 <= 0.0 || footprint.empty()) {
            LOG_INFO << "[Integrator] Change detection #" << cd.id << " (net " << cd.netChangeM3
                     << " m3) adds no material";
            return outcome;
        }

        for (const auto& area : store_.sourceAreas(footprint.bbox())) {
            double areaM2 = Geo::areaM2(area.geometry);
            if (areaM2 <= 0.0) continue;
            double overlap = Geo::intersectionAreaM2(area.geometry, footprint) / areaM2;
            if (overlap <= 0.0) continue;

            double magnitude = cd.netChangeM3 / config_.volumeNormM3 * (std::min)(overlap, 1.0);
            auto updated = store_.updateSourceArea(area.id, [&](SourceArea& a) {
                auto dup = std::find_if(a.contributions.begin(), a.contributions.end(),
                    [&](const MaterialContribution& c) { return c.changeDetectionId == cd.id; });
                if (dup != a.contributions.end()) return;
                a.contributions.push_back({cd.id, magnitude, cd.timestamp});
                a.materialAvailability = materialAt(a, now);
                a.updatedAt = now;
            });
            LOG_INFO << "[Integrator] Source area #" << area.id << " material "
                     << updated.materialAvailability.value_or(0.0) << " (change #" << cd.id
                     << ", overlap " << overlap << ")";
            outcome.updatedAreas.push_back(std::move(updated));
        }
        return outcome;
    }

    /**
     * @brief 新增或刷新易发区，并按已有贡献重新计算物源可用性
     */
    SourceArea upsertSourceArea(SourceArea area, TimePoint now) {
        auto stored = store_.upsertSourceArea(std::move(area));
        return store_.updateSourceArea(stored.id, [&](SourceArea& a) {
            if (!a.contributions.empty() || a.baseMaterialAvailability) {
                a.materialAvailability = materialAt(a, now);
            }
            a.updatedAt = now;
        });
    }

    /**
     * @brief 按当前时间重新计算所有带贡献易发区的衰减
     * @return 物源可用性发生变化的易发区
     */
    std::vector<SourceArea> refresh(TimePoint now) {
        std::vector<SourceArea> changed;
        for (const auto& area : store_.sourceAreas()) {
            if (area.contributions.empty()) continue;
            double next = materialAt(area, now);
            if (area.materialAvailability && std::abs(*area.materialAvailability - next) < 1e-4) continue;
            changed.push_back(store_.updateSourceArea(area.id, [&](SourceArea& a) {
                a.materialAvailability = materialAt(a, now);
                a.updatedAt = now;
            }));
        }
        if (!changed.empty()) {
            LOG_DEBUG << "[Integrator] Refreshed material decay for " << changed.size() << " source areas";
        }
        return changed;
    }

    /**
     * @brief 物源可用性：基准值加上衰减后的贡献，截断到 [0, 1]
     */
    double materialAt(const SourceArea& area, TimePoint now) const {
        double total = area.baseMaterialAvailability.value_or(0.0);
        double tauSec = config_.decayTauDays * 86400.0;
        for (const auto& c : area.contributions) {
            double ageSec = (std::max)(0.0, std::chrono::duration<double>(now - c.observedAt).count());
            total += c.magnitude * std::exp(-ageSec / tauSec);
        }
        return std::clamp(total, 0.0, 1.0);
    }

private:
    SpatialStore& store_;
    ChangeDetectionConfig config_;
};
