#pragma once

#include "modules/pipeline/HazardPipeline.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief 地形服务：快照、易发区与变化检测
 */
class TerrainService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    Task<Json::Value> ingestSnapshot(const Json::Value& body) {
        auto snapshot = co_await HazardPipeline::instance().ingestSnapshot(TerrainSnapshot::fromJson(body));
        co_return snapshot.toJson();
    }

    Json::Value snapshots() const {
        return JsonHelper::toArray(HazardPipeline::instance().store().snapshots());
    }

    Task<Json::Value> upsertSourceArea(const Json::Value& body) {
        auto area = co_await HazardPipeline::instance().upsertSourceArea(SourceArea::fromJson(body));
        co_return area.toJson();
    }

    Json::Value sourceAreas(std::optional<BoundingBox> bbox) const {
        return JsonHelper::toArray(HazardPipeline::instance().store().sourceAreas(bbox));
    }

    /**
     * @return {change_detection, updated_source_areas}
     */
    Task<Json::Value> ingestChangeDetection(const Json::Value& body) {
        auto outcome = co_await HazardPipeline::instance().ingestChangeDetection(ChangeDetection::fromJson(body));

        Json::Value data;
        data["change_detection"] = outcome.change.toJson();
        data["updated_source_areas"] = JsonHelper::toArray(outcome.updatedAreas);
        co_return data;
    }

    Json::Value changeDetections() const {
        return JsonHelper::toArray(HazardPipeline::instance().store().changeDetections());
    }
};
