#pragma once

#include "domain/ObservationRepository.hpp"
#include "modules/pipeline/HazardPipeline.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief 气象观测服务
 */
class WeatherService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;
    using TimePoint = std::chrono::system_clock::time_point;

    Task<Json::Value> ingest(const Json::Value& observations) {
        auto report = co_await HazardPipeline::instance().ingest(observations);
        co_return report.toJson();
    }

    /**
     * @brief 观测时间序列
     *
     * 起点落在内存保留期内时直接读 SpatialStore，否则查询数据库。
     * @throws NotFoundException 监测点不存在
     */
    Task<Json::Value> observations(const std::string& locationId,
                                   std::optional<TimePoint> from,
                                   std::optional<TimePoint> to) {
        auto& pipeline = HazardPipeline::instance();
        if (!pipeline.locations().find(locationId)) {
            throw NotFoundException("监测点不存在: " + locationId);
        }

        auto retainedFrom = std::chrono::system_clock::now() - SpatialStore::OBSERVATION_RETENTION;
        if (!from || *from >= retainedFrom) {
            co_return JsonHelper::toArray(pipeline.store().observations(locationId, from, to));
        }

        auto items = co_await ObservationRepository::find(locationId, from, to,
                                                          static_cast<size_t>(Constants::MAX_UNPAGED_ROWS));
        co_return JsonHelper::toArray(items);
    }

    /**
     * @brief 每个监测点当前的 1h/24h/7d 滚动降雨量
     */
    Json::Value aggregates() const {
        auto& pipeline = HazardPipeline::instance();
        auto now = std::chrono::system_clock::now();

        Json::Value items(Json::arrayValue);
        for (const auto& location : pipeline.locations().all()) {
            Json::Value item = pipeline.totals(location.id, now).toJson();
            item["location_id"] = location.id;
            item["location_name"] = location.name;
            items.append(item);
        }
        return items;
    }
};
