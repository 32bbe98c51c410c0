#pragma once

#include "domain/RainfallEventRepository.hpp"
#include "modules/pipeline/HazardPipeline.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief 降雨事件查询服务
 */
class EventService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    Json::Value active() const {
        return JsonHelper::toArray(HazardPipeline::instance().store().activeEvents());
    }

    /**
     * @brief 事件历史（数据库，新的在前）
     */
    Task<std::pair<Json::Value, int>> history(const std::string& locationId, const Pagination& page) {
        auto [items, total] = co_await RainfallEventRepository::findPage(locationId, page);
        co_return std::make_pair(JsonHelper::toArray(items), total);
    }
};
