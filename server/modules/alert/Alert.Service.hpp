#pragma once

#include "domain/AlertRepository.hpp"
#include "modules/pipeline/HazardPipeline.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief 告警服务
 *
 * 告警流水账从数据库分页查询；确认走流水线，以内存状态为准。
 */
class AlertService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    Task<std::pair<Json::Value, int>> list(bool unacknowledgedOnly, const Pagination& page) {
        auto [items, total] = co_await AlertRepository::findPage(unacknowledgedOnly, page);
        co_return std::make_pair(JsonHelper::toArray(items), total);
    }

    /**
     * @throws NotFoundException 告警不存在或已归档
     * @throws ConflictException 已被确认
     */
    Task<Json::Value> acknowledge(int64_t id, const std::string& username) {
        auto alert = co_await HazardPipeline::instance().acknowledgeAlert(id, username);
        co_return alert.toJson();
    }
};
