#pragma once

#include "modules/pipeline/HazardPipeline.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief 风险查询服务（只读投影，不产生状态变化）
 */
class RiskService {
public:
    Json::Value current() const {
        return HazardPipeline::instance().currentRisk(std::chrono::system_clock::now());
    }

    Json::Value zones(std::optional<BoundingBox> bbox) const {
        return JsonHelper::toArray(HazardPipeline::instance().store().zones(bbox));
    }
};
