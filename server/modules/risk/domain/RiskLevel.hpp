#pragma once

#include "common/utils/AppException.hpp"

/**
 * @brief 风险等级（有序：LOW < MODERATE < HIGH < CRITICAL）
 */
enum class RiskLevel {
    Low = 0,
    Moderate = 1,
    High = 2,
    Critical = 3
};

inline std::string riskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low:      return "low";
        case RiskLevel::Moderate: return "moderate";
        case RiskLevel::High:     return "high";
        case RiskLevel::Critical: return "critical";
    }
    return "low";
}

inline std::optional<RiskLevel> riskLevelFromString(const std::string& s) {
    if (s == "low") return RiskLevel::Low;
    if (s == "moderate") return RiskLevel::Moderate;
    if (s == "high") return RiskLevel::High;
    if (s == "critical") return RiskLevel::Critical;
    return std::nullopt;
}

/**
 * @brief 风险分级阈值
 *
 * value < moderate → LOW；< high → MODERATE；< critical → HIGH；否则 CRITICAL。
 * 等级只由 risk_value 分桶得到，不单独赋值。
 */
struct RiskThresholds {
    double moderate = 0.25;
    double high = 0.5;
    double critical = 0.75;

    RiskLevel classify(double value) const {
        if (value < moderate) return RiskLevel::Low;
        if (value < high) return RiskLevel::Moderate;
        if (value < critical) return RiskLevel::High;
        return RiskLevel::Critical;
    }

    /**
     * @brief 校验阈值严格递增且位于 (0, 1)
     * @return 错误描述，合法时为空
     */
    std::optional<std::string> validate() const {
        if (!(moderate > 0.0 && moderate < high && high < critical && critical < 1.0)) {
            return "风险阈值必须满足 0 < moderate < high < critical < 1";
        }
        return std::nullopt;
    }
};
