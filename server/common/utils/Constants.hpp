#pragma once

/**
 * @brief 不随部署变化的常量（可调参数在 custom_config.hazard）
 */
namespace Constants {

// ==================== 访问日志 ====================

/** 请求体日志截断长度 */
inline constexpr int REQUEST_LOG_MAX_LENGTH = 1000;

/** 超过该耗时的请求以 INFO 级别记录（毫秒） */
inline constexpr int64_t SLOW_REQUEST_MS = 1000;

// ==================== 查询与入库 ====================

/** 列表接口未分页时的最大行数 */
inline constexpr int MAX_UNPAGED_ROWS = 2000;

/** 单次批量写入的最大观测条数 */
inline constexpr size_t OBSERVATION_BATCH_MAX = 5000;

// ==================== 入库重试策略 ====================

/** 入库重试基础延迟（秒） */
inline constexpr double RETRY_BASE_DELAY_SEC = 0.5;

/** 入库重试最大延迟（秒） */
inline constexpr double RETRY_MAX_DELAY_SEC = 10.0;

/** 重试抖动比例（±20%） */
inline constexpr double RETRY_JITTER_RATIO = 0.2;

/** 入库最大尝试次数 */
inline constexpr int RETRY_MAX_ATTEMPTS = 5;

// ==================== 风险评估 ====================

/** 饱和度达到该值时评估结果建议启动模拟 */
inline constexpr double SATURATION_RECOMMEND_SIMULATION = 0.7;

}  // namespace Constants
