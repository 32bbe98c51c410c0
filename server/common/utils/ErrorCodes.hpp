#pragma once

/**
 * @brief 错误码（响应体 code 字段）
 *
 * 0 成功；1xxx 请求错误；2xxx 认证；3xxx 监测流水线；5xxx 服务端与外部依赖
 */
namespace ErrorCodes {

inline constexpr int SUCCESS = 0;

inline constexpr int NOT_FOUND = 1001;
inline constexpr int BAD_REQUEST = 1002;
inline constexpr int CONFLICT = 1004;
inline constexpr int VALIDATION_FAILED = 1005;

inline constexpr int UNAUTHORIZED = 2004;
inline constexpr int TOKEN_EXPIRED = 2005;
inline constexpr int CREDENTIALS_INVALID = 2006;

/** 同一 (快照, 降雨事件) 已有未结束的模拟 */
inline constexpr int DUPLICATE_DISPATCH = 3001;
/** 终态运行或已确认告警不可再变更 */
inline constexpr int ILLEGAL_TRANSITION = 3002;
/** 易发区缺少易发性或物源数据 */
inline constexpr int INTEGRATION_GAP = 3003;

inline constexpr int INTERNAL_ERROR = 5000;
/** 数据库不可用（HTTP 503） */
inline constexpr int DATABASE_ERROR = 5001;
/** 模拟执行器调用失败（HTTP 502） */
inline constexpr int EXECUTOR_ERROR = 5002;

}  // namespace ErrorCodes
