#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 业务异常基类
 *
 * 携带错误码与 HTTP 状态，由全局异常处理器转换为 JSON 响应。
 */
class AppException : public std::exception {
public:
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

private:
    int code_;
    std::string message_;
    HttpStatusCode status_;

public:
    AppException(int code, std::string message, HttpStatusCode status = k400BadRequest)
        : code_(code), message_(std::move(message)), status_(status) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    HttpStatusCode getStatus() const { return status_; }
};

/** 404 */
class NotFoundException : public AppException {
public:
    explicit NotFoundException(const std::string& message = "资源不存在")
        : AppException(ErrorCodes::NOT_FOUND, message, k404NotFound) {}
};

/**
 * @brief 请求内容不合法（400）
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败")
        : AppException(ErrorCodes::VALIDATION_FAILED, message, k400BadRequest) {}
};


class ConflictException : public AppException {
public:
    explicit ConflictException(const std::string& message = "资源状态冲突")
        : AppException(ErrorCodes::CONFLICT, message, k409Conflict) {}
};

/**
 * @brief 调度冲突 - 同一 (地形快照, 降雨事件) 已有未结束的模拟
 */
class DuplicateDispatchException : public AppException {
public:
    explicit DuplicateDispatchException(const std::string& message = "该快照与降雨事件已有进行中的模拟")
        : AppException(ErrorCodes::DUPLICATE_DISPATCH, message, k409Conflict) {}
};

/**
 * @brief 非法状态转换（终态不可再变更）
 */
class IllegalTransitionException : public AppException {
public:
    explicit IllegalTransitionException(const std::string& message = "非法状态转换")
        : AppException(ErrorCodes::ILLEGAL_TRANSITION, message, k409Conflict) {}
};

/**
 * @brief 数据缺口 - 易发区缺少易发性或物源数据
 *
 * 仅在风险评估内部使用，评估器捕获后降级为默认值
 */
class IntegrationGapException : public AppException {
public:
    explicit IntegrationGapException(const std::string& message = "缺少易发区数据")
        : AppException(ErrorCodes::INTEGRATION_GAP, message, k422UnprocessableEntity) {}
};

/**
 * @brief 外部模拟执行器错误
 */
class ExecutorException : public AppException {
public:
    explicit ExecutorException(const std::string& message = "模拟执行器调用失败")
        : AppException(ErrorCodes::EXECUTOR_ERROR, message, k502BadGateway) {}
};

/**
 * @brief 认证相关异常
 */
namespace AuthException {
    using enum drogon::HttpStatusCode;

    inline AppException CredentialsInvalid() {
        return AppException(ErrorCodes::CREDENTIALS_INVALID, "用户名或密码错误", k401Unauthorized);
    }

    inline AppException TokenInvalid() {
        return AppException(ErrorCodes::UNAUTHORIZED, "令牌无效或已过期", k401Unauthorized);
    }

    inline AppException TokenExpired() {
        return AppException(ErrorCodes::TOKEN_EXPIRED, "令牌已过期", k401Unauthorized);
    }
}
