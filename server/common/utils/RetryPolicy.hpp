#pragma once

#include "Constants.hpp"

/**
 * @brief 指数退避重试策略（仅用于入库边界）
 *
 * - 基础延迟 0.5 秒，指数增长
 * - 最大延迟 10 秒，最多尝试 5 次
 * - ±20% 随机抖动防止雷群效应
 *
 * 流水线状态转换（事件开闭、模拟状态）不走重试，避免重复创建。
 */
class RetryPolicy {
public:
    explicit RetryPolicy(int maxAttempts = Constants::RETRY_MAX_ATTEMPTS)
        : maxAttempts_((std::max)(maxAttempts, 1)) {}

    /**
     * @brief 获取当前重试的延迟时间（秒）
     */
    double getDelay() const {
        double delay = Constants::RETRY_BASE_DELAY_SEC
            * std::pow(2.0, static_cast<double>(attempts_ > 0 ? attempts_ - 1 : 0));
        delay = (std::min)(delay, Constants::RETRY_MAX_DELAY_SEC);

        // ±20% 随机抖动
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(
            -Constants::RETRY_JITTER_RATIO, Constants::RETRY_JITTER_RATIO);
        return delay * (1.0 + dist(rng));
    }

    /**
     * @brief 记录一次尝试
     */
    void recordAttempt() { ++attempts_; }

    bool exhausted() const { return attempts_ >= maxAttempts_; }

    int attempts() const { return attempts_; }

    /**
     * @brief 带退避地执行协程操作，最后一次失败的异常原样抛出
     *
     * 只重试数据库错误；校验等业务异常立即抛出。
     */
    template<typename Fn>
    static auto run(const char* what, int maxAttempts, Fn&& fn) -> decltype(fn()) {
        RetryPolicy policy(maxAttempts);
        while (true) {
            policy.recordAttempt();
            double delay = 0.0;
            try {
                co_return co_await fn();
            } catch (const drogon::orm::DrogonDbException& e) {
                if (policy.exhausted()) throw;
                delay = policy.getDelay();
                LOG_WARN << "[Retry] " << what << " failed (attempt " << policy.attempts()
                         << "/" << policy.maxAttempts_ << "): " << e.base().what()
                         << ", retrying in " << delay << "s";
            }
            co_await drogon::sleepCoro(drogon::app().getLoop(), std::chrono::duration<double>(delay));
        }
    }

private:
    int maxAttempts_;
    int attempts_ = 0;
};
