#pragma once

#include "DatabaseService.hpp"

/**
 * @brief 事务守卫（RAII）
 *
 * 未 commit() 即析构时回滚。用于必须原子落库的多表写入，例如模拟完成时
 * 运行终态与风险区、易发区 revision 与新增物源贡献。
 *
 * @code
 * auto guard = co_await TransactionGuard::create(dbService);
 * co_await guard.execSqlCoro(UPSERT_RUN_SQL, runParams(run));
 * co_await guard.execSqlCoro(INSERT_ZONE_SQL, zoneParams(zone));
 * co_await guard.commit();
 * @endcode
 */
class TransactionGuard {
public:
    using Transaction = drogon::orm::Transaction;
    using Result = drogon::orm::Result;
    template<typename T = void> using Task = drogon::Task<T>;

    static Task<TransactionGuard> create(DatabaseService& dbService) {
        co_return TransactionGuard(co_await dbService.newTransactionCoro());
    }

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    TransactionGuard(TransactionGuard&& other) noexcept
        : transaction_(std::move(other.transaction_)) {}

    TransactionGuard& operator=(TransactionGuard&& other) noexcept {
        if (this != &other) {
            rollbackIfOpen();
            transaction_ = std::move(other.transaction_);
        }
        return *this;
    }

    ~TransactionGuard() { rollbackIfOpen(); }

    /**
     * @throws std::logic_error 已提交
     */
    Task<Result> execSqlCoro(const std::string& sql, const std::vector<std::string>& params = {}) {
        if (!transaction_) throw std::logic_error("Transaction already committed");
        co_return co_await execParameterized(*transaction_, sql, params);
    }

    /**
     * @brief 提交并等待 PostgreSQL 确认
     *
     * Drogon 在 Transaction 析构时发送 COMMIT，结果经 setCommitCallback 回调，
     * 协程在回调中恢复。返回即表示数据已落库。
     */
    Task<void> commit() {
        if (!transaction_) throw std::logic_error("Transaction already committed");

        struct CommitAwaiter : drogon::CallbackAwaiter<bool> {
            std::shared_ptr<Transaction> tx;
            explicit CommitAwaiter(std::shared_ptr<Transaction> t) : tx(std::move(t)) {}

            void await_suspend(std::coroutine_handle<> handle) {
                tx->setCommitCallback([this, handle](bool ok) {
                    setValue(ok);
                    handle.resume();
                });
                tx.reset();
            }
        };

        bool ok = co_await CommitAwaiter{std::move(transaction_)};
        if (!ok) throw std::runtime_error("Transaction commit failed");
    }

private:
    std::shared_ptr<Transaction> transaction_;

    explicit TransactionGuard(std::shared_ptr<Transaction> trans) : transaction_(std::move(trans)) {}

    void rollbackIfOpen() noexcept {
        if (!transaction_) return;
        LOG_WARN << "[DB] Rolling back uncommitted transaction";
        try {
            transaction_->rollback();
        } catch (const std::exception& e) {
            LOG_ERROR << "[DB] Rollback failed: " << e.what();
        }
        transaction_.reset();
    }
};
