#pragma once

/**
 * @brief 将 SQL 中的 ? 占位符转换为 PostgreSQL 原生 $1, $2, ... 格式
 *
 * 空间谓词中的类型转换（如 ?::geometry）不受影响，只替换问号本身。
 */
inline std::string toParameterized(const std::string& sql, size_t paramCount) {
    if (paramCount == 0) return sql;

    std::string result;
    result.reserve(sql.size() + paramCount * 3);
    size_t idx = 1;
    for (char c : sql) {
        if (c == '?' && idx <= paramCount) {
            result += '$';
            result += std::to_string(idx++);
        } else {
            result += c;
        }
    }
    return result;
}

/**
 * @brief 构造参数绑定后的查询并等待结果（连接池与事务共用）
 */
template<typename Executor>
drogon::Task<drogon::orm::Result> execParameterized(Executor& executor, const std::string& sql,
                                                    const std::vector<std::string>& params) {
    if (params.empty()) {
        co_return co_await executor.execSqlCoro(sql);
    }
    auto binder = executor << toParameterized(sql, params.size());
    for (const auto& p : params) {
        binder << p;
    }
    co_return co_await drogon::orm::internal::SqlAwaiter(std::move(binder));
}

/**
 * @brief 数据库客户端选择（由 ConfigManager 根据 db_clients[0] 设置）
 */
struct DbClientSettings {
    std::string name = "default";
    bool fast = false;

    static DbClientSettings& current() {
        static DbClientSettings settings;
        return settings;
    }
};

/**
 * @brief 数据库服务类
 */
class DatabaseService {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    using Result = drogon::orm::Result;
    using Transaction = drogon::orm::Transaction;
    template<typename T = void> using Task = drogon::Task<T>;

    DatabaseService() = default;

    static DbClientPtr client() {
        const auto& settings = DbClientSettings::current();
        return settings.fast
            ? drogon::app().getFastDbClient(settings.name)
            : drogon::app().getDbClient(settings.name);
    }

    DbClientPtr getClient() const { return client(); }

    /**
     * @brief 连通性检查，返回 PostgreSQL 版本
     */
    Task<std::string> serverVersion() {
        auto result = co_await getClient()->execSqlCoro("SHOW server_version");
        co_return result.empty() ? std::string() : result[0][0].as<std::string>();
    }

    /**
     * @brief 已安装的 PostGIS 版本，未安装时为空
     */
    Task<std::optional<std::string>> postgisVersion() {
        auto result = co_await getClient()->execSqlCoro(
            "SELECT extversion FROM pg_extension WHERE extname = 'postgis'");
        if (result.empty()) co_return std::nullopt;
        co_return result[0]["extversion"].as<std::string>();
    }

    Task<Result> execSqlCoro(const std::string& sql,
                              const std::vector<std::string>& params = {}) {
        auto db = getClient();
        co_return co_await execParameterized(*db, sql, params);
    }

    Task<std::shared_ptr<Transaction>> newTransactionCoro() {
        co_return co_await getClient()->newTransactionCoro();
    }
};
