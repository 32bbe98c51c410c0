// mimalloc: 全局替换 new/delete，必须在所有其他 include 之前
#include <mimalloc-new-delete.h>

// Utils
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/ExceptionHandler.hpp"
#include "common/utils/PasswordUtils.hpp"

// Filters
#include "common/filters/AuthFilter.hpp"
#include "common/filters/RequestAdvices.hpp"

// Database
#include "common/database/DatabaseInitializer.hpp"
#include "common/database/DatabaseService.hpp"

// Pipeline
#include "modules/pipeline/HazardPipeline.hpp"
#include "modules/pipeline/PersistenceEventHandlers.hpp"
#include "modules/pipeline/StateLoader.hpp"

// Controllers
#include "modules/auth/Auth.Controller.hpp"
#include "modules/weather/Weather.Controller.hpp"
#include "modules/event/Event.Controller.hpp"
#include "modules/risk/Risk.Controller.hpp"
#include "modules/simulation/Simulation.Controller.hpp"
#include "modules/terrain/Terrain.Controller.hpp"
#include "modules/alert/Alert.Controller.hpp"

// WebSocket Module
#include "modules/websocket/WebSocket.Controller.hpp"
#include "modules/websocket/WsEventHandlers.hpp"

using namespace drogon;

// ─── 启动流程 ──────────────────────────────────────────────

namespace {

/**
 * @brief 启动失败：控制台给出排查提示，日志记 FATAL
 */
void reportStartupFailure(const std::string& title, const std::string& detail,
                          const std::vector<std::string>& hints = {}) {
    std::cerr << "\n" << std::string(60, '=') << "\n [ERROR] " << title << "\n"
              << std::string(60, '-') << "\n  " << detail << "\n";
    if (!hints.empty()) {
        std::cerr << "\n  请检查:\n";
        for (const auto& hint : hints) std::cerr << "    - " << hint << "\n";
    }
    std::cerr << std::string(60, '=') << "\n" << std::endl;
    LOG_FATAL << "[Startup] " << title << ": " << detail;
}

const std::vector<std::string> DB_HINTS = {
    "PostgreSQL 服务是否正在运行，PostGIS 扩展是否可用",
    "config 中 db_clients 的 host/port/user/passwd/dbname",
};

/**
 * @brief 启动阶段：名称、失败时的排查提示、执行体
 */
struct StartupStage {
    const char* name;
    std::vector<std::string> hints;
    std::function<Task<>()> run;
};

std::vector<StartupStage> startupStages() {
    return {
        {"database:ping", DB_HINTS, []() -> Task<> {
            DatabaseService db;
            LOG_INFO << "[Startup] PostgreSQL " << co_await db.serverVersion();
        }},
        {"database:initialize", DB_HINTS, []() -> Task<> {
            co_await DatabaseInitializer::initialize();
            DatabaseService db;
            auto postgis = co_await db.postgisVersion();
            if (!postgis) throw std::runtime_error("PostGIS extension is not installed in the target database");
            LOG_INFO << "[Startup] PostGIS " << *postgis;
        }},
        {"state:load", {"数据库连接是否稳定", "数据表结构是否与当前版本一致"}, []() -> Task<> {
            co_await StateLoader::load(HazardPipeline::instance());
        }},
        {"pipeline:start", {"custom_config.hazard.ingest.worker_threads 是否合理"}, []() -> Task<> {
            HazardPipeline::instance().start();
            co_return;
        }},
    };
}

/**
 * @brief 依次执行启动阶段，任一失败即退出进程
 */
Task<> bootstrap() {
    for (const auto& stage : startupStages()) {
        LOG_INFO << "[Startup] " << stage.name;
        std::string error;
        try {
            co_await stage.run();
        } catch (const drogon::orm::DrogonDbException& e) {
            error = e.base().what();
        } catch (const std::exception& e) {
            error = e.what();
        }
        if (!error.empty()) {
            reportStartupFailure(std::string("启动阶段失败: ") + stage.name, error, stage.hints);
            app().getLoop()->queueInLoop([]() { app().quit(); });
            co_return;
        }
    }
    LOG_INFO << "[Startup] bootstrap completed";
}

/**
 * @brief 监听就绪后：装配流水线、注册订阅者，再异步执行启动阶段
 */
void onServerStarted() {
    std::cout << "Hazard Monitor started" << std::endl;
    for (const auto& addr : app().getListeners()) {
        std::cout << "  -> http://" << addr.toIpPort() << std::endl;
        LOG_INFO << "Server listening on http://" << addr.toIpPort();
    }
    std::cout << "Logs: " << ConfigManager::getLogSettings().dir << "/hazard-monitor_*.log" << std::endl;

    const auto& config = ConfigManager::getPipelineConfig();
    HazardPipeline::instance().configure(
        config, std::make_shared<HttpSimulationExecutor>(config.simulation.executorUrl));

    // 订阅者先于状态恢复注册，恢复期间产生的失败事件同样落库和推送
    PersistenceEventHandlers::registerAll(config.retryMaxAttempts);
    WsEventHandlers::registerAll();

    async_run(bootstrap);
}

void onServerStopping() {
    LOG_INFO << "Server is stopping";
    HazardPipeline::instance().stop();
    EventBus::instance().unsubscribeAll();
    if (auto failures = EventBus::instance().failureCount(); failures > 0) {
        LOG_WARN << "[EventBus] " << failures << " subscriber failures since startup";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 生成操作员 password_hash 后退出
    if (argc == 3 && std::string_view(argv[1]) == "--hash-password") {
        std::cout << PasswordUtils::hashPassword(argv[2]) << std::endl;
        return 0;
    }
    if (argc > 1) {
        std::cerr << "Usage: " << argv[0] << " [--hash-password <password>]" << std::endl;
        return 2;
    }

    // 0. 验证 mimalloc 已激活
    int v = mi_version();
    std::cout << "mimalloc v" << (v / 100) << "." << (v % 100) << " active" << std::endl;

    // 1. 初始化日志系统（AsyncFileLogger 异步写盘 + 按日期轮转）
    LoggerManager::initialize();

    // 2. 加载并验证配置文件（失败时 ConfigManager 已输出详细错误）
    if (!ConfigManager::load()) {
        std::cerr << "Server startup aborted due to configuration errors." << std::endl;
        return 1;
    }

    // 3. 应用日志配置
    LoggerManager::apply(ConfigManager::getLogSettings());

    // 4. 设置全局异常处理
    AppExceptionHandler::setup();

    // 5. 注册请求/响应拦截器
    RequestAdvices::setup();

    // 6. 监听就绪后检查连接池并启动流水线
    app().registerBeginningAdvice([]() {
        std::string failure;
        try {
            if (!DatabaseService::client()) {
                failure = "Drogon 未能创建 DB 客户端 '" + DbClientSettings::current().name + "'";
            }
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (!failure.empty()) {
            reportStartupFailure("数据库客户端不可用", failure, DB_HINTS);
            std::exit(1);
        }
        onServerStarted();
    });

    // 7. 启动服务器
    app().run();

    // 8. 服务器退出后清理资源
    onServerStopping();
    LoggerManager::close();

    return 0;
}
