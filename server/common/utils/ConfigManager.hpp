#pragma once

#include "LoggerManager.hpp"
#include "common/database/DatabaseService.hpp"
#include "modules/pipeline/PipelineConfig.hpp"

/**
 * @brief 配置管理器
 *
 * 配置文件查找顺序：环境变量 HAZARD_MONITOR_CONFIG，其次 config/config.local.json、config/config.json。
 * 启动时一次性收集全部错误后再退出，警告（占位符、弱密钥）不阻断启动。
 *
 * custom_config 结构：
 * - logging   日志（见 LogSettings）
 * - jwt       { secret, access_token_expires_in }
 * - operators [{ username, password_hash }]
 * - hazard    流水线（见 PipelineConfig）
 */
class ConfigManager {
public:
    static constexpr const char* CONFIG_ENV = "HAZARD_MONITOR_CONFIG";

    /**
     * @brief 加载并验证配置文件
     * @return 失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load() {
        DbClientSettings::current() = DbClientSettings{};
        operators_.clear();

        auto path = findConfigFile();
        if (!path) return false;

        Json::Value root;
        if (!parseConfigFile(*path, root)) return false;

        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        validate(root, errors, warnings);
        if (!warnings.empty()) printWarnings("配置警告 (" + *path + ")", warnings);
        if (!errors.empty()) {
            printErrors("配置验证失败: " + *path, errors);
            return false;
        }

        apply(root);

        try {
            drogon::app().loadConfigFile(*path);
        } catch (const std::exception& e) {
            printErrors("Drogon 加载配置失败", {e.what()});
            return false;
        }

        LOG_INFO << "[Config] Loaded from " << *path << " (" << pipelineConfig_.locations.size()
                 << " monitored locations, " << operators_.size() << " operators)";
        return true;
    }

    static const LogSettings& getLogSettings() { return logSettings_; }

    static const PipelineConfig& getPipelineConfig() { return pipelineConfig_; }

    static std::optional<std::string> findOperatorHash(const std::string& username) {
        auto it = operators_.find(username);
        if (it == operators_.end()) return std::nullopt;
        return it->second;
    }

private:
    inline static LogSettings logSettings_;
    inline static PipelineConfig pipelineConfig_;
    inline static std::map<std::string, std::string> operators_;

    static std::optional<std::string> findConfigFile() {
        if (const char* env = std::getenv(CONFIG_ENV); env && *env) {
            if (fs::exists(env)) return std::string(env);
            printErrors("配置文件不存在", {std::string(CONFIG_ENV) + "=" + env});
            return std::nullopt;
        }

        static const std::vector<std::string> candidates = {
            "./config/config.local.json",
            "./config/config.json",
            "../config/config.local.json",
            "../config/config.json",
        };
        for (const auto& path : candidates) {
            if (fs::exists(path)) return path;
        }

        std::vector<std::string> hints = {"未设置 " + std::string(CONFIG_ENV) + "，且以下位置均不存在配置文件:"};
        for (const auto& p : candidates) hints.push_back("  - " + p);
        hints.emplace_back("可参考 config/config.example.json");
        printErrors("未找到配置文件", hints);
        return std::nullopt;
    }

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON 解析失败: " + path, {errs});
            return false;
        }
        if (!root.isObject()) {
            printErrors("JSON 格式错误: " + path, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }
        return true;
    }

    // ─── 验证 ──────────────────────────────────────────────────

    static void validate(const Json::Value& root, std::vector<std::string>& errors,
                         std::vector<std::string>& warnings) {
        validateListeners(root["listeners"], errors);
        validateDbClients(root["db_clients"], errors, warnings);

        const auto& custom = root["custom_config"];
        if (!custom.isObject()) {
            errors.emplace_back("[custom_config] 缺少自定义配置节");
            return;
        }
        LogSettings::fromJson(custom["logging"], errors);
        validateJwt(custom["jwt"], errors, warnings);
        validateOperators(custom["operators"], errors, warnings);
        PipelineConfig::fromJson(custom["hazard"], errors);
    }

    static void validateListeners(const Json::Value& listeners, std::vector<std::string>& errors) {
        if (!listeners.isArray() || listeners.empty()) {
            errors.emplace_back("[listeners] 需要至少一个监听地址");
            return;
        }
        for (Json::ArrayIndex i = 0; i < listeners.size(); ++i) {
            auto prefix = "[listeners[" + std::to_string(i) + "]] ";
            if (listeners[i].get("address", "").asString().empty()) {
                errors.push_back(prefix + "缺少 address 字段");
            }
            validatePort(listeners[i], prefix, errors);
        }
    }

    static void validateDbClients(const Json::Value& clients, std::vector<std::string>& errors,
                                  std::vector<std::string>& warnings) {
        if (!clients.isArray() || clients.empty()) {
            errors.emplace_back("[db_clients] 需要至少一个 PostgreSQL/PostGIS 连接");
            return;
        }
        for (Json::ArrayIndex i = 0; i < clients.size(); ++i) {
            const auto& db = clients[i];
            auto prefix = "[db_clients[" + std::to_string(i) + "]] ";

            for (const char* field : {"name", "host", "user", "dbname"}) {
                if (db.get(field, "").asString().empty()) {
                    errors.push_back(prefix + "缺少必填字段: " + field);
                }
            }
            // 空间存储依赖 PostGIS
            auto rdbms = db.get("rdbms", "").asString();
            if (rdbms != "postgresql") {
                errors.push_back(prefix + "rdbms 必须为 postgresql（当前: " + (rdbms.empty() ? "未设置" : rdbms) + "）");
            }
            validatePort(db, prefix, errors);

            if (!db["passwd"].isString()) {
                errors.push_back(prefix + "缺少 passwd 字段");
            } else if (isPlaceholder(db["passwd"].asString())) {
                warnings.push_back(prefix + "passwd 看起来是占位符");
            }
        }
    }

    static void validateJwt(const Json::Value& jwt, std::vector<std::string>& errors,
                            std::vector<std::string>& warnings) {
        if (!jwt.isObject()) {
            errors.emplace_back("[custom_config.jwt] 缺少 JWT 配置");
            return;
        }

        auto secret = jwt.get("secret", "").asString();
        if (secret.empty()) {
            errors.emplace_back("[jwt] 缺少 secret 字段");
        } else if (isPlaceholder(secret)) {
            warnings.emplace_back("[jwt] secret 看起来是占位符");
        } else if (secret.size() < 32) {
            warnings.push_back("[jwt] secret 只有 " + std::to_string(secret.size()) + " 个字符，建议至少 32 个");
        }

        const auto& expires = jwt["access_token_expires_in"];
        if (!expires.isIntegral() || expires.asInt() <= 0) {
            errors.emplace_back("[jwt] access_token_expires_in 必须为正整数（秒）");
        }
    }

    static void validateOperators(const Json::Value& ops, std::vector<std::string>& errors,
                                  std::vector<std::string>& warnings) {
        if (!ops.isArray() || ops.empty()) {
            errors.emplace_back("[custom_config.operators] 需要至少一个操作员账号");
            return;
        }

        std::set<std::string> names;
        for (Json::ArrayIndex i = 0; i < ops.size(); ++i) {
            auto prefix = "[operators[" + std::to_string(i) + "]] ";

            auto username = ops[i].get("username", "").asString();
            if (username.empty()) {
                errors.push_back(prefix + "缺少 username 字段");
            } else if (!names.insert(username).second) {
                errors.push_back(prefix + "username 重复: " + username);
            }

            auto hash = ops[i].get("password_hash", "").asString();
            auto dollar = hash.find('$');
            if (hash.empty()) {
                errors.push_back(prefix + "缺少 password_hash 字段");
            } else if (isPlaceholder(hash)) {
                warnings.push_back(prefix + "password_hash 看起来是占位符，该账号无法登录");
            } else if (dollar == std::string::npos || dollar == 0 || dollar + 1 == hash.size()) {
                errors.push_back(prefix + "password_hash 格式应为 salt$hash（PBKDF2）");
            }
        }
    }

    static void validatePort(const Json::Value& obj, const std::string& prefix, std::vector<std::string>& errors) {
        if (!obj["port"].isIntegral()) {
            errors.push_back(prefix + "缺少 port 字段");
            return;
        }
        int port = obj["port"].asInt();
        if (port < 1 || port > 65535) {
            errors.push_back(prefix + "port 超出范围 1-65535: " + std::to_string(port));
        }
    }

    static bool isPlaceholder(const std::string& value) {
        return value.starts_with("YOUR_") || value.find("CHANGE_ME") != std::string::npos;
    }

    // ─── 应用 ──────────────────────────────────────────────────

    static void apply(const Json::Value& root) {
        const auto& db = root["db_clients"][0];
        auto& settings = DbClientSettings::current();
        settings.name = db.get("name", "default").asString();
        settings.fast = db.get("is_fast", false).asBool();

        // 已通过验证，这里的错误列表必为空
        std::vector<std::string> unused;
        const auto& custom = root["custom_config"];
        logSettings_ = LogSettings::fromJson(custom["logging"], unused);
        pipelineConfig_ = PipelineConfig::fromJson(custom["hazard"], unused);
        for (const auto& op : custom["operators"]) {
            operators_[op["username"].asString()] = op["password_hash"].asString();
        }
    }

    // ─── 输出 ──────────────────────────────────────────────────

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '=') << "\n [ERROR] " << title << "\n" << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << std::string(60, '=') << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::endl;
    }
};
