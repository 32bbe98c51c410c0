#pragma once

#include "../utils/Constants.hpp"
#include "../utils/JsonHelper.hpp"

/**
 * @brief 请求/响应拦截器
 *
 * - 每个请求分配 X-Request-Id（客户端提供时沿用），写入响应头与访问日志
 * - 访问日志：5xx 记 WARN，慢请求记 INFO，其余 DEBUG
 * - 请求体与查询参数中的 token/password/secret 字段脱敏；观测批量只记录条数
 * - /api/ 下的响应禁止缓存（风险与告警是实时状态）
 */
class RequestAdvices {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using enum drogon::HttpMethod;

    static void setup() {
        drogon::app().registerPreHandlingAdvice([](const HttpRequestPtr& req) {
            auto attrs = req->attributes();
            attrs->insert("startTime", std::chrono::steady_clock::now());

            auto requestId = req->getHeader("X-Request-Id");
            if (requestId.empty() || requestId.size() > 64) requestId = drogon::utils::getUuid();
            attrs->insert("requestId", requestId);

            if (req->method() != Get && !req->body().empty()) {
                attrs->insert("requestBody", describeBody(req));
            }
        });

        drogon::app().registerPostHandlingAdvice([](const HttpRequestPtr& req, const HttpResponsePtr& resp) {
            const auto& attrs = req->attributes();
            auto requestId = attrs->find("requestId") ? attrs->get<std::string>("requestId") : std::string("-");
            resp->addHeader("X-Request-Id", requestId);
            if (req->path().starts_with("/api/") && resp->getHeader("Cache-Control").empty()) {
                resp->addHeader("Cache-Control", "no-store");
            }
            logAccess(req, resp, requestId);
        });
    }

private:
    static void logAccess(const HttpRequestPtr& req, const HttpResponsePtr& resp, const std::string& requestId) {
        const auto& attrs = req->attributes();
        int64_t elapsedMs = -1;
        if (attrs->find("startTime")) {
            elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - attrs->get<std::chrono::steady_clock::time_point>("startTime")).count();
        }

        std::ostringstream line;
        line << "[" << requestId << "] [" << (attrs->find("username") ? attrs->get<std::string>("username") : "-")
             << "] " << req->methodString() << " " << req->path();
        auto query = redactQuery(req->query());
        if (!query.empty()) line << "?" << query;
        line << " -> " << static_cast<int>(resp->statusCode()) << " (" << elapsedMs << "ms)";
        if (attrs->find("requestBody")) line << " " << attrs->get<std::string>("requestBody");

        int status = static_cast<int>(resp->statusCode());
        if (status >= 500) {
            LOG_WARN << line.str();
        } else if (elapsedMs >= Constants::SLOW_REQUEST_MS) {
            LOG_INFO << "[Slow] " << line.str();
        } else {
            LOG_DEBUG << line.str();
        }
    }

    static bool isSensitive(std::string key) {
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        for (const char* word : {"token", "password", "passwd", "secret", "authorization"}) {
            if (key.find(word) != std::string::npos) return true;
        }
        return false;
    }

    static std::string truncate(const std::string& value) {
        if (value.size() <= static_cast<size_t>(Constants::REQUEST_LOG_MAX_LENGTH)) return value;
        return value.substr(0, Constants::REQUEST_LOG_MAX_LENGTH) + "...(truncated)";
    }

    static void redact(Json::Value& value) {
        if (value.isObject()) {
            for (const auto& name : value.getMemberNames()) {
                if (isSensitive(name)) {
                    value[name] = "[REDACTED]";
                } else {
                    redact(value[name]);
                }
            }
        } else if (value.isArray()) {
            for (auto& item : value) redact(item);
        }
    }

    static std::string describeBody(const HttpRequestPtr& req) {
        if (req->method() == Post && req->path() == "/api/weather/observations") {
            auto json = req->getJsonObject();
            if (json && (*json)["observations"].isArray()) {
                return "[observation-batch count=" + std::to_string((*json)["observations"].size()) + "]";
            }
            return "[observation-batch length=" + std::to_string(req->body().size()) + "]";
        }

        auto parsed = JsonHelper::tryParse(std::string(req->body()));
        if (!parsed) return "[non-json-body length=" + std::to_string(req->body().size()) + "]";
        redact(*parsed);
        return truncate(JsonHelper::serialize(*parsed));
    }

    static std::string redactQuery(const std::string& query) {
        std::stringstream in(query);
        std::string out;
        std::string pair;
        while (std::getline(in, pair, '&')) {
            if (!out.empty()) out += '&';
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                out += pair;
                continue;
            }
            auto key = pair.substr(0, eq);
            out += key + "=" + (isSensitive(key) ? std::string("[REDACTED]") : truncate(pair.substr(eq + 1)));
        }
        return out;
    }
};
