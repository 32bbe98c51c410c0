#pragma once

#include "modules/simulation/domain/SimulationRun.hpp"

/**
 * @brief 执行器回报的运行状态
 */
struct ExecutorStatus {
    RunStatus status = RunStatus::Running;
    std::optional<std::string> outputPath;
    SimulationMetrics metrics;
    std::optional<std::string> errorMessage;

    /**
     * @brief 解析执行器轮询响应
     * @throws ExecutorException 状态字段缺失或无法识别
     */
    static ExecutorStatus fromJson(const Json::Value& json) {
        ExecutorStatus s;
        auto statusText = json.get("status", "").asString();
        if (statusText == "queued" || statusText == "submitted") statusText = "pending";
        auto status = runStatusFromString(statusText);
        if (!status) {
            throw ExecutorException("执行器返回未知状态: " + statusText);
        }
        s.status = *status;
        if (json.isMember("output_path") && json["output_path"].isString()) {
            s.outputPath = json["output_path"].asString();
        }
        if (json.isMember("metrics")) {
            try {
                s.metrics = SimulationMetrics::fromJson(json["metrics"]);
            } catch (const ValidationException& e) {
                throw ExecutorException(std::string("执行器返回的指标无效: ") + e.what());
            }
        }
        if (json.isMember("error_message") && json["error_message"].isString()) {
            s.errorMessage = json["error_message"].asString();
        }
        return s;
    }
};

/**
 * @brief 外部模拟执行器接口（提交/轮询/取消）
 *
 * 提交可能被重复调用（至少一次），但每个外部运行只会报告一次终态。
 */
class SimulationExecutor {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    virtual ~SimulationExecutor() = default;

    /**
     * @return 外部运行 ID
     * @throws ExecutorException
     */
    virtual Task<std::string> submit(const Json::Value& parameters,
                                     const std::string& modelName,
                                     const std::string& modelVersion) = 0;

    /**
     * @throws ExecutorException
     */
    virtual Task<ExecutorStatus> poll(const std::string& externalRunId) = 0;

    /**
     * @brief 通知执行器停止运行（协作式，执行器可忽略）
     */
    virtual Task<void> cancel(const std::string& externalRunId) = 0;
};

/**
 * @brief 基于 HTTP 的执行器
 *
 *   POST {base}/runs               {model_name, model_version, parameters} → {run_id}
 *   GET  {base}/runs/{id}          → {status, output_path?, metrics?, error_message?}
 *   POST {base}/runs/{id}/cancel
 */
class HttpSimulationExecutor : public SimulationExecutor {
public:
    static constexpr double REQUEST_TIMEOUT_SEC = 30.0;

    explicit HttpSimulationExecutor(const std::string& baseUrl)
        : client_(drogon::HttpClient::newHttpClient(baseUrl, drogon::app().getLoop())) {
        client_->setUserAgent("hazard-monitor");
    }

    Task<std::string> submit(const Json::Value& parameters,
                             const std::string& modelName,
                             const std::string& modelVersion) override {
        Json::Value body;
        body["model_name"] = modelName;
        body["model_version"] = modelVersion;
        body["parameters"] = parameters;

        auto req = drogon::HttpRequest::newHttpJsonRequest(body);
        req->setMethod(drogon::Post);
        req->setPath("/runs");

        auto json = co_await send(req, "submit");
        auto runId = json.get("run_id", "").asString();
        if (runId.empty()) {
            throw ExecutorException("执行器未返回 run_id");
        }
        co_return runId;
    }

    Task<ExecutorStatus> poll(const std::string& externalRunId) override {
        auto req = drogon::HttpRequest::newHttpRequest();
        req->setMethod(drogon::Get);
        req->setPath("/runs/" + externalRunId);

        auto json = co_await send(req, "poll");
        co_return ExecutorStatus::fromJson(json);
    }

    Task<void> cancel(const std::string& externalRunId) override {
        auto req = drogon::HttpRequest::newHttpRequest();
        req->setMethod(drogon::Post);
        req->setPath("/runs/" + externalRunId + "/cancel");
        co_await send(req, "cancel");
    }

private:
    drogon::HttpClientPtr client_;

    Task<Json::Value> send(const drogon::HttpRequestPtr& req, const char* action) {
        drogon::HttpResponsePtr resp;
        try {
            resp = co_await client_->sendRequestCoro(req, REQUEST_TIMEOUT_SEC);
        } catch (const std::exception& e) {
            throw ExecutorException(std::string("执行器 ") + action + " 请求失败: " + e.what());
        }

        auto code = static_cast<int>(resp->getStatusCode());
        if (code < 200 || code >= 300) {
            throw ExecutorException(std::string("执行器 ") + action + " 返回 HTTP " + std::to_string(code));
        }

        auto body = resp->getBody();
        if (body.empty()) co_return Json::Value(Json::objectValue);

        auto json = resp->getJsonObject();
        if (!json) {
            throw ExecutorException(std::string("执行器 ") + action + " 响应不是 JSON");
        }
        co_return *json;
    }
};
