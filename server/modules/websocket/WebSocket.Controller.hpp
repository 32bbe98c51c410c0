#pragma once

#include "common/network/WebSocketManager.hpp"
#include "common/utils/JwtUtils.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief WebSocket 控制器
 *
 * 路径：/ws
 * 认证：Sec-WebSocket-Protocol 传递 JWT（["auth", "<jwt>"]），也接受 Authorization 头
 * 客户端消息：
 * - {"type":"ping"} → {"type":"pong"}
 * - {"type":"subscribe","topics":["alert","risk"]} → {"type":"subscribed","data":{"topics":[...]}}
 *   空数组恢复为接收全部主题
 */
class WsController : public drogon::WebSocketController<WsController> {
public:
    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/ws");
    WS_PATH_LIST_END

    WsController() : jwtUtils_(JwtUtils::fromConfig(drogon::app().getCustomConfig())) {}

    void handleNewConnection(const drogon::HttpRequestPtr& req,
                             const drogon::WebSocketConnectionPtr& conn) override {
        std::string token = tokenFromProtocol(req->getHeader("Sec-WebSocket-Protocol"));
        if (token.empty()) {
            auto authHeader = req->getHeader("Authorization");
            if (authHeader.starts_with("Bearer ")) token = authHeader.substr(7);
        }

        if (token.empty()) {
            conn->send(buildError("auth_failed", "认证令牌缺失"));
            conn->shutdown(drogon::CloseCode::kViolation, "No token");
            return;
        }

        OperatorClaims claims;
        try {
            claims = jwtUtils_.verify(token);
        } catch (const AppException& e) {
            LOG_WARN << "[WS] Auth failed from " << req->peerAddr().toIp() << ": " << e.getMessage();
            conn->send(buildError("auth_failed", e.getMessage()));
            conn->shutdown(drogon::CloseCode::kViolation, "Auth failed");
            return;
        }

        auto session = std::make_shared<WsSession>();
        session->username = claims.username;
        WebSocketManager::instance().addConnection(conn, session);

        Json::Value data;
        data["username"] = claims.username;
        data["topics"] = topicsJson(wsTopics());
        conn->send(WebSocketManager::buildMessage("connected", data));
    }

    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                          std::string&& message,
                          const drogon::WebSocketMessageType& type) override {
        if (type == drogon::WebSocketMessageType::Ping) {
            conn->send(message, drogon::WebSocketMessageType::Pong);
            return;
        }
        if (type != drogon::WebSocketMessageType::Text) return;

        auto parsed = JsonHelper::tryParse(message);
        if (!parsed || !parsed->isObject()) {
            conn->send(buildError("bad_message", "消息必须是 JSON 对象"));
            return;
        }
        const auto& msg = *parsed;

        auto msgType = msg.get("type", "").asString();
        if (msgType == "ping") {
            conn->send(WebSocketManager::buildMessage("pong", Json::Value()));
        } else if (msgType == "subscribe") {
            std::vector<std::string> requested;
            for (const auto& t : msg["topics"]) {
                if (t.isString()) requested.push_back(t.asString());
            }
            auto topics = WebSocketManager::instance().subscribe(conn, requested);
            Json::Value data;
            data["topics"] = topicsJson(topics.empty() ? wsTopics() : topics);
            conn->send(WebSocketManager::buildMessage("subscribed", data));
        } else {
            conn->send(buildError("bad_message", "未知消息类型: " + msgType));
        }
    }

    void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override {
        WebSocketManager::instance().removeConnection(conn);
    }

private:
    JwtUtils jwtUtils_;

    /**
     * @brief 约定 new WebSocket(url, ["auth", "<jwt>"])
     */
    static std::string tokenFromProtocol(const std::string& header) {
        std::vector<std::string> parts;
        std::stringstream ss(header);
        std::string part;
        while (std::getline(ss, part, ',')) {
            auto start = part.find_first_not_of(" \t");
            if (start == std::string::npos) continue;
            auto end = part.find_last_not_of(" \t");
            parts.push_back(part.substr(start, end - start + 1));
        }
        if (parts.size() >= 2 && parts[0] == "auth") return parts[1];
        return "";
    }

    static Json::Value topicsJson(const std::set<std::string>& topics) {
        Json::Value arr(Json::arrayValue);
        for (const auto& t : topics) arr.append(t);
        return arr;
    }

    static std::string buildError(const std::string& code, const std::string& message) {
        Json::Value data;
        data["code"] = code;
        data["message"] = message;
        return WebSocketManager::buildMessage("error", data);
    }
};
