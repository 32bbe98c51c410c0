#pragma once

/**
 * @brief WebSocket 连接会话（存储在连接 context 中）
 *
 * topics 为空表示接收全部推送；否则只推送 type 前缀（冒号前部分）在集合中的消息。
 */
struct WsSession {
    std::string username;
    std::set<std::string> topics;

    bool accepts(const std::string& type) const {
        if (topics.empty()) return true;
        return topics.count(type.substr(0, type.find(':'))) > 0;
    }
};

/**
 * @brief 推送主题（消息 type 的前缀）
 */
inline const std::set<std::string>& wsTopics() {
    static const std::set<std::string> topics = {
        "event", "risk", "simulation", "zone", "alert", "source-area"
    };
    return topics;
}

/**
 * @brief WebSocket 连接管理器（单例）
 *
 * 流水线状态变化按主题推送给已连接的操作员。
 * 会话的主题集合在 shared_mutex 保护下修改，推送时按会话过滤。
 *
 * 消息格式：
 * { "type": "alert:raised", "data": {...}, "ts": 1234567890 }
 */
class WebSocketManager {
public:
    using WebSocketConnectionPtr = drogon::WebSocketConnectionPtr;

    static WebSocketManager& instance() {
        static WebSocketManager mgr;
        return mgr;
    }

    void addConnection(const WebSocketConnectionPtr& conn, std::shared_ptr<WsSession> session) {
        std::unique_lock lock(mutex_);
        LOG_INFO << "[WS] Operator " << session->username << " connected, total: " << sessions_.size() + 1;
        conn->setContext(session);
        sessions_[conn] = std::move(session);
    }

    void removeConnection(const WebSocketConnectionPtr& conn) {
        std::unique_lock lock(mutex_);
        auto it = sessions_.find(conn);
        if (it == sessions_.end()) return;
        LOG_INFO << "[WS] Operator " << it->second->username << " disconnected, total: " << sessions_.size() - 1;
        sessions_.erase(it);
    }

    /**
     * @brief 替换连接订阅的主题，未知主题被忽略
     * @return 实际生效的主题
     */
    std::set<std::string> subscribe(const WebSocketConnectionPtr& conn, const std::vector<std::string>& topics) {
        std::set<std::string> accepted;
        for (const auto& t : topics) {
            if (wsTopics().count(t)) accepted.insert(t);
        }
        std::unique_lock lock(mutex_);
        auto it = sessions_.find(conn);
        if (it != sessions_.end()) it->second->topics = accepted;
        return accepted;
    }

    void broadcast(const std::string& type, const Json::Value& data) {
        std::string msg;
        std::shared_lock lock(mutex_);
        for (const auto& [conn, session] : sessions_) {
            if (!conn->connected() || !session->accepts(type)) continue;
            if (msg.empty()) msg = buildMessage(type, data);
            conn->send(msg);
        }
    }

    size_t connectionCount() const {
        std::shared_lock lock(mutex_);
        return sessions_.size();
    }

    static std::string buildMessage(const std::string& type, const Json::Value& data) {
        Json::Value msg;
        msg["type"] = type;
        msg["data"] = data;
        msg["ts"] = static_cast<Json::Int64>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, msg);
    }

private:
    WebSocketManager() = default;

    std::map<WebSocketConnectionPtr, std::shared_ptr<WsSession>> sessions_;
    mutable std::shared_mutex mutex_;
};
