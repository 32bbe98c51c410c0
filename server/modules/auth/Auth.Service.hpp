#pragma once

#include "common/utils/JwtUtils.hpp"
#include "common/utils/PasswordUtils.hpp"
#include "common/utils/ConfigManager.hpp"

/**
 * @brief 操作员认证服务
 *
 * 操作员账号来自配置文件（custom_config.operators，PBKDF2 口令哈希），
 * 登录成功签发只携带 username 的访问令牌。
 */
class AuthService {
public:
    AuthService() : jwtUtils_(JwtUtils::fromConfig(drogon::app().getCustomConfig())) {}

    /**
     * @brief 操作员登录
     * @return {token, expiresIn, username}
     * @throws AppException 用户名或口令错误
     */
    Json::Value login(const std::string& username, const std::string& password) const {
        auto hash = ConfigManager::findOperatorHash(username);
        if (!hash || !PasswordUtils::verifyPassword(password, *hash)) {
            LOG_WARN << "[Auth] Login failed for operator '" << username << "'";
            throw AuthException::CredentialsInvalid();
        }

        Json::Value data;
        data["token"] = jwtUtils_.issue(username);
        data["expiresIn"] = jwtUtils_.expiresIn();
        data["username"] = username;

        LOG_INFO << "[Auth] Operator '" << username << "' logged in";
        return data;
    }

private:
    JwtUtils jwtUtils_;
};
