#pragma once

#include "common/utils/JwtUtils.hpp"
#include "common/utils/Response.hpp"

/**
 * @brief 操作员 JWT 校验
 *
 * 要求 "Authorization: Bearer <jwt>"；通过后写入请求属性 "username"。
 */
class AuthFilter : public drogon::HttpFilter<AuthFilter> {
public:
    AuthFilter() : jwtUtils_(JwtUtils::fromConfig(drogon::app().getCustomConfig())) {}

    void doFilter(const drogon::HttpRequestPtr& req,
                  drogon::FilterCallback&& reject,
                  drogon::FilterChainCallback&& next) override {
        static constexpr std::string_view BEARER = "Bearer ";

        const auto& header = req->getHeader("Authorization");
        if (header.empty()) return reject(Response::unauthorized("缺少认证令牌"));
        if (!header.starts_with(BEARER)) return reject(Response::unauthorized("令牌格式错误"));

        OperatorClaims claims;
        try {
            claims = jwtUtils_.verify(header.substr(BEARER.size()));
        } catch (const AppException& e) {
            LOG_DEBUG << "[Auth] Rejected token on " << req->path() << ": " << e.getMessage();
            return reject(Response::error(e));
        }

        req->attributes()->insert("username", claims.username);
        next();
    }

private:
    JwtUtils jwtUtils_;
};
