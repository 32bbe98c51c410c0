#pragma once

#include "Auth.Service.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ControllerMacros.hpp"

/**
 * @brief 认证控制器
 */
class AuthController : public drogon::HttpController<AuthController> {
private:
    AuthService authService_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(AuthController::login, "/api/auth/login", Post);
    METHOD_LIST_END

    Task<HttpResponsePtr> login(HttpRequestPtr req) {
        auto json = ControllerUtils::getJson(req);
        std::string username = json->get("username", "").asString();
        std::string password = json->get("password", "").asString();

        if (username.empty() || password.empty()) {
            co_return Response::badRequest("用户名和密码不能为空");
        }

        co_return Response::ok(authService_.login(username, password), "登录成功");
    }
};
