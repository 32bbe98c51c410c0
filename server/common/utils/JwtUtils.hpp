#pragma once

#include "AppException.hpp"
#include "JsonHelper.hpp"

/**
 * @brief 访问令牌中携带的操作员信息
 */
struct OperatorClaims {
    std::string username;
    int64_t issuedAt = 0;
    int64_t expiresAt = 0;
};

/**
 * @brief JWT 工具类（HS256）
 *
 * 只签发和接受 alg=HS256、带 exp 的令牌。
 */
class JwtUtils {
public:
    JwtUtils(std::string secret, int expiresIn = 3600)
        : secret_(std::move(secret)), expiresIn_(expiresIn) {}

    /**
     * @brief 按 custom_config.jwt 构造
     */
    static JwtUtils fromConfig(const Json::Value& customConfig) {
        const auto& jwt = customConfig["jwt"];
        return JwtUtils(jwt["secret"].asString(), jwt.get("access_token_expires_in", 3600).asInt());
    }

    int expiresIn() const { return expiresIn_; }

    /**
     * @brief 为操作员签发访问令牌
     */
    std::string issue(const std::string& username) const {
        auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        Json::Value payload;
        payload["username"] = username;
        payload["iat"] = Json::Int64(now);
        payload["exp"] = Json::Int64(now + expiresIn_);

        std::string signingInput = base64UrlEncode(JsonHelper::serialize(header()))
            + "." + base64UrlEncode(JsonHelper::serialize(payload));
        return signingInput + "." + base64UrlEncode(hmacSha256(signingInput));
    }

    /**
     * @brief 校验令牌并取出操作员信息
     * @throws AppException TokenInvalid（格式、算法、签名、缺少字段）或 TokenExpired
     */
    OperatorClaims verify(const std::string& token) const {
        auto firstDot = token.find('.');
        auto secondDot = firstDot == std::string::npos ? std::string::npos : token.find('.', firstDot + 1);
        if (secondDot == std::string::npos || token.find('.', secondDot + 1) != std::string::npos) {
            throw AuthException::TokenInvalid();
        }

        auto signingInput = token.substr(0, secondDot);
        auto expected = base64UrlEncode(hmacSha256(signingInput));
        auto signature = token.substr(secondDot + 1);

        // 常量时间比较
        if (signature.size() != expected.size()
            || CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
            throw AuthException::TokenInvalid();
        }

        auto head = parse(base64UrlDecode(token.substr(0, firstDot)));
        if (head.get("alg", "").asString() != "HS256") {
            throw AuthException::TokenInvalid();
        }

        auto payload = parse(base64UrlDecode(token.substr(firstDot + 1, secondDot - firstDot - 1)));
        if (!payload["username"].isString() || payload["username"].asString().empty()
            || !payload["exp"].isIntegral()) {
            throw AuthException::TokenInvalid();
        }

        OperatorClaims claims;
        claims.username = payload["username"].asString();
        claims.issuedAt = payload.get("iat", 0).asInt64();
        claims.expiresAt = payload["exp"].asInt64();

        auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        if (now > claims.expiresAt) {
            throw AuthException::TokenExpired();
        }
        return claims;
    }

private:
    std::string secret_;
    int expiresIn_;

    static const Json::Value& header() {
        static const Json::Value value = [] {
            Json::Value h;
            h["alg"] = "HS256";
            h["typ"] = "JWT";
            return h;
        }();
        return value;
    }

    static Json::Value parse(const std::string& text) {
        auto json = JsonHelper::tryParse(text);
        if (!json || !json->isObject()) throw AuthException::TokenInvalid();
        return std::move(*json);
    }

    static std::string base64UrlEncode(const std::string& input) {
        std::string out(4 * ((input.size() + 2) / 3), '\0');
        int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(input.data()),
                                static_cast<int>(input.size()));
        out.resize(static_cast<size_t>(n));

        while (!out.empty() && out.back() == '=') out.pop_back();
        for (char& c : out) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        return out;
    }

    static std::string base64UrlDecode(std::string input) {
        for (char& c : input) {
            if (c == '-') c = '+';
            else if (c == '_') c = '/';
        }
        size_t padding = (4 - input.size() % 4) % 4;
        if (padding == 3) throw AuthException::TokenInvalid();
        input.append(padding, '=');

        std::string out(3 * input.size() / 4, '\0');
        int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(input.data()),
                                static_cast<int>(input.size()));
        if (n < 0) throw AuthException::TokenInvalid();
        // EVP_DecodeBlock 把填充也计入输出长度
        out.resize(static_cast<size_t>(n) - padding);
        return out;
    }

    std::string hmacSha256(const std::string& data) const {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int digestLen = 0;

        HMAC(EVP_sha256(),
             secret_.data(), static_cast<int>(secret_.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             digest.data(), &digestLen);

        return std::string(reinterpret_cast<const char*>(digest.data()), digestLen);
    }
};
