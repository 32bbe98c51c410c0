#include <gtest/gtest.h>

#include "common/utils/ErrorCodes.hpp"
#include "common/utils/JwtUtils.hpp"
#include "common/utils/PasswordUtils.hpp"
#include "common/network/WebSocketManager.hpp"

class JwtUtilsTest : public ::testing::Test {
protected:
    JwtUtils jwt{"unit-test-secret", 3600};

    static int codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const AppException& e) {
            return e.getCode();
        }
        return 0;
    }

    static std::vector<std::string> segments(const std::string& token) {
        std::vector<std::string> parts;
        std::stringstream ss(token);
        std::string part;
        while (std::getline(ss, part, '.')) parts.push_back(part);
        return parts;
    }
};

TEST_F(JwtUtilsTest, IssuedTokenVerifies) {
    auto claims = jwt.verify(jwt.issue("operator"));
    EXPECT_EQ(claims.username, "operator");
    EXPECT_EQ(claims.expiresAt - claims.issuedAt, 3600);
}

TEST_F(JwtUtilsTest, FromConfigReadsSecretAndLifetime) {
    Json::Value custom;
    custom["jwt"]["secret"] = "unit-test-secret";
    custom["jwt"]["access_token_expires_in"] = 600;
    auto fromConfig = JwtUtils::fromConfig(custom);
    EXPECT_EQ(fromConfig.expiresIn(), 600);
    // 同一密钥签发的令牌可以互相校验
    EXPECT_EQ(jwt.verify(fromConfig.issue("operator")).username, "operator");
}

TEST_F(JwtUtilsTest, SplicedPayloadIsRejected) {
    auto victim = segments(jwt.issue("operator"));
    auto other = segments(jwt.issue("admin"));
    ASSERT_EQ(victim.size(), 3u);
    ASSERT_EQ(other.size(), 3u);

    auto spliced = victim[0] + "." + other[1] + "." + victim[2];
    EXPECT_EQ(codeOf([&] { jwt.verify(spliced); }), ErrorCodes::UNAUTHORIZED);
}

TEST_F(JwtUtilsTest, WrongSecretAndMalformedTokensAreRejected) {
    auto token = JwtUtils("another-secret").issue("operator");
    EXPECT_EQ(codeOf([&] { jwt.verify(token); }), ErrorCodes::UNAUTHORIZED);
    EXPECT_EQ(codeOf([&] { jwt.verify("not-a-token"); }), ErrorCodes::UNAUTHORIZED);
    EXPECT_EQ(codeOf([&] { jwt.verify("a.b.c.d"); }), ErrorCodes::UNAUTHORIZED);
    EXPECT_EQ(codeOf([&] { jwt.verify(""); }), ErrorCodes::UNAUTHORIZED);
}

TEST_F(JwtUtilsTest, ExpiredTokenIsRejected) {
    JwtUtils shortLived("unit-test-secret", -60);
    auto token = shortLived.issue("operator");
    EXPECT_EQ(codeOf([&] { shortLived.verify(token); }), ErrorCodes::TOKEN_EXPIRED);
}

TEST(PasswordUtilsTest, HashVerifiesOnlyOriginalPassword) {
    auto hashed = PasswordUtils::hashPassword("s3cret-pass");
    EXPECT_NE(hashed.find('$'), std::string::npos);
    EXPECT_TRUE(PasswordUtils::verifyPassword("s3cret-pass", hashed));
    EXPECT_FALSE(PasswordUtils::verifyPassword("s3cret-Pass", hashed));
}

TEST(PasswordUtilsTest, SaltDiffersPerHash) {
    auto a = PasswordUtils::hashPassword("same");
    auto b = PasswordUtils::hashPassword("same");
    EXPECT_NE(a, b);
    EXPECT_TRUE(PasswordUtils::verifyPassword("same", b));
}

TEST(PasswordUtilsTest, MalformedHashNeverVerifies) {
    EXPECT_FALSE(PasswordUtils::verifyPassword("anything", "no-separator"));
}

TEST(WsSessionTest, TopicFilterMatchesTypePrefix) {
    WsSession session;
    EXPECT_TRUE(session.accepts("simulation:failed"));

    session.topics = {"alert", "source-area"};
    EXPECT_TRUE(session.accepts("alert:raised"));
    EXPECT_TRUE(session.accepts("source-area:updated"));
    EXPECT_FALSE(session.accepts("risk:assessed"));
    EXPECT_FALSE(session.accepts("alerting"));
}

TEST(PasswordUtilsTest, NonHexSaltNeverVerifies) {
    auto hashed = PasswordUtils::hashPassword("pw");
    auto tampered = "zz" + hashed.substr(2);
    EXPECT_FALSE(PasswordUtils::verifyPassword("pw", tampered));
    EXPECT_FALSE(PasswordUtils::verifyPassword("pw", "$" + hashed.substr(hashed.find('$') + 1)));
}
