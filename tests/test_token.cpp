#include <gtest/gtest.h>
#include <agent-worker/util/json.hpp>
#include <agent-worker/worker/token.hpp>

using namespace agentworker;

TEST(Base64Url, Unpadded) {
    EXPECT_EQ(base64url_encode(""), "");
    EXPECT_EQ(base64url_encode("f"), "Zg");
    EXPECT_EQ(base64url_encode("fo"), "Zm8");
    EXPECT_EQ(base64url_encode("foo"), "Zm9v");
    EXPECT_EQ(base64url_encode("\xfb\xff"), "-_8");
}

TEST(AccessToken, KnownSignature) {
    auto token = mint_access_token_at("APIkey", "secret", 1700000000, std::chrono::seconds(600));
    EXPECT_EQ(token,
              "eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9."
              "eyJpc3MiOiJBUElrZXkiLCJuYmYiOjE3MDAwMDAwMDAsImV4cCI6MTcwMDAwMDYwMCwidmlkZW8iOnsiYWdlbnQiOnRydWV9fQ."
              "JpPwoPe0MNMKeYCO2RcW0_b_Z1MwuPOWoDc6K4U-axg");
}

TEST(AccessToken, ThreeSegments) {
    auto token = mint_access_token("k", "s");
    auto first = token.find('.');
    auto second = token.find('.', first + 1);
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_EQ(token.find('.', second + 1), std::string::npos);
    EXPECT_EQ(token.find('='), std::string::npos);
}
