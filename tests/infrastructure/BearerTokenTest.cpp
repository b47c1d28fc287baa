#include "infrastructure/BearerToken.hpp"

#include <gtest/gtest.h>

using desk::infrastructure::extract_bearer_token;

TEST(BearerToken, ReadsQueryParameter) {
    EXPECT_EQ(extract_bearer_token("/ws?token=abc123", ""), "abc123");
    EXPECT_EQ(extract_bearer_token("/ws?foo=1&token=abc123&bar=2", ""), "abc123");
}

TEST(BearerToken, PercentDecodesQueryValue) {
    EXPECT_EQ(extract_bearer_token("/ws?token=a%2Bb%3Dc", ""), "a+b=c");
    EXPECT_EQ(extract_bearer_token("/ws?token=two+words", ""), "two words");
}

TEST(BearerToken, IgnoresFragmentAndSimilarKeys) {
    EXPECT_EQ(extract_bearer_token("/ws?token=abc#frag", ""), "abc");
    EXPECT_FALSE(extract_bearer_token("/ws?access_token=abc", "").has_value());
    EXPECT_FALSE(extract_bearer_token("/ws?tokens=abc", "").has_value());
}

TEST(BearerToken, FallsBackToAuthorizationHeader) {
    EXPECT_EQ(extract_bearer_token("/ws", "Bearer xyz"), "xyz");
    EXPECT_EQ(extract_bearer_token("/ws", "bearer   xyz  "), "xyz");
    EXPECT_EQ(extract_bearer_token("/ws?token=", "BEARER xyz"), "xyz");
}

TEST(BearerToken, QueryTakesPrecedenceOverHeader) {
    EXPECT_EQ(extract_bearer_token("/ws?token=from-query", "Bearer from-header"), "from-query");
}

TEST(BearerToken, MissingOrEmptyCredentialIsAbsent) {
    EXPECT_FALSE(extract_bearer_token("/ws", "").has_value());
    EXPECT_FALSE(extract_bearer_token("/ws", "Bearer ").has_value());
    EXPECT_FALSE(extract_bearer_token("/ws", "Bearer    ").has_value());
    EXPECT_FALSE(extract_bearer_token("/ws", "Basic dXNlcjpwYXNz").has_value());
}
