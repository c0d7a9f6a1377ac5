#include "core/Token.hpp"

#include <gtest/gtest.h>

TEST(TokenTest, Parse) {
    const auto TOKEN = CToken::fromString("0a1b2c-1700000000000-c2lnbmF0dXJl");

    ASSERT_TRUE(TOKEN.has_value());
    EXPECT_EQ(TOKEN->raw(), "0a1b2c");
    EXPECT_EQ(TOKEN->nonce(), 1700000000000u);
    EXPECT_EQ(TOKEN->signature(), "c2lnbmF0dXJl");
    EXPECT_EQ(TOKEN->signedMaterial(), "0a1b2c-1700000000000");
    EXPECT_EQ(TOKEN->tokenString(), "0a1b2c-1700000000000-c2lnbmF0dXJl");
}

TEST(TokenTest, ZeroNonce) {
    const auto TOKEN = CToken::fromString("abc-0-sig");

    ASSERT_TRUE(TOKEN.has_value());
    EXPECT_EQ(TOKEN->nonce(), 0u);
}

TEST(TokenTest, Format) {
    EXPECT_EQ(CToken("abc", 42, "c2ln").tokenString(), "abc-42-c2ln");
    EXPECT_EQ(CToken::signedMaterial("abc", 42), "abc-42");
}

TEST(TokenTest, Malformed) {
    const char* const BAD[] = {
        "",
        "not-a-token",
        "abc",
        "abc-123",
        "abc-123-sig-extra",
        "-123-sig",
        "abc--sig",
        "abc-123-",
        "abc-+1-sig",
        "abc- 1-sig",
        "abc-1.5-sig",
        "abc-0x10-sig",
        "abc-99999999999999999999999-sig",
        "abc-0123-sig",
        "abc-00-sig",
    };

    for (const auto* s : BAD) {
        EXPECT_FALSE(CToken::fromString(s).has_value()) << s;
    }
}
