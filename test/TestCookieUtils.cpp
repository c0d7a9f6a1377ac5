#include "helpers/CookieUtils.hpp"

#include <gtest/gtest.h>

TEST(CookieUtilsTest, ParseCookieHeader) {
    const auto COOKIES = NCookieUtils::parseCookieHeader("a=1; csrf-token=abc-1-x/y+z=;b=\"quoted\" ; junk; =nameless");

    ASSERT_EQ(COOKIES.size(), 3u);
    EXPECT_EQ(COOKIES[0].first, "a");
    EXPECT_EQ(COOKIES[0].second, "1");
    EXPECT_EQ(COOKIES[1].first, "csrf-token");
    EXPECT_EQ(COOKIES[1].second, "abc-1-x/y+z=");
    EXPECT_EQ(COOKIES[2].first, "b");
    EXPECT_EQ(COOKIES[2].second, "quoted");

    EXPECT_TRUE(NCookieUtils::parseCookieHeader("").empty());
}

TEST(CookieUtilsTest, FindCookie) {
    EXPECT_EQ(NCookieUtils::findCookie("a=1; a=2; b=3", "a"), "1");
    EXPECT_EQ(NCookieUtils::findCookie("a=1; b=3", "b"), "3");
    EXPECT_FALSE(NCookieUtils::findCookie("a=1; b=3", "B").has_value());
    EXPECT_FALSE(NCookieUtils::findCookie("", "a").has_value());
}

TEST(CookieUtilsTest, FormatSetCookie) {
    SCookie cookie;
    cookie.name     = "csrf-token";
    cookie.value    = "v";
    cookie.path     = "/";
    cookie.domain   = "example.com";
    cookie.sameSite = "Lax";
    cookie.secure   = true;

    EXPECT_EQ(NCookieUtils::formatSetCookie(cookie), "csrf-token=v; Domain=example.com; Path=/; Secure; SameSite=Lax");

    SCookie bare;
    bare.name  = "a";
    bare.value = "";
    EXPECT_EQ(NCookieUtils::formatSetCookie(bare), "a=");
}

TEST(CookieUtilsTest, ParseSetCookie) {
    const auto COOKIE = NCookieUtils::parseSetCookie("sid=abc; Path=/app; HttpOnly; max-age=60; Expires=Wed, 21 Oct 2015 07:28:00 GMT; secure");

    ASSERT_TRUE(COOKIE.has_value());
    EXPECT_EQ(COOKIE->name, "sid");
    EXPECT_EQ(COOKIE->value, "abc");
    EXPECT_EQ(COOKIE->path, "/app");
    EXPECT_TRUE(COOKIE->httpOnly);
    EXPECT_TRUE(COOKIE->secure);
    EXPECT_EQ(COOKIE->maxAge, 60);
    ASSERT_EQ(COOKIE->extensions.size(), 1u);
    EXPECT_EQ(COOKIE->extensions[0], "Expires=Wed, 21 Oct 2015 07:28:00 GMT");

    // and back, attributes in our order
    EXPECT_EQ(NCookieUtils::formatSetCookie(*COOKIE), "sid=abc; Path=/app; Max-Age=60; Secure; HttpOnly; Expires=Wed, 21 Oct 2015 07:28:00 GMT");
}

TEST(CookieUtilsTest, ParseSetCookieInvalid) {
    EXPECT_FALSE(NCookieUtils::parseSetCookie("").has_value());
    EXPECT_FALSE(NCookieUtils::parseSetCookie("novalue").has_value());
    EXPECT_FALSE(NCookieUtils::parseSetCookie("=x; Path=/").has_value());
}
