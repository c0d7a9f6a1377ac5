#include "core/Crypto.hpp"

#include <gtest/gtest.h>

TEST(CryptoTest, ConstantTimeEquals) {
    EXPECT_TRUE(NCrypto::constantTimeEquals("", ""));
    EXPECT_TRUE(NCrypto::constantTimeEquals("abcdef", "abcdef"));

    EXPECT_FALSE(NCrypto::constantTimeEquals("abcdef", "xbcdef"));
    EXPECT_FALSE(NCrypto::constantTimeEquals("abcdef", "abcdex"));
}

TEST(CryptoTest, ConstantTimeEqualsLength) {
    // a shared prefix must not be enough
    EXPECT_FALSE(NCrypto::constantTimeEquals("abc", "abcd"));
    EXPECT_FALSE(NCrypto::constantTimeEquals("abcd", "abc"));
    EXPECT_FALSE(NCrypto::constantTimeEquals("", "a"));

    // padding with zero bytes must not make them equal either
    EXPECT_FALSE(NCrypto::constantTimeEquals(std::string_view{"ab"}, std::string_view{"ab\0", 3}));
}

TEST(CryptoTest, ConstantTimeEqualsBytes) {
    const std::vector<uint8_t> A = {1, 2, 3, 4};
    const std::vector<uint8_t> B = {1, 2, 3, 5};

    EXPECT_TRUE(NCrypto::constantTimeEquals(A, A));
    EXPECT_FALSE(NCrypto::constantTimeEquals(A, B));
    EXPECT_FALSE(NCrypto::constantTimeEquals(A, std::span<const uint8_t>{A}.first(3)));
}
