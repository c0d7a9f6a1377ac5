#include "helpers/Encoding.hpp"

#include <gtest/gtest.h>

static std::vector<uint8_t> bytesOf(std::string_view s) {
    return std::vector<uint8_t>{s.begin(), s.end()};
}

TEST(EncodingTest, Hex) {
    const std::vector<uint8_t> BYTES = {0x00, 0xab, 0x10, 0xff};

    EXPECT_EQ(NEncoding::toHex(BYTES), "00ab10ff");
    EXPECT_EQ(NEncoding::fromHex("00ab10ff"), BYTES);
    EXPECT_EQ(NEncoding::toHex(std::vector<uint8_t>{}), "");
}

TEST(EncodingTest, BadHex) {
    EXPECT_FALSE(NEncoding::fromHex("abc").has_value());
    EXPECT_FALSE(NEncoding::fromHex("zz").has_value());
    EXPECT_FALSE(NEncoding::fromHex("0x").has_value());
    EXPECT_FALSE(NEncoding::fromHex("a ").has_value());
}

TEST(EncodingTest, Base64) {
    EXPECT_EQ(NEncoding::toBase64(bytesOf("foobar")), "Zm9vYmFy");
    EXPECT_EQ(NEncoding::toBase64(bytesOf("fo")), "Zm8=");
    EXPECT_EQ(NEncoding::toBase64(bytesOf("f")), "Zg==");

    EXPECT_EQ(NEncoding::fromBase64("Zm9vYmFy"), bytesOf("foobar"));
    EXPECT_EQ(NEncoding::fromBase64("Zm8="), bytesOf("fo"));
    EXPECT_EQ(NEncoding::fromBase64("Zg=="), bytesOf("f"));
}

TEST(EncodingTest, Base64OnlyCanonical) {
    // same bytes as Zm8= but with non-zero trailing bits
    EXPECT_FALSE(NEncoding::fromBase64("Zm9=").has_value());

    EXPECT_FALSE(NEncoding::fromBase64("").has_value());
    EXPECT_FALSE(NEncoding::fromBase64("Zm8").has_value());
    EXPECT_FALSE(NEncoding::fromBase64("Zm8*").has_value());
    EXPECT_FALSE(NEncoding::fromBase64(" Zm8=").has_value());
    EXPECT_FALSE(NEncoding::fromBase64("Zm-8").has_value());
}

TEST(EncodingTest, Alphabets) {
    EXPECT_TRUE(NEncoding::isLowerHex("0123456789abcdef"));
    EXPECT_FALSE(NEncoding::isLowerHex("ABCDEF"));
    EXPECT_TRUE(NEncoding::isDigits("0123456789"));
    EXPECT_FALSE(NEncoding::isDigits("12a"));
    EXPECT_FALSE(NEncoding::isDigits("-1"));
}
