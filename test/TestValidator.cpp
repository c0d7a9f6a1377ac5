#include "core/Validator.hpp"
#include "core/TokenFactory.hpp"
#include "core/Token.hpp"
#include "helpers/Encoding.hpp"

#include <gtest/gtest.h>

#include <type_traits>

static_assert(!std::is_convertible_v<std::shared_ptr<const CSigner>, CValidator>);

class ValidatorTest : public ::testing::Test {
  protected:
    CSecureRandom                  random;
    std::shared_ptr<const CSigner> signer = std::make_shared<const CSigner>(CSigningKey::generate());
    CTokenFactory                  factory{signer, random, {}};
    CValidator                     validator{signer};
};

TEST_F(ValidatorTest, RoundTrip) {
    for (const std::string RAW : {std::string{"abc"}, std::string{"0"}, factory.generateRaw()}) {
        EXPECT_EQ(validator.extractRaw(factory.signExisting(RAW)), RAW);
    }

    const auto TOKEN = factory.newToken();
    EXPECT_EQ(validator.extractRaw(TOKEN), CToken::fromString(TOKEN)->raw());
}

TEST_F(ValidatorTest, Errors) {
    EXPECT_EQ(validator.verify("garbage").error(), TOKEN_ERROR_MALFORMED);
    EXPECT_EQ(validator.verify("abc-1-!!!!").error(), TOKEN_ERROR_MALFORMED);
    EXPECT_EQ(validator.verify("abc-1-c2lnbmF0dXJl").error(), TOKEN_ERROR_BAD_SIGNATURE);
}

TEST_F(ValidatorTest, TamperedSignatureBytes) {
    const auto TOKEN     = CToken::fromString(factory.newToken());
    const auto SIGNATURE = NEncoding::fromBase64(TOKEN->signature());
    ASSERT_TRUE(SIGNATURE.has_value());

    for (size_t i = 0; i < SIGNATURE->size() * 8; ++i) {
        auto altered = *SIGNATURE;
        altered[i / 8] ^= (uint8_t)(1 << (i % 8));

        const auto TAMPERED = CToken(TOKEN->raw(), TOKEN->nonce(), NEncoding::toBase64(altered)).tokenString();
        EXPECT_FALSE(validator.extractRaw(TAMPERED).has_value()) << "bit " << i;
    }
}

TEST_F(ValidatorTest, TamperedTokenString) {
    const auto TOKEN = factory.newToken();

    for (size_t i = 0; i < TOKEN.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            auto altered = TOKEN;
            altered[i]   = (char)(altered[i] ^ (1 << bit));
            EXPECT_FALSE(validator.extractRaw(altered).has_value()) << "char " << i << " bit " << bit;
        }
    }
}

TEST_F(ValidatorTest, ZeroPaddedNonce) {
    const auto TOKEN = CToken::fromString(factory.newToken());
    ASSERT_TRUE(TOKEN.has_value());

    for (const char* padding : {"0", "000"}) {
        const auto PADDED = TOKEN->raw() + "-" + padding + std::to_string(TOKEN->nonce()) + "-" + TOKEN->signature();
        EXPECT_EQ(validator.verify(PADDED).error(), TOKEN_ERROR_MALFORMED) << PADDED;
    }

    EXPECT_TRUE(validator.extractRaw(TOKEN->tokenString()).has_value());
}

TEST_F(ValidatorTest, OtherKey) {
    auto          otherSigner = std::make_shared<const CSigner>(CSigningKey::generate());
    CTokenFactory otherFactory(otherSigner, random, {});

    const auto    TOKEN = otherFactory.newToken();
    EXPECT_EQ(validator.verify(TOKEN).error(), TOKEN_ERROR_BAD_SIGNATURE);
    EXPECT_TRUE(CValidator(otherSigner).extractRaw(TOKEN).has_value());
}

TEST_F(ValidatorTest, TokensMatch) {
    const auto RAW = factory.generateRaw();
    const auto A   = factory.signExisting(RAW);
    const auto B   = factory.signExisting(RAW);

    EXPECT_TRUE(validator.tokensMatch(A, B));
    EXPECT_TRUE(validator.tokensMatch(A, A));
    EXPECT_FALSE(validator.tokensMatch(A, factory.newToken()));
    EXPECT_FALSE(validator.tokensMatch(A, "garbage"));
    EXPECT_FALSE(validator.tokensMatch("garbage", "garbage"));
}
