#include "core/TokenFactory.hpp"
#include "core/Token.hpp"
#include "core/Validator.hpp"
#include "helpers/Encoding.hpp"

#include <gtest/gtest.h>

using namespace std::chrono;

class TokenFactoryTest : public ::testing::Test {
  protected:
    CSecureRandom                  random;
    std::shared_ptr<const CSigner> signer = std::make_shared<const CSigner>(CSigningKey::generate());
    system_clock::time_point       now    = system_clock::time_point(milliseconds(1700000000000));

    CTokenFactory                  factory{signer, random, [this] { return now; }};
};

TEST_F(TokenFactoryTest, NewToken) {
    const auto TOKEN = CToken::fromString(factory.newToken());

    ASSERT_TRUE(TOKEN.has_value());
    EXPECT_EQ(TOKEN->raw().size(), 64u);
    EXPECT_TRUE(NEncoding::isLowerHex(TOKEN->raw()));
    EXPECT_EQ(TOKEN->nonce(), 1700000000000u);

    const auto SIGNATURE = NEncoding::fromBase64(TOKEN->signature());
    ASSERT_TRUE(SIGNATURE.has_value());
    EXPECT_TRUE(signer->verify(TOKEN->signedMaterial(), *SIGNATURE));
}

TEST_F(TokenFactoryTest, FreshRawEachTime) {
    const auto A = CToken::fromString(factory.newToken());
    const auto B = CToken::fromString(factory.newToken());

    ASSERT_TRUE(A && B);
    EXPECT_NE(A->raw(), B->raw());
    EXPECT_NE(factory.generateRaw(), factory.generateRaw());
}

TEST_F(TokenFactoryTest, SignExistingKeepsRaw) {
    const std::string RAW = factory.generateRaw();

    const auto        A = factory.signExisting(RAW);
    const auto        B = factory.signExisting(RAW);

    // frozen clock, still never the same wire value
    EXPECT_NE(A, B);
    EXPECT_EQ(CToken::fromString(A)->raw(), RAW);
    EXPECT_EQ(CToken::fromString(B)->raw(), RAW);

    CValidator validator(signer);
    EXPECT_TRUE(validator.tokensMatch(A, B));
}

TEST_F(TokenFactoryTest, NonceStrictlyIncreasing) {
    const auto FIRST = CToken::fromString(factory.newToken())->nonce();

    // same millisecond
    const auto SECOND = CToken::fromString(factory.newToken())->nonce();
    EXPECT_GT(SECOND, FIRST);

    // clock stepped back
    now -= seconds(10);
    const auto THIRD = CToken::fromString(factory.newToken())->nonce();
    EXPECT_GT(THIRD, SECOND);

    // and forward again
    now += minutes(1);
    EXPECT_EQ(CToken::fromString(factory.newToken())->nonce(), (uint64_t)duration_cast<milliseconds>(now.time_since_epoch()).count());
}

TEST(TokenFactoryDefaultsTest, NoSigner) {
    CSecureRandom random;
    EXPECT_THROW(CTokenFactory(nullptr, random, {}), std::invalid_argument);
}

TEST(TokenFactoryDefaultsTest, SystemClock) {
    CSecureRandom random;
    CTokenFactory factory(std::make_shared<const CSigner>(CSigningKey::generate()), random, {});

    const auto    BEFORE = (uint64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    const auto    TOKEN  = CToken::fromString(factory.newToken());

    ASSERT_TRUE(TOKEN.has_value());
    EXPECT_GE(TOKEN->nonce(), BEFORE);
}
