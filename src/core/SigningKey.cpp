#include "SigningKey.hpp"
#include "Crypto.hpp"

#include <fmt/format.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>

CSigningKey::CSigningKey(std::vector<uint8_t>&& bytes, eSigningAlgorithm algorithm) : m_bytes(std::move(bytes)), m_algorithm(algorithm) {
    const auto EXPECTED = NCsrfTypes::algorithmKeyLength(m_algorithm);

    if (EXPECTED == 0)
        throw CInvalidKeyError("unsupported signing algorithm");

    if (m_bytes.empty())
        throw CInvalidKeyError("signing key is empty");

    if (m_bytes.size() != EXPECTED)
        throw CInvalidKeyError(fmt::format("{} needs a {} byte key, got {}", NCsrfTypes::algorithmToString(m_algorithm), EXPECTED, m_bytes.size()));
}

CSigningKey::~CSigningKey() {
    if (!m_bytes.empty())
        OPENSSL_cleanse(m_bytes.data(), m_bytes.size());
}

CSigningKey CSigningKey::generate(eSigningAlgorithm algorithm) {
    const auto           LEN = NCsrfTypes::algorithmKeyLength(algorithm);

    std::vector<uint8_t> bytes;
    bytes.resize(LEN);

    if (LEN == 0 || RAND_priv_bytes(bytes.data(), (int)bytes.size()) != 1)
        throw CInvalidKeyError(fmt::format("couldn't generate a key: {}", NCrypto::lastOpenSSLError()));

    return CSigningKey(std::move(bytes), algorithm);
}

CSigningKey CSigningKey::fromBytes(std::span<const uint8_t> bytes, eSigningAlgorithm algorithm) {
    const auto LEN = NCsrfTypes::algorithmKeyLength(algorithm);

    if (bytes.size() < LEN)
        throw CInvalidKeyError(fmt::format("{} needs at least {} bytes of key material, got {}", NCsrfTypes::algorithmToString(algorithm), LEN, bytes.size()));

    return CSigningKey(std::vector<uint8_t>(bytes.begin(), bytes.begin() + LEN), algorithm);
}

std::span<const uint8_t> CSigningKey::bytes() const {
    return m_bytes;
}

eSigningAlgorithm CSigningKey::algorithm() const {
    return m_algorithm;
}
