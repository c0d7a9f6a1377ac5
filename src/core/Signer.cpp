#include "Signer.hpp"
#include "Crypto.hpp"

#include "../debug/log.hpp"

#include <stdexcept>

#include <openssl/core_names.h>
#include <openssl/params.h>

CSigner::CSigner(CSigningKey key) : m_key(std::move(key)) {
    // CSigningKey already guarantees the key length matches the algorithm
    m_mac = EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr);

    if (!m_mac) {
        Debug::log(CRIT, "CSigner: EVP_MAC_fetch: err {}", NCrypto::lastOpenSSLError());
        throw std::runtime_error("HMAC unavailable");
    }

    Debug::log(LOG, "Signer ready, using {}", NCsrfTypes::algorithmToString(m_key.algorithm()));
}

CSigner::~CSigner() {
    if (m_mac)
        EVP_MAC_free(m_mac);
}

std::vector<uint8_t> CSigner::sign(std::string_view material) const {
    EVP_MAC_CTX* ctx = EVP_MAC_CTX_new(m_mac);
    if (!ctx)
        throw std::runtime_error("EVP_MAC_CTX_new failed");

    char       digest[16] = {0};
    const auto DIGESTNAME = std::string_view{NCsrfTypes::algorithmDigestName(m_key.algorithm())};
    DIGESTNAME.copy(digest, sizeof(digest) - 1);

    const OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
        OSSL_PARAM_construct_end(),
    };

    if (!EVP_MAC_init(ctx, m_key.bytes().data(), m_key.bytes().size(), params)) {
        Debug::log(ERR, "CSigner::sign: EVP_MAC_init: err {}", NCrypto::lastOpenSSLError());
        EVP_MAC_CTX_free(ctx);
        throw std::runtime_error("EVP_MAC_init failed");
    }

    if (!EVP_MAC_update(ctx, (const unsigned char*)material.data(), material.size())) {
        Debug::log(ERR, "CSigner::sign: EVP_MAC_update: err {}", NCrypto::lastOpenSSLError());
        EVP_MAC_CTX_free(ctx);
        throw std::runtime_error("EVP_MAC_update failed");
    }

    std::vector<uint8_t> buf;
    buf.resize(EVP_MAX_MD_SIZE);
    size_t len = 0;

    if (!EVP_MAC_final(ctx, buf.data(), &len, buf.size())) {
        Debug::log(ERR, "CSigner::sign: EVP_MAC_final: err {}", NCrypto::lastOpenSSLError());
        EVP_MAC_CTX_free(ctx);
        throw std::runtime_error("EVP_MAC_final failed");
    }

    EVP_MAC_CTX_free(ctx);

    buf.resize(len);
    return buf;
}

bool CSigner::verify(std::string_view material, std::span<const uint8_t> signature) const {
    // signature length is public (fixed per algorithm)
    if (signature.size() != signatureLength())
        return false;

    const auto EXPECTED = sign(material);

    return NCrypto::constantTimeEquals(EXPECTED, signature);
}

eSigningAlgorithm CSigner::algorithm() const {
    return m_key.algorithm();
}

size_t CSigner::signatureLength() const {
    // HMAC output length equals the digest length, which is also our key length
    return NCsrfTypes::algorithmKeyLength(m_key.algorithm());
}
